#include "etcdpp/transport/http_response_decoder.hpp"

#include <llhttp.h>

namespace etcdpp {

namespace {

// Status line plus headers; llhttp itself does not bound them
constexpr std::size_t max_header_bytes = 64 * 1024;

HttpResponseDecoder* decoder_of(llhttp_t* parser) {
    return static_cast<HttpResponseDecoder*>(parser->data);
}

}  // namespace

HttpResponseDecoder::HttpResponseDecoder(std::size_t max_body_size, bool head_request)
    : max_body_size_(max_body_size)
    , head_request_(head_request)
    , settings_(std::make_unique<llhttp_settings_t>())
    , parser_(std::make_unique<llhttp_t>())
{
    llhttp_settings_init(settings_.get());
    settings_->on_message_begin = &HttpResponseDecoder::on_message_begin;
    settings_->on_status = &HttpResponseDecoder::on_status;
    settings_->on_header_field = &HttpResponseDecoder::on_header_field;
    settings_->on_header_value = &HttpResponseDecoder::on_header_value;
    settings_->on_headers_complete = &HttpResponseDecoder::on_headers_complete;
    settings_->on_body = &HttpResponseDecoder::on_body;
    settings_->on_message_complete = &HttpResponseDecoder::on_message_complete;

    llhttp_init(parser_.get(), HTTP_RESPONSE, settings_.get());
    parser_->data = this;
}

HttpResponseDecoder::~HttpResponseDecoder() = default;

EtcdResult<bool> HttpResponseDecoder::feed(std::string_view data) {
    if (complete_) {
        return true;
    }
    if (data.empty()) {
        return false;
    }
    started_ = true;

    const llhttp_errno_t err = llhttp_execute(parser_.get(), data.data(), data.size());
    if (err == HPE_OK) {
        return complete_;
    }
    if (err == HPE_PAUSED && complete_) {
        return true;
    }

    if (failure_.empty()) {
        const char* reason = llhttp_get_error_reason(parser_.get());
        failure_ = std::string("Malformed HTTP response: ") + llhttp_errno_name(err) +
                   (reason != nullptr ? std::string(" (") + reason + ")" : std::string());
    }
    return tl::unexpected(TransportError::protocol(failure_));
}

bool HttpResponseDecoder::finish() {
    if (complete_) {
        return true;
    }
    if (started_ == false || failure_.empty() == false) {
        return false;
    }
    // Completes a close-delimited body through on_message_complete; any
    // other state at EOF is an error
    const llhttp_errno_t err = llhttp_finish(parser_.get());
    if (err != HPE_OK && err != HPE_PAUSED) {
        failure_ = std::string("HTTP response cut short: ") + llhttp_errno_name(err);
        return false;
    }
    return complete_;
}

HttpResponse HttpResponseDecoder::take_response() {
    return std::move(response_);
}

void HttpResponseDecoder::store_header() {
    if (field_.empty()) {
        return;
    }
    auto existing = response_.headers.end();
    for (auto it = response_.headers.begin(); it != response_.headers.end(); ++it) {
        if (iequals(it->first, field_)) {
            existing = it;
            break;
        }
    }
    if (existing != response_.headers.end()) {
        existing->second += ", " + value_;
    } else {
        response_.headers.emplace(field_, value_);
    }
    field_.clear();
    value_.clear();
    reading_value_ = false;
}

// ─────────────────────────────────────────────────────────────────────────────
// llhttp callbacks
// ─────────────────────────────────────────────────────────────────────────────

int HttpResponseDecoder::on_message_begin(llhttp_t* parser) {
    auto* self = decoder_of(parser);
    self->response_ = HttpResponse{};
    self->field_.clear();
    self->value_.clear();
    self->reading_value_ = false;
    self->header_bytes_ = 0;
    return HPE_OK;
}

bool HttpResponseDecoder::count_header_bytes(std::size_t length) {
    header_bytes_ += length;
    if (header_bytes_ > max_header_bytes) {
        failure_ = "HTTP header section exceeds " + std::to_string(max_header_bytes) + " bytes";
        return false;
    }
    return true;
}

int HttpResponseDecoder::on_status(llhttp_t* parser, const char* at, std::size_t length) {
    auto* self = decoder_of(parser);
    if (self->count_header_bytes(length) == false) {
        return -1;
    }
    self->response_.reason.append(at, length);
    return HPE_OK;
}

int HttpResponseDecoder::on_header_field(llhttp_t* parser, const char* at, std::size_t length) {
    auto* self = decoder_of(parser);
    if (self->count_header_bytes(length) == false) {
        return -1;
    }
    if (self->reading_value_) {
        self->store_header();
    }
    self->field_.append(at, length);
    return HPE_OK;
}

int HttpResponseDecoder::on_header_value(llhttp_t* parser, const char* at, std::size_t length) {
    auto* self = decoder_of(parser);
    if (self->count_header_bytes(length) == false) {
        return -1;
    }
    self->reading_value_ = true;
    self->value_.append(at, length);
    return HPE_OK;
}

int HttpResponseDecoder::on_headers_complete(llhttp_t* parser) {
    auto* self = decoder_of(parser);
    self->store_header();
    self->response_.status_code = static_cast<int>(parser->status_code);

    // 1 tells llhttp the message has no body
    if (self->head_request_) {
        return 1;
    }

    const bool has_length = (parser->flags & F_CONTENT_LENGTH) != 0;
    if (has_length && parser->content_length > self->max_body_size_) {
        self->failure_ = "HTTP body of " + std::to_string(parser->content_length) +
                         " bytes exceeds limit of " + std::to_string(self->max_body_size_);
        return -1;
    }
    return HPE_OK;
}

int HttpResponseDecoder::on_body(llhttp_t* parser, const char* at, std::size_t length) {
    auto* self = decoder_of(parser);
    auto& body = self->response_.body;
    if (length > self->max_body_size_ - body.size()) {
        self->failure_ = "HTTP body exceeds limit of " + std::to_string(self->max_body_size_) + " bytes";
        return -1;
    }
    body.append(at, length);
    return HPE_OK;
}

int HttpResponseDecoder::on_message_complete(llhttp_t* parser) {
    auto* self = decoder_of(parser);
    const int status = self->response_.status_code;
    if (status >= 100 && status < 200) {
        return HPE_OK;  // Interim response; the final one follows
    }
    self->complete_ = true;
    return HPE_PAUSED;
}

}  // namespace etcdpp
