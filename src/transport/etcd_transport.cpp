#include "etcdpp/transport/etcd_transport.hpp"

#include "etcdpp/transport/http_connection.hpp"
#include "etcdpp/transport/http_request_builder.hpp"
#include "etcdpp/transport/tls_context.hpp"

#include <asio/this_coro.hpp>

#include <algorithm>

namespace etcdpp {

namespace {

std::vector<Endpoint> parse_endpoints(const std::vector<std::string>& uris) {
    if (uris.empty()) {
        throw std::invalid_argument("EtcdTransport: at least one endpoint is required");
    }
    std::vector<Endpoint> endpoints;
    endpoints.reserve(uris.size());
    for (const auto& uri : uris) {
        auto endpoint = parse_endpoint(uri);
        if (endpoint.has_value() == false) {
            throw std::invalid_argument("EtcdTransport: invalid endpoint '" + uri + "'");
        }
        endpoints.push_back(std::move(*endpoint));
    }
    return endpoints;
}

EtcdTransportConfig config_from_endpoints(std::vector<std::string> endpoints) {
    EtcdTransportConfig config;
    config.endpoints = std::move(endpoints);
    return config;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

EtcdTransport::EtcdTransport(EtcdTransportConfig config)
    : config_(std::move(config))
    , endpoints_(parse_endpoints(config_.endpoints))
    , default_policy_(config_.retry_policy ? config_.retry_policy : default_retry_policy())
{
    if (config_.tls.has_value()) {
        tls_context_ = make_tls_context(*config_.tls);
    }
    start_workers();
}

EtcdTransport::EtcdTransport(
    std::shared_ptr<asio::ssl::context> tls,
    std::vector<std::string> endpoints
)
    : config_(config_from_endpoints(std::move(endpoints)))
    , endpoints_(parse_endpoints(config_.endpoints))
    , default_policy_(default_retry_policy())
    , tls_context_(std::move(tls))
{
    start_workers();
}

EtcdTransport::~EtcdTransport() {
    close();

    // A worker that ran close() itself is joined here
    const auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (worker.joinable() == false) {
            continue;
        }
        if (worker.get_id() == self) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

void EtcdTransport::start_workers() {
    work_guard_.emplace(asio::make_work_guard(io_));

    const std::size_t threads = std::max<std::size_t>(1, config_.worker_threads);
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() {
            io_.run();
        });
    }

    std::string names;
    for (const auto& endpoint : endpoints_) {
        names += names.empty() ? endpoint.to_string() : ", " + endpoint.to_string();
    }
    get_logger()->info_fmt("etcd transport started with {} worker(s) for [{}]", threads, names);
}

// ─────────────────────────────────────────────────────────────────────────────
// Close
// ─────────────────────────────────────────────────────────────────────────────

void EtcdTransport::close() {
    std::call_once(close_once_, [this]() {
        std::vector<std::weak_ptr<PendingRequest>> pending;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            closed_.store(true);
            pending.swap(pending_);
        }

        std::size_t aborted = 0;
        for (const auto& weak : pending) {
            if (auto request = weak.lock(); request != nullptr && request->is_done() == false) {
                request->abort(TransportError::closed());
                ++aborted;
            }
        }

        work_guard_.reset();
        io_.stop();

        // close() from a completion listener runs on a worker, which cannot
        // join itself; the destructor picks it up
        const auto self = std::this_thread::get_id();
        for (auto& worker : workers_) {
            if (worker.joinable() && worker.get_id() != self) {
                worker.join();
            }
        }

        get_logger()->info_fmt("etcd transport closed ({} pending request(s) failed)", aborted);
    });
}

bool EtcdTransport::register_pending(const std::shared_ptr<PendingRequest>& pending) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (closed_.load()) {
        return false;
    }
    // Drop entries whose requests already finished
    std::erase_if(pending_, [](const std::weak_ptr<PendingRequest>& weak) {
        auto request = weak.lock();
        return request == nullptr || request->is_done();
    });
    pending_.push_back(pending);
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Attempt pipeline
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<EtcdResult<HttpResponse>> EtcdTransport::exchange(
    const Endpoint& endpoint,
    const std::string& target,
    EtcdRequestBase& request,
    std::optional<std::size_t> sticky_index
) {
    auto executor = co_await asio::this_coro::executor;

    std::shared_ptr<asio::ssl::context> tls;
    if (endpoint.is_secure()) {
        tls = tls_for(endpoint);
    }

    HttpConnection::Options options;
    options.connect_timeout = config_.connect_timeout;
    options.max_body_size = config_.max_response_body_size;
    options.verify_hostname = config_.tls.has_value() ? config_.tls->verify_hostname : true;
    auto connection = std::make_shared<HttpConnection>(executor, endpoint, std::move(tls), options);

    auto connected = co_await connection->connect();
    if (connected.has_value() == false) {
        get_logger()->warn_fmt(
            "Attempt on {} failed: {} ({})",
            endpoint.to_string(), connected.error().message, to_string(connected.error().code)
        );
        co_return tl::unexpected(connected.error());
    }

    get_logger()->info_fmt("Connected to {} ({})", endpoint.to_string(), connection->remote_address());
    if (sticky_index.has_value()) {
        last_working_endpoint_.store(*sticky_index, std::memory_order_relaxed);
    }

    auto wire = build_http_request(target, request, config_.default_headers);
    if (wire.has_value() == false) {
        get_logger()->error_fmt("{}", wire.error().message);
        co_return tl::unexpected(wire.error());
    }

    auto bytes = serialize_request(*wire, endpoint);
    if (bytes.has_value() == false) {
        get_logger()->error_fmt("{}", bytes.error().message);
        co_return tl::unexpected(bytes.error());
    }

    const auto read_timeout = request.timeout().value_or(config_.read_timeout);
    auto response = co_await connection->round_trip(
        std::move(*bytes),
        read_timeout,
        wire->method == HttpMethod::Head
    );
    connection->close();

    if (response.has_value()) {
        get_logger()->debug_fmt(
            "{} {} -> {} ({} bytes)",
            to_string(wire->method), wire->target, response->status_code, response->body.size()
        );
    } else {
        get_logger()->warn_fmt(
            "{} {} on {} failed: {}",
            to_string(wire->method), wire->target, endpoint.to_string(), response.error().message
        );
    }
    co_return response;
}

std::shared_ptr<asio::ssl::context> EtcdTransport::tls_for(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(tls_mutex_);
    if (tls_context_ == nullptr) {
        // https endpoint (or redirect) without explicit TLS settings
        get_logger()->info_fmt("Creating default TLS context for {}", endpoint.to_string());
        tls_context_ = make_tls_context(TlsConfig{});
    }
    return tls_context_;
}

std::string EtcdTransport::join_target(const Endpoint& endpoint, const std::string& url) {
    std::string base = endpoint.path;
    while (base.empty() == false && base.back() == '/') {
        base.pop_back();
    }
    if (url.empty() || url.front() != '/') {
        return base + "/" + url;
    }
    return base + url;
}

std::optional<std::pair<Endpoint, std::string>> EtcdTransport::resolve_redirect(
    const Endpoint& current,
    const std::string& location
) {
    if (location.empty()) {
        return std::nullopt;
    }
    // The request's own parameters are appended again, so the location's
    // query is dropped
    if (location.front() == '/') {
        return std::make_pair(current, location.substr(0, location.find('?')));
    }
    auto next = parse_endpoint(location);
    if (next.has_value() == false) {
        return std::nullopt;
    }
    std::string target = next->path;
    next->path = "/";
    next->query.clear();
    return std::make_pair(std::move(*next), std::move(target));
}

}  // namespace etcdpp
