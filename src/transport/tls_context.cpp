#include "etcdpp/transport/tls_context.hpp"

#include "etcdpp/log/logger.hpp"

#include <stdexcept>
#include <system_error>

namespace etcdpp {

namespace {

void load_or_throw(const char* what, const std::string& path, auto&& load) {
    std::error_code ec;
    load(path, ec);
    if (ec) {
        throw std::invalid_argument(
            std::string("Failed to load ") + what + " '" + path + "': " + ec.message()
        );
    }
}

}  // namespace

std::shared_ptr<asio::ssl::context> make_tls_context(const TlsConfig& config) {
    auto context = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
    context->set_options(
        asio::ssl::context::default_workarounds |
        asio::ssl::context::no_sslv2 |
        asio::ssl::context::no_sslv3 |
        asio::ssl::context::no_tlsv1 |
        asio::ssl::context::no_tlsv1_1
    );

    if (config.ca_cert_path.empty()) {
        std::error_code ec;
        context->set_default_verify_paths(ec);
        if (ec) {
            get_logger()->warn_fmt("No default CA store available: {}", ec.message());
        }
    } else {
        load_or_throw("CA bundle", config.ca_cert_path,
            [&context](const std::string& path, std::error_code& ec) {
                context->load_verify_file(path, ec);
            });
    }

    const bool has_cert = config.client_cert_path.has_value();
    const bool has_key = config.client_key_path.has_value();
    if (has_cert != has_key) {
        throw std::invalid_argument("Client certificate and key must be configured together");
    }
    if (has_cert) {
        load_or_throw("client certificate", *config.client_cert_path,
            [&context](const std::string& path, std::error_code& ec) {
                context->use_certificate_chain_file(path, ec);
            });
        load_or_throw("client key", *config.client_key_path,
            [&context](const std::string& path, std::error_code& ec) {
                context->use_private_key_file(path, asio::ssl::context::pem, ec);
            });
    }

    context->set_verify_mode(config.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);
    if (config.verify_peer == false) {
        get_logger()->warn("TLS peer verification is disabled");
    }
    return context;
}

}  // namespace etcdpp
