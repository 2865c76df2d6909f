#include "etcdpp/transport/etcd_transport_config.hpp"

#include "etcdpp/transport/retry_policy.hpp"

#include <openssl/evp.h>

#include <vector>

namespace etcdpp {

namespace {

std::string base64_encode(const std::string& input) {
    // 4 output bytes per 3 input bytes, plus the terminator EVP writes
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(input.data()),
        static_cast<int>(input.size())
    );
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

}  // namespace

EtcdTransportConfig& EtcdTransportConfig::with_endpoint(const std::string& uri) {
    endpoints.push_back(uri);
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_header(
    const std::string& name,
    const std::string& value
) {
    default_headers[name] = value;
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_basic_auth(
    const std::string& user,
    const std::string& password
) {
    default_headers["Authorization"] = "Basic " + base64_encode(user + ":" + password);
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_worker_threads(std::size_t threads) {
    worker_threads = threads;
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_max_response_body_size(std::size_t bytes) {
    max_response_body_size = bytes;
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_max_redirects(std::size_t redirects) {
    max_redirects = redirects;
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_retry_policy(std::shared_ptr<IRetryPolicy> policy) {
    retry_policy = std::move(policy);
    return *this;
}

EtcdTransportConfig& EtcdTransportConfig::with_tls(TlsConfig config) {
    tls = std::move(config);
    return *this;
}

std::shared_ptr<IRetryPolicy> default_retry_policy() {
    return retry_with_exponential_backoff(
        std::chrono::milliseconds{20},
        2,
        std::chrono::seconds{10}
    );
}

}  // namespace etcdpp
