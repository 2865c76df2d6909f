// ─────────────────────────────────────────────────────────────────────────────
// etcdpp-cli - etcd key-value command line client
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   etcdpp-cli version
//   etcdpp-cli --endpoints http://10.0.0.1:2379,http://10.0.0.2:2379 get config/leader
//   etcdpp-cli set config/leader node-1 --ttl 30
//   etcdpp-cli get config --recursive --sorted
//   etcdpp-cli rm config/leader
//
// Results are printed to stdout as JSON; logs go to stderr. The exit code is
// 0 on success, 1 on usage errors and 2 when the request failed.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "etcdpp/log/spdlog_logger.hpp"
#include "etcdpp/requests/etcd_key_request.hpp"
#include "etcdpp/requests/etcd_version_request.hpp"
#include "etcdpp/responses/etcd_keys_response.hpp"
#include "etcdpp/transport/etcd_transport.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace etcdpp;
using Json = nlohmann::json;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

std::vector<std::string> split_endpoints(const std::string& list) {
    std::vector<std::string> endpoints;
    std::stringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty() == false) {
            endpoints.push_back(item);
        }
    }
    return endpoints;
}

std::string get_env(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

Json error_json(const TransportError& error) {
    Json out = {
        {"error", std::string(to_string(error.code))},
        {"message", error.message}
    };
    if (error.http_status.has_value()) {
        out["status"] = *error.http_status;
    }
    if (error.server_error.has_value()) {
        out["etcd"] = *error.server_error;
    }
    return out;
}

// Wait for `future` and print its outcome
template <typename T, typename Print>
int finish(const std::shared_ptr<ResponsePromise<T>>& future, Print&& print) {
    const auto result = future->get();
    if (result.has_value() == false) {
        std::cout << error_json(result.error()).dump(2) << "\n";
        return kExitFailed;
    }
    print(*result);
    return 0;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("etcdpp-cli", "etcd key-value client");

    options.add_options()
        ("e,endpoints", "Comma-separated endpoint URLs (or ETCDPP_ENDPOINTS)",
            cxxopts::value<std::string>()->default_value(get_env("ETCDPP_ENDPOINTS", "http://127.0.0.1:2379")))
        ("t,timeout", "Response timeout in milliseconds (0 = none)",
            cxxopts::value<long>()->default_value("5000"))
        ("connect-timeout", "Connect timeout in milliseconds",
            cxxopts::value<long>()->default_value("300"))
        ("r,retries", "Retries per request",
            cxxopts::value<std::size_t>()->default_value("2"))
        ("ttl", "Time to live in seconds (set)", cxxopts::value<long>())
        ("recursive", "Recursive get / delete")
        ("sorted", "Sort directory listings")
        ("dir", "Operate on a directory (rm)")
        ("ca-file", "CA bundle for https endpoints", cxxopts::value<std::string>())
        ("cert-file", "Client certificate for https endpoints", cxxopts::value<std::string>())
        ("key-file", "Client key for https endpoints", cxxopts::value<std::string>())
        ("insecure", "Skip TLS peer verification")
        ("l,log-level", "trace | debug | info | warn | error | off",
            cxxopts::value<std::string>()->default_value("warn"))
        ("v,verbose", "Same as --log-level debug")
        ("command", "version | get | set | rm", cxxopts::value<std::string>())
        ("args", "Command arguments", cxxopts::value<std::vector<std::string>>())
        ("h,help", "Print usage");

    options.parse_positional({"command", "args"});
    options.positional_help("COMMAND [KEY] [VALUE]");

    try {
        auto parsed = options.parse(argc, argv);

        if (parsed.count("help") || parsed.count("command") == 0) {
            std::cout << options.help() << "\n";
            return parsed.count("help") ? 0 : kExitUsage;
        }

        const LogLevel level = parsed.count("verbose")
            ? LogLevel::Debug
            : parse_log_level(parsed["log-level"].as<std::string>());
        set_logger(make_spdlog_stderr_logger(level));

        const auto command = parsed["command"].as<std::string>();
        const auto args = parsed.count("args")
            ? parsed["args"].as<std::vector<std::string>>()
            : std::vector<std::string>{};

        EtcdTransportConfig config;
        config.endpoints = split_endpoints(parsed["endpoints"].as<std::string>());
        config.with_connect_timeout(std::chrono::milliseconds{parsed["connect-timeout"].as<long>()})
              .with_read_timeout(std::chrono::milliseconds{parsed["timeout"].as<long>()})
              .with_retry_policy(retry_with_exponential_backoff(
                  std::chrono::milliseconds{20},
                  parsed["retries"].as<std::size_t>(),
                  std::chrono::seconds{10}
              ))
              .with_worker_threads(1);

        const bool wants_tls = parsed.count("ca-file") || parsed.count("cert-file") ||
                               parsed.count("key-file") || parsed.count("insecure");
        if (wants_tls) {
            TlsConfig tls;
            if (parsed.count("ca-file")) {
                tls.ca_cert_path = parsed["ca-file"].as<std::string>();
            }
            if (parsed.count("cert-file")) {
                tls.client_cert_path = parsed["cert-file"].as<std::string>();
            }
            if (parsed.count("key-file")) {
                tls.client_key_path = parsed["key-file"].as<std::string>();
            }
            if (parsed.count("insecure")) {
                tls.verify_peer = false;
                tls.verify_hostname = false;
            }
            config.with_tls(std::move(tls));
        }

        EtcdTransport transport(std::move(config));

        const auto print_keys = [](const EtcdKeysResponse& response) {
            std::cout << Json(response).dump(2) << "\n";
        };

        if (command == "version") {
            return finish(transport.send(EtcdVersionRequest::create()), [](const std::string& body) {
                // Bodies that are not JSON are printed as a string
                const Json parsed_body = Json::parse(body, nullptr, false);
                std::cout << (parsed_body.is_discarded() ? Json(body) : parsed_body).dump(2) << "\n";
            });
        }

        if (command == "get") {
            if (args.size() != 1) {
                std::cerr << "usage: etcdpp-cli get KEY\n";
                return kExitUsage;
            }
            auto request = EtcdKeyRequest::get(args[0]);
            if (parsed.count("recursive")) {
                request->recursive();
            }
            if (parsed.count("sorted")) {
                request->sorted();
            }
            return finish(transport.send(request), print_keys);
        }

        if (command == "set") {
            if (args.size() != 2) {
                std::cerr << "usage: etcdpp-cli set KEY VALUE [--ttl SECONDS]\n";
                return kExitUsage;
            }
            auto request = EtcdKeyRequest::put(args[0], args[1]);
            if (parsed.count("ttl")) {
                request->ttl(parsed["ttl"].as<long>());
            }
            return finish(transport.send(request), print_keys);
        }

        if (command == "rm") {
            if (args.size() != 1) {
                std::cerr << "usage: etcdpp-cli rm KEY [--recursive] [--dir]\n";
                return kExitUsage;
            }
            auto request = EtcdKeyRequest::remove(args[0]);
            if (parsed.count("recursive")) {
                request->recursive();
            }
            if (parsed.count("dir")) {
                request->dir();
            }
            return finish(transport.send(request), print_keys);
        }

        std::cerr << "Unknown command '" << command << "'\n" << options.help() << "\n";
        return kExitUsage;

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitUsage;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitUsage;
    }
}
