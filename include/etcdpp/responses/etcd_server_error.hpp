#ifndef ETCDPP_RESPONSES_ETCD_SERVER_ERROR_HPP
#define ETCDPP_RESPONSES_ETCD_SERVER_ERROR_HPP

#include <cstdint>
#include <string>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// EtcdServerError
// ─────────────────────────────────────────────────────────────────────────────
// Error document returned by the service alongside 4xx/5xx statuses:
//   {"errorCode":100,"message":"Key not found","cause":"/foo","index":7}

struct EtcdServerError {
    // Well-known error codes
    static constexpr int kKeyNotFound = 100;
    static constexpr int kTestFailed = 101;
    static constexpr int kNotFile = 102;
    static constexpr int kNotDir = 104;
    static constexpr int kNodeExist = 105;
    static constexpr int kDirNotEmpty = 108;
    static constexpr int kEventIndexCleared = 401;

    int error_code{0};
    std::string message;
    std::string cause;
    std::uint64_t index{0};

    [[nodiscard]] bool is(int code) const noexcept {
        return error_code == code;
    }
};

}  // namespace etcdpp

#endif  // ETCDPP_RESPONSES_ETCD_SERVER_ERROR_HPP
