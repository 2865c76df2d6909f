#pragma once

#include "etcdpp/requests/etcd_request.hpp"

#include <memory>
#include <string>

namespace etcdpp {

// GET /version; the result is the raw body, e.g.
//   {"etcdserver":"2.3.8","etcdcluster":"2.3.0"}
class EtcdVersionRequest final : public EtcdRequest<std::string> {
public:
    EtcdVersionRequest()
        : EtcdRequest<std::string>(HttpMethod::Get, "/version", TextDecoding{})
    {}

    [[nodiscard]] static std::shared_ptr<EtcdVersionRequest> create() {
        return std::make_shared<EtcdVersionRequest>();
    }
};

}  // namespace etcdpp
