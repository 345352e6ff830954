#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace ovdm::ctl {

class Router;

// Unix-domain admin socket. One request per connection: a 4-byte big-endian length, then that many bytes of JSON.
class Server final : public concurrency::AsyncService {
public:
    Server(config::CtlConfig cfg, std::shared_ptr<Router> router);
    ~Server() override;

    [[nodiscard]] const std::string& socketPath() const noexcept { return cfg_.socket_path; }

protected:
    void runLoop() override;
    void onStop() override; // close listener to break accept()

private:
    static constexpr uint32_t kMaxRequestBytes = 1u << 20;

    config::CtlConfig cfg_;
    std::shared_ptr<Router> router_;
    std::optional<gid_t> adminGid_;
    int listenFd_ = -1;

    void bindListener();
    void closeListener();
    void serve(int cfd) const;
};

}
