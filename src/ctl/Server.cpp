#include "ctl/Server.hpp"
#include "ctl/Router.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <netinet/in.h>
#include <grp.h>
#include <pwd.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>
#include <nlohmann/json.hpp>

using nlohmann::json;

using namespace ovdm::ctl;
using namespace ovdm::log;

namespace {

struct Peer {
    uid_t uid;
    gid_t gid;
    pid_t pid;
};

std::system_error sysError(const std::string& what) {
    return {errno, std::generic_category(), what};
}

Peer peercred(const int fd) {
    ucred c{};
    socklen_t len = sizeof(c);
    if (getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &c, &len) != 0) throw sysError("SO_PEERCRED");
    return {c.uid, c.gid, c.pid};
}

bool admitted(const uid_t uid, const std::optional<gid_t>& adminGid) {
    if (uid == 0) return true;
    if (!adminGid) return false;
    passwd entry{};
    passwd* pw = nullptr;
    std::vector<char> buf(ovdm::util::passwdBufferSize());
    if (getpwuid_r(uid, &entry, buf.data(), buf.size(), &pw) != 0 || !pw) return false;
    if (pw->pw_gid == *adminGid) return true;
    int ng = 0;
    getgrouplist(pw->pw_name, pw->pw_gid, nullptr, &ng);
    std::vector<gid_t> gs(ng);
    if (getgrouplist(pw->pw_name, pw->pw_gid, gs.data(), &ng) < 0) return false;
    return std::ranges::any_of(gs, [&](const gid_t g) { return g == *adminGid; });
}

bool readn(const int fd, void* buf, size_t n) {
    auto* p = static_cast<unsigned char*>(buf);
    while (n) {
        const ssize_t r = ::read(fd, p, n);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        p += r;
        n -= r;
    }
    return true;
}

bool writen(const int fd, const void* buf, size_t n) {
    auto* p = static_cast<const unsigned char*>(buf);
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= w;
    }
    return true;
}

bool send_json(const int fd, const json& j) {
    const auto s = j.dump();
    const auto len = htonl(static_cast<uint32_t>(s.size()));
    return writen(fd, &len, 4) && writen(fd, s.data(), s.size());
}

}

Server::Server(config::CtlConfig cfg, std::shared_ptr<Router> router)
    : AsyncService("CtlServer"), cfg_(std::move(cfg)), router_(std::move(router)) {
    if (!router_) throw std::invalid_argument("Control server requires a router");

    group entry{};
    group* grp = nullptr;
    std::vector<char> buf(ovdm::util::passwdBufferSize());
    if (getgrnam_r(cfg_.admin_group.c_str(), &entry, buf.data(), buf.size(), &grp) == 0 && grp) adminGid_ = grp->gr_gid;
    else Registry::ctl()->warn("[CtlServer] Admin group '{}' not found; only root may connect", cfg_.admin_group);
}

Server::~Server() {
    stop();
    closeListener();
}

void Server::closeListener() {
    if (listenFd_ >= 0) {
        ::shutdown(listenFd_, SHUT_RDWR);
        ::close(listenFd_);
        listenFd_ = -1;
    }
    ::unlink(cfg_.socket_path.c_str());
}

void Server::onStop() {
    closeListener();
}

void Server::bindListener() {
    const std::filesystem::path path(cfg_.socket_path);
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    ::unlink(cfg_.socket_path.c_str());
    listenFd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listenFd_ < 0) throw sysError("socket()");

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (cfg_.socket_path.size() >= sizeof(addr.sun_path))
        throw std::invalid_argument("Control socket path too long: " + cfg_.socket_path);
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", cfg_.socket_path.c_str());

    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr),
               sizeof(sa_family_t) + std::strlen(addr.sun_path) + 1) != 0)
        throw sysError("bind(" + cfg_.socket_path + ")");
    if (::chmod(cfg_.socket_path.c_str(), 0660) != 0) throw sysError("chmod(" + cfg_.socket_path + ")");
    if (adminGid_ && ::chown(cfg_.socket_path.c_str(), static_cast<uid_t>(-1), *adminGid_) != 0)
        Registry::ctl()->warn("[CtlServer] Could not hand {} to group {}: {}", cfg_.socket_path, cfg_.admin_group,
                              std::strerror(errno));

    if (::listen(listenFd_, 16) != 0) throw sysError("listen()");
    Registry::ctl()->info("[CtlServer] Listening on {}", cfg_.socket_path);
}

void Server::runLoop() {
    bindListener();

    while (!interruptFlag_.load()) {
        const int cfd = ::accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (interruptFlag_.load()) break; // listener closed during stop
            if (errno == EINTR || errno == ECONNABORTED) continue;
            throw sysError("accept4()");
        }

        try {
            serve(cfd);
        } catch (const std::exception& e) {
            Registry::ctl()->error("[CtlServer] Request failed: {}", e.what());
            (void)send_json(cfd, {{"ok", false}, {"error", e.what()}});
        }
        ::close(cfd);
    }
}

void Server::serve(const int cfd) const {
    const auto p = peercred(cfd);

    if (!admitted(p.uid, adminGid_)) {
        Registry::ctl()->warn("[CtlServer] Connection from UID {} (PID {}) not in group {}", p.uid, p.pid, cfg_.admin_group);
        (void)send_json(cfd, {{"ok", false}, {"error", "permission denied"}});
        return;
    }

    uint32_t be = 0;
    if (!readn(cfd, &be, 4)) return;
    const uint32_t len = ntohl(be);
    if (len > kMaxRequestBytes) {
        (void)send_json(cfd, {{"ok", false}, {"error", "request too large"}});
        return;
    }

    std::string body(len, '\0');
    if (!readn(cfd, body.data(), len)) return;

    const auto req = json::parse(body, nullptr, false);
    if (req.is_discarded()) {
        (void)send_json(cfd, {{"ok", false}, {"error", "malformed JSON"}});
        return;
    }

    Registry::ctl()->debug("[CtlServer] UID {} (PID {}): {}", p.uid, p.pid,
                            req.is_object() ? req.value("cmd", "") : std::string{});
    if (!send_json(cfd, router_->handle(req)))
        Registry::ctl()->warn("[CtlServer] Client {} went away before the reply was written", p.pid);
}
