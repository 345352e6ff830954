#include "support/EngineFixture.hpp"

#include "ctl/Router.hpp"
#include "ctl/Server.hpp"

#include <arpa/inet.h>
#include <grp.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using namespace ovdm;
using nlohmann::json;
using ovdm::test::waitUntil;

namespace {

// Minimal client speaking the length-prefixed framing.
class Client {
public:
    explicit Client(const std::string& path) {
        fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        connected_ = fd_ >= 0 && ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    ~Client() {
        if (fd_ >= 0) ::close(fd_);
    }

    [[nodiscard]] bool connected() const { return connected_; }

    bool sendRaw(const std::string& body) const {
        const uint32_t len = htonl(static_cast<uint32_t>(body.size()));
        return ::write(fd_, &len, 4) == 4 && ::write(fd_, body.data(), body.size()) == static_cast<ssize_t>(body.size());
    }

    [[nodiscard]] json receive() const {
        uint32_t be = 0;
        if (!readAll(&be, 4)) return nullptr;
        std::string body(ntohl(be), '\0');
        if (!readAll(body.data(), body.size())) return nullptr;
        return json::parse(body);
    }

private:
    int fd_{-1};
    bool connected_{false};

    bool readAll(void* buf, size_t n) const {
        auto* p = static_cast<char*>(buf);
        while (n) {
            const auto r = ::read(fd_, p, n);
            if (r <= 0) return false;
            p += r;
            n -= static_cast<size_t>(r);
        }
        return true;
    }
};

class CtlServerTest : public ovdm::test::EngineFixture {
protected:
    std::unique_ptr<ctl::Server> server;
    std::string socketPath;

    void SetUp() override {
        EngineFixture::SetUp();
        boot(baseConfig());

        config::CtlConfig cfg;
        socketPath = (tmp.path() / "run" / "ctl.sock").string();
        cfg.socket_path = socketPath;
        const group* grp = getgrgid(getgid());
        ASSERT_NE(grp, nullptr);
        cfg.admin_group = grp->gr_name;

        server = std::make_unique<ctl::Server>(cfg, std::make_shared<ctl::Router>(engine));
        server->start();
        ASSERT_TRUE(waitUntil([&] { return Client(socketPath).connected(); }));
    }

    void TearDown() override {
        if (server) server->stop();
        EngineFixture::TearDown();
    }

    [[nodiscard]] json request(const json& body) const {
        const Client client(socketPath);
        EXPECT_TRUE(client.connected());
        EXPECT_TRUE(client.sendRaw(body.dump()));
        return client.receive();
    }
};

}

TEST_F(CtlServerTest, AnswersASnapshotRequest) {
    const auto reply = request({{"cmd", "snapshot"}, {"id", kScsId}});
    ASSERT_TRUE(reply.is_object());
    EXPECT_TRUE(reply.at("ok").get<bool>());
    EXPECT_EQ(reply.at("snapshot").at("status"), "idle");
}

TEST_F(CtlServerTest, MalformedJsonGetsAnErrorReply) {
    const Client client(socketPath);
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.sendRaw("{not json"));

    const auto reply = client.receive();
    ASSERT_TRUE(reply.is_object());
    EXPECT_FALSE(reply.at("ok").get<bool>());
    EXPECT_EQ(reply.at("error"), "malformed JSON");
}

TEST_F(CtlServerTest, ServesConsecutiveConnections) {
    EXPECT_TRUE(request({{"cmd", "run"}, {"id", kScsId}}).at("ok").get<bool>());
    ASSERT_TRUE(waitUntil([&] { return script->copies.load() == 1; }));
    EXPECT_FALSE(request({{"cmd", "bogus"}}).at("ok").get<bool>());
}

TEST_F(CtlServerTest, StopRemovesTheSocket) {
    server->stop();
    EXPECT_FALSE(server->isRunning());
    EXPECT_FALSE(std::filesystem::exists(socketPath));
}
