// Runtime
#include "runtime/Engine.hpp"
#include "runtime/Manager.hpp"

// Database
#include "db/PgStore.hpp"
#include "db/Schema.hpp"
#include "db/Transactions.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "process/Runner.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using namespace ovdm::config;
using namespace ovdm::runtime;
using namespace ovdm::db;
using namespace ovdm::log;

namespace {
std::atomic<int> receivedSignal = 0;

void signalHandler(const int signum) {
    receivedSignal = signum;
}
}

int main(const int argc, char* argv[]) {
    try {
        ConfigRegistry::init(argc > 1 ? std::filesystem::path(argv[1]) : kDefaultConfigPath);
        Registry::init();

        const auto& config = ConfigRegistry::get();
        Registry::ovdm()->info("[*] Initializing OpenVDM transfer engine...");

        ensureSchema(config.database);
        Transactions::init(config.database);

        const auto engine = std::make_shared<Engine>(config, std::make_shared<PgStore>(),
                                                     std::make_shared<ovdm::process::PosixRunner>());
        engine->start();

        Manager services(engine);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);

        services.startAll();
        Registry::ovdm()->info("[✓] OpenVDM transfer engine started.");

        while (receivedSignal == 0) std::this_thread::sleep_for(std::chrono::milliseconds(500));

        Registry::ovdm()->info("[!] Signal {} received. Shutting down gracefully...", receivedSignal.load());

        services.stopAll();
        engine->shutdown();

        Registry::ovdm()->info("[✓] OpenVDM transfer engine shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::ovdm()->error("[-] Failed to start OpenVDM: {}", e.what());
        else spdlog::error("[-] Failed to start OpenVDM: {}", e.what());
        return EXIT_FAILURE;
    }
}
