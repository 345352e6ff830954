#pragma once

#include "cancel/Manager.hpp"
#include "config/Config.hpp"
#include "filter/Engine.hpp"
#include "process/Runner.hpp"
#include "protocols/Adapter.hpp"
#include "state/RecordStore.hpp"
#include "state/Tracker.hpp"

#include <ctime>
#include <memory>

namespace ovdm::tasks {

// Everything a task handler reaches for. Built once by the engine and shared by every handler.
struct Context {
    config::Config config{};
    std::shared_ptr<state::RecordStore> store{};
    std::shared_ptr<state::Tracker> tracker{};
    std::shared_ptr<filter::Engine> filter{};
    std::shared_ptr<protocols::AdapterFactory> adapters{};
    std::shared_ptr<process::Runner> runner{};
    std::shared_ptr<cancel::Manager> canceller{};
};

// Collection systems and extra directories a cruise data definition leaves behind.
filter::ExclusionSources exclusionsFor(const types::TransferDefinition& def, state::RecordStore& store);

// Resolves against the given voyage. Throws filter::ContextUnavailable or filter::ConfigurationError.
filter::ResolvedTransfer resolve(const Context& ctx, const types::TransferDefinition& def,
                                 const types::VoyageContext& voyage, std::time_t now);

}
