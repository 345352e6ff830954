#pragma once

#include "cancel/Token.hpp"
#include "state/RecordStore.hpp"
#include "types/TransferDefinition.hpp"
#include "types/VoyageContext.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ovdm::state {

struct Snapshot {
    unsigned int id{};
    types::Status status{types::Status::Idle};
    std::optional<int> pid{};
    types::LastResult last_result{};
};

struct StatusEntry {
    unsigned int id{};
    std::string name{};
    types::Status status{types::Status::Idle};
};

enum class StartResult { Ok, AlreadyRunning, NotFound };

enum class StopResult {
    NotRunning,  // nothing in flight, nothing touched
    Dequeued,    // queued job dropped before it was claimed
    Stopping     // in-flight job flagged and its process signalled
};

// Every transition is written to the record store before it becomes visible; a rejected write
// leaves the in-memory record untouched and propagates. finish() is the exception, see there.
class Tracker {
public:
    explicit Tracker(std::shared_ptr<RecordStore> store);

    // Idle/Error -> Queued. Exactly one caller wins until finish() runs.
    StartResult tryStart(unsigned int id);

    // Queued -> Starting, owned by pid. Returns nullptr if the job was stopped or never queued.
    std::shared_ptr<cancel::Token> claim(unsigned int id, int pid);

    // Starting -> Running. False if a stop arrived first.
    bool markRunning(unsigned int id, int pid);

    void attachProcess(unsigned int id, const std::shared_ptr<process::Handle>& handle);
    void detachProcess(unsigned int id);

    // Running/Starting -> Stopping (signals the attached process), Queued -> prior state.
    StopResult requestStop(unsigned int id);

    // Always releases the definition, then persists; a store error still propagates to the caller.
    void finish(unsigned int id, types::LastResult::Outcome outcome,
                std::string reason = {}, std::vector<std::string> warnings = {});

    [[nodiscard]] Snapshot snapshot(unsigned int id);
    [[nodiscard]] std::vector<StatusEntry> statusesOf(types::Category category);

    // Drops the cached record of an idle definition so the next access re-reads it from the store.
    bool forget(unsigned int id);

    // Boot recovery: anything left mid-flight by a previous process goes back to Idle.
    unsigned int resetInFlight();

    // Definitions currently Queued, Starting, Running or Stopping in this process.
    [[nodiscard]] std::vector<unsigned int> inFlight() const;

    void updateSizes(const types::SizeSnapshot& sizes);
    [[nodiscard]] types::SizeSnapshot sizes() const;

private:
    struct Entry {
        std::mutex mutex;
        types::LiveState state;
        types::Status prior{types::Status::Idle};
        std::shared_ptr<cancel::Token> token;
    };

    std::shared_ptr<RecordStore> store_;

    mutable std::shared_mutex entriesMutex_;
    std::unordered_map<unsigned int, std::shared_ptr<Entry>> entries_;

    mutable std::mutex sizesMutex_;
    types::SizeSnapshot sizes_;

    std::shared_ptr<Entry> entry(unsigned int id);
    std::shared_ptr<Entry> entry(const types::TransferDefinition& def);
    void persist(unsigned int id, const types::LiveState& state) const;
};

std::string to_string(StartResult r);
std::string to_string(StopResult r);

}
