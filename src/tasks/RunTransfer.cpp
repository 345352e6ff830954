#include "tasks/RunTransfer.hpp"
#include "tasks/TransferLog.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace ovdm::tasks;
using namespace ovdm::types;
using namespace ovdm::concurrency;
using namespace ovdm::log;

namespace {

std::vector<std::string> prefixed(const std::string& prefix, const std::vector<std::string>& paths) {
    if (prefix.empty() || prefix == ".") return paths;
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) out.push_back((fs::path(prefix) / p).generic_string());
    return out;
}

}

RunTransfer::RunTransfer(std::shared_ptr<Context> ctx) : ctx_(std::move(ctx)) {
    if (!ctx_) throw std::invalid_argument("RunTransfer requires a task context");
}

JobResult RunTransfer::operator()(const Job& job) const {
    if (!job.definition_id) return JobResult::failed("Run job carries no transfer definition");
    const auto id = *job.definition_id;

    std::shared_ptr<cancel::Token> token;
    try {
        token = ctx_->tracker->claim(id, static_cast<int>(::getpid()));
    } catch (const std::exception& e) {
        Registry::transfer()->error("[RunTransfer] Unable to claim transfer {}: {}", id, e.what());
        return conclude(id, LastResult::Outcome::Failure, std::string("Unable to record transfer start: ") + e.what());
    }
    if (!token) return JobResult::failed(fmt::format("Transfer {} was stopped before it started", id));

    try {
        return execute(id, *token);
    } catch (const std::exception& e) {
        ctx_->tracker->detachProcess(id);
        Registry::transfer()->error("[RunTransfer] Transfer {} failed: {}", id, e.what());
        return conclude(id, LastResult::Outcome::Failure, e.what());
    }
}

JobResult RunTransfer::execute(const unsigned int id, const cancel::Token& token) const {
    const auto startedAt = util::now();

    const auto def = ctx_->store->definition(id);
    if (!def) return conclude(id, LastResult::Outcome::Failure, "Transfer definition no longer exists");
    const auto voyage = ctx_->store->voyageContext();

    filter::ResolvedTransfer resolved;
    try {
        resolved = resolve(*ctx_, *def, voyage, startedAt);
    } catch (const filter::ContextUnavailable& e) {
        return conclude(id, LastResult::Outcome::Skipped, e.what());
    } catch (const filter::ConfigurationError& e) {
        return conclude(id, LastResult::Outcome::Failure, e.what());
    }

    const auto adapter = ctx_->adapters->create(resolved);

    const auto report = adapter->test();
    if (!report.passed()) {
        Registry::transfer()->warn("[RunTransfer] {}: connection test failed: {}", def->name, report.failureReason());
        return conclude(id, LastResult::Outcome::Failure, report.failureReason(), {}, {{"parts", report}});
    }

    if (token.cancelled() || !ctx_->tracker->markRunning(id, static_cast<int>(::getpid())))
        return conclude(id, LastResult::Outcome::Cancelled, "Stopped before the transfer began");

    const auto plan = ctx_->filter->plan(resolved, adapter->enumerate(), util::now());
    if (token.cancelled()) return conclude(id, LastResult::Outcome::Cancelled, "Stopped before the transfer began");

    Registry::transfer()->info("[RunTransfer] {}: {} item(s) to transfer ({} bytes), {} deferred, {} excluded",
                               def->name, plan.include.size(), plan.total_bytes, plan.deferred.size(), plan.excluded.size());

    auto copy = adapter->copy(plan, protocols::BandwidthLimit::of(def->bandwidth_limit),
                              [this, id](const std::shared_ptr<process::Handle>& handle) {
                                  ctx_->tracker->attachProcess(id, handle);
                              });
    ctx_->tracker->detachProcess(id);

    nlohmann::json data = {{"plan", plan}, {"copy", copy}};

    if (copy.status == CopyResult::Status::Fatal)
        return conclude(id, LastResult::Outcome::Failure, copy.error, {}, std::move(data));
    if (token.cancelled())
        return conclude(id, LastResult::Outcome::Cancelled, "Stopped by operator", {}, std::move(data));
    if (copy.status == CopyResult::Status::Interrupted)
        return conclude(id, LastResult::Outcome::Failure, copy.error, {}, std::move(data));

    std::vector<std::string> warnings;
    for (const auto& failure : copy.failures) warnings.push_back(fmt::format("{}: {}", failure.path, failure.reason));

    if (resolved.direction() == filter::Direction::Pull) finishPull(resolved, plan, startedAt, copy, warnings);

    std::string prefix;
    if (resolved.direction() == filter::Direction::Pull)
        prefix = fs::path(resolved.dest_dir).lexically_relative(ctx_->filter->cruiseDir(voyage)).generic_string();

    nlohmann::json hook = {
        {"cruiseID", voyage.cruise_id},
        {"transferID", id},
        {"transferName", def->name},
        {"files", {
            {"new", prefixed(prefix, copy.new_files)},
            {"updated", prefixed(prefix, copy.updated_files)},
            {"deleted", prefixed(prefix, copy.deleted_files)}
        }}
    };
    if (voyage.loweringActive()) hook["loweringID"] = *voyage.lowering_id;
    if (def->category == Category::CollectionSystem) {
        hook["collectionSystemTransferID"] = id;
        hook["collectionSystemTransferName"] = def->name;
    }

    data["copy"] = copy;
    data["hook"] = std::move(hook);

    const auto outcome = warnings.empty() && copy.status == CopyResult::Status::Success
                             ? LastResult::Outcome::Success
                             : LastResult::Outcome::SuccessWithWarnings;
    const auto reason = outcome == LastResult::Outcome::Success ? "" : fmt::format("{} warning(s)", warnings.size());
    return conclude(id, outcome, reason, std::move(warnings), std::move(data));
}

void RunTransfer::finishPull(const filter::ResolvedTransfer& transfer, const Plan& plan, const std::time_t startedAt,
                             CopyResult& copy, std::vector<std::string>& warnings) const {
    const auto& def = transfer.definition;
    const fs::path dest = transfer.dest_dir;

    if (def.sync_from_source && !def.remove_source_files) {
        std::set<std::string> keep;
        for (const auto& f : plan.include) keep.insert(f.rel_path);
        keep.insert(plan.deferred.begin(), plan.deferred.end());

        auto removed = util::removeUnlisted(dest, keep);
        util::pruneEmptyDirectories(dest);
        if (!removed.empty())
            Registry::transfer()->info("[RunTransfer] {}: removed {} file(s) no longer at the source", def.name, removed.size());
        copy.deleted_files.insert(copy.deleted_files.end(), removed.begin(), removed.end());
    }

    const auto& warehouse = ctx_->filter->warehouse();
    if (!warehouse.username.empty() && fs::exists(dest)) {
        if (const auto err = util::setOwner(warehouse.username, dest); !err.empty()) {
            Registry::transfer()->warn("[RunTransfer] {}: {}", def.name, err);
            warnings.push_back(err);
        }
    }

    if (def.category != Category::CollectionSystem) return;

    try {
        const auto dir = ctx_->filter->cruiseDir(transfer.voyage) / warehouse.transfer_logs_dir;
        const auto written = writeTransferLogs(dir, {def.name, startedAt, copy.new_files, copy.updated_files, plan.excluded});
        if (!warehouse.username.empty())
            for (const auto& path : written)
                if (const auto err = util::setOwner(warehouse.username, path); !err.empty()) warnings.push_back(err);
    } catch (const std::exception& e) {
        Registry::transfer()->warn("[RunTransfer] {}: unable to write transfer logs: {}", def.name, e.what());
        warnings.push_back(std::string("Unable to write transfer logs: ") + e.what());
    }
}

JobResult RunTransfer::conclude(const unsigned int id, const LastResult::Outcome outcome, const std::string& reason,
                                std::vector<std::string> warnings, nlohmann::json data) const {
    data["outcome"] = to_string(outcome);
    if (!warnings.empty()) data["warnings"] = warnings;

    ctx_->tracker->finish(id, outcome, reason, std::move(warnings));

    if (outcome == LastResult::Outcome::Success || outcome == LastResult::Outcome::SuccessWithWarnings)
        return JobResult::ok(std::move(data));
    return JobResult::failed(reason, std::move(data));
}
