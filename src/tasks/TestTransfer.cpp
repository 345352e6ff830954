#include "tasks/TestTransfer.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace ovdm::tasks;
using namespace ovdm::types;
using namespace ovdm::concurrency;
using namespace ovdm::log;

namespace {

JobResult toResult(const TestReport& report) {
    JobResult result{report.passed(), nlohmann::json(report)};
    if (!report.passed()) result.data["reason"] = report.failureReason();
    return result;
}

}

TestTransfer::TestTransfer(std::shared_ptr<Context> ctx) : ctx_(std::move(ctx)) {
    if (!ctx_) throw std::invalid_argument("TestTransfer requires a task context");
}

JobResult TestTransfer::operator()(const Job& job) const {
    if (!job.definition_id) return JobResult::failed("Test job carries no transfer definition");
    const auto id = *job.definition_id;
    const auto pid = static_cast<int>(::getpid());

    TestReport report;
    switch (ctx_->tracker->tryStart(id)) {
        case state::StartResult::NotFound:
            report.fail("Transfer definition", "Unknown transfer definition " + std::to_string(id));
            return toResult(report);
        case state::StartResult::AlreadyRunning:
            report.fail("Transfer In-Progress", "Transfer is already in progress");
            return toResult(report);
        case state::StartResult::Ok:
            break;
    }

    if (!ctx_->tracker->claim(id, pid)) {
        report.fail("Transfer In-Progress", "Test was stopped before it started");
        return toResult(report);
    }
    ctx_->tracker->markRunning(id, pid);

    try {
        report = probe(id);
    } catch (const std::exception& e) {
        Registry::transfer()->error("[TestTransfer] Test of transfer {} failed: {}", id, e.what());
        report.fail("Connection test", e.what());
    }

    const auto outcome = report.passed() ? LastResult::Outcome::TestPassed : LastResult::Outcome::TestFailed;
    ctx_->tracker->finish(id, outcome, report.failureReason());

    Registry::transfer()->info("[TestTransfer] Transfer {}: {}", id, report.passed() ? "Pass" : report.failureReason());
    return toResult(report);
}

TestReport TestTransfer::probe(const unsigned int id) const {
    TestReport report;

    const auto def = ctx_->store->definition(id);
    if (!def) {
        report.fail("Transfer definition", "Transfer definition no longer exists");
        return report;
    }

    filter::ResolvedTransfer resolved;
    try {
        resolved = resolve(*ctx_, *def, ctx_->store->voyageContext(), util::now());
    } catch (const filter::ContextUnavailable& e) {
        report.fail("Resolve transfer", e.what());
        return report;
    } catch (const filter::ConfigurationError& e) {
        report.fail("Resolve transfer", e.what());
        return report;
    }

    return ctx_->adapters->create(resolved)->test();
}
