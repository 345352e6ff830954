#include "hooks/Dispatcher.hpp"
#include "log/Registry.hpp"

using namespace ovdm::hooks;
using namespace ovdm::concurrency;
using namespace ovdm::log;

Dispatcher::Dispatcher(Table table, std::shared_ptr<JobQueue> queue) : table_(std::move(table)), queue_(queue) {
    if (!queue) throw std::invalid_argument("Hook dispatcher requires a job queue");
    queue->requireRegistered(table_.kinds());
}

void Dispatcher::onCompleted(const Job& job, const JobResult& result) const {
    if (!result.success) return;

    const auto& followOns = table_.followOns(job.kind);
    if (followOns.empty()) return;

    const auto queue = queue_.lock();
    if (!queue) return;

    auto payload = job.payload.is_object() ? job.payload : nlohmann::json::object();
    if (result.data.contains("hook") && result.data["hook"].is_object()) payload.update(result.data["hook"]);

    for (const auto kind : followOns) {
        try {
            const auto handle = queue->submit(kind, payload, job.definition_id);
            Registry::hooks()->info("[HookDispatcher] {} -> {} ({})", job.handle, to_string(kind), handle);
        } catch (const std::exception& e) {
            Registry::hooks()->error("[HookDispatcher] Could not enqueue {} after {}: {}", to_string(kind), job.handle, e.what());
        }
    }
}
