#include "tasks/PostHook.hpp"
#include "tasks/ExternalCommand.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <nlohmann/json.hpp>

using namespace ovdm::tasks;
using namespace ovdm::concurrency;
using namespace ovdm::log;

namespace {

std::string joinedFiles(const nlohmann::json& payload, const std::string& key) {
    if (!payload.contains("files") || !payload["files"].contains(key)) return "";
    return boost::algorithm::join(payload["files"][key].get<std::vector<std::string>>(), " ");
}

std::string payloadString(const nlohmann::json& payload, const std::string& key, const std::string& fallback) {
    if (!payload.contains(key)) return fallback;
    const auto& v = payload[key];
    return v.is_string() ? v.get<std::string>() : v.dump();
}

}

std::string ovdm::tasks::replaceHookTokens(std::string arg, const std::map<std::string, std::string>& values) {
    for (const auto& [token, value] : values)
        if (!value.empty()) boost::algorithm::replace_all(arg, "{" + token + "}", value);
    return arg;
}

PostHook::PostHook(std::shared_ptr<Context> ctx, const TaskKind kind) : ctx_(std::move(ctx)), kind_(kind) {
    if (!ctx_) throw std::invalid_argument("PostHook requires a task context");
}

JobResult PostHook::operator()(const Job& job) const {
    const auto name = to_string(kind_);
    const auto it = ctx_->config.post_hook_commands.find(name);
    if (it == ctx_->config.post_hook_commands.end()) return JobResult::ok({{"skipped", true}});

    std::optional<types::TransferDefinition> def;
    if (job.definition_id) def = ctx_->store->definition(*job.definition_id);
    const std::string transferName = def ? def->name : "";

    const auto entry = std::ranges::find_if(it->second, [&](const config::PostHookEntry& e) {
        return e.transfer_name == transferName;
    });
    if (entry == it->second.end() || entry->commands.empty()) {
        Registry::hooks()->debug("[PostHook] No {} commands for '{}'", name, transferName);
        return JobResult::ok({{"skipped", true}});
    }

    const auto voyage = ctx_->store->voyageContext();
    const auto& payload = job.payload;
    const std::map<std::string, std::string> values = {
        {"cruiseID", payloadString(payload, "cruiseID", voyage.cruise_id)},
        {"loweringID", payloadString(payload, "loweringID", voyage.lowering_id.value_or(""))},
        {"collectionSystemTransferID", def ? std::to_string(def->id) : ""},
        {"collectionSystemTransferName", transferName},
        {"newFiles", joinedFiles(payload, "new")},
        {"updatedFiles", joinedFiles(payload, "updated")}
    };

    const auto blob = commandBlob(*ctx_, job).dump();
    auto ran = nlohmann::json::array();

    for (const auto& command : entry->commands) {
        std::vector<std::string> argv;
        argv.reserve(command.command.size() + 1);
        for (const auto& arg : command.command) argv.push_back(replaceHookTokens(arg, values));
        argv.push_back(blob);
        const auto label = command.name.empty() ? argv.front() : command.name;

        Registry::hooks()->info("[PostHook] {} for '{}': running {}", name, transferName, label);
        try {
            const auto res = ctx_->runner->run(argv);
            if (res.ok()) Registry::hooks()->info("[PostHook] {} exited 0", label);
            else Registry::hooks()->warn("[PostHook] {} exited with code {}{}", label, res.exit_code, res.signaled ? " (signalled)" : "");
            ran.push_back({{"name", command.name}, {"exit_code", res.exit_code}});
        } catch (const std::exception& e) {
            Registry::hooks()->error("[PostHook] Could not run {}: {}", label, e.what());
            ran.push_back({{"name", command.name}, {"error", e.what()}});
        }
    }

    return JobResult::ok({{"commands", ran}});
}
