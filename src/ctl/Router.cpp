#include "ctl/Router.hpp"
#include "runtime/Engine.hpp"
#include "log/Registry.hpp"

#include <limits>

using namespace ovdm::ctl;
using namespace ovdm::types;
using namespace ovdm::log;
using nlohmann::json;

namespace {

unsigned int requireId(const json& request) {
    if (!request.contains("id") || !request["id"].is_number_integer())
        throw std::invalid_argument("Request is missing a numeric 'id'");
    const auto id = request["id"].get<long long>();
    if (id < 0 || id > static_cast<long long>(std::numeric_limits<unsigned int>::max()))
        throw std::invalid_argument("Request 'id' is out of range");
    return static_cast<unsigned int>(id);
}

json toJson(const ovdm::state::Snapshot& s) {
    json j = {{"id", s.id}, {"status", to_string(s.status)}, {"lastResult", s.last_result}};
    j["pid"] = s.pid ? json(*s.pid) : json(nullptr);
    return j;
}

}

Router::Router(std::shared_ptr<runtime::Engine> engine) : engine_(std::move(engine)) {
    if (!engine_) throw std::invalid_argument("Router requires an engine");
}

json Router::handle(const json& request) const {
    std::string cmd;
    try {
        if (!request.is_object() || !request.contains("cmd")) throw std::invalid_argument("Request has no 'cmd'");
        if (!request["cmd"].is_string()) throw std::invalid_argument("Request 'cmd' must be a string");
        cmd = request["cmd"].get<std::string>();
        if (cmd.empty()) throw std::invalid_argument("Request has no 'cmd'");
        auto reply = dispatch(cmd, request);
        reply["ok"] = true;
        return reply;
    } catch (const std::exception& e) {
        Registry::ctl()->warn("[Router] {} failed: {}", cmd.empty() ? "<none>" : cmd, e.what());
        return {{"ok", false}, {"error", e.what()}};
    }
}

json Router::dispatch(const std::string& cmd, const json& request) const {
    if (cmd == "test") {
        const auto result = engine_->test(requireId(request));
        return {{"passed", result.success}, {"result", result.data}};
    }

    if (cmd == "run") {
        const auto result = engine_->run(requireId(request));
        json reply = {{"status", sched::to_string(result.status)}, {"queued", result.queued()}};
        if (!result.handle.empty()) reply["handle"] = result.handle;
        if (!result.reason.empty()) reply["reason"] = result.reason;
        return reply;
    }

    if (cmd == "stop") return {{"handle", engine_->stop(requireId(request))}};

    if (cmd == "snapshot") return {{"snapshot", toJson(engine_->snapshot(requireId(request)))}};

    if (cmd == "statuses") {
        const auto category = categoryFromString(request.value("category", ""));
        json list = json::array();
        for (const auto& s : engine_->statusesOf(category))
            list.push_back({{"id", s.id}, {"name", s.name}, {"status", to_string(s.status)}});
        return {{"statuses", list}};
    }

    if (cmd == "definitionChanged") return {{"handle", engine_->definitionChanged(requireId(request))}};

    throw std::invalid_argument("Unknown command: " + cmd);
}
