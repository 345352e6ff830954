#pragma once

#include <memory>
#include <nlohmann/json.hpp>

namespace ovdm::runtime { class Engine; }

namespace ovdm::ctl {

// Maps one admin request object onto the engine and shapes the reply.
// Requests: {"cmd": test|run|stop|snapshot|statuses|definitionChanged, "id"?: n, "category"?: name}.
class Router {
public:
    explicit Router(std::shared_ptr<runtime::Engine> engine);

    // Never throws; failures come back as {"ok": false, "error": ...}.
    nlohmann::json handle(const nlohmann::json& request) const;

private:
    std::shared_ptr<runtime::Engine> engine_;

    nlohmann::json dispatch(const std::string& cmd, const nlohmann::json& request) const;
};

}
