#pragma once

#include "concurrency/TaskKind.hpp"

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ovdm::concurrency {

enum class Mode { Background, Synchronous };

struct Job {
    TaskKind kind{};
    std::optional<unsigned int> definition_id{};
    Mode mode{Mode::Background};
    std::string handle{};
    nlohmann::json payload = nlohmann::json::object();
};

struct JobResult {
    bool success{false};
    nlohmann::json data = nlohmann::json::object();

    static JobResult ok(nlohmann::json data = nlohmann::json::object()) { return {true, std::move(data)}; }
    static JobResult failed(const std::string& reason, nlohmann::json data = nlohmann::json::object()) {
        data["reason"] = reason;
        return {false, std::move(data)};
    }
};

std::string to_string(Mode mode);

}
