#include "types/Report.hpp"
#include "types/Plan.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace ovdm::types;

void TestReport::pass(std::string name) {
    parts.push_back({std::move(name), ReportPart::Result::Pass, ""});
}

void TestReport::fail(std::string name, std::string reason) {
    parts.push_back({std::move(name), ReportPart::Result::Fail, std::move(reason)});
}

void TestReport::warn(std::string name, std::string reason) {
    parts.push_back({std::move(name), ReportPart::Result::Warn, std::move(reason)});
}

bool TestReport::passed() const {
    return std::ranges::none_of(parts, [](const ReportPart& p) { return p.result == ReportPart::Result::Fail; });
}

std::string TestReport::failureReason() const {
    const auto it = std::ranges::find_if(parts, [](const ReportPart& p) { return p.result == ReportPart::Result::Fail; });
    if (it == parts.end()) return "";
    return it->reason.empty() ? it->name + " failed" : it->reason;
}

std::vector<std::string> Plan::paths() const {
    std::vector<std::string> out;
    out.reserve(include.size());
    for (const auto& f : include) out.push_back(f.rel_path);
    return out;
}

void ovdm::types::to_json(nlohmann::json& j, const FileEntry& f) {
    j = {{"path", f.rel_path}, {"size", f.size}, {"mtime", f.mtime}, {"is_dir", f.is_dir}};
}

void ovdm::types::to_json(nlohmann::json& j, const Plan& p) {
    j = {
        {"include", p.paths()},
        {"exclude", p.excluded},
        {"deferred", p.deferred},
        {"total_bytes", p.total_bytes}
    };
}

void ovdm::types::to_json(nlohmann::json& j, const ReportPart& p) {
    j = {{"partName", p.name}, {"result", to_string(p.result)}};
    if (!p.reason.empty()) j["reason"] = p.reason;
}

void ovdm::types::to_json(nlohmann::json& j, const TestReport& r) {
    j = {{"parts", r.parts}, {"verdict", r.passed() ? "Pass" : "Fail"}};
    if (!r.passed()) j["reason"] = r.failureReason();
}

void ovdm::types::to_json(nlohmann::json& j, const FileFailure& f) {
    j = {{"path", f.path}, {"reason", f.reason}};
}

void ovdm::types::to_json(nlohmann::json& j, const CopyResult& r) {
    j = {
        {"status", to_string(r.status)},
        {"bytes_moved", r.bytes_moved},
        {"file_count", r.file_count},
        {"failures", r.failures},
        {"new", r.new_files},
        {"updated", r.updated_files},
        {"deleted", r.deleted_files}
    };
    if (!r.error.empty()) j["error"] = r.error;
}

std::string ovdm::types::to_string(const ReportPart::Result r) {
    switch (r) {
        case ReportPart::Result::Pass: return "Pass";
        case ReportPart::Result::Fail: return "Fail";
        case ReportPart::Result::Warn: return "Warn";
        default: throw std::invalid_argument("Unknown report result");
    }
}

std::string ovdm::types::to_string(const CopyResult::Status s) {
    switch (s) {
        case CopyResult::Status::Success: return "success";
        case CopyResult::Status::Partial: return "partial";
        case CopyResult::Status::Fatal: return "fatal";
        case CopyResult::Status::Interrupted: return "interrupted";
        default: throw std::invalid_argument("Unknown copy status");
    }
}
