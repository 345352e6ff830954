#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ovdm::types {

struct ReportPart {
    enum class Result { Pass, Fail, Warn };

    std::string name{};
    Result result{Result::Pass};
    std::string reason{};
};

// Ordered sub-checks of a connection test. The verdict fails as soon as any part fails.
struct TestReport {
    std::vector<ReportPart> parts{};

    void pass(std::string name);
    void fail(std::string name, std::string reason);
    void warn(std::string name, std::string reason);

    [[nodiscard]] bool passed() const;
    [[nodiscard]] std::string failureReason() const;
};

struct FileFailure {
    std::string path{};
    std::string reason{};
};

struct CopyResult {
    enum class Status { Success, Partial, Fatal, Interrupted };

    Status status{Status::Success};
    std::uintmax_t bytes_moved{0};
    std::size_t file_count{0};
    std::vector<FileFailure> failures{};
    std::vector<std::string> new_files{}, updated_files{}, deleted_files{};
    std::string error{};
    int exit_code{0};

    [[nodiscard]] bool ok() const { return status == Status::Success || status == Status::Partial; }
};

void to_json(nlohmann::json& j, const ReportPart& p);
void to_json(nlohmann::json& j, const TestReport& r);
void to_json(nlohmann::json& j, const FileFailure& f);
void to_json(nlohmann::json& j, const CopyResult& r);

std::string to_string(ReportPart::Result r);
std::string to_string(CopyResult::Status s);

}
