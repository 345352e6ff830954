#pragma once

#include "process/Handle.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ovdm::process {

struct Result {
    int exit_code{-1};
    bool signaled{false};
    int term_signal{0};
    std::vector<std::string> output{};

    [[nodiscard]] bool ok() const { return !signaled && exit_code == 0; }
};

struct RunOptions {
    std::function<void(const std::string&)> on_line{};
    std::function<void(const std::shared_ptr<Handle>&)> on_spawn{};
    std::map<std::string, std::string> env{};
    std::string cwd{};
};

// Executes an argv vector with stdout and stderr merged, blocking until exit.
class Runner {
public:
    virtual ~Runner() = default;

    virtual Result run(const std::vector<std::string>& argv, const RunOptions& opts) = 0;

    Result run(const std::vector<std::string>& argv) { return run(argv, RunOptions{}); }
};

class PosixRunner final : public Runner {
public:
    using Runner::run;

    Result run(const std::vector<std::string>& argv, const RunOptions& opts) override;
};

std::string describe(const std::vector<std::string>& argv);

}
