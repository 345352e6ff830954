#include "process/Runner.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char** environ;

using namespace ovdm::process;
using namespace ovdm::log;

bool PosixHandle::terminate() {
    if (::kill(-pgid_, SIGTERM) == 0) {
        Registry::proc()->debug("[Process] Sent SIGTERM to process group {}", pgid_);
        return true;
    }
    if (errno == ESRCH) {
        Registry::proc()->debug("[Process] Process group {} already exited", pgid_);
        return false;
    }
    throw std::system_error(errno, std::generic_category(), fmt::format("kill(-{})", pgid_));
}

std::string ovdm::process::describe(const std::vector<std::string>& argv) {
    return fmt::format("{}", fmt::join(argv, " "));
}

namespace {

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string_view entry(*e);
        const auto key = entry.substr(0, entry.find('='));
        if (!extra.contains(std::string(key))) env.emplace_back(entry);
    }
    for (const auto& [k, v] : extra) env.push_back(k + "=" + v);
    return env;
}

std::vector<char*> toCArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

}

Result PosixRunner::run(const std::vector<std::string>& argv, const RunOptions& opts) {
    if (argv.empty()) throw std::invalid_argument("Cannot run an empty command");

    Registry::proc()->debug("[Process] exec: {}", describe(argv));

    // Everything the child needs is built before fork so the child only calls async-signal-safe functions.
    auto args = argv;
    auto cargs = toCArray(args);
    auto envStrings = buildEnvironment(opts.env);
    auto cenv = toCArray(envStrings);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) == -1) throw std::system_error(errno, std::generic_category(), "pipe2");

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::dup2(pipefd[1], STDERR_FILENO);
        if (!opts.cwd.empty() && ::chdir(opts.cwd.c_str()) != 0) ::_exit(126);
        ::execvpe(cargs[0], cargs.data(), cenv.data());
        ::_exit(127); // exec failed
    }

    // Both sides call setpgid to close the race with an early kill.
    ::setpgid(pid, pid);
    ::close(pipefd[1]);

    const auto handle = std::make_shared<PosixHandle>(pid);
    if (opts.on_spawn) opts.on_spawn(handle);

    Result result;
    std::string pending;
    char buf[4096];

    auto emit = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (opts.on_line) opts.on_line(line);
        result.output.push_back(std::move(line));
    };

    while (true) {
        const ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        pending.append(buf, static_cast<size_t>(n));

        // progress meters rewrite their line with '\r'; treat it as a line break
        size_t start = 0;
        for (size_t i = 0; i < pending.size(); ++i) {
            if (pending[i] == '\n' || pending[i] == '\r') {
                if (i > start) emit(pending.substr(start, i - start));
                start = i + 1;
            }
        }
        pending.erase(0, start);
    }
    if (!pending.empty()) emit(pending);
    ::close(pipefd[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::system_error(errno, std::generic_category(), "waitpid");
    }

    if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.term_signal = WTERMSIG(status);
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    Registry::proc()->debug("[Process] {} finished (exit={}, signal={})", argv.front(), result.exit_code, result.term_signal);
    return result;
}
