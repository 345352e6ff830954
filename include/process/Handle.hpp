#pragma once

#include <sys/types.h>

namespace ovdm::process {

// A running external process that can be asked to go away.
class Handle {
public:
    virtual ~Handle() = default;

    [[nodiscard]] virtual int pid() const = 0;

    // Returns false when the process had already exited.
    virtual bool terminate() = 0;
};

// Signals a whole process group so that children (ssh under rsync, etc.) go down too.
class PosixHandle final : public Handle {
public:
    explicit PosixHandle(pid_t pgid) : pgid_(pgid) {}

    [[nodiscard]] int pid() const override { return pgid_; }

    bool terminate() override;

private:
    pid_t pgid_;
};

}
