#pragma once

#include "filter/Engine.hpp"
#include "process/Runner.hpp"
#include "types/Plan.hpp"
#include "types/Report.hpp"
#include "types/TransferDefinition.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ovdm::protocols {

class RsyncCommand;

struct BandwidthLimit {
    std::optional<unsigned int> kbps{};

    static BandwidthLimit unlimited() { return {}; }
    static BandwidthLimit of(const unsigned int kbps) { return kbps == 0 ? unlimited() : BandwidthLimit{kbps}; }

    [[nodiscard]] bool isUnlimited() const { return !kbps.has_value(); }
};

// Where a transfer reads and writes, with every path already resolved. Filter strings never get here.
struct Target {
    unsigned int id{};
    std::string name{};
    types::TransferType type{types::TransferType::LocalDirectory};
    types::Credentials credentials{};
    filter::Direction direction{filter::Direction::Pull};
    std::string source_dir{}, dest_dir{};

    bool remove_source_files{false};
    bool skip_empty_dirs{true};
    bool skip_empty_files{true};
    bool sync_to_dest{false};
    bool local_dir_is_mount_point{false};

    static Target from(const filter::ResolvedTransfer& transfer);

    [[nodiscard]] bool pull() const { return direction == filter::Direction::Pull; }

    // The side of the transfer that lives on the far end of the protocol.
    [[nodiscard]] const std::string& remoteDir() const { return pull() ? source_dir : dest_dir; }
};

using SpawnObserver = std::function<void(const std::shared_ptr<process::Handle>&)>;

class Adapter {
public:
    Adapter(Target target, std::shared_ptr<process::Runner> runner);
    virtual ~Adapter() = default;

    Adapter(const Adapter&) = delete;
    Adapter& operator=(const Adapter&) = delete;

    // Ordered sub-checks; never throws for an unreachable endpoint.
    virtual types::TestReport test() = 0;

    // Candidates under the source directory, relative to it.
    virtual std::vector<types::FileEntry> enumerate() = 0;

    // Moves exactly the plan's include set. onSpawn sees every external process before it does any work.
    virtual types::CopyResult copy(const types::Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) = 0;

    [[nodiscard]] const Target& target() const { return target_; }

protected:
    Target target_;
    std::shared_ptr<process::Runner> runner_;

    // Regular files plus empty directories; symlinks are not followed.
    static std::vector<types::FileEntry> enumerateLocal(const std::filesystem::path& root);

    // Runs a prepared rsync and folds its itemized output into a copy result.
    types::CopyResult runRsync(const RsyncCommand& cmd, const types::Plan& plan, const SpawnObserver& onSpawn,
                               const std::map<std::string, std::string>& env = {}) const;

    // Destination files with no source counterpart are removed and reported as deleted.
    void mirrorDeletions(const RsyncCommand& cmd, const process::RunOptions& opts, types::CopyResult& out) const;

    // Writes the plan's include set as an rsync --files-from list inside dir.
    static std::filesystem::path writeFileList(const types::Plan& plan, const std::filesystem::path& dir);

    // After the first failing check the checks that depend on it fail with the same reason.
    static void failRemaining(types::TestReport& report, const std::vector<std::string>& parts,
                              const std::string& reason);

    process::Result runQuiet(const std::vector<std::string>& argv,
                             const std::map<std::string, std::string>& env = {}) const;
};

class AdapterFactory {
public:
    virtual ~AdapterFactory() = default;

    // Throws filter::ConfigurationError for a transfer type with no adapter.
    virtual std::unique_ptr<Adapter> create(const filter::ResolvedTransfer& transfer) = 0;
};

class DefaultAdapterFactory final : public AdapterFactory {
public:
    explicit DefaultAdapterFactory(std::shared_ptr<process::Runner> runner);

    std::unique_ptr<Adapter> create(const filter::ResolvedTransfer& transfer) override;

private:
    std::shared_ptr<process::Runner> runner_;
};

}
