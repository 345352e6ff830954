#include "protocols/Adapter.hpp"
#include "protocols/LocalAdapter.hpp"
#include "protocols/NfsAdapter.hpp"
#include "protocols/RsyncAdapter.hpp"
#include "protocols/RsyncCommand.hpp"
#include "protocols/SmbAdapter.hpp"
#include "protocols/SshAdapter.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <map>

namespace fs = std::filesystem;

using namespace ovdm::protocols;
using namespace ovdm::types;
using namespace ovdm::log;

Target Target::from(const filter::ResolvedTransfer& transfer) {
    const auto& def = transfer.definition;
    Target t;
    t.id = def.id;
    t.name = def.name;
    t.type = def.transfer_type;
    t.credentials = def.credentials;
    t.direction = transfer.direction();
    t.source_dir = transfer.source_dir;
    t.dest_dir = transfer.dest_dir;
    t.remove_source_files = def.remove_source_files;
    t.skip_empty_dirs = def.skip_empty_dirs;
    t.skip_empty_files = def.skip_empty_files;
    t.sync_to_dest = def.sync_to_dest && !def.isPull();
    t.local_dir_is_mount_point = def.local_dir_is_mount_point;
    return t;
}

Adapter::Adapter(Target target, std::shared_ptr<process::Runner> runner)
    : target_(std::move(target)), runner_(std::move(runner)) {
    if (!runner_) throw std::invalid_argument("Adapter requires a process runner");
}

std::vector<FileEntry> Adapter::enumerateLocal(const fs::path& root) {
    std::vector<FileEntry> out;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) throw std::runtime_error("Source directory not found: " + root.string());

    const auto opts = fs::directory_options::skip_permission_denied;
    for (auto it = fs::recursive_directory_iterator(root, opts, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        const auto& entry = *it;
        if (entry.is_symlink(ec)) continue;

        const bool dir = entry.is_directory(ec);
        if (dir && !fs::is_empty(entry.path(), ec)) continue;
        if (!dir && !entry.is_regular_file(ec)) continue;

        const auto ftime = fs::last_write_time(entry.path(), ec);
        if (ec) continue;
        out.push_back({
            fs::relative(entry.path(), root).generic_string(),
            dir ? 0 : entry.file_size(ec),
            util::fileTimeToTimeT(ftime),
            dir
        });
    }

    if (ec) throw std::runtime_error("Unable to enumerate " + root.string() + ": " + ec.message());
    return out;
}

CopyResult Adapter::runRsync(const RsyncCommand& cmd, const Plan& plan, const SpawnObserver& onSpawn,
                             const std::map<std::string, std::string>& env) const {
    process::RunOptions opts;
    opts.env = env;
    opts.on_spawn = onSpawn;

    Registry::transfer()->debug("[{}] {}", target_.name, process::describe(cmd.argv()));
    const auto res = runner_->run(cmd.argv(), opts);

    RsyncReport report;
    for (const auto& line : res.output) report.consume(line);

    std::map<std::string, std::uintmax_t> sizes;
    for (const auto& f : plan.include) sizes[f.rel_path] = f.size;

    CopyResult out;
    out.exit_code = res.exit_code;
    out.status = classifyRsyncExit(res);
    out.new_files = std::move(report.new_files);
    out.updated_files = std::move(report.updated_files);
    out.deleted_files = std::move(report.deleted_files);

    for (const auto* list : {&out.new_files, &out.updated_files}) {
        for (const auto& path : *list) {
            ++out.file_count;
            if (const auto it = sizes.find(path); it != sizes.end()) out.bytes_moved += it->second;
        }
    }

    // Failure paths come back absolute; report them relative to the source like everything else.
    auto prefix = cmd.source();
    if (const auto colon = prefix.find(':'); !prefix.starts_with("/") && colon != std::string::npos)
        prefix = prefix.substr(colon + 1);
    if (prefix.starts_with("//")) prefix = prefix.substr(prefix.find('/', 2));
    for (auto& failure : report.failures) {
        auto path = failure.path;
        if (!prefix.empty() && path.starts_with(prefix)) path = path.substr(prefix.size());
        if (path.starts_with("./")) path = path.substr(2);
        out.failures.push_back({path, failure.reason});
    }

    if (cmd.deletesExtraneous() && out.ok()) mirrorDeletions(cmd, opts, out);

    if (out.status == CopyResult::Status::Fatal)
        out.error = report.last_error.empty() ? "rsync exited with code " + std::to_string(res.exit_code) : report.last_error;
    else if (out.status == CopyResult::Status::Interrupted && out.error.empty())
        out.error = res.signaled ? "rsync terminated by signal " + std::to_string(res.term_signal) : "rsync interrupted";

    Registry::transfer()->debug("[{}] rsync {}: {} new, {} updated, {} failed", target_.name, to_string(out.status),
                                out.new_files.size(), out.updated_files.size(), out.failures.size());
    return out;
}

void Adapter::mirrorDeletions(const RsyncCommand& cmd, const process::RunOptions& opts, CopyResult& out) const {
    const auto argv = cmd.deletionArgv();
    Registry::transfer()->debug("[{}] {}", target_.name, process::describe(argv));
    const auto res = runner_->run(argv, opts);

    RsyncReport report;
    for (const auto& line : res.output) report.consume(line);
    out.deleted_files.insert(out.deleted_files.end(), report.deleted_files.begin(), report.deleted_files.end());
    if (!report.deleted_files.empty())
        Registry::transfer()->info("[{}] Removed {} file(s) no longer at the source", target_.name, report.deleted_files.size());

    switch (classifyRsyncExit(res)) {
        case CopyResult::Status::Success:
            break;
        case CopyResult::Status::Interrupted:
            out.status = CopyResult::Status::Interrupted;
            out.error = res.signaled ? "rsync terminated by signal " + std::to_string(res.term_signal) : "rsync interrupted";
            break;
        default: {
            const auto detail = report.last_error.empty() ? "rsync exited with code " + std::to_string(res.exit_code)
                                                          : report.last_error;
            Registry::transfer()->warn("[{}] Unable to remove extraneous files at {}: {}", target_.name, cmd.dest(), detail);
            out.status = CopyResult::Status::Partial;
            out.failures.push_back({cmd.dest(), "Unable to remove files no longer at the source: " + detail});
            break;
        }
    }
}

fs::path Adapter::writeFileList(const Plan& plan, const fs::path& dir) {
    std::string content;
    for (const auto& f : plan.include) {
        content += f.rel_path;
        if (f.is_dir) content += '/';
        content += '\n';
    }
    const auto path = dir / "files-from";
    util::writeFile(path, content);
    return path;
}

void Adapter::failRemaining(TestReport& report, const std::vector<std::string>& parts, const std::string& reason) {
    for (const auto& part : parts) report.fail(part, reason);
}

ovdm::process::Result Adapter::runQuiet(const std::vector<std::string>& argv,
                                        const std::map<std::string, std::string>& env) const {
    process::RunOptions opts;
    opts.env = env;
    return runner_->run(argv, opts);
}

DefaultAdapterFactory::DefaultAdapterFactory(std::shared_ptr<process::Runner> runner) : runner_(std::move(runner)) {}

std::unique_ptr<Adapter> DefaultAdapterFactory::create(const filter::ResolvedTransfer& transfer) {
    auto target = Target::from(transfer);
    switch (target.type) {
        case TransferType::LocalDirectory: return std::make_unique<LocalAdapter>(std::move(target), runner_);
        case TransferType::RsyncServer: return std::make_unique<RsyncAdapter>(std::move(target), runner_);
        case TransferType::SmbShare: return std::make_unique<SmbAdapter>(std::move(target), runner_);
        case TransferType::SshServer: return std::make_unique<SshAdapter>(std::move(target), runner_);
        case TransferType::NfsShare: return std::make_unique<NfsAdapter>(std::move(target), runner_);
        default: throw filter::ConfigurationError("No adapter for transfer type of " + target.name);
    }
}
