#include "sync_runner.hpp"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>
#include <system_error>
#include <unistd.h>
#include <vector>
#include "lock_utils.hpp"
#include "logger.hpp"
#include "process_utils.hpp"
#include "signal_guard.hpp"
#include "sync_errors.hpp"
#include "system_utils.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;
using procutil::SignalGuard;

namespace {

fs::path batch_dir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : dir;
}

/** sftp batch script in a private temporary file, removed on destruction. */
class BatchFile {
  public:
    explicit BatchFile(const std::string& content) {
        std::string tmpl = (batch_dir() / "remotesync-batch-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        procutil::UniqueFd fd(mkostemp(buf.data(), O_CLOEXEC));
        if (!fd)
            throw IoError("Cannot create sftp batch file: " + procutil::errno_message(errno));
        path_ = buf.data();
        if (!procutil::write_all(fd.get(), content)) {
            int err = errno;
            unlink(path_.c_str());
            throw IoError("Cannot write sftp batch file: " + procutil::errno_message(err));
        }
    }
    ~BatchFile() { unlink(path_.c_str()); }

    BatchFile(const BatchFile&) = delete;
    BatchFile& operator=(const BatchFile&) = delete;

    const fs::path& path() const { return path_; }

  private:
    fs::path path_;
};

procutil::ProcessResult run_tool(const std::vector<std::string>& argv,
                                 const procutil::ProcessOptions& popts, const std::string& what) {
    log_debug("Running " + procutil::format_command(argv));
    procutil::ProcessResult res;
    try {
        res = procutil::run_process(argv, popts);
    } catch (const std::system_error& e) {
        throw TransferFailed(what + " could not be started: " + e.what(), -1);
    }
    // a child that died from the forwarded signal is a cancellation, not a failure
    SignalGuard::throw_if_cancelled();
    if (res.ok())
        return res;
    if (res.term_signal != 0)
        throw TransferFailed(what + " was killed by signal " + std::to_string(res.term_signal),
                             -1);
    if (res.exit_code == 127)
        throw TransferFailed(what + " could not be executed (" + argv[0] + ")", 127);
    throw TransferFailed(what + " failed with exit status " + std::to_string(res.exit_code),
                         res.exit_code);
}

void say(const Options& opts, const std::string& msg) {
    if (!opts.silent)
        std::cout << msg << std::endl;
}

} // namespace

transfer::Endpoint endpoint_from_options(const Options& opts) {
    const auto& pos = opts.positional;
    transfer::Endpoint ep;
    ep.port = opts.port;
    if (opts.mode == transfer::Mode::SFTP) {
        if (pos.size() != 4)
            throw UsageError("sftp mode expects 4 parameters: <mount_point> <remote_dir> "
                             "<local_dir> <ssh_key>, got " +
                             std::to_string(pos.size()));
        ep.mount_point = pos[0];
        ep.remote_dir = pos[1];
        ep.local_dir = pos[2];
        ep.ssh_key = pos[3];
        if (opts.purge && transfer::is_root_dir(ep.remote_dir))
            throw UsageError("Refusing to purge remote directory '" + ep.remote_dir + "'");
    } else {
        if (pos.size() != 3)
            throw UsageError("rsync mode expects 3 parameters: <mount_point> <local_dir> "
                             "<ssh_key>, got " +
                             std::to_string(pos.size()));
        ep.mount_point = pos[0];
        ep.local_dir = pos[1];
        ep.ssh_key = pos[2];
    }
    for (const auto& p : pos) {
        if (p.empty())
            throw UsageError("Empty positional parameter");
    }
    return ep;
}

fs::path resolve_lock_path(const Options& opts) {
    if (!opts.lock_file.empty())
        return opts.lock_file;
    return procutil::default_lock_path(opts.exec_path, opts.lock_dir);
}

std::string resolve_sentinel_path(const Options& opts, const transfer::Endpoint& ep) {
    if (!opts.sentinel_path.empty())
        return opts.sentinel_path;
    return transfer::default_sentinel_path(ep.remote_dir);
}

fs::path create_marker(const fs::path& local_dir, const std::string& name) {
    std::error_code ec;
    if (!fs::exists(local_dir, ec))
        throw IoError("Local directory " + local_dir.string() + " does not exist");
    if (!fs::is_directory(local_dir, ec))
        throw IoError(local_dir.string() + " is not a directory");
    fs::path marker = local_dir / name;
    procutil::UniqueFd fd(open(marker.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd)
        throw IoError("Cannot create " + marker.string() + ": " +
                      procutil::errno_message(errno));
    return marker;
}

void remove_marker(const fs::path& marker) {
    if (unlink(marker.c_str()) != 0 && errno != ENOENT)
        throw IoError("Cannot remove " + marker.string() + ": " +
                      procutil::errno_message(errno));
}

void verify_local_copy(const std::map<std::string, std::uintmax_t>& remote,
                       const fs::path& local_dir) {
    size_t bad = 0;
    for (const auto& [rel, size] : remote) {
        fs::path local = local_dir / rel;
        std::error_code ec;
        if (!fs::is_regular_file(local, ec)) {
            log_warning("Missing after transfer", {{"file", rel}});
            ++bad;
            continue;
        }
        std::uintmax_t have = fs::file_size(local, ec);
        if (ec || have != size) {
            log_warning("Size mismatch after transfer", {{"file", rel},
                                                         {"remote", std::to_string(size)},
                                                         {"local", std::to_string(have)}});
            ++bad;
        }
    }
    if (bad > 0)
        throw VerificationFailed(std::to_string(bad) + " of " + std::to_string(remote.size()) +
                                 " files are missing or differ in " + local_dir.string());
    log_debug("Verified local copy", {{"files", std::to_string(remote.size())}});
}

void print_plan(const Options& opts, std::ostream& os) {
    const transfer::Endpoint ep = endpoint_from_options(opts);
    os << "# lock file: " << resolve_lock_path(opts).string() << "\n";
    os << "# marker: " << (ep.local_dir / opts.marker_name).string() << "\n";
    if (opts.mode == transfer::Mode::RSYNC) {
        os << procutil::format_command(transfer::rsync_command(opts.clients, ep, opts.cipher))
           << "\n";
        return;
    }
    const std::string batch = transfer::sftp_batch(ep.remote_dir, ep.local_dir);
    size_t start = 0;
    while (start < batch.size()) {
        size_t end = batch.find('\n', start);
        os << "# batch: " << batch.substr(start, end - start) << "\n";
        start = end == std::string::npos ? batch.size() : end + 1;
    }
    const fs::path batch_file = batch_dir() / "remotesync-batch-XXXXXX";
    os << procutil::format_command(transfer::sftp_command(opts.clients, ep, batch_file)) << "\n";
    if (!opts.purge)
        return;
    if (opts.verify)
        os << procutil::format_command(transfer::ssh_command(
                  opts.clients, ep, transfer::listing_script(ep.remote_dir)))
           << "\n";
    const std::string script = transfer::purge_script(
        ep.remote_dir, resolve_sentinel_path(opts, ep), opts.sentinel_value);
    os << procutil::format_command(transfer::ssh_command(opts.clients, ep, script)) << "\n";
}

void run_sync(const Options& opts) {
    const transfer::Endpoint ep = endpoint_from_options(opts);
    const fs::path lock_path = resolve_lock_path(opts);
    const std::string tool = fs::path(opts.exec_path).filename().string();

    // handlers first, so the lock file never exists without them
    SignalGuard guard;
    const procutil::InstanceLock& lock = guard.acquire(lock_path);
    if (lock.state() == procutil::LockState::BUSY)
        throw AlreadyRunning((tool.empty() ? "remotesync" : tool) +
                             " is already running. Aborting");
    if (!lock.held())
        throw IoError(lock.error());
    log_info("Lock acquired", {{"lock", lock_path.string()}});
    SignalGuard::throw_if_cancelled();

    const auto start = std::chrono::steady_clock::now();
    const fs::path marker = create_marker(ep.local_dir, opts.marker_name);
    SignalGuard::throw_if_cancelled();

    procutil::ProcessOptions popts;
    popts.stderr_log = opts.tool_log;
    popts.kill_grace = opts.kill_grace;

    const std::map<std::string, std::string> where{{"mode", transfer::mode_name(opts.mode)},
                                                   {"source", ep.mount_point},
                                                   {"target", ep.local_dir.string()}};
    if (opts.mode == transfer::Mode::RSYNC) {
        say(opts, "Moving " + ep.mount_point + " to " + ep.local_dir.string());
        log_info("Starting transfer", where);
        run_tool(transfer::rsync_command(opts.clients, ep, opts.cipher), popts, "rsync");
    } else {
        say(opts, "Fetching " + ep.mount_point + ":" + ep.remote_dir + " into " +
                      ep.local_dir.string());
        log_info("Starting transfer", where);
        {
            BatchFile batch(transfer::sftp_batch(ep.remote_dir, ep.local_dir));
            run_tool(transfer::sftp_command(opts.clients, ep, batch.path()), popts, "sftp");
        }
        SignalGuard::throw_if_cancelled();

        if (opts.purge) {
            if (opts.verify) {
                procutil::ProcessOptions lopts = popts;
                lopts.capture_stdout = true;
                auto res = run_tool(transfer::ssh_command(opts.clients, ep,
                                                          transfer::listing_script(ep.remote_dir)),
                                    lopts, "Remote listing");
                verify_local_copy(transfer::parse_listing(res.output), ep.local_dir);
                SignalGuard::throw_if_cancelled();
            } else {
                log_warning("Purging remote directory without verification",
                            {{"remote_dir", ep.remote_dir}});
            }
            const std::string sentinel = resolve_sentinel_path(opts, ep);
            say(opts, "Purging " + ep.mount_point + ":" + ep.remote_dir);
            run_tool(transfer::ssh_command(
                         opts.clients, ep,
                         transfer::purge_script(ep.remote_dir, sentinel, opts.sentinel_value)),
                     popts, "Remote purge");
            log_info("Remote directory purged", {{"remote_dir", ep.remote_dir},
                                                 {"sentinel", sentinel}});
        }
    }
    SignalGuard::throw_if_cancelled();

    remove_marker(marker);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log_info("Sync finished", {{"mode", transfer::mode_name(opts.mode)},
                               {"duration", format_duration_short(elapsed)}});
    say(opts, "Sync finished in " + format_duration_short(elapsed));
}
