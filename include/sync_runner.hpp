#ifndef SYNC_RUNNER_HPP
#define SYNC_RUNNER_HPP
#include <cstdint>
#include <filesystem>
#include <map>
#include <ostream>
#include <string>
#include "options.hpp"
#include "transfer_commands.hpp"

/**
 * @brief Build the transfer endpoint from the positional parameters.
 *
 * SFTP mode takes `mount_point remote_dir local_dir ssh_key`, rsync mode
 * `mount_point local_dir ssh_key`.
 *
 * @throws UsageError when the count does not match the mode, or when the
 *         SFTP remote directory is the filesystem root.
 */
transfer::Endpoint endpoint_from_options(const Options& opts);

/** Lock file for this run: `--lock-file`, or derived from the tool name. */
std::filesystem::path resolve_lock_path(const Options& opts);

/** Remote sentinel for the purge: `--sentinel-path` or `<remote_dir>/.test`. */
std::string resolve_sentinel_path(const Options& opts, const transfer::Endpoint& ep);

/**
 * @brief Create the in-progress marker @p name inside @p local_dir.
 *
 * @return Path of the marker.
 * @throws IoError when @p local_dir is missing, not a directory or not
 *         writable.
 */
std::filesystem::path create_marker(const std::filesystem::path& local_dir,
                                    const std::string& name);

/** @throws IoError when the marker cannot be removed. */
void remove_marker(const std::filesystem::path& marker);

/**
 * @brief Check that every file of a remote listing exists below
 *        @p local_dir with the same size.
 *
 * @throws VerificationFailed listing how many files are missing or differ.
 */
void verify_local_copy(const std::map<std::string, std::uintmax_t>& remote,
                       const std::filesystem::path& local_dir);

/**
 * @brief Print the commands a run would execute, one per line.
 *
 * Nothing is locked, created or executed.
 *
 * @throws UsageError like endpoint_from_options().
 */
void print_plan(const Options& opts, std::ostream& os);

/**
 * @brief Perform one guarded sync run.
 *
 * Takes the instance lock, marks @ref Options::positional's local directory
 * as in progress, runs the transfer (and in SFTP mode the verification and
 * purge), then clears the marker. The lock is released on every path; the
 * marker is left behind whenever the run does not complete.
 *
 * @throws AlreadyRunning, UsageError, IoError, TransferFailed,
 *         VerificationFailed or SyncCancelled.
 */
void run_sync(const Options& opts);

#endif // SYNC_RUNNER_HPP
