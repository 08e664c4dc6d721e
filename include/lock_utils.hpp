#ifndef LOCK_UTILS_HPP
#define LOCK_UTILS_HPP
#include <atomic>
#include <filesystem>
#include <string>

namespace procutil {

/**
 * @brief Derive the lock file location from the tool's own name.
 *
 * The name is the basename of @p exec_path with its extension stripped, so
 * `/usr/local/bin/remotesync` and `./remotesync.sh` both map to
 * `<dir>/remotesync.pid`.
 *
 * @param exec_path Path the tool was invoked as (usually `argv[0]`).
 * @param dir       Directory holding the lock; the system temporary
 *                  directory when empty.
 */
std::filesystem::path default_lock_path(const std::string& exec_path,
                                        const std::filesystem::path& dir = {});

enum class LockState { HELD, BUSY, FAILED };

/**
 * @brief RAII guard around an exclusive, non-blocking `flock()` on a file.
 *
 * The constructor opens (creating if needed) the lock file and tries to
 * lock it without waiting. On success the current PID is written into the
 * file for operators. Releasing the lock removes the file. The descriptor is
 * close-on-exec so spawned transfer clients never inherit the lock.
 */
class InstanceLock {
  public:
    explicit InstanceLock(const std::filesystem::path& path);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    bool held() const { return state_ == LockState::HELD; }
    LockState state() const { return state_; }
    const std::filesystem::path& path() const { return path_; }
    /** Reason the lock could not be taken; empty when held. */
    const std::string& error() const { return err_; }

    /**
     * @brief Remove the lock file and drop the lock. Idempotent.
     */
    void release();

    /**
     * @brief Flag flipped by the first release; shared with the signal guard
     *        so the lock file is removed exactly once.
     */
    std::atomic<bool>& released_flag() { return released_; }

  private:
    std::filesystem::path path_;
    int fd_ = -1;
    LockState state_ = LockState::FAILED;
    std::string err_;
    std::atomic<bool> released_{false};
};

} // namespace procutil

#endif // LOCK_UTILS_HPP
