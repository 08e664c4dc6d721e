#include "lock_utils.hpp"
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace procutil {

fs::path default_lock_path(const std::string& exec_path, const fs::path& dir) {
    std::string name = fs::path(exec_path).stem().string();
    if (name.empty())
        name = "remotesync";
    fs::path base = dir;
    if (base.empty()) {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec)
            base = "/tmp";
    }
    return base / (name + ".pid");
}

namespace {

// True when @p path still names the inode behind @p fd. A previous holder
// unlinks the file on release, so a lock won on an unlinked inode is void.
bool same_file(int fd, const fs::path& path) {
    struct stat by_fd {};
    struct stat by_path {};
    if (fstat(fd, &by_fd) != 0 || stat(path.c_str(), &by_path) != 0)
        return false;
    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

} // namespace

InstanceLock::InstanceLock(const fs::path& path) : path_(path) {
    for (int attempt = 0; attempt < 8; ++attempt) {
        UniqueFd fd(open(path_.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644));
        if (!fd) {
            err_ = "Cannot open lock file " + path_.string() + ": " + errno_message(errno);
            state_ = LockState::FAILED;
            return;
        }
        int rc;
        do {
            rc = flock(fd.get(), LOCK_EX | LOCK_NB);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            if (errno == EWOULDBLOCK) {
                err_ = path_.string() + " is locked by another instance";
                state_ = LockState::BUSY;
            } else {
                err_ = "Cannot lock " + path_.string() + ": " + errno_message(errno);
                state_ = LockState::FAILED;
            }
            return;
        }
        if (!same_file(fd.get(), path_))
            continue;
        char buf[32];
        int len = std::snprintf(buf, sizeof(buf), "%ld\n", static_cast<long>(getpid()));
        // The PID is informational only; failing to record it keeps the lock.
        if (ftruncate(fd.get(), 0) != 0 ||
            !write_all(fd.get(), std::string(buf, static_cast<size_t>(len))))
            log_warning("Could not record PID in " + path_.string());
        fd_ = fd.release();
        state_ = LockState::HELD;
        return;
    }
    err_ = "Lock file " + path_.string() + " keeps being replaced";
    state_ = LockState::FAILED;
}

InstanceLock::~InstanceLock() { release(); }

void InstanceLock::release() {
    if (fd_ < 0)
        return;
    if (!released_.exchange(true))
        unlink(path_.c_str());
    // flock is dropped together with the descriptor
    close(fd_);
    fd_ = -1;
}

} // namespace procutil
