#ifndef SIGNAL_GUARD_HPP
#define SIGNAL_GUARD_HPP
#include <filesystem>
#include <optional>
#include <signal.h>
#include <sys/types.h>
#include "lock_utils.hpp"

namespace procutil {

/**
 * @brief Scoped handling of SIGINT, SIGQUIT, SIGTERM and SIGHUP for a run
 *        that holds an @ref InstanceLock.
 *
 * The handlers are installed by the constructor, before any lock file
 * exists, and the lock is taken through acquire() so the guard owns it.
 * While a guard is alive the first termination signal is recorded and
 * forwarded to the registered child process; the run notices it through
 * throw_if_cancelled() and unwinds. A second signal before the run has
 * finished unwinding removes the lock file straight from the handler and
 * exits with 128+signal.
 *
 * The destructor releases the lock while the handlers are still in place,
 * then restores the previous dispositions and clears the pending signal.
 * Only one guard may be active at a time.
 */
class SignalGuard {
  public:
    SignalGuard();
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

    /**
     * @brief Take the instance lock at @p path.
     *
     * The handled signals are blocked while the lock file is created and
     * registered with the handler, so no signal can leave it behind.
     * Check the returned lock's state; a busy or failed lock is kept only
     * for its diagnostics.
     *
     * @throws std::logic_error when a lock was already acquired.
     */
    InstanceLock& acquire(const std::filesystem::path& path);

    /** @return Signal number received so far, or 0. */
    static int pending_signal();

    /** @brief Throw SyncCancelled when a termination signal was received. */
    static void throw_if_cancelled();

    /**
     * @brief Set the process that should receive forwarded signals.
     *
     * Pass `-1` once the child has been reaped. If a signal is already
     * pending when @p pid is registered it is forwarded immediately.
     */
    static void set_child(pid_t pid);

    /** @brief Fill @p set with the signals handled by the guard. */
    static void handled_signals(sigset_t& set);

  private:
    struct sigaction previous_[4];
    bool installed_ = false;
    std::optional<InstanceLock> lock_;
};

} // namespace procutil

#endif // SIGNAL_GUARD_HPP
