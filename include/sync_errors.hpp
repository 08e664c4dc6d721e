#ifndef SYNC_ERRORS_HPP
#define SYNC_ERRORS_HPP
#include <stdexcept>
#include <string>

/** Process exit statuses reported by remotesync. */
enum ExitCode : int {
    RC_OK = 0,
    RC_ALREADY_RUNNING = 1,
    RC_USAGE = 2,
    RC_IO = 3,
    RC_TRANSFER = 4,
    RC_VERIFY = 5,
    RC_SIGNAL_BASE = 128
};

/**
 * @brief Base class for every fatal condition of a sync run.
 *
 * Each subclass maps to one exit status so the entry point can translate
 * an exception into the process result without inspecting its type.
 */
class SyncError : public std::runtime_error {
  public:
    SyncError(const std::string& what, int code) : std::runtime_error(what), code_(code) {}
    int exit_code() const noexcept { return code_; }

  private:
    int code_;
};

/** Another process holds the instance lock. */
class AlreadyRunning : public SyncError {
  public:
    explicit AlreadyRunning(const std::string& what) : SyncError(what, RC_ALREADY_RUNNING) {}
};

/** Wrong number or shape of command line parameters. */
class UsageError : public SyncError {
  public:
    explicit UsageError(const std::string& what) : SyncError(what, RC_USAGE) {}
};

/** A local filesystem operation failed. */
class IoError : public SyncError {
  public:
    explicit IoError(const std::string& what) : SyncError(what, RC_IO) {}
};

/** An external transfer client failed or could not be started. */
class TransferFailed : public SyncError {
  public:
    TransferFailed(const std::string& what, int status)
        : SyncError(what, RC_TRANSFER), status_(status) {}
    /** Exit status of the client, or -1 when it was killed by a signal. */
    int tool_status() const noexcept { return status_; }

  private:
    int status_;
};

/** The local copy did not match the remote listing. */
class VerificationFailed : public SyncError {
  public:
    explicit VerificationFailed(const std::string& what) : SyncError(what, RC_VERIFY) {}
};

/** The run was interrupted by a termination signal. */
class SyncCancelled : public SyncError {
  public:
    explicit SyncCancelled(int sig)
        : SyncError("Interrupted by signal " + std::to_string(sig), RC_SIGNAL_BASE + sig),
          signal_(sig) {}
    int signal_number() const noexcept { return signal_; }

  private:
    int signal_;
};

#endif // SYNC_ERRORS_HPP
