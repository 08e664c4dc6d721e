#ifndef PROCESS_UTILS_HPP
#define PROCESS_UTILS_HPP
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace procutil {

/** Outcome of an external command. */
struct ProcessResult {
    int exit_code = -1;   ///< Exit status, or -1 when the child was killed.
    int term_signal = 0;  ///< Signal that terminated the child, if any.
    std::string output;   ///< Captured stdout when requested.
    bool ok() const { return exit_code == 0; }
};

struct ProcessOptions {
    bool capture_stdout = false;
    /** Append the child's stderr to this file when non-empty. */
    std::filesystem::path stderr_log;
    /** Wait this long after forwarding a termination signal before SIGKILL. */
    std::chrono::milliseconds kill_grace{2000};
};

/**
 * @brief Run @p argv (argv[0] resolved through PATH) and wait for it.
 *
 * stdin is redirected from /dev/null. The child is registered with the
 * active SignalGuard so termination signals reach it; if it is still alive
 * @ref ProcessOptions::kill_grace after such a signal it is killed.
 * An executable that cannot be started yields exit code 127.
 *
 * @throws std::system_error when fork or pipe creation fails.
 */
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts = {});

/**
 * @brief Quote @p arg for a POSIX shell. Plain words are returned unchanged.
 */
std::string shell_quote(const std::string& arg);

/**
 * @brief Render a command line for display, quoting where needed.
 */
std::string format_command(const std::vector<std::string>& argv);

} // namespace procutil

#endif // PROCESS_UTILS_HPP
