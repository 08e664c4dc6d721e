#include "process_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

#include "logger.hpp"
#include "signal_guard.hpp"
#include "system_utils.hpp"

namespace procutil {

namespace {

void reset_child_signals(const sigset_t& handled) {
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    for (int s = 1; s < NSIG; ++s) {
        if (sigismember(&handled, s) == 1)
            sigaction(s, &dfl, nullptr);
    }
}

void read_available(int fd, std::string& out, bool& eof) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        // 0 is EOF; EAGAIN means drained for now, anything else ends the stream
        eof = n == 0 || errno != EAGAIN;
        return;
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    if (argv.empty())
        throw std::invalid_argument("run_process: empty command");

    UniqueFd out_r;
    UniqueFd out_w;
    if (opts.capture_stdout) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0)
            throw std::system_error(errno, std::generic_category(), "pipe");
        out_r.reset(fds[0]);
        out_w.reset(fds[1]);
        fcntl(out_r.get(), F_SETFL, fcntl(out_r.get(), F_GETFL) | O_NONBLOCK);
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv)
        cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    const std::string err_log = opts.stderr_log.string();

    sigset_t handled;
    sigset_t old_mask;
    SignalGuard::handled_signals(handled);
    pthread_sigmask(SIG_BLOCK, &handled, &old_mask);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
        throw std::system_error(err, std::generic_category(), "fork");
    }
    if (pid == 0) {
        reset_child_signals(handled);
        pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        if (out_w)
            dup2(out_w.get(), STDOUT_FILENO);
        if (!err_log.empty()) {
            int fd = open(err_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    SignalGuard::set_child(pid);
    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    out_w.reset();
    log_debug("Started " + argv[0], {{"pid", std::to_string(pid)}});

    ProcessResult result;
    int status = 0;
    bool killed = false;
    bool cancelling = false;
    std::chrono::steady_clock::time_point cancel_start;
    while (true) {
        if (out_r) {
            pollfd pfd{out_r.get(), POLLIN, 0};
            if (poll(&pfd, 1, 100) > 0) {
                bool eof = false;
                read_available(out_r.get(), result.output, eof);
                if (eof)
                    out_r.reset();
            }
        } else {
            poll(nullptr, 0, 100);
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid)
            break;
        if (w < 0 && errno != EINTR) {
            int err = errno;
            SignalGuard::set_child(-1);
            throw std::system_error(err, std::generic_category(), "waitpid");
        }

        if (!killed && SignalGuard::pending_signal() != 0) {
            auto now = std::chrono::steady_clock::now();
            if (!cancelling) {
                cancelling = true;
                cancel_start = now;
            } else if (now - cancel_start >= opts.kill_grace) {
                log_warning(argv[0] + " ignored termination, killing it",
                            {{"pid", std::to_string(pid)}});
                kill(pid, SIGKILL);
                killed = true;
            }
        }
    }
    SignalGuard::set_child(-1);

    if (out_r) {
        bool eof = false;
        read_available(out_r.get(), result.output, eof);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.term_signal = WTERMSIG(status);
    }
    log_debug(argv[0] + " finished", {{"status", std::to_string(result.exit_code)},
                                      {"signal", std::to_string(result.term_signal)}});
    return result;
}

std::string shell_quote(const std::string& arg) {
    static const char* safe = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"
                              "_@%+=:,./-";
    if (!arg.empty() && arg.find_first_not_of(safe) == std::string::npos)
        return arg;
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0)
            out += ' ';
        out += shell_quote(argv[i]);
    }
    return out;
}

} // namespace procutil
