#include "signal_guard.hpp"
#include <atomic>
#include <cstring>
#include <limits.h>
#include <pthread.h>
#include <stdexcept>
#include <unistd.h>
#include "sync_errors.hpp"

namespace procutil {

namespace {

constexpr int kSignals[4] = {SIGINT, SIGQUIT, SIGTERM, SIGHUP};

std::atomic<int> g_pending{0};
std::atomic<pid_t> g_child{-1};
std::atomic<std::atomic<bool>*> g_released{nullptr};
std::atomic<bool> g_active{false};
char g_lock_path[PATH_MAX];

extern "C" void on_termination_signal(int sig) {
    int expected = 0;
    if (g_pending.compare_exchange_strong(expected, sig)) {
        pid_t child = g_child.load();
        if (child > 0)
            kill(child, sig);
        return;
    }
    std::atomic<bool>* released = g_released.load();
    if (released && !released->exchange(true))
        unlink(g_lock_path);
    _exit(RC_SIGNAL_BASE + sig);
}

/** Blocks the handled signals in the calling thread for its lifetime. */
class SignalBlock {
  public:
    SignalBlock() {
        sigset_t set;
        SignalGuard::handled_signals(set);
        pthread_sigmask(SIG_BLOCK, &set, &old_);
    }
    ~SignalBlock() { pthread_sigmask(SIG_SETMASK, &old_, nullptr); }

    SignalBlock(const SignalBlock&) = delete;
    SignalBlock& operator=(const SignalBlock&) = delete;

  private:
    sigset_t old_;
};

} // namespace

SignalGuard::SignalGuard() {
    if (g_active.exchange(true))
        throw std::logic_error("A SignalGuard is already active");
    g_lock_path[0] = '\0';
    g_released.store(nullptr);
    g_pending.store(0);
    g_child.store(-1);

    struct sigaction sa {};
    sa.sa_handler = on_termination_signal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: blocking calls in the run should see EINTR.
    sa.sa_flags = 0;
    for (int i = 0; i < 4; ++i)
        sigaction(kSignals[i], &sa, &previous_[i]);
    installed_ = true;
}

SignalGuard::~SignalGuard() {
    {
        // A signal arriving here is delivered to our handler once unblocked,
        // after the lock file is already gone.
        SignalBlock block;
        if (lock_)
            lock_->release();
        g_released.store(nullptr);
        lock_.reset();
    }
    if (installed_) {
        for (int i = 0; i < 4; ++i)
            sigaction(kSignals[i], &previous_[i], nullptr);
    }
    g_child.store(-1);
    g_pending.store(0);
    g_active.store(false);
}

InstanceLock& SignalGuard::acquire(const std::filesystem::path& path) {
    if (lock_)
        throw std::logic_error("SignalGuard already holds a lock");
    SignalBlock block;
    lock_.emplace(path);
    if (lock_->held()) {
        std::string p = lock_->path().string();
        std::strncpy(g_lock_path, p.c_str(), sizeof(g_lock_path) - 1);
        g_lock_path[sizeof(g_lock_path) - 1] = '\0';
        g_released.store(&lock_->released_flag());
    }
    return *lock_;
}

int SignalGuard::pending_signal() { return g_pending.load(); }

void SignalGuard::throw_if_cancelled() {
    int sig = g_pending.load();
    if (sig != 0)
        throw SyncCancelled(sig);
}

void SignalGuard::set_child(pid_t pid) {
    g_child.store(pid);
    int sig = g_pending.load();
    if (pid > 0 && sig != 0)
        kill(pid, sig);
}

void SignalGuard::handled_signals(sigset_t& set) {
    sigemptyset(&set);
    for (int s : kSignals)
        sigaddset(&set, s);
}

} // namespace procutil
