#include "signal_handler.h"

#include <fcntl.h>
#include <pthread.h>
#include <unistd.h>

#include <cerrno>
#include <mutex>

#include "debug.h"

namespace {

volatile sig_atomic_t g_pending_signal = 0;

// Self-pipe: every handled signal writes one byte so a poll(2) on the read end cannot miss
// a signal that lands between a flag check and the wait that follows it. Lives for the
// whole process.
int g_wake_pipe[2] = {-1, -1};
std::once_flag g_wake_pipe_once;

void open_wake_pipe() {
    int fds[2];
    if (pipe(fds) == -1) {
        debug_msg("wake pipe creation failed: errno %d", errno);
        return;
    }
    for (int fd : fds) {
        (void)fcntl(fd, F_SETFD, FD_CLOEXEC);
        (void)fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    }
    g_wake_pipe[0] = fds[0];
    g_wake_pipe[1] = fds[1];
}

void notify_wake_pipe() {
    if (g_wake_pipe[1] < 0) {
        return;
    }
    int saved_errno = errno;
    const char byte = 1;
    // A full pipe already holds a pending wakeup.
    ssize_t written = write(g_wake_pipe[1], &byte, 1);
    (void)written;
    errno = saved_errno;
}

struct SignalName {
    int signal;
    const char* name;
};

const SignalName kSignalNames[] = {
    {SIGHUP, "HUP"},   {SIGINT, "INT"},   {SIGQUIT, "QUIT"}, {SIGKILL, "KILL"},
    {SIGUSR1, "USR1"}, {SIGUSR2, "USR2"}, {SIGPIPE, "PIPE"}, {SIGALRM, "ALRM"},
    {SIGTERM, "TERM"}, {SIGCHLD, "CHLD"}, {SIGCONT, "CONT"}, {SIGSTOP, "STOP"},
    {SIGTSTP, "TSTP"}, {SIGTTIN, "TTIN"}, {SIGTTOU, "TTOU"},
};

}  // namespace

SignalMask::SignalMask(int signum) : active(false) {
    sigset_t mask{};
    sigemptyset(&mask);
    sigaddset(&mask, signum);
    if (pthread_sigmask(SIG_BLOCK, &mask, &old_mask) == 0) {
        active = true;
    }
}

SignalMask::SignalMask(const std::vector<int>& signals) : active(false) {
    if (signals.empty())
        return;
    sigset_t mask{};
    sigemptyset(&mask);
    for (int sig : signals) {
        sigaddset(&mask, sig);
    }
    if (pthread_sigmask(SIG_BLOCK, &mask, &old_mask) == 0) {
        active = true;
    }
}

SignalMask::~SignalMask() {
    if (active) {
        pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    }
}

void reset_child_signals() {
    (void)signal(SIGINT, SIG_DFL);
    (void)signal(SIGQUIT, SIG_DFL);
    (void)signal(SIGTSTP, SIG_DFL);
    (void)signal(SIGTTIN, SIG_DFL);
    (void)signal(SIGTTOU, SIG_DFL);
    (void)signal(SIGCHLD, SIG_DFL);
    (void)signal(SIGTERM, SIG_DFL);
    (void)signal(SIGHUP, SIG_DFL);
    (void)signal(SIGPIPE, SIG_DFL);

    sigset_t set{};
    sigemptyset(&set);
    sigprocmask(SIG_SETMASK, &set, nullptr);
}

SignalHandler::SignalHandler() {
    g_pending_signal = 0;
    std::call_once(g_wake_pipe_once, open_wake_pipe);

    struct sigaction sa{};
    sa.sa_handler = &SignalHandler::signal_handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: blocking calls on the control thread return EINTR and see the signal.
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &old_sigint_);
    sigaction(SIGTERM, &sa, &old_sigterm_);

    // Child exits only wake foreground waits; interrupted syscalls elsewhere are restarted.
    struct sigaction chld{};
    chld.sa_handler = &SignalHandler::child_handler;
    sigemptyset(&chld.sa_mask);
    chld.sa_flags = SA_RESTART | SA_NOCLDSTOP;
    sigaction(SIGCHLD, &chld, &old_sigchld_);

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &old_sigpipe_);

    debug_msg("signal handlers installed");
}

SignalHandler::~SignalHandler() {
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGCHLD, &old_sigchld_, nullptr);
    sigaction(SIGPIPE, &old_sigpipe_, nullptr);
}

void SignalHandler::signal_handler(int signum) {
    g_pending_signal = signum;
    notify_wake_pipe();
}

void SignalHandler::child_handler(int) {
    notify_wake_pipe();
}

int SignalHandler::wake_fd() {
    return g_wake_pipe[0];
}

void SignalHandler::drain_wakeups() {
    if (g_wake_pipe[0] < 0) {
        return;
    }
    char buffer[64];
    while (read(g_wake_pipe[0], buffer, sizeof(buffer)) > 0) {
    }
}

bool SignalHandler::has_pending_signal() {
    return g_pending_signal != 0;
}

int SignalHandler::take_pending_signal() {
    int signum = g_pending_signal;
    g_pending_signal = 0;
    return signum;
}

const char* SignalHandler::get_signal_name(int signum) {
    for (const auto& entry : kSignalNames) {
        if (entry.signal == signum) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

const std::vector<int>& SignalHandler::worker_blocked_signals() {
    static const std::vector<int> signals = {SIGINT, SIGTERM, SIGCHLD};
    return signals;
}
