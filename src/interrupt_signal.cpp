#include "interrupt_signal.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace {
    volatile sig_atomic_t g_interrupted = 0;
    int g_pipe[2] = {-1, -1};

    void on_sigint(int) {
        int saved = errno;
        g_interrupted = 1;
        char b = 1;
        // pipe full means a wakeup is already pending
        ssize_t rc = ::write(g_pipe[1], &b, 1);
        (void)rc;
        errno = saved;
    }

    bool make_nonblocking(int fd) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0) return false;
        if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;
        return ::fcntl(fd, F_SETFD, FD_CLOEXEC) == 0;
    }
} // anonymous namespace

Result install_interrupt_handler() {
    if (g_pipe[0] >= 0) return Result::ok();

    int fds[2];
    if (::pipe(fds) < 0) return Result::fail(std::strerror(errno));
    if (!make_nonblocking(fds[0]) || !make_nonblocking(fds[1])) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return Result::fail(std::strerror(err));
    }
    g_pipe[0] = fds[0];
    g_pipe[1] = fds[1];

    // no SA_RESTART: blocked send()/poll() must return EINTR
    struct sigaction sa{};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (::sigaction(SIGINT, &sa, nullptr) < 0) return Result::fail(std::strerror(errno));
    return Result::ok();
}

bool interrupt_requested() {
    return g_interrupted != 0;
}

int interrupt_fd() {
    return g_pipe[0];
}

void reset_interrupt() {
    g_interrupted = 0;
    if (g_pipe[0] < 0) return;
    char buf[64];
    while (::read(g_pipe[0], buf, sizeof(buf)) > 0) {
    }
}
