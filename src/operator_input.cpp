#include "operator_input.hpp"
#include "interrupt_signal.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace {
    constexpr size_t READ_CHUNK = 4096;
}

OperatorInput::OperatorInput(int fd_) : fd(fd_) {}

Result OperatorInput::read_line(std::string& line) {
    for (;;) {
        if (interrupt_requested()) return Result::interrupted();

        size_t nl = pending.find('\n');
        if (nl != std::string::npos) {
            line.assign(pending, 0, nl);
            pending.erase(0, nl + 1);
            return Result::ok();
        }
        if (eof) {
            if (pending.empty()) return Result::end_of_input();
            // last line had no newline
            line.swap(pending);
            pending.clear();
            return Result::ok();
        }

        pollfd fds[2]{};
        fds[0].fd = fd;
        fds[0].events = POLLIN;
        fds[1].fd = interrupt_fd();   // poll() ignores a negative fd
        fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return Result::fail(std::strerror(errno));
        }
        if (fds[1].revents & POLLIN) return Result::interrupted();
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            char buf[READ_CHUNK];
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                return Result::fail(std::strerror(errno));
            }
            if (n == 0) eof = true;
            else pending.append(buf, static_cast<size_t>(n));
        } else if (fds[0].revents & POLLNVAL) {
            return Result::fail("input descriptor is not open");
        }
    }
}
