#include "tcp_connector.hpp"
#include "interrupt_signal.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace {
    std::string errno_text(int err) {
        return std::strerror(err);
    }

    // getaddrinfo() result list, freed on scope exit
    struct AddrList {
        addrinfo* head{nullptr};
        ~AddrList() { if (head) ::freeaddrinfo(head); }
    };
} // anonymous namespace

// ---- TCPConnector impl ----

TCPConnector::TCPConnector(const std::string& host_, int port_)
    : host(host_), port(port_) {}

TCPConnector::~TCPConnector() {
    close_connection();
}

Result TCPConnector::open_connection() {
    if (sockfd >= 0) return Result::fail("already connected");

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    AddrList addrs;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs.head);
    if (rc != 0) {
        return Result::fail(rc == EAI_SYSTEM ? errno_text(errno) : ::gai_strerror(rc));
    }

    int last_err = 0;
    for (addrinfo* ai = addrs.head; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_err = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            sockfd = fd;
            return Result::ok();
        }
        last_err = errno;
        ::close(fd);
    }
    return Result::fail(last_err ? errno_text(last_err) : "no usable address for " + host);
}

Result TCPConnector::send_all(const std::string& data) {
    if (sockfd < 0) return Result::fail("not connected");

    // poll() covers the interrupt pipe too; send() itself never blocks
    size_t off = 0;
    while (off < data.size()) {
        if (interrupt_requested()) return Result::interrupted();

        pollfd fds[2]{};
        fds[0].fd = sockfd;
        fds[0].events = POLLOUT;
        fds[1].fd = interrupt_fd();   // negative before install: ignored
        fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return Result::fail(errno_text(errno));
        }
        if (fds[1].revents & POLLIN) return Result::interrupted();

        ssize_t n = ::send(sockfd, data.data() + off, data.size() - off,
                           MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return Result::fail(errno_text(errno));
        }
        off += static_cast<size_t>(n);
    }
    return Result::ok();
}

void TCPConnector::close_connection() {
    if (sockfd >= 0) {
        ::close(sockfd);
        sockfd = -1;
    }
}
