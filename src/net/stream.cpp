#include "anp/net/stream.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "anp/net/errors.hpp"

namespace anp::net {

namespace {

/*
    writing to a socket whose peer has gone raises SIGPIPE, which terminates the process by
    default. ignore it once at startup; send() then fails with EPIPE. MSG_NOSIGNAL on every
    send covers the same case per call.
*/
struct SigpipeIgnorer {
    SigpipeIgnorer() {
        signal(SIGPIPE, SIG_IGN);
    }
};

static SigpipeIgnorer sigpipe_ignorer;

}  // namespace

SocketStream::SocketStream(int fd, std::string peer) : fd_(fd), peer_(std::move(peer)) {
    if (peer_.empty() && fd >= 0) {
        peer_ = peer_address(fd);
    }
}

SocketStream::~SocketStream() {
    close();
}

std::size_t SocketStream::read_some(uint8_t* buf, std::size_t len) {
    int fd = fd_.load();
    if (fd < 0) {
        throw ConnectionError("read on closed connection");
    }
    while (true) {
        ssize_t n = recv(fd, buf, len, 0);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;  // retry
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw ConnectionError("receive from " + peer_ + " timed out");
        }
        throw ConnectionError("receive from " + peer_ + " failed: " + std::string(strerror(errno)));
    }
}

std::size_t SocketStream::write_some(const uint8_t* buf, std::size_t len) {
    int fd = fd_.load();
    if (fd < 0) {
        throw ConnectionError("write on closed connection");
    }
    while (true) {
        ssize_t n = send(fd, buf, len, MSG_NOSIGNAL);
        if (n > 0) {
            return static_cast<std::size_t>(n);
        }
        if (n < 0 && errno == EINTR) {
            continue;  // retry
        }
        if (n == 0) {
            throw ConnectionError("send to " + peer_ + " made no progress");
        }
        throw ConnectionError("send to " + peer_ + " failed: " + std::string(strerror(errno)));
    }
}

void SocketStream::shutdown() {
    std::lock_guard lock(mutex_);
    int fd = fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);  // can fail if the peer already reset, but we ignore
    }
}

void SocketStream::close() {
    std::lock_guard lock(mutex_);
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

std::string peer_address(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0 ||
        addr.sin_family != AF_INET) {
        return "fd=" + std::to_string(fd);
    }
    char host[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host));
    return std::string(host) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace anp::net
