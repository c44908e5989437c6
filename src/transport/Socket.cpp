#include "transport/Socket.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <utility>

namespace shairmeta::transport {

namespace {
    std::string errno_text(int err) {
        return std::strerror(err);
    }

    bool set_non_blocking(int fd, bool enabled) {
        const int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0) {
            return false;
        }
        const int wanted = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
        return fcntl(fd, F_SETFL, wanted) == 0;
    }

    using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

    AddrInfoPtr resolve(const std::string& host, uint16_t port, bool passive) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        if (passive) hints.ai_flags = AI_PASSIVE;

        addrinfo* result = nullptr;
        const char* node = host.empty() ? nullptr : host.c_str();
        int rc = getaddrinfo(node, std::to_string(port).c_str(), &hints, &result);
        if (rc != 0) {
            throw std::runtime_error("cannot resolve '" + host + "': " + gai_strerror(rc));
        }
        return AddrInfoPtr(result, freeaddrinfo);
    }
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Socket Socket::connect_tcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    auto addresses = resolve(host, port, false);
    std::string last_error = "no usable address";

    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock.is_open()) {
            last_error = errno_text(errno);
            continue;
        }

        // Non-blocking connect so an unreachable broker cannot stall shutdown
        if (!set_non_blocking(sock.fd(), true)) {
            last_error = errno_text(errno);
            continue;
        }

        if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                last_error = errno_text(errno);
                continue;
            }

            pollfd pfd{sock.fd(), POLLOUT, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (ready <= 0) {
                last_error = ready == 0 ? "connection timed out" : errno_text(errno);
                continue;
            }

            int err = 0;
            socklen_t len = sizeof(err);
            if (getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0) {
                last_error = errno_text(err != 0 ? err : errno);
                continue;
            }
        }

        if (!set_non_blocking(sock.fd(), false)) {
            last_error = errno_text(errno);
            continue;
        }
        return sock;
    }

    throw std::runtime_error("cannot connect to " + host + ":" + std::to_string(port) + ": " + last_error);
}

Socket Socket::listen_tcp(const std::string& host, uint16_t port, int backlog) {
    auto addresses = resolve(host, port, true);
    std::string last_error = "no usable address";

    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock.is_open()) {
            last_error = errno_text(errno);
            continue;
        }

        int reuse = 1;
        if (setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
            last_error = errno_text(errno);
            continue;
        }

        if (::bind(sock.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
            last_error = "bind: " + errno_text(errno);
            continue;
        }

        if (::listen(sock.fd(), backlog) != 0) {
            last_error = "listen: " + errno_text(errno);
            continue;
        }

        // Accept loop polls; accept itself must never block
        if (!set_non_blocking(sock.fd(), true)) {
            last_error = errno_text(errno);
            continue;
        }
        return sock;
    }

    throw std::runtime_error("cannot listen on " + host + ":" + std::to_string(port) + ": " + last_error);
}

std::optional<Socket> Socket::accept_connection() {
    int fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
        switch (errno) {
            case EAGAIN:
#if EWOULDBLOCK != EAGAIN
            case EWOULDBLOCK:
#endif
            case EINTR:
            case ECONNABORTED:
            // Errors of the pending connection, not of the listener (see accept(2))
            case EPROTO:
            case ENETDOWN:
            case ENOPROTOOPT:
            case EHOSTDOWN:
            case ENONET:
            case EHOSTUNREACH:
            case EOPNOTSUPP:
            case ENETUNREACH:
                return std::nullopt;
            default:
                break;
        }
        throw std::runtime_error("accept: " + errno_text(errno));
    }
    return Socket(fd);
}

bool Socket::wait_readable(std::chrono::milliseconds timeout) const {
    pollfd pfd{fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) return false;
        throw std::runtime_error("poll: " + errno_text(errno));
    }
    return ready > 0;
}

size_t Socket::read_some(char* buffer, size_t length) {
    while (true) {
        ssize_t n = ::recv(fd_, buffer, length, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) continue;
        throw std::runtime_error("recv: " + errno_text(errno));
    }
}

void Socket::send_all(const void* data, size_t length) {
    const auto* bytes = static_cast<const char*>(data);
    size_t sent = 0;
    while (sent < length) {
        ssize_t n = ::send(fd_, bytes + sent, length - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("send: " + errno_text(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

void Socket::set_send_timeout(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        throw std::runtime_error("setsockopt(SO_SNDTIMEO): " + errno_text(errno));
    }
}

uint16_t Socket::local_port() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

std::string Socket::peer_name() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return "unknown";
    }

    char host[INET6_ADDRSTRLEN] = {};
    uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        auto* in = reinterpret_cast<sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "unknown";
    }
    return std::string(host) + ":" + std::to_string(port);
}

}  // namespace shairmeta::transport
