#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace shairmeta::transport {

/// Owning wrapper around a TCP socket descriptor.
/// Setup failures throw std::runtime_error; the descriptor is closed on destruction.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    // Resolve `host` and connect, giving up after `timeout`
    static Socket connect_tcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    // Bound and listening; port 0 picks an ephemeral port (see local_port())
    static Socket listen_tcp(const std::string& host, uint16_t port, int backlog = 64);

    // nullopt when nothing usable is pending. Throws std::runtime_error when
    // the process is out of descriptors or kernel memory (EMFILE, ENOBUFS).
    std::optional<Socket> accept_connection();

    // true when data (or EOF/error) is ready, false on timeout or signal
    bool wait_readable(std::chrono::milliseconds timeout) const;

    // Bytes read, 0 on orderly EOF. Throws on socket error.
    size_t read_some(char* buffer, size_t length);

    void send_all(const void* data, size_t length);
    void send_all(const std::string& data) { send_all(data.data(), data.size()); }

    void set_send_timeout(std::chrono::milliseconds timeout);

    [[nodiscard]] uint16_t local_port() const;
    [[nodiscard]] std::string peer_name() const;

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] int fd() const { return fd_; }
    void close();

private:
    int fd_ = -1;
};

}  // namespace shairmeta::transport
