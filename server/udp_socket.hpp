// server/udp_socket.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

// Owns one datagram socket. Closed on destruction.
class UdpSocket {
private:
    int socket_fd{-1};
    uint16_t port{0};

public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    // Resolves host (IPv4) and binds. Port 0 picks an ephemeral port.
    // Throws BindError.
    void bind(const std::string& host, uint16_t port);

    // Reads one datagram without blocking. Returns the datagram's full length,
    // which may exceed `capacity` when it was truncated. Returns -1 with errno
    // set on failure, EAGAIN when nothing is queued.
    ssize_t receive(uint8_t* buffer, size_t capacity);

    void close();

    int fd() const { return socket_fd; }
    bool is_open() const { return socket_fd != -1; }
    uint16_t local_port() const { return port; }
};
