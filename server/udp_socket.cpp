// server/udp_socket.cpp
#include "udp_socket.hpp"
#include "errors.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_fd(std::exchange(other.socket_fd, -1)), port(std::exchange(other.port, 0)) {}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_fd = std::exchange(other.socket_fd, -1);
        port = std::exchange(other.port, 0);
    }
    return *this;
}

void UdpSocket::bind(const std::string& host, uint16_t requested_port) {
    close();

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* result = nullptr;
    const char* node = host.empty() ? nullptr : host.c_str();
    int rc = getaddrinfo(node, std::to_string(requested_port).c_str(), &hints, &result);
    if (rc != 0) {
        throw BindError("Cannot resolve bind address " + host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("socket() failed: ") + std::strerror(errno);
            continue;
        }

        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = std::string("bind() failed: ") + std::strerror(errno);
            ::close(fd);
            continue;
        }

        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_error = std::string("fcntl() failed: ") + std::strerror(errno);
            ::close(fd);
            continue;
        }

        struct sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
            port = ntohs(bound.sin_port);
        } else {
            port = requested_port;
        }
        socket_fd = fd;
        break;
    }
    freeaddrinfo(result);

    if (socket_fd == -1) {
        throw BindError("Bind failed on " + host + ":" + std::to_string(requested_port) + " (" + last_error + ")");
    }
}

ssize_t UdpSocket::receive(uint8_t* buffer, size_t capacity) {
    while (true) {
        // MSG_TRUNC reports the real datagram length even when it does not fit
        ssize_t n = recv(socket_fd, buffer, capacity, MSG_TRUNC);
        if (n >= 0) return n;
        if (errno == EINTR) continue;
        return -1;
    }
}

void UdpSocket::close() {
    if (socket_fd != -1) {
        ::close(socket_fd);
        socket_fd = -1;
    }
    port = 0;
}
