// ============================================================
// socket.cpp -- UdpSocket implementation
// ============================================================

#include "socket.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

static sockaddr_in make_addr(const std::string& ip, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
        return addr;
    }
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    return addr;
}

std::string UdpPeer::to_string() const {
    if (!valid) return "unknown";
    char buf[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
    }
    return "unknown";
}

UdpSocket::UdpSocket() {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void UdpSocket::connect(const std::string& ip, u16 port) {
    sockaddr_in addr = make_addr(ip, port);
    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("connect() failed: " + socket_error_str(last_socket_error()));
    }
}

void UdpSocket::bind(const std::string& ip, u16 port) {
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
    sockaddr_in addr = make_addr(ip, port);
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
}

void UdpSocket::send(const void* buf, size_t len) {
#ifdef _WIN32
    int sent = ::send(fd_, static_cast<const char*>(buf), (int)len, 0);
#else
    ssize_t sent = ::send(fd_, buf, len, 0);
#endif
    if (sent < 0) {
        int err = last_socket_error();
#ifndef _WIN32
        // Pending port-unreachable from an earlier datagram; this one is lost
        if (err == ECONNREFUSED) return;
#endif
        throw std::runtime_error("send() failed: " + socket_error_str(err));
    }
    if ((size_t)sent != len) {
        throw std::runtime_error("send() truncated datagram");
    }
}

void UdpSocket::send_to(const void* buf, size_t len, const UdpPeer& peer) {
    if (!peer.valid) {
        throw std::runtime_error("send_to() without a peer address");
    }
#ifdef _WIN32
    int sent = ::sendto(fd_, static_cast<const char*>(buf), (int)len, 0,
                        (const sockaddr*)&peer.addr, sizeof(peer.addr));
#else
    ssize_t sent = ::sendto(fd_, buf, len, 0, (const sockaddr*)&peer.addr, sizeof(peer.addr));
#endif
    if (sent < 0 || (size_t)sent != len) {
        throw std::runtime_error("sendto() failed: " + socket_error_str(last_socket_error()));
    }
}

int UdpSocket::recv(void* buf, size_t cap) {
    UdpPeer ignored;
    return recv_from(buf, cap, ignored);
}

int UdpSocket::recv_from(void* buf, size_t cap, UdpPeer& peer) {
#ifdef _WIN32
    int len = sizeof(peer.addr);
    int n = ::recvfrom(fd_, static_cast<char*>(buf), (int)cap, 0, (sockaddr*)&peer.addr, &len);
#else
    socklen_t len = sizeof(peer.addr);
    ssize_t n = ::recvfrom(fd_, buf, cap, 0, (sockaddr*)&peer.addr, &len);
#endif
    if (n < 0) {
        int err = last_socket_error();
#ifndef _WIN32
        // ECONNREFUSED: ICMP port-unreachable from a peer that is not up yet
        if (err == EINTR || err == ECONNREFUSED) return -1;
#endif
        if (would_block(err)) return -1;
        throw std::runtime_error("recvfrom() failed: " + socket_error_str(err));
    }
    peer.valid = true;
    return (int)n;
}

void UdpSocket::set_recv_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}

u16 UdpSocket::local_port() const {
    sockaddr_in addr{};
#ifdef _WIN32
    int len = sizeof(addr);
#else
    socklen_t len = sizeof(addr);
#endif
    if (getsockname(fd_, (sockaddr*)&addr, &len) != 0) return 0;
    return ntohs(addr.sin_port);
}

void UdpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}
