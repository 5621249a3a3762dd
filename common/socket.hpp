#pragma once

// ============================================================
// socket.hpp -- RAII UDP socket wrapper (one frame per datagram)
// ============================================================

#include "platform.hpp"
#include <string>

// Remote endpoint of a datagram
struct UdpPeer {
    sockaddr_in addr{};
    bool        valid{false};

    std::string to_string() const;
};

class UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    UdpSocket(UdpSocket&& o) noexcept;
    UdpSocket& operator=(UdpSocket&& o) noexcept;

    // Client: fix the default destination for send()
    void connect(const std::string& ip, u16 port);

    // Server: bind to a local address ("0.0.0.0" for all interfaces)
    void bind(const std::string& ip, u16 port);

    // Send one datagram to the connected peer; throws on error
    void send(const void* buf, size_t len);

    // Send one datagram to an explicit peer; throws on error
    void send_to(const void* buf, size_t len, const UdpPeer& peer);

    // Receive one datagram. Returns its length, or -1 when the
    // receive timeout expired.
    int recv(void* buf, size_t cap);
    int recv_from(void* buf, size_t cap, UdpPeer& peer);

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

    u16 local_port() const;

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    void close();

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
