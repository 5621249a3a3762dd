#pragma once

// ============================================================
// server_app.hpp -- mavftp_device: serves a directory over UDP
//   with the MAVFTP read protocol, one frame per datagram.
//   Replies go back to the sender of the request.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "device_sim.hpp"
#include <string>
#include <atomic>
#include <random>

struct ServerConfig {
    std::string root_dir;
    std::string listen_ip;        // e.g. "0.0.0.0"
    u16         listen_port{14555};
    int         loss_percent{0};  // test-only: drop N% of replies
    u32         burst_packets{16};
    u32         loss_seed{0};     // 0 = seed from std::random_device
};

class ServerApp {
public:
    explicit ServerApp(ServerConfig config);
    ~ServerApp();

    // Blocks until stop() is called (or fatal error)
    int run();

    // Call from signal handler to shut down gracefully
    void stop();

private:
    void handle_datagram(const u8* data, size_t len, const UdpPeer& peer);
    bool drop_reply();

    ServerConfig      config_;
    UdpSocket         sock_;
    DeviceSimulator   device_;
    std::mt19937      rng_;
    std::atomic<bool> running_{false};
    u64               requests_{0};
    u64               replies_sent_{0};
    u64               replies_dropped_{0};
};
