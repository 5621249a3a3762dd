// ============================================================
// server_app.cpp -- mavftp_device UDP loop
// ============================================================

#include "server_app.hpp"
#include "../common/protocol_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <array>

// Wake up regularly so stop() is noticed without traffic
static constexpr int RECV_TIMEOUT_MS = 200;

ServerApp::ServerApp(ServerConfig config)
    : config_(std::move(config))
    , device_(config_.root_dir, config_.burst_packets)
{
    if (config_.loss_seed != 0) {
        rng_.seed(config_.loss_seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

ServerApp::~ServerApp() {
    stop();
}

void ServerApp::stop() {
    running_.store(false);
}

bool ServerApp::drop_reply() {
    if (config_.loss_percent <= 0) return false;
    std::uniform_int_distribution<int> dist(0, 99);
    return dist(rng_) < config_.loss_percent;
}

int ServerApp::run() {
    sock_.bind(config_.listen_ip, config_.listen_port);
    sock_.set_recv_timeout_ms(RECV_TIMEOUT_MS);
    running_.store(true);

    LOG_INFO("Serving " + config_.root_dir + " on " + config_.listen_ip + ":" +
             std::to_string(sock_.local_port()) +
             " burst=" + std::to_string(config_.burst_packets) +
             " loss=" + std::to_string(config_.loss_percent) + "%");

    std::array<u8, 2 * MAVFTP_FRAME_LEN> buf{};
    while (running_.load()) {
        UdpPeer peer;
        int n = sock_.recv_from(buf.data(), buf.size(), peer);
        if (n <= 0) continue;
        handle_datagram(buf.data(), (size_t)n, peer);
    }

    LOG_INFO("Stopped after " + std::to_string(requests_) + " requests, " +
             std::to_string(replies_sent_) + " replies sent, " +
             std::to_string(replies_dropped_) + " dropped");
    return 0;
}

void ServerApp::handle_datagram(const u8* data, size_t len, const UdpPeer& peer) {
    FtpPacket req;
    try {
        req = proto::decode(data, len);
    } catch (const proto::DecodeError& e) {
        LOG_WARN("Dropping malformed request from " + peer.to_string() + ": " + e.what());
        return;
    }
    ++requests_;
    LOG_DEBUG("< " + peer.to_string() + " " + req.to_string());

    for (const FtpPacket& reply : device_.handle_request(req)) {
        if (drop_reply()) {
            ++replies_dropped_;
            LOG_DEBUG("dropping reply " + reply.to_string());
            continue;
        }
        proto::Frame frame = proto::encode_frame(reply);
        sock_.send_to(frame.data(), frame.size(), peer);
        ++replies_sent_;
    }
}
