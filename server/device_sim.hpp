#pragma once

// ============================================================
// device_sim.hpp -- Remote end of the MAVFTP read path
//
// Serves files below a root directory the way a flight controller
// does: one open session at a time, read-only, burst and single
// reads. Pure request -> replies; the transport lives in ServerApp.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/file_io.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>

class DeviceSimulator {
public:
    // burst_packets: replies per BurstReadFile request before the
    // burst is marked complete
    explicit DeviceSimulator(std::string root_dir, u32 burst_packets = 16);

    std::vector<FtpPacket> handle_request(const FtpPacket& req);

    bool session_open() const { return session_.has_value(); }
    std::optional<u8> open_session() const { return session_; }
    const std::string& open_path() const { return path_; }

private:
    std::vector<FtpPacket> on_open(const FtpPacket& req);
    std::vector<FtpPacket> on_burst_read(const FtpPacket& req);
    std::vector<FtpPacket> on_read(const FtpPacket& req);
    std::vector<FtpPacket> on_terminate(const FtpPacket& req);

    FtpPacket ack(const FtpPacket& req, u16 seq_step = 1) const;
    FtpPacket nack(const FtpPacket& req, FtpError err) const;
    FtpPacket data_reply(const FtpPacket& req, u32 offset, u32 len, u16 seq_step) const;

    // Requested read size, 0 or oversized means a full payload
    static u32 read_size(const FtpPacket& req);

    void close_file();

    std::string                          root_dir_;
    u32                                  burst_packets_;
    std::unique_ptr<file_io::MmapReader> file_;
    std::optional<u8>                    session_;
    std::string                          path_;
};
