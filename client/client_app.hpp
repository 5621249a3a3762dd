#pragma once

// ============================================================
// client_app.hpp -- mavftp_get: download one file from a device
//   over UDP (one MAVFTP frame per datagram)
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/file_io.hpp"
#include "transfer_engine.hpp"
#include <string>
#include <memory>
#include <atomic>

struct ClientOptions {
    std::string device_ip;
    u16         device_port{14555};
    std::string remote_path;
    std::string local_path;       // "-" writes the file to stdout
    FtpSettings ftp;
    int         timeout_secs{0};  // 0 = no overall deadline
};

class ClientApp {
public:
    explicit ClientApp(const ClientOptions& opts);
    ~ClientApp();

    // Run the download to completion, failure, timeout or stop().
    // Returns 0 on success, nonzero on error.
    int run();

    // Signal stop from a signal handler
    void stop();

private:
    std::unique_ptr<file_io::ByteSink> make_sink() const;
    void on_complete(std::unique_ptr<file_io::ByteSink> sink);
    void on_progress(double fraction);

    ClientOptions     opts_;
    UdpSocket         sock_;
    std::atomic<bool> stop_{false};
    bool              done_{false};
    bool              success_{false};
    int               last_decile_{-1};
};
