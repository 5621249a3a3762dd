// ============================================================
// client/main.cpp -- mavftp_get entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static ClientApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <ip> <port> <remote_path> [local_path|-] [options]\n"
        << "\n"
        << "  ip               device (or mavftp_device) IP address\n"
        << "  port             UDP port of the device\n"
        << "  remote_path      file to fetch, e.g. @PARAM/param.pck or /APM/LOGS/1.BIN\n"
        << "  local_path       destination file (default: basename of remote_path),\n"
        << "                   '-' writes the file to stdout\n"
        << "\nOptions:\n"
        << "  --debug N          protocol debug level 0..2 (default: 0)\n"
        << "  --pkt-loss-tx N    drop N% of burst replies, for testing (default: 0)\n"
        << "  --pkt-loss-rx N    drop N% of all replies, for testing (default: 0)\n"
        << "  --max-backlog N    outstanding gap reads while streaming (default: 5)\n"
        << "  --burst-size N     burst read size 1..239 (default: 80)\n"
        << "  --retry-ms N       burst stall and gap retry timeout (default: 500)\n"
        << "  --read-retry-ms N  open retry timeout (default: 1000)\n"
        << "  --idle-ms N        idle link threshold (default: 3700)\n"
        << "  --timeout S        give up after S seconds (default: none)\n"
        << "  --log-file P       also append log lines to P\n"
        << "  --verbose          enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " 127.0.0.1 14555 @PARAM/param.pck params.pck\n"
        << "  " << prog << " 192.168.4.1 14555 /APM/LOGS/00000012.BIN - --burst-size 239\n";
}

// Parse a non-negative integer option; false if out of [lo, hi]
static bool parse_int(const char* s, long lo, long hi, long& out) {
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || v < lo || v > hi) return false;
    out = v;
    return true;
}

static std::string default_local_path(const std::string& remote_path) {
    std::string::size_type slash = remote_path.find_last_of('/');
    std::string base = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    std::string::size_type q = base.find('?');
    if (q != std::string::npos) base.erase(q);
    if (!base.empty() && base[0] == '@') base.erase(0, 1);
    return base.empty() ? "download.bin" : base;
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ClientOptions opts;
    opts.device_ip   = argv[1];
    int port_int     = std::atoi(argv[2]);
    opts.remote_path = argv[3];

    int first_opt = 4;
    if (argc > 4 && std::strncmp(argv[4], "--", 2) != 0) {
        opts.local_path = argv[4];
        first_opt = 5;
    } else {
        opts.local_path = default_local_path(opts.remote_path);
    }

    std::string log_file;
    bool verbose = false;

    for (int i = first_opt; i < argc; ++i) {
        long v = 0;
        const char* opt = argv[i];
        bool has_val = i + 1 < argc;
        if (std::strcmp(opt, "--debug") == 0 && has_val && parse_int(argv[i + 1], 0, 2, v)) {
            opts.ftp.debug = (int)v; ++i;
        } else if (std::strcmp(opt, "--pkt-loss-tx") == 0 && has_val && parse_int(argv[i + 1], 0, 100, v)) {
            opts.ftp.pkt_loss_tx = (int)v; ++i;
        } else if (std::strcmp(opt, "--pkt-loss-rx") == 0 && has_val && parse_int(argv[i + 1], 0, 100, v)) {
            opts.ftp.pkt_loss_rx = (int)v; ++i;
        } else if (std::strcmp(opt, "--max-backlog") == 0 && has_val && parse_int(argv[i + 1], 0, 100, v)) {
            opts.ftp.max_backlog = (u32)v; ++i;
        } else if (std::strcmp(opt, "--burst-size") == 0 && has_val && parse_int(argv[i + 1], 1, 239, v)) {
            opts.ftp.burst_read_size = (int)v; ++i;
        } else if (std::strcmp(opt, "--retry-ms") == 0 && has_val && parse_int(argv[i + 1], 1, 60000, v)) {
            opts.ftp.retry_ms = (u64)v; ++i;
        } else if (std::strcmp(opt, "--read-retry-ms") == 0 && has_val && parse_int(argv[i + 1], 1, 60000, v)) {
            opts.ftp.read_retry_ms = (u64)v; ++i;
        } else if (std::strcmp(opt, "--idle-ms") == 0 && has_val && parse_int(argv[i + 1], 1, 600000, v)) {
            opts.ftp.idle_detection_ms = (u64)v; ++i;
        } else if (std::strcmp(opt, "--timeout") == 0 && has_val && parse_int(argv[i + 1], 0, 86400, v)) {
            opts.timeout_secs = (int)v; ++i;
        } else if (std::strcmp(opt, "--log-file") == 0 && has_val) {
            log_file = argv[++i];
        } else if (std::strcmp(opt, "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Invalid option: " << opt << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_ip(opts.device_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << opts.device_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (!utils::is_ascii(opts.remote_path) || opts.remote_path.empty()) {
        std::cerr << "ERROR: remote_path must be non-empty ASCII\n";
        return 1;
    }
    opts.device_port = (u16)port_int;

    Logger::get().set_level(verbose || opts.ftp.debug > 1 ? LogLevel::DEBUG : LogLevel::INFO);
    if (!log_file.empty()) {
        Logger::get().set_log_file(log_file);
    }

    try {
        ClientApp app(opts);
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
