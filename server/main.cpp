// ============================================================
// server/main.cpp -- mavftp_device entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <filesystem>

static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <root_dir> <ip> <port> [options]\n"
        << "\n"
        << "  root_dir          directory served as the device file system\n"
        << "  ip                IP address to listen on (use 0.0.0.0 for all interfaces)\n"
        << "  port              UDP port (e.g. 14555)\n"
        << "\nOptions:\n"
        << "  --loss N          drop N% of replies, for testing (default: 0)\n"
        << "  --burst-packets N replies per burst read (default: 16)\n"
        << "  --seed N          seed of the loss generator (default: random)\n"
        << "  --verbose         enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " ./sdcard 0.0.0.0 14555 --loss 10\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    cfg.root_dir   = argv[1];
    cfg.listen_ip  = argv[2];
    int port_int   = std::atoi(argv[3]);

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--loss") == 0 && i + 1 < argc) {
            cfg.loss_percent = utils::clamp(std::atoi(argv[++i]), 0, 100);
        } else if (std::strcmp(argv[i], "--burst-packets") == 0 && i + 1 < argc) {
            cfg.burst_packets = (u32)utils::clamp(std::atoi(argv[++i]), 1, 1000);
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            cfg.loss_seed = (u32)std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(cfg.root_dir, ec)) {
        std::cerr << "ERROR: Not a directory: " << cfg.root_dir << "\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    cfg.listen_port = (u16)port_int;

    try {
        ServerApp app(cfg);
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
