// ============================================================
// client_app.cpp -- mavftp_get: UDP transport and message pump
// ============================================================

#include "client_app.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/protocol_io.hpp"
#include "../common/hash.hpp"
#include <array>
#include <stdexcept>
#include <iostream>

// Poll cadence of the pump; also bounds how late a tick can run
static constexpr int RECV_TIMEOUT_MS    = 20;
static constexpr u64 STATUS_INTERVAL_MS = 1000;

ClientApp::ClientApp(const ClientOptions& opts)
    : opts_(opts)
{
    if (opts_.local_path == "-") {
        // stdout carries the file content
        Logger::get().set_stderr_only(true);
    }
    LOG_INFO("ClientApp: device=" + opts_.device_ip + ":" + std::to_string(opts_.device_port) +
             " remote=" + opts_.remote_path + " local=" + opts_.local_path);
}

ClientApp::~ClientApp() {
    stop();
}

void ClientApp::stop() {
    stop_.store(true);
}

std::unique_ptr<file_io::ByteSink> ClientApp::make_sink() const {
    if (opts_.local_path == "-") {
        return std::make_unique<file_io::MemorySink>();
    }
    return std::make_unique<file_io::FileSink>(opts_.local_path);
}

void ClientApp::on_progress(double fraction) {
    int decile = (int)(fraction * 10.0);
    if (decile != last_decile_) {
        last_decile_ = decile;
        LOG_DEBUG("Progress " + std::to_string(decile * 10) + "%");
    }
}

void ClientApp::on_complete(std::unique_ptr<file_io::ByteSink> sink) {
    done_ = true;
    if (!sink) {
        success_ = false;
        return;
    }
    success_ = true;

    if (auto* mem = dynamic_cast<file_io::MemorySink*>(sink.get())) {
        const std::vector<u8>& bytes = mem->bytes();
        hash::Hash128 digest = hash::xxh3_128(bytes.data(), bytes.size());
        LOG_INFO("xxh3 " + hash::to_hex(digest) + "  " + opts_.remote_path);
        std::cout.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
        std::cout.flush();
        return;
    }

    try {
        file_io::MmapReader reader(sink->describe());
        hash::Hash128 digest = hash::xxh3_128(reader.data(), (size_t)reader.size());
        LOG_INFO("xxh3 " + hash::to_hex(digest) + "  " + sink->describe());
    } catch (const std::exception& e) {
        LOG_WARN("Cannot digest " + sink->describe() + ": " + e.what());
    }
}

// ---------------------------------------------------------------
// run
// ---------------------------------------------------------------

int ClientApp::run() {
    sock_.connect(opts_.device_ip, opts_.device_port);
    sock_.set_recv_timeout_ms(RECV_TIMEOUT_MS);

    TransferEngine engine(opts_.ftp, [this](const u8* frame, size_t len) {
        sock_.send(frame, len);
    });

    engine.reset_sessions();

    FtpStatus st = engine.start_download(
        opts_.remote_path, make_sink(),
        [this](std::unique_ptr<file_io::ByteSink> sink) { on_complete(std::move(sink)); },
        [this](double fraction) { on_progress(fraction); });
    if (!st.ok()) {
        st.log();
        return 1;
    }

    const u64 start_ms    = utils::now_ms();
    u64       last_status = start_ms;
    bool      was_idle    = false;
    std::array<u8, 2 * MAVFTP_FRAME_LEN> buf{};

    while (!done_ && !stop_.load()) {
        int n = sock_.recv(buf.data(), buf.size());
        if (n > 0) {
            try {
                engine.handle_frame(buf.data(), (size_t)n);
            } catch (const proto::DecodeError& e) {
                LOG_WARN(std::string("Dropping malformed frame: ") + e.what());
            }
        }

        u64 now = utils::now_ms();
        bool idle = engine.periodic_tick(now);
        if (idle != was_idle) {
            was_idle = idle;
            if (idle) LOG_DEBUG("Link idle");
        }

        if (opts_.timeout_secs > 0 && now - start_ms > (u64)opts_.timeout_secs * 1000) {
            LOG_ERROR("Timed out: " + engine.status_line(now));
            engine.terminate();
            break;
        }
        if (now - last_status >= STATUS_INTERVAL_MS && engine.in_progress()) {
            last_status = now;
            LOG_DEBUG(engine.status_line(now));
        }
    }

    if (engine.in_progress()) {
        LOG_WARN("Interrupted: " + engine.status_line(utils::now_ms()));
        engine.cancel();
    }

    const TransferStats& stats = engine.last_stats();
    if (success_) {
        LOG_INFO("Transfer complete: " + utils::format_bytes(stats.file_size) +
                 " in " + utils::format_seconds(stats.elapsed_ms) +
                 ", " + std::to_string(stats.gaps_at_eof) + " gaps at EOF, " +
                 std::to_string(stats.read_retries) + " retries, " +
                 std::to_string(stats.duplicates) + " duplicates");
        return 0;
    }
    LOG_ERROR("Download of " + opts_.remote_path + " failed");
    return 1;
}
