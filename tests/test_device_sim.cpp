#include "test_support.hpp"
#include "../server/device_sim.hpp"
#include "../client/transfer_engine.hpp"
#include <gtest/gtest.h>
#include <deque>
#include <random>

using testing_support::TempDir;
using testing_support::pattern;

namespace {

FtpPacket request(Opcode op, u8 session, u32 offset = 0, u8 size = 0) {
    FtpPacket p = make_request(op, offset, size);
    p.session = session;
    p.seq = 7;
    return p;
}

FtpPacket open_request(const std::string& path, u8 session) {
    FtpPacket p = make_path_request(Opcode::OP_OPEN_FILE_RO, path);
    p.session = session;
    return p;
}

u8 nack_code(const FtpPacket& p) {
    EXPECT_TRUE(p.is_nack());
    return p.payload.empty() ? 0 : p.payload[0];
}

class DeviceSimTest : public ::testing::Test {
protected:
    void SetUp() override {
        testing_support::write_file(tmp.file("APM/LOGS/1.BIN"), pattern(0, 1000));
        testing_support::write_file(tmp.file("empty.bin"), {});
    }

    TempDir tmp;
};

} // namespace

TEST_F(DeviceSimTest, OpenReportsFileSize) {
    DeviceSimulator dev(tmp.path().string(), 4);
    auto replies = dev.handle_request(open_request("/APM/LOGS/1.BIN", 3));
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_TRUE(replies[0].is_ack());
    EXPECT_EQ(replies[0].req_opcode, Opcode::OP_OPEN_FILE_RO);
    EXPECT_EQ(replies[0].session, 3);
    ASSERT_EQ(replies[0].payload.size(), 4u);
    EXPECT_EQ(proto::read_u32(replies[0].payload.data()), 1000u);
    EXPECT_TRUE(dev.session_open());
    EXPECT_EQ(*dev.open_session(), 3);
}

TEST_F(DeviceSimTest, OpenFailures) {
    DeviceSimulator dev(tmp.path().string(), 4);
    EXPECT_EQ(nack_code(dev.handle_request(open_request("/missing.bin", 1))[0]),
              (u8)FtpError::ERR_FILE_NOT_FOUND);
    EXPECT_EQ(nack_code(dev.handle_request(open_request("/../../etc/passwd", 1))[0]),
              (u8)FtpError::ERR_FILE_NOT_FOUND);

    dev.handle_request(open_request("/APM/LOGS/1.BIN", 1));
    EXPECT_EQ(nack_code(dev.handle_request(open_request("/empty.bin", 2))[0]),
              (u8)FtpError::ERR_NO_SESSIONS_AVAILABLE);
}

TEST_F(DeviceSimTest, BurstEndsAtPacketLimit) {
    DeviceSimulator dev(tmp.path().string(), 4);
    dev.handle_request(open_request("/APM/LOGS/1.BIN", 1));

    auto replies = dev.handle_request(request(Opcode::OP_BURST_READ_FILE, 1, 0, 100));
    ASSERT_EQ(replies.size(), 4u);
    for (size_t i = 0; i < replies.size(); ++i) {
        EXPECT_EQ(replies[i].offset, i * 100);
        EXPECT_EQ(replies[i].payload, pattern(i * 100, 100));
        EXPECT_EQ(replies[i].burst_complete, i == 3);
        EXPECT_EQ(replies[i].seq, 7 + 1 + i);
    }
}

TEST_F(DeviceSimTest, BurstEndsAtEndOfFile) {
    DeviceSimulator dev(tmp.path().string(), 16);
    dev.handle_request(open_request("/APM/LOGS/1.BIN", 1));

    auto replies = dev.handle_request(request(Opcode::OP_BURST_READ_FILE, 1, 700, 239));
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].payload.size(), 239u);
    EXPECT_FALSE(replies[0].burst_complete);
    EXPECT_EQ(replies[1].offset, 939u);
    EXPECT_EQ(replies[1].payload.size(), 61u);
    EXPECT_TRUE(replies[1].burst_complete);

    auto eof = dev.handle_request(request(Opcode::OP_BURST_READ_FILE, 1, 1000, 239));
    ASSERT_EQ(eof.size(), 1u);
    EXPECT_EQ(nack_code(eof[0]), (u8)FtpError::ERR_END_OF_FILE);
    EXPECT_EQ(eof[0].offset, 1000u);
}

TEST_F(DeviceSimTest, ReadFileAndSessionChecks) {
    DeviceSimulator dev(tmp.path().string(), 16);
    EXPECT_EQ(nack_code(dev.handle_request(request(Opcode::OP_READ_FILE, 1, 0, 10))[0]),
              (u8)FtpError::ERR_INVALID_SESSION);

    dev.handle_request(open_request("/APM/LOGS/1.BIN", 1));
    auto r = dev.handle_request(request(Opcode::OP_READ_FILE, 1, 990, 239));
    ASSERT_EQ(r.size(), 1u);
    EXPECT_EQ(r[0].payload, pattern(990, 10));
    EXPECT_EQ(r[0].req_opcode, Opcode::OP_READ_FILE);

    EXPECT_EQ(nack_code(dev.handle_request(request(Opcode::OP_READ_FILE, 2, 0, 10))[0]),
              (u8)FtpError::ERR_INVALID_SESSION);
    EXPECT_EQ(nack_code(dev.handle_request(request(Opcode::OP_READ_FILE, 1, 1000, 10))[0]),
              (u8)FtpError::ERR_END_OF_FILE);
}

TEST_F(DeviceSimTest, TerminateAndResetCloseTheSession) {
    DeviceSimulator dev(tmp.path().string(), 16);
    dev.handle_request(open_request("/APM/LOGS/1.BIN", 1));
    EXPECT_EQ(nack_code(dev.handle_request(request(Opcode::OP_TERMINATE_SESSION, 0))[0]),
              (u8)FtpError::ERR_INVALID_SESSION);
    EXPECT_TRUE(dev.handle_request(request(Opcode::OP_TERMINATE_SESSION, 1))[0].is_ack());
    EXPECT_FALSE(dev.session_open());

    dev.handle_request(open_request("/APM/LOGS/1.BIN", 2));
    EXPECT_TRUE(dev.handle_request(request(Opcode::OP_RESET_SESSIONS, 9))[0].is_ack());
    EXPECT_FALSE(dev.session_open());
}

TEST_F(DeviceSimTest, WriteOpcodesAreUnknown) {
    DeviceSimulator dev(tmp.path().string(), 16);
    EXPECT_EQ(nack_code(dev.handle_request(request(Opcode::OP_WRITE_FILE, 0))[0]),
              (u8)FtpError::ERR_UNKNOWN_COMMAND);
    EXPECT_EQ(nack_code(dev.handle_request(request(Opcode::OP_LIST_DIRECTORY, 0))[0]),
              (u8)FtpError::ERR_UNKNOWN_COMMAND);
}

// ---- Engine against the simulator, frames pumped in memory ----

namespace {

struct Link {
    DeviceSimulator& device;
    std::mt19937 rng{12345};
    int data_loss_percent{0};
    u64 now{1000};
    u32 dropped{0};

    std::deque<std::vector<u8>> to_device;
    std::deque<std::vector<u8>> to_client;

    // Only data replies are dropped so open replies always make it
    bool drop(const FtpPacket& reply) {
        if (data_loss_percent <= 0) return false;
        if (reply.req_opcode != Opcode::OP_BURST_READ_FILE &&
            reply.req_opcode != Opcode::OP_READ_FILE) {
            return false;
        }
        std::uniform_int_distribution<int> dist(0, 99);
        return dist(rng) < data_loss_percent;
    }

    void deliver_requests() {
        while (!to_device.empty()) {
            std::vector<u8> frame = std::move(to_device.front());
            to_device.pop_front();
            for (const FtpPacket& r : device.handle_request(proto::decode(frame))) {
                if (drop(r)) {
                    ++dropped;
                    continue;
                }
                proto::Frame f = proto::encode_frame(r);
                to_client.emplace_back(f.begin(), f.end());
            }
        }
    }
};

struct Download {
    bool done{false};
    bool ok{false};
    std::vector<u8> bytes;
    TransferStats stats;
    u32 dropped{0};
};

Download run_download(DeviceSimulator& device, const std::string& path,
                      FtpSettings settings, int loss_percent) {
    Link link{device};
    link.data_loss_percent = loss_percent;

    TransferEngine engine(
        settings,
        [&](const u8* frame, size_t len) { link.to_device.emplace_back(frame, frame + len); },
        [&]() { return link.now; });

    Download dl;
    engine.reset_sessions();
    engine.start_download(path, std::make_unique<file_io::MemorySink>(),
        [&](std::unique_ptr<file_io::ByteSink> sink) {
            dl.done = true;
            dl.ok = sink != nullptr;
            if (sink) dl.bytes = static_cast<file_io::MemorySink*>(sink.get())->bytes();
        });

    for (int step = 0; step < 200000 && !dl.done; ++step) {
        link.deliver_requests();
        while (!link.to_client.empty() && !dl.done) {
            std::vector<u8> frame = std::move(link.to_client.front());
            link.to_client.pop_front();
            engine.handle_frame(frame.data(), frame.size());
        }
        link.now += 10;
        engine.periodic_tick(link.now);
    }
    // let the closing TerminateSession reach the device
    link.deliver_requests();
    dl.stats = engine.last_stats();
    dl.dropped = link.dropped;
    return dl;
}

} // namespace

TEST_F(DeviceSimTest, DownloadWithoutLoss) {
    testing_support::write_file(tmp.file("@PARAM/param.pck"), pattern(0, 5000));
    DeviceSimulator dev(tmp.path().string(), 8);

    FtpSettings s;
    s.loss_seed = 1;
    Download dl = run_download(dev, "@PARAM/param.pck", s, 0);
    ASSERT_TRUE(dl.done);
    ASSERT_TRUE(dl.ok);
    EXPECT_EQ(dl.bytes, pattern(0, 5000));
    EXPECT_EQ(dl.stats.duplicates, 0u);
    EXPECT_EQ(dl.stats.gaps_at_eof, 0u);
    EXPECT_EQ(dl.stats.read_retries, 0u);
    // the finished transfer released its remote session
    EXPECT_FALSE(dev.session_open());
}

TEST_F(DeviceSimTest, DownloadOfExactMultipleOfBurstSize) {
    testing_support::write_file(tmp.file("blocks.bin"), pattern(0, 239 * 6));
    DeviceSimulator dev(tmp.path().string(), 4);

    FtpSettings s;
    s.burst_read_size = 239;
    s.loss_seed = 1;
    Download dl = run_download(dev, "/blocks.bin", s, 0);
    ASSERT_TRUE(dl.ok);
    EXPECT_EQ(dl.bytes, pattern(0, 239 * 6));
}

TEST_F(DeviceSimTest, DownloadOfEmptyFile) {
    DeviceSimulator dev(tmp.path().string(), 4);
    FtpSettings s;
    s.loss_seed = 1;
    Download dl = run_download(dev, "/empty.bin", s, 0);
    ASSERT_TRUE(dl.ok);
    EXPECT_TRUE(dl.bytes.empty());
}

TEST_F(DeviceSimTest, DownloadSurvivesReplyLoss) {
    testing_support::write_file(tmp.file("APM/LOGS/big.BIN"), pattern(0, 20000));
    DeviceSimulator dev(tmp.path().string(), 16);

    FtpSettings s;
    s.loss_seed = 1;
    Download dl = run_download(dev, "/APM/LOGS/big.BIN", s, 15);
    ASSERT_TRUE(dl.done);
    ASSERT_TRUE(dl.ok);
    EXPECT_EQ(dl.bytes, pattern(0, 20000));
    EXPECT_GT(dl.dropped, 0u);
    EXPECT_FALSE(dev.session_open());
}

TEST_F(DeviceSimTest, MissingFileFails) {
    DeviceSimulator dev(tmp.path().string(), 4);
    FtpSettings s;
    s.loss_seed = 1;
    Download dl = run_download(dev, "/nope.bin", s, 0);
    ASSERT_TRUE(dl.done);
    EXPECT_FALSE(dl.ok);
}
