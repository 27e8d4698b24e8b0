#include <gtest/gtest.h>
#include "sector_host.hpp"
#include "tcp_host_session.hpp"
#include "test_utils.hpp"
#include <thread>

using namespace sectorcast;

class TcpHostSessionTest : public ::testing::Test {
protected:
    void start_host(const HostConfig& cfg) {
        host_.reset(new SectorHost(io_, cfg));
        host_->start();
        io_thread_ = std::thread([this] { io_.run(); });
    }

    void TearDown() override {
        io_.stop();
        if (io_thread_.joinable())
            io_thread_.join();
    }

    static HostConfig loopback() {
        HostConfig cfg;
        cfg.listen_host = "127.0.0.1";
        cfg.listen_port = 0;
        cfg.threads = 1;
        return cfg;
    }

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_{asio::make_work_guard(io_)};
    std::unique_ptr<SectorHost> host_;
    std::thread io_thread_;
    TaskManager tm_;
};

TEST_F(TcpHostSessionTest, StoresSector) {
    start_host(loopback());
    TcpHostSession session("127.0.0.1", host_->port(), std::chrono::milliseconds(5000));
    EXPECT_EQ(session.host_id(), "127.0.0.1:" + std::to_string(host_->port()));

    auto a = test_utils::pattern_bytes(4096, 1);
    auto b = test_utils::pattern_bytes(100, 2);
    EXPECT_FALSE(session.upload_sector(5, 0, 3, a, tm_));
    EXPECT_FALSE(session.upload_sector(5, 1, 0, b, tm_));

    EXPECT_EQ(host_->stored_sectors(), 2u);
    EXPECT_EQ(host_->stored_bytes(), 4196u);
    std::vector<uint8_t> out;
    ASSERT_TRUE(host_->sector(5, 0, 3, out));
    EXPECT_EQ(out, a);
    EXPECT_FALSE(host_->sector(5, 0, 4, out));
    EXPECT_TRUE(session.good_for_upload());
}

TEST_F(TcpHostSessionTest, StoresSectorOnDisk) {
    test_utils::TempDir dir;
    HostConfig cfg = loopback();
    cfg.storage_dir = dir.path();
    start_host(cfg);
    TcpHostSession session("127.0.0.1", host_->port(), std::chrono::milliseconds(5000));

    auto a = test_utils::pattern_bytes(2048, 3);
    EXPECT_FALSE(session.upload_sector(9, 2, 1, a, tm_));
    std::vector<uint8_t> out;
    ASSERT_TRUE(host_->sector(9, 2, 1, out));
    EXPECT_EQ(out, a);
}

TEST_F(TcpHostSessionTest, FullHostRejectsAndStopsTakingUploads) {
    HostConfig cfg = loopback();
    cfg.capacity = 1000;
    start_host(cfg);
    TcpHostSession session("127.0.0.1", host_->port(), std::chrono::milliseconds(5000));

    EXPECT_FALSE(session.upload_sector(1, 0, 0, test_utils::pattern_bytes(800, 4), tm_));
    EXPECT_EQ(session.upload_sector(1, 0, 1, test_utils::pattern_bytes(800, 5), tm_),
              errc::upload_rejected);
    EXPECT_FALSE(session.good_for_upload());
    EXPECT_EQ(host_->stored_sectors(), 1u);
}

TEST_F(TcpHostSessionTest, OversizedSectorIsRejected) {
    HostConfig cfg = loopback();
    cfg.max_sector = 512;
    start_host(cfg);
    TcpHostSession session("127.0.0.1", host_->port(), std::chrono::milliseconds(5000));

    EXPECT_EQ(session.upload_sector(1, 0, 0, test_utils::pattern_bytes(513, 6), tm_),
              errc::upload_rejected);
    // The connection survives a rejection.
    EXPECT_FALSE(session.upload_sector(1, 0, 1, test_utils::pattern_bytes(512, 7), tm_));
    EXPECT_TRUE(session.good_for_upload());
}

TEST_F(TcpHostSessionTest, UnreachableHostFails) {
    uint16_t port;
    {
        asio::ip::tcp::acceptor spare(io_, asio::ip::tcp::endpoint(
                                               asio::ip::make_address("127.0.0.1"), 0));
        port = spare.local_endpoint().port();
    }
    TcpHostSession session("127.0.0.1", port, std::chrono::milliseconds(2000));
    EXPECT_EQ(session.upload_sector(1, 0, 0, {1, 2, 3}, tm_), errc::connection_failed);
}

TEST_F(TcpHostSessionTest, StopInterruptsSilentHost) {
    // Accepts the connection but never answers.
    asio::ip::tcp::acceptor silent(io_, asio::ip::tcp::endpoint(
                                            asio::ip::make_address("127.0.0.1"), 0));
    asio::ip::tcp::socket peer(io_);
    silent.async_accept(peer, [](std::error_code) {});
    io_thread_ = std::thread([this] { io_.run(); });

    TcpHostSession session("127.0.0.1", silent.local_endpoint().port(),
                           std::chrono::milliseconds(30000));
    std::thread stopper([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        tm_.stop();
    });
    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(session.upload_sector(1, 0, 0, test_utils::pattern_bytes(64, 8), tm_),
              errc::interrupted);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    stopper.join();
    io_.stop();
    io_thread_.join();
}
