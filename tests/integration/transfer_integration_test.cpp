/**
 * @file transfer_integration_test.cpp
 * @brief End-to-end transfers between TransferClient and TransferServer
 *
 * Runs both sides on loopback with ephemeral ports: dual-channel sends,
 * status and cancel requests, the legacy single-channel mode and the
 * connection limit.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

#include "Logger.h"
#include "PathUtils.h"
#include "ProtocolMessages.h"
#include "TestHelpers.h"
#include "TransferClient.h"
#include "TransferServer.h"

using namespace HuffStream;
using HuffStream::test::bytesOf;
using HuffStream::test::TempDir;

class TransferIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::WARN);

        ServerSettings settings;
        settings.host = "127.0.0.1";
        settings.controlPort = 0;
        settings.dataPort = 0;
        settings.legacyPort = test::unusedPort();
        settings.maxConnections = 8;
        settings.bufferSize = 512;
        settings.saveDirectory = dir_.file("received");

        server_ = std::make_unique<TransferServer>(settings);
        auto started = server_->start();
        ASSERT_TRUE(started) << started.error().message;
    }

    void TearDown() override {
        server_->stop();
        Logger::instance().setLevel(LogLevel::INFO);
    }

    ClientSettings clientSettings() const {
        ClientSettings settings;
        settings.host = "127.0.0.1";
        settings.controlPort = server_->controlPort();
        settings.dataPort = server_->dataPort();
        settings.legacyPort = server_->legacyPort();
        settings.bufferSize = 256;
        settings.retryAttempts = 1;
        settings.retryDelayMs = 0;
        return settings;
    }

    std::string writeInput(const std::string& name, const std::string& text) {
        std::ofstream out(dir_.file(name), std::ios::binary);
        out << text;
        return dir_.file(name);
    }

    std::vector<uint8_t> readReceived(const std::string& name) {
        auto data = PathUtils::readFile(dir_.path() / "received" / name);
        return data ? data.value() : std::vector<uint8_t>{};
    }

    TempDir dir_;
    std::unique_ptr<TransferServer> server_;
};

TEST_F(TransferIntegrationTest, SendsAndDecodesFile) {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "line " + std::to_string(i) + ": the quick brown fox\n";
    }
    auto input = writeInput("report.txt", text);

    TransferClient client(clientSettings());
    ASSERT_TRUE(client.initialize());

    auto sent = client.sendFile(input);
    ASSERT_TRUE(sent) << sent.error().message;
    EXPECT_TRUE(sent->complete);
    EXPECT_EQ(sent->remoteName, "report_encoded.txt");
    EXPECT_EQ(sent->originalSize, text.size());
    EXPECT_LT(sent->payloadSize, text.size());
    EXPECT_GT(sent->ratio, 0.0);

    auto status = client.checkStatus(sent->transferId);
    ASSERT_TRUE(status) << status.error().message;
    EXPECT_EQ(status.value(), "decoded");

    EXPECT_EQ(readReceived("report_decoded.txt"), bytesOf(text));
    EXPECT_EQ(readReceived("report_encoded.txt").size(), sent->payloadSize);
}

TEST_F(TransferIntegrationTest, SendsEmptyFile) {
    auto input = writeInput("empty.bin", "");

    TransferClient client(clientSettings());
    ASSERT_TRUE(client.initialize());

    auto sent = client.sendFile(input);
    ASSERT_TRUE(sent) << sent.error().message;
    EXPECT_TRUE(sent->complete);
    EXPECT_EQ(sent->payloadSize, 0u);

    EXPECT_EQ(client.checkStatus(sent->transferId).value(), "decoded");
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "received" / "empty_decoded.bin"));
}

TEST_F(TransferIntegrationTest, CancelAndStatusOfUnknownTransfer) {
    TransferClient client(clientSettings());
    ASSERT_TRUE(client.initialize());

    auto cancelled = client.cancel("no-such-transfer");
    ASSERT_TRUE(cancelled) << cancelled.error().message;
    EXPECT_EQ(cancelled.value(), "cancelled");

    EXPECT_EQ(client.checkStatus("no-such-transfer").value(), "unknown");
}

TEST_F(TransferIntegrationTest, CancelledTransferRefusesData) {
    TransferClient client(clientSettings());
    ASSERT_TRUE(client.initialize());

    auto payload = bytesOf("irrelevant");

    // Prepare by hand so the transfer can be cancelled before streaming
    DialOptions options;
    options.retryAttempts = 1;
    auto control = ConnectionManager::dial("127.0.0.1", server_->controlPort(), options);
    ASSERT_TRUE(control);
    ASSERT_TRUE(control.value()->sendFrame(
        ProtocolMessages::toString(ProtocolMessages::prepare("t-cancel", "x_encoded.bin", payload.size()))));
    EXPECT_NE(control.value()->receiveTextFrame().value_or("").find("ready"), std::string::npos);

    ASSERT_EQ(client.cancel("t-cancel").value(), "cancelled");

    auto data = ConnectionManager::dial("127.0.0.1", server_->dataPort(), options);
    ASSERT_TRUE(data);
    ASSERT_TRUE(data.value()->sendFrame(ProtocolMessages::toString(ProtocolMessages::dataHandshake("t-cancel"))));
    EXPECT_FALSE(data.value()->receiveTextFrame().has_value());

    EXPECT_EQ(client.checkStatus("t-cancel").value(), "cancelled");
}

TEST_F(TransferIntegrationTest, UnknownDataHandshakeLeavesServerUsable) {
    DialOptions options;
    options.retryAttempts = 1;
    auto data = ConnectionManager::dial("127.0.0.1", server_->dataPort(), options);
    ASSERT_TRUE(data);
    ASSERT_TRUE(data.value()->sendFrame(ProtocolMessages::toString(ProtocolMessages::dataHandshake("bogus"))));
    EXPECT_FALSE(data.value()->receiveTextFrame().has_value());
    EXPECT_FALSE(server_->registry().find("bogus").has_value());

    TransferClient client(clientSettings());
    ASSERT_TRUE(client.initialize());
    auto sent = client.sendFile(writeInput("after.txt", "still serving"));
    ASSERT_TRUE(sent) << sent.error().message;
    EXPECT_TRUE(sent->complete);
}

TEST_F(TransferIntegrationTest, LegacyTransferReportsSuccess) {
    auto input = writeInput("legacy.txt", "sent over the single channel");

    TransferClient client(clientSettings());
    ASSERT_TRUE(client.initialize());

    auto reply = client.sendLegacy(input);
    ASSERT_TRUE(reply) << reply.error().message;
    EXPECT_EQ(reply.value(), hfs::config::LEGACY_SUCCESS_REPLY);
    EXPECT_EQ(readReceived("legacy_decoded.txt"), bytesOf("sent over the single channel"));
}

TEST_F(TransferIntegrationTest, LegacyNeedsConfiguredPort) {
    auto settings = clientSettings();
    settings.legacyPort = 0;

    TransferClient client(settings);
    ASSERT_TRUE(client.initialize());

    auto reply = client.sendLegacy(writeInput("x.txt", "x"));
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().code, hfs::ErrorCode::MissingConfig);
}

TEST_F(TransferIntegrationTest, MissingInputFileIsReported) {
    TransferClient client(clientSettings());
    ASSERT_TRUE(client.initialize());

    auto sent = client.sendFile(dir_.file("does_not_exist.txt"));
    ASSERT_FALSE(sent);
    EXPECT_EQ(sent.error().code, hfs::ErrorCode::FileNotFound);
}

TEST_F(TransferIntegrationTest, UnreachableServerFailsToConnect) {
    auto settings = clientSettings();
    settings.controlPort = test::unusedPort();

    TransferClient client(settings);
    ASSERT_TRUE(client.initialize());

    auto status = client.checkStatus("anything");
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().code, hfs::ErrorCode::ConnectionFailed);
}

TEST_F(TransferIntegrationTest, ConcurrentSendsAllComplete) {
    const int senders = 3;
    std::vector<std::string> inputs;
    for (int i = 0; i < senders; ++i) {
        inputs.push_back(writeInput("file" + std::to_string(i) + ".txt",
                                    std::string(1000 + i * 100, static_cast<char>('a' + i)) + "tail"));
    }

    std::atomic<int> completed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < senders; ++i) {
        threads.emplace_back([this, &inputs, &completed, i]() {
            TransferClient client(clientSettings());
            if (!client.initialize()) {
                return;
            }
            auto sent = client.sendFile(inputs[i]);
            if (sent && sent->complete) {
                ++completed;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(completed.load(), senders);
    for (int i = 0; i < senders; ++i) {
        auto original = PathUtils::readFile(inputs[i]);
        ASSERT_TRUE(original);
        EXPECT_EQ(readReceived("file" + std::to_string(i) + "_decoded.txt"), original.value());
    }
}

TEST_F(TransferIntegrationTest, ConnectionsBeyondLimitAreRejected) {
    DialOptions options;
    options.retryAttempts = 1;

    std::vector<std::unique_ptr<Connection>> idle;
    for (int i = 0; i < 8; ++i) {
        auto conn = ConnectionManager::dial("127.0.0.1", server_->controlPort(), options);
        ASSERT_TRUE(conn);
        idle.push_back(std::move(conn.value()));
    }
    ASSERT_TRUE(test::waitFor([this]() { return server_->activeConnections() == 8; }));

    auto extra = ConnectionManager::dial("127.0.0.1", server_->controlPort(), options);
    ASSERT_TRUE(extra);
    EXPECT_FALSE(extra.value()->receiveFrame().has_value());
    EXPECT_TRUE(test::waitFor([this]() { return server_->rejectedConnections() >= 1; }));

    idle.clear();
    ASSERT_TRUE(test::waitFor([this]() { return server_->activeConnections() == 0; }));

    TransferClient client(clientSettings());
    ASSERT_TRUE(client.initialize());
    EXPECT_EQ(client.checkStatus("x").value(), "unknown");
}

TEST_F(TransferIntegrationTest, StopClosesIdleConnections) {
    DialOptions options;
    options.retryAttempts = 1;
    auto conn = ConnectionManager::dial("127.0.0.1", server_->controlPort(), options);
    ASSERT_TRUE(conn);
    ASSERT_TRUE(test::waitFor([this]() { return server_->activeConnections() == 1; }));

    server_->stop();
    EXPECT_FALSE(server_->isRunning());
    EXPECT_FALSE(conn.value()->receiveFrame().has_value());
}
