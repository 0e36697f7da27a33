#include <gtest/gtest.h>

#include "TransferRegistry.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace HuffStream;

class TransferRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.prepare("t-1", "report_encoded.txt", 100, "/tmp/received/report_encoded.txt");
    }

    TransferRegistry registry_;
};

TEST_F(TransferRegistryTest, PreparedRecordHoldsMetadata) {
    auto record = registry_.find("t-1");
    ASSERT_TRUE(record.has_value());

    EXPECT_EQ(record->transferId, "t-1");
    EXPECT_EQ(record->filename, "report_encoded.txt");
    EXPECT_EQ(record->declaredSize, 100u);
    EXPECT_EQ(record->status, TransferStatus::Prepared);
    EXPECT_EQ(record->destinationPath, "/tmp/received/report_encoded.txt");
    EXPECT_FALSE(record->decodedPath.has_value());
}

TEST_F(TransferRegistryTest, UnknownIdHasNoStatus) {
    EXPECT_FALSE(registry_.status("nope").has_value());
    EXPECT_FALSE(registry_.find("nope").has_value());
}

TEST_F(TransferRegistryTest, FullLifecycle) {
    EXPECT_EQ(registry_.status("t-1"), TransferStatus::Prepared);

    auto receiving = registry_.beginReceiving("t-1");
    ASSERT_TRUE(receiving.has_value());
    EXPECT_EQ(receiving->status, TransferStatus::Receiving);
    EXPECT_EQ(registry_.status("t-1"), TransferStatus::Receiving);

    EXPECT_TRUE(registry_.transition("t-1", TransferStatus::Receiving, TransferStatus::Received));
    EXPECT_EQ(registry_.status("t-1"), TransferStatus::Received);

    EXPECT_TRUE(registry_.markDecoded("t-1", "/tmp/received/report_decoded.txt"));
    EXPECT_EQ(registry_.status("t-1"), TransferStatus::Decoded);
    EXPECT_EQ(registry_.find("t-1")->decodedPath.value(), "/tmp/received/report_decoded.txt");

    EXPECT_TRUE(registry_.cancel("t-1"));
    EXPECT_EQ(registry_.status("t-1"), TransferStatus::Cancelled);
}

TEST_F(TransferRegistryTest, BeginReceivingOnlyFromPrepared) {
    ASSERT_TRUE(registry_.beginReceiving("t-1").has_value());
    EXPECT_FALSE(registry_.beginReceiving("t-1").has_value());
    EXPECT_FALSE(registry_.beginReceiving("unknown").has_value());

    registry_.prepare("t-2", "x", 1, "/tmp/x");
    ASSERT_TRUE(registry_.cancel("t-2"));
    EXPECT_FALSE(registry_.beginReceiving("t-2").has_value());
}

TEST_F(TransferRegistryTest, TransitionRequiresExpectedState) {
    EXPECT_FALSE(registry_.transition("t-1", TransferStatus::Receiving, TransferStatus::Received));
    EXPECT_EQ(registry_.status("t-1"), TransferStatus::Prepared);

    EXPECT_FALSE(registry_.markDecoded("t-1", "/tmp/out"));
    EXPECT_FALSE(registry_.transition("unknown", TransferStatus::Prepared, TransferStatus::Receiving));
}

TEST_F(TransferRegistryTest, CancelDuringReceivingSticks) {
    ASSERT_TRUE(registry_.beginReceiving("t-1").has_value());
    ASSERT_TRUE(registry_.cancel("t-1"));

    EXPECT_FALSE(registry_.transition("t-1", TransferStatus::Receiving, TransferStatus::Received));
    EXPECT_EQ(registry_.status("t-1"), TransferStatus::Cancelled);
}

TEST_F(TransferRegistryTest, CancelUnknownCreatesNothing) {
    EXPECT_FALSE(registry_.cancel("ghost"));
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_FALSE(registry_.status("ghost").has_value());
}

TEST_F(TransferRegistryTest, PrepareAgainReplacesRecord) {
    ASSERT_TRUE(registry_.beginReceiving("t-1").has_value());

    registry_.prepare("t-1", "other.bin", 7, "/tmp/other.bin");
    auto record = registry_.find("t-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, TransferStatus::Prepared);
    EXPECT_EQ(record->filename, "other.bin");
    EXPECT_EQ(record->declaredSize, 7u);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(TransferRegistryTest, ConcurrentPreparesAreAllRecorded) {
    const int threadCount = 8;
    const int perThread = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < perThread; ++i) {
                std::string id = "c-" + std::to_string(t) + "-" + std::to_string(i);
                registry_.prepare(id, "f", static_cast<uint64_t>(i), "/tmp/f");
                EXPECT_TRUE(registry_.beginReceiving(id).has_value());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(registry_.size(), 1u + threadCount * perThread);
    EXPECT_EQ(registry_.status("c-3-17"), TransferStatus::Receiving);
}

TEST_F(TransferRegistryTest, ConcurrentBeginReceivingHasOneWinner) {
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &winners]() {
            if (registry_.beginReceiving("t-1")) {
                ++winners;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(winners.load(), 1);
}

TEST(TransferStatusTest, NamesRoundTrip) {
    for (auto status : {TransferStatus::Prepared, TransferStatus::Receiving, TransferStatus::Received,
                        TransferStatus::Decoded, TransferStatus::DecodeFailed, TransferStatus::Incomplete,
                        TransferStatus::Cancelled}) {
        EXPECT_EQ(parseTransferStatus(toString(status)), status);
    }
    EXPECT_STREQ(toString(TransferStatus::DecodeFailed), "decode_failed");
    EXPECT_FALSE(parseTransferStatus("unknown").has_value());
    EXPECT_TRUE(isTerminal(TransferStatus::Incomplete));
    EXPECT_FALSE(isTerminal(TransferStatus::Receiving));
}
