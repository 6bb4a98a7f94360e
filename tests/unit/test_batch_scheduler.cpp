#include <gtest/gtest.h>
#include "libnsdp/scan/batch_scheduler.h"
#include "mock/mock_transport.h"

using namespace libnsdp;
using namespace libnsdp::test;

namespace {

const MacAddress kSwitchMac = makeMac(0x00, 0x11, 0x22, 0x33, 0x44, 0x55);

struct Fixture {
    std::shared_ptr<MockTransport> mock = std::make_shared<MockTransport>();
    SimulatedSwitch sw{kSwitchMac};
    NsdpDevice device{std::make_shared<Session>(mock), kSwitchMac};

    Fixture() {
        mock->setRecordSends(false);
        sw.attach(*mock);
    }
};

} // anonymous

TEST(BatchScheduler, PartitionSplitsAtBatchSize) {
    auto batches = BatchScheduler::partition({0x0C00, 0x0C05}, 3);
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].index, 1u);
    EXPECT_EQ(batches[0].first, 0x0C00);
    EXPECT_EQ(batches[0].last, 0x0C02);
    EXPECT_EQ(batches[1].index, 2u);
    EXPECT_EQ(batches[1].first, 0x0C03);
    EXPECT_EQ(batches[1].last, 0x0C05);
}

TEST(BatchScheduler, PartitionCoversRangeExactlyOnce) {
    const ScanRange range{0x0010, 0x0200};
    for (uint32_t size : {1u, 7u, 100u, 497u, 1000u}) {
        auto batches = BatchScheduler::partition(range, size);
        ASSERT_FALSE(batches.empty());

        uint32_t expected = range.start;
        for (const auto& b : batches) {
            EXPECT_EQ(b.first, expected) << "batch size " << size;
            EXPECT_LE(b.size(), size);
            expected = static_cast<uint32_t>(b.last) + 1;
        }
        EXPECT_EQ(batches.back().last, range.end);
        EXPECT_EQ(batches.size(), (range.size() + size - 1) / size);
    }
}

TEST(BatchScheduler, PartitionFullRangeTerminates) {
    auto batches = BatchScheduler::partition({0x0000, 0xFFFF}, 100);
    ASSERT_EQ(batches.size(), 656u);
    EXPECT_EQ(batches.back().first, 0xFFA0);
    EXPECT_EQ(batches.back().last, 0xFFFF);
    EXPECT_EQ(batches.back().size(), 96u);
}

TEST(BatchScheduler, PartitionSingleId) {
    auto batches = BatchScheduler::partition({0xFFFF, 0xFFFF}, 100);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].first, 0xFFFF);
    EXPECT_EQ(batches[0].last, 0xFFFF);
}

TEST(BatchScheduler, PartitionRejectsBadInput) {
    EXPECT_TRUE(BatchScheduler::partition({0x0000, 0x0010}, 0).empty());
    EXPECT_TRUE(BatchScheduler::partition({0x0010, 0x0001}, 10).empty());
}

TEST(BatchScheduler, RunRejectsZeroBatchSize) {
    Fixture f;
    BatchScheduler scheduler;
    ScanOptions options;
    options.batchSize = 0;
    ScanResult result;
    result.range = {0x0000, 0x0010};

    EXPECT_EQ(scheduler.run(f.device, options, result).code(), ErrorCode::InvalidBatchSize);
    EXPECT_EQ(f.sw.requestCount(), 0u);
}

TEST(BatchScheduler, RunRejectsInvertedRange) {
    Fixture f;
    BatchScheduler scheduler;
    ScanResult result;
    result.range = {0x0010, 0x0001};

    EXPECT_EQ(scheduler.run(f.device, ScanOptions(), result).code(), ErrorCode::InvalidRange);
    EXPECT_EQ(f.sw.requestCount(), 0u);
}

TEST(BatchScheduler, SleepsBetweenBatchesOnly) {
    Fixture f;
    BatchScheduler scheduler;
    std::vector<uint32_t> sleeps;
    scheduler.setSleepHandler([&](uint32_t ms) { sleeps.push_back(ms); });

    ScanOptions options;
    options.batchSize = 3;
    options.interBatchDelayMs = 250;
    ScanResult result;
    result.range = {0x0C00, 0x0C07};  // 3 batches

    ASSERT_TRUE(scheduler.run(f.device, options, result).ok());
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], 250u);
    EXPECT_EQ(sleeps[1], 250u);
    EXPECT_EQ(f.sw.requestCount(), 8u);
}

TEST(BatchScheduler, NoSleepWithZeroDelay) {
    Fixture f;
    BatchScheduler scheduler;
    int sleeps = 0;
    scheduler.setSleepHandler([&](uint32_t) { ++sleeps; });

    ScanOptions options;
    options.batchSize = 2;
    options.interBatchDelayMs = 0;
    ScanResult result;
    result.range = {0x0000, 0x0009};

    ASSERT_TRUE(scheduler.run(f.device, options, result).ok());
    EXPECT_EQ(sleeps, 0);
}

TEST(BatchScheduler, ProgressCallbackPerBatch) {
    Fixture f;
    f.sw.setParam(0x0C01, {0x01});
    f.sw.setParam(0x0C04, {0x02, 0x03});
    f.sw.setParam(0x0C05, {0x04});

    BatchScheduler scheduler;
    scheduler.setSleepHandler([](uint32_t) {});

    std::vector<BatchProgress> events;
    std::vector<TlvId> reported;
    scheduler.setBatchCallback([&](const BatchProgress& p) {
        events.push_back(p);
        ASSERT_NE(p.findings, nullptr);
        for (const auto& finding : *p.findings) reported.push_back(finding.id);
    });

    ScanOptions options;
    options.batchSize = 3;
    ScanResult result;
    result.range = {0x0C00, 0x0C05};

    ASSERT_TRUE(scheduler.run(f.device, options, result).ok());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].batch.index, 1u);
    EXPECT_EQ(events[0].totalBatches, 2u);
    EXPECT_EQ(events[0].found, 1u);
    EXPECT_EQ(events[1].batch.first, 0x0C03);
    EXPECT_EQ(events[1].found, 2u);
    EXPECT_EQ(reported, (std::vector<TlvId>{0x0C01, 0x0C04, 0x0C05}));

    ASSERT_EQ(result.findings.size(), 3u);
    EXPECT_EQ(result.findings[1].data, (Bytes{0x02, 0x03}));
}

TEST(BatchScheduler, PartitionHugeBatchSize) {
    const ScanRange range{0x0002, 0x000A};
    for (uint32_t size : {0xFFFFFFFFu, 0xFFFFFFF0u, 0x10000u, 0x0009u}) {
        auto batches = BatchScheduler::partition(range, size);
        ASSERT_EQ(batches.size(), 1u) << "batch size " << size;
        EXPECT_EQ(batches[0].first, 0x0002);
        EXPECT_EQ(batches[0].last, 0x000A);
    }

    auto full = BatchScheduler::partition({0x0005, 0xFFFF}, 0xFFFFFFFF);
    ASSERT_EQ(full.size(), 1u);
    EXPECT_EQ(full[0].first, 0x0005);
    EXPECT_EQ(full[0].last, 0xFFFF);
}

TEST(BatchScheduler, HugeBatchStaysInsideRange) {
    Fixture f;
    f.sw.setParam(0x0001, {0x01});
    f.sw.setParam(0x000B, {0x02});

    BatchScheduler scheduler;
    ScanOptions options;
    options.batchSize = 0xFFFFFFFF;
    ScanResult result;
    result.range = {0x0002, 0x000A};

    ASSERT_TRUE(scheduler.run(f.device, options, result).ok());
    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(scheduler.prober().stats().queried, 9u);
    EXPECT_EQ(f.sw.requestCount(), 9u);
}

TEST(BatchScheduler, StatsCoverOnlyTheLatestRun) {
    Fixture f;
    f.sw.setParam(0x0001, {0x01});

    BatchScheduler scheduler;
    ScanOptions options;
    options.interBatchDelayMs = 0;
    ScanResult result;
    result.range = {0x0000, 0x0002};

    ASSERT_TRUE(scheduler.run(f.device, options, result).ok());
    ASSERT_TRUE(scheduler.run(f.device, options, result).ok());

    EXPECT_EQ(scheduler.prober().stats().queried, 3u);
    EXPECT_EQ(scheduler.prober().stats().found, 1u);
    EXPECT_EQ(f.sw.requestCount(), 6u);
}
