#include <gtest/gtest.h>
#include "libnsdp/scan/result_aggregator.h"

using namespace libnsdp;
using namespace std::chrono;

TEST(ResultAggregator, FinalizeSortsAndCounts) {
    ScanResult result;
    result.range = {0x0000, 0x0063};  // 100 ids
    result.findings.push_back({0x0050, {0x01}});
    result.findings.push_back({0x0003, {0x02}});
    result.findings.push_back({0x0020, {0x03}});

    auto start = steady_clock::now() - milliseconds(1500);
    ResultAggregator::finalize(result, start);

    ASSERT_EQ(result.findings.size(), 3u);
    EXPECT_EQ(result.findings[0].id, 0x0003);
    EXPECT_EQ(result.findings[1].id, 0x0020);
    EXPECT_EQ(result.findings[2].id, 0x0050);
    EXPECT_EQ(result.totalTested, 100u);
    EXPECT_EQ(result.totalValid, 3u);
    EXPECT_GE(result.duration.count(), 1500);
}

TEST(ResultAggregator, SuccessRate) {
    ScanResult result;
    result.totalTested = 100;
    result.totalValid = 3;
    EXPECT_DOUBLE_EQ(ResultAggregator::successRate(result), 3.0);
    EXPECT_EQ(ResultAggregator::formatSuccessRate(result), "3.00%");

    result.totalTested = 65536;
    result.totalValid = 2;
    EXPECT_EQ(ResultAggregator::formatSuccessRate(result), "0.00%");

    result.totalTested = 3;
    result.totalValid = 1;
    EXPECT_EQ(ResultAggregator::formatSuccessRate(result), "33.33%");
}

TEST(ResultAggregator, SuccessRateWithNothingTested) {
    ScanResult result;
    result.totalTested = 0;
    EXPECT_DOUBLE_EQ(ResultAggregator::successRate(result), 0.0);
    EXPECT_EQ(ResultAggregator::formatSuccessRate(result), "0.00%");
}

TEST(ResultAggregator, FormatDuration) {
    EXPECT_EQ(ResultAggregator::formatDuration(milliseconds(12345)), "12.345s");
    EXPECT_EQ(ResultAggregator::formatDuration(milliseconds(7)), "0.007s");
    EXPECT_EQ(ResultAggregator::formatDuration(milliseconds(0)), "0.000s");
    EXPECT_EQ(ResultAggregator::formatDuration(milliseconds(3600000)), "3600.000s");
}
