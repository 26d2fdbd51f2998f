#include <rangefetch/progress.hpp>
#include <gtest/gtest.h>

#include "test_support.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

using rangefetch::CompletionChannel;
using rangefetch::CompletionNotice;
using rangefetch::ConsoleProgressReporter;
using rangefetch::ProgressAggregator;
using rangefetch::ProgressReporter;
using rangefetch::test::RecordingReporter;

namespace {

class ThrowingReporter final : public ProgressReporter {
public:
    void onProgress(std::uint64_t, std::uint64_t) override { throw std::runtime_error("terminal gone"); }
    void onComplete(std::uint64_t, std::uint64_t) override { ++complete_calls; }

    int complete_calls{0};
};

void sendAll(CompletionChannel& channel, const std::vector<std::uint64_t>& sizes) {
    std::uint64_t index = 0;
    for (const auto bytes : sizes) {
        ASSERT_TRUE(channel.send(CompletionNotice{0, index++, bytes}));
    }
}

} // namespace

TEST(ProgressAggregatorTest, ReportsRunningTotalAndCompletes) {
    CompletionChannel channel{1};
    RecordingReporter reporter;
    ProgressAggregator aggregator{25, channel, reporter};

    std::thread producer([&] {
        sendAll(channel, {10, 10, 5});
        channel.close();
    });
    const auto total = aggregator.run();
    producer.join();

    EXPECT_EQ(total, 25u);
    EXPECT_EQ(reporter.progress, (std::vector<std::uint64_t>{10, 20, 25}));
    EXPECT_EQ(reporter.total, 25u);
    EXPECT_EQ(reporter.complete_calls, 1);
    EXPECT_EQ(reporter.final_bytes, 25u);
}

TEST(ProgressAggregatorTest, ClosureEndsRunBeforeTotalIsReached) {
    CompletionChannel channel{4};
    RecordingReporter reporter;
    ProgressAggregator aggregator{100, channel, reporter};

    sendAll(channel, {10});
    channel.close();

    EXPECT_EQ(aggregator.run(), 10u);
    EXPECT_EQ(reporter.complete_calls, 1);
    EXPECT_EQ(reporter.final_bytes, 10u);
}

TEST(ProgressAggregatorTest, ClosedEmptyChannelOnlySignalsCompletion) {
    CompletionChannel channel{1};
    RecordingReporter reporter;
    ProgressAggregator aggregator{100, channel, reporter};
    channel.close();

    EXPECT_EQ(aggregator.run(), 0u);
    EXPECT_TRUE(reporter.progress.empty());
    EXPECT_EQ(reporter.complete_calls, 1);
}

TEST(ProgressAggregatorTest, KeepsDrainingWhenDisplayFails) {
    CompletionChannel channel{1};
    ThrowingReporter reporter;
    ProgressAggregator aggregator{30, channel, reporter};

    std::thread producer([&] {
        sendAll(channel, {10, 10, 10});
        channel.close();
    });
    const auto total = aggregator.run();
    producer.join();

    EXPECT_EQ(total, 30u);
    EXPECT_EQ(reporter.complete_calls, 1);
}

TEST(ConsoleProgressReporterTest, FormatsSizes) {
    EXPECT_EQ(ConsoleProgressReporter::formatSize(512), "512 B");
    EXPECT_EQ(ConsoleProgressReporter::formatSize(2048), "2.0 KB");
    EXPECT_EQ(ConsoleProgressReporter::formatSize(10ULL * 1024 * 1024), "10.0 MB");
    EXPECT_EQ(ConsoleProgressReporter::formatSize(3ULL * 1024 * 1024 * 1024), "3.0 GB");
}

TEST(ConsoleProgressReporterTest, FormatsPercentage) {
    const auto line = ConsoleProgressReporter::formatLine(25, 100);
    EXPECT_NE(line.find(" 25.00%"), std::string::npos) << line;
    EXPECT_NE(line.find("(25 B/100 B)"), std::string::npos) << line;

    EXPECT_NE(ConsoleProgressReporter::formatLine(100, 100).find("100.00%"), std::string::npos);
    EXPECT_NE(ConsoleProgressReporter::formatLine(0, 0).find("N/A"), std::string::npos);
}
