// tests/test_metrics.cpp

#include <gtest/gtest.h>

#include "metrics/metrics.hpp"

using agentbus::metrics::MetricsCollector;

TEST(MetricsTest, CountersAreKeptPerLabelSet)
{
    MetricsCollector metrics;
    metrics.increment("message_dropped", {{"reason", "invalid"}});
    metrics.increment("message_dropped", {{"reason", "invalid"}});
    metrics.increment("message_dropped", {{"reason", "duplicate"}});
    metrics.increment("bytes_sent", {}, 128);

    EXPECT_EQ(metrics.value("message_dropped", {{"reason", "invalid"}}), 2u);
    EXPECT_EQ(metrics.value("message_dropped", {{"reason", "duplicate"}}), 1u);
    EXPECT_EQ(metrics.value("message_dropped"), 0u);
    EXPECT_EQ(metrics.total("message_dropped"), 3u);
    EXPECT_EQ(metrics.value("bytes_sent"), 128u);
    EXPECT_EQ(metrics.total("never_touched"), 0u);
}

TEST(MetricsTest, SnapshotNamesSeriesWithLabels)
{
    MetricsCollector metrics;
    metrics.increment("message_error", {{"reason", "handler"}, {"transport", "in_process"}});
    metrics.increment("task_timeout");

    auto snapshot = metrics.snapshot();
    EXPECT_EQ(snapshot["message_error{reason=handler,transport=in_process}"], 1);
    EXPECT_EQ(snapshot["task_timeout"], 1);

    metrics.reset();
    EXPECT_TRUE(metrics.snapshot().empty());
}
