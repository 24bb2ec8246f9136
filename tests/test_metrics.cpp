#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <memory>
#include <vector>
#include "metrics.hpp"

class RollingHistTest : public ::testing::Test {
protected:
    void SetUp() override {
        hist = std::make_unique<RollingHist>(5);  // Small capacity for testing
    }

    std::unique_ptr<RollingHist> hist;
};

TEST_F(RollingHistTest, EmptyHistogram) {
    EXPECT_EQ(hist->size(), 0);
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 0.0);
    EXPECT_DOUBLE_EQ(hist->perc(95.0), 0.0);
}

TEST_F(RollingHistTest, SingleValue) {
    hist->add(42.0);
    EXPECT_EQ(hist->size(), 1);
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 42.0);
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 42.0);
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 42.0);
}

TEST_F(RollingHistTest, MultipleValues) {
    // Add values: 1, 2, 3, 4, 5
    for (int i = 1; i <= 5; ++i) {
        hist->add(static_cast<double>(i));
    }
    
    EXPECT_EQ(hist->size(), 5);
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 1.0);   // Min value
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 3.0);  // Median
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 5.0); // Max value
}

TEST_F(RollingHistTest, CapacityOverflow) {
    // Add 7 values to a capacity-5 histogram
    for (int i = 1; i <= 7; ++i) {
        hist->add(static_cast<double>(i));
    }
    
    EXPECT_EQ(hist->size(), 5);  // Should cap at 5
    // Should contain values 3, 4, 5, 6, 7 (oldest dropped)
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 3.0);
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 7.0);
}

TEST_F(RollingHistTest, PercentileCalculation) {
    // Add values: 10, 20, 30, 40, 50
    for (int i = 1; i <= 5; ++i) {
        hist->add(static_cast<double>(i * 10));
    }
    
    EXPECT_DOUBLE_EQ(hist->perc(25.0), 20.0);  // 25th percentile
    EXPECT_DOUBLE_EQ(hist->perc(75.0), 40.0);  // 75th percentile
}

TEST_F(RollingHistTest, ThreadSafety) {
    const int num_threads = 4;
    const int values_per_thread = 100;
    
    std::vector<std::thread> threads;
    
    // Launch multiple threads to add values concurrently
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, values_per_thread]() {
            for (int i = 0; i < values_per_thread; ++i) {
                hist->add(static_cast<double>(t * values_per_thread + i));
            }
        });
    }
    
    // Wait for all threads to complete
    for (auto& thread : threads) {
        thread.join();
    }
    
    // Should have exactly 5 values due to capacity limit
    EXPECT_EQ(hist->size(), 5);
    
    // All values should be valid (no corruption)
    double p50 = hist->perc(50.0);
    double p95 = hist->perc(95.0);
    EXPECT_GE(p50, 0.0);
    EXPECT_GE(p95, p50);
}

class CaptureMetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        metrics = std::make_unique<CaptureMetrics>();
    }

    std::unique_ptr<CaptureMetrics> metrics;
};

TEST_F(CaptureMetricsTest, InitialState) {
    EXPECT_EQ(metrics->shots_total(), 0u);
    EXPECT_EQ(metrics->failures_total(), 0u);

    auto snapshot = metrics->snapshot();
    EXPECT_DOUBLE_EQ(snapshot.failure_rate, 0.0);
    EXPECT_EQ(snapshot.runs_total, 0u);
}

TEST_F(CaptureMetricsTest, CountsShotsAndFailures) {
    metrics->add_capture(1.0, true);
    metrics->add_capture(2.0, false);
    metrics->add_capture(3.0, true);
    metrics->add_capture(4.0, true);
    metrics->inc_run();

    EXPECT_EQ(metrics->shots_total(), 4u);
    EXPECT_EQ(metrics->failures_total(), 1u);

    auto snapshot = metrics->snapshot();
    EXPECT_DOUBLE_EQ(snapshot.failure_rate, 0.25);  // 1/4
    EXPECT_EQ(snapshot.runs_total, 1u);
}

TEST_F(CaptureMetricsTest, DurationsAreReportedInMilliseconds) {
    metrics->add_capture(1.5, true);

    auto snapshot = metrics->snapshot();
    EXPECT_DOUBLE_EQ(snapshot.capture_p50, 1500.0);
    EXPECT_DOUBLE_EQ(snapshot.capture_p99, 1500.0);
}

TEST_F(CaptureMetricsTest, PrometheusOutput) {
    metrics->add_capture(0.8, true);
    metrics->inc_run();

    std::string prometheus_text = metrics->prometheus_text(metrics->snapshot());

    EXPECT_NE(prometheus_text.find("capture_duration_ms{quantile=\"0.5\"}"), std::string::npos);
    EXPECT_NE(prometheus_text.find("capture_shots_total 1"), std::string::npos);
    EXPECT_NE(prometheus_text.find("capture_failures_total 0"), std::string::npos);
    EXPECT_NE(prometheus_text.find("acquisition_runs_total 1"), std::string::npos);
}

TEST_F(CaptureMetricsTest, ConcurrentAccess) {
    const int num_threads = 4;
    const int captures_per_thread = 1000;

    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, captures_per_thread]() {
            for (int i = 0; i < captures_per_thread; ++i) {
                metrics->add_capture(1.0, i % 10 != 0);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(metrics->shots_total(), static_cast<uint64_t>(num_threads * captures_per_thread));
    EXPECT_EQ(metrics->failures_total(),
              static_cast<uint64_t>(num_threads * (captures_per_thread / 10)));
}
