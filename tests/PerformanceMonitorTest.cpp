// =================================================================
// tests/PerformanceMonitorTest.cpp
// =================================================================
// Unit tests for performance records and aggregation.

#include "Maestro/PerformanceMonitor.hpp"
#include "TestModels.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <fstream>
#include <mutex>

using namespace Maestro;

namespace {

PerformanceRecord makeRecord(const std::string& model_id, long latency_ms, bool success,
                             ErrorCode code = ErrorCode::NONE) {
    PerformanceRecord record;
    record.model_id = model_id;
    record.latency = std::chrono::milliseconds(latency_ms);
    record.success = success;
    record.error_code = code;
    return record;
}

class CountingSink : public MetricsSink {
public:
    void observe(const PerformanceRecord& record) override {
        (void)record;
        m_count++;
    }
    size_t count() const { return m_count.load(); }

private:
    std::atomic<size_t> m_count{0};
};

/**
 * @brief Sink that holds the dispatcher until released
 */
class GateSink : public MetricsSink {
public:
    void observe(const PerformanceRecord& record) override {
        (void)record;
        std::unique_lock<std::mutex> lock(m_mutex);
        m_entered = true;
        m_cv.notify_all();
        m_cv.wait(lock, [this] { return m_open; });
        m_delivered++;
    }

    void waitEntered() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_entered; });
    }

    void open() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
        m_cv.notify_all();
    }

    size_t delivered() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_delivered;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_entered = false;
    bool m_open = false;
    size_t m_delivered = 0;
};

class ThrowingSink : public MetricsSink {
public:
    void observe(const PerformanceRecord& record) override {
        throw std::runtime_error("exporter offline for " + record.model_id);
    }
};

} // namespace

class PerformanceMonitorTest {
public:
    PerformanceMonitorTest() {
        MaestroTest::silenceLogging();
    }

    void testAggregation() {
        std::cout << "Testing aggregation per model and category..." << std::endl;

        PerformanceMonitor monitor;
        monitor.record(makeRecord("reasoning-specialist", 100, true));
        monitor.record(makeRecord("reasoning-specialist", 300, false, ErrorCode::REMOTE_TRANSIENT));
        monitor.record(makeRecord("coder-fallback", 200, true));

        PerformanceRecord synthesis = makeRecord("synthesis", 400, true);
        synthesis.category = TaskCategory::REASONING;
        synthesis.confidence = 0.8;
        monitor.record(synthesis);

        PerformanceSummary summary = monitor.aggregateAll();
        assert(summary.total_records == 4);
        assert(std::abs(summary.average_latency_ms - 250.0) < 1e-9);
        assert(std::abs(summary.success_rate - 0.75) < 1e-9);

        const ModelStats& reasoning = summary.per_model.at("reasoning-specialist");
        assert(reasoning.calls == 2);
        assert(reasoning.successes == 1);
        assert(reasoning.failures == 1);
        assert(std::abs(reasoning.average_latency_ms - 200.0) < 1e-9);
        assert(std::abs(reasoning.success_rate - 0.5) < 1e-9);

        assert(summary.error_counts.at("remote_transient") == 1);

        // Only synthesis records contribute categories
        assert(summary.per_category.size() == 1);
        const CategoryStats& category = summary.per_category.at("reasoning");
        assert(category.count == 1);
        assert(std::abs(category.average_confidence - 0.8) < 1e-9);
        assert(std::abs(category.average_latency_ms - 400.0) < 1e-9);

        std::cout << "✓ Aggregation test passed" << std::endl;
    }

    void testWindowedAggregation() {
        std::cout << "Testing windowed aggregation excludes old records..." << std::endl;

        PerformanceMonitor monitor;
        PerformanceRecord old_record = makeRecord("reasoning-specialist", 900, false, ErrorCode::TIMEOUT);
        old_record.timestamp = std::chrono::system_clock::now() - std::chrono::hours(2);
        monitor.record(old_record);
        monitor.record(makeRecord("reasoning-specialist", 100, true));

        PerformanceSummary recent = monitor.aggregate(std::chrono::seconds(3600));
        assert(recent.total_records == 1);
        assert(recent.success_rate == 1.0);
        assert(recent.error_counts.empty());

        assert(monitor.aggregateAll().total_records == 2);

        std::cout << "✓ Windowed aggregation test passed" << std::endl;
    }

    void testRecentLatency() {
        std::cout << "Testing recent latency of successful calls..." << std::endl;

        PerformanceMonitor monitor;
        monitor.record(makeRecord("reasoning-specialist", 100, true));
        monitor.record(makeRecord("reasoning-specialist", 300, true));
        monitor.record(makeRecord("reasoning-specialist", 5000, false, ErrorCode::TIMEOUT));

        auto latency = monitor.recentLatency("reasoning-specialist", std::chrono::seconds(60));
        assert(latency.has_value());
        assert(*latency == std::chrono::milliseconds(200));
        assert(!monitor.recentLatency("coder-fallback", std::chrono::seconds(60)).has_value());

        std::cout << "✓ Recent latency test passed" << std::endl;
    }

    void testRecordLimit() {
        std::cout << "Testing record retention limit..." << std::endl;

        PerformanceMonitor monitor(3);
        for (int i = 0; i < 5; ++i) {
            monitor.record(makeRecord("m", 10 * (i + 1), true));
        }
        assert(monitor.recordCount() == 3);

        // The oldest two were dropped: 30, 40, 50 remain
        assert(std::abs(monitor.aggregateAll().average_latency_ms - 40.0) < 1e-9);

        monitor.clear();
        assert(monitor.recordCount() == 0);
        assert(monitor.aggregateAll().total_records == 0);

        std::cout << "✓ Record limit test passed" << std::endl;
    }

    void testSinks() {
        std::cout << "Testing metrics sinks and their failures..." << std::endl;

        PerformanceMonitor monitor;
        auto counting = std::make_shared<CountingSink>();
        monitor.addSink(std::make_shared<ThrowingSink>());
        monitor.addSink(counting);
        monitor.addSink(nullptr);

        monitor.record(makeRecord("reasoning-specialist", 100, true));
        monitor.record(makeRecord("coder-fallback", 100, true));
        monitor.flush();

        assert(counting->count() == 2 && "A failing sink must not starve the others");
        assert(monitor.recordCount() == 2);
        assert(monitor.droppedObservations() == 0);

        std::cout << "✓ Sink test passed" << std::endl;
    }

    void testSlowSinkDoesNotBlockRecording() {
        std::cout << "Testing a stalled sink does not block recording..." << std::endl;

        PerformanceMonitor monitor(100, 2);
        auto gate = std::make_shared<GateSink>();
        monitor.addSink(gate);

        monitor.record(makeRecord("reasoning-specialist", 100, true));
        gate->waitEntered();

        // The dispatcher is stuck inside the sink; record() must still return
        auto started = std::chrono::steady_clock::now();
        monitor.record(makeRecord("reasoning-specialist", 110, true));
        monitor.record(makeRecord("reasoning-specialist", 120, true));
        monitor.record(makeRecord("reasoning-specialist", 130, true));
        assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(100));

        assert(monitor.recordCount() == 4 && "Aggregation keeps every record");
        assert(monitor.droppedObservations() == 1);

        gate->open();
        monitor.flush();
        assert(gate->delivered() == 3);

        std::cout << "✓ Stalled sink test passed" << std::endl;
    }

    void testJsonAndSave() {
        std::cout << "Testing summary JSON and file export..." << std::endl;

        PerformanceMonitor monitor;
        monitor.record(makeRecord("reasoning-specialist", 120, true));
        monitor.record(makeRecord("coder-fallback", 80, false, ErrorCode::REMOTE_PERMANENT));

        nlohmann::json j = monitor.aggregateAll().toJson();
        assert(j["total_records"] == 2);
        assert(j["models"]["reasoning-specialist"]["calls"] == 1);
        assert(j["errors"]["remote_permanent"] == 1);
        assert(j.contains("categories"));

        const std::string path = "performance_monitor_test.json";
        assert(monitor.saveToFile(path));

        std::ifstream in(path);
        assert(in.is_open());
        nlohmann::json saved = nlohmann::json::parse(in);
        in.close();
        assert(saved["total_records"] == 2);
        std::remove(path.c_str());

        assert(!monitor.saveToFile("/nonexistent-directory/summary.json"));

        std::cout << "✓ JSON export test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PerformanceMonitor Tests..." << std::endl;
        std::cout << "==================================" << std::endl;

        testAggregation();
        std::cout << std::endl;

        testWindowedAggregation();
        std::cout << std::endl;

        testRecentLatency();
        std::cout << std::endl;

        testRecordLimit();
        std::cout << std::endl;

        testSinks();
        std::cout << std::endl;

        testSlowSinkDoesNotBlockRecording();
        std::cout << std::endl;

        testJsonAndSave();
        std::cout << std::endl;

        std::cout << "All PerformanceMonitor tests passed!" << std::endl;
    }
};

int main() {
    try {
        PerformanceMonitorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All PerformanceMonitor component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
