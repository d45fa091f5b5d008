// =================================================================
// src/Maestro/PerformanceMonitor.cpp
// =================================================================
// Implementation of the performance monitor.

#include "Maestro/PerformanceMonitor.hpp"
#include "Maestro/Logger.hpp"
#include <fstream>

namespace Maestro {

namespace {

const char* kSynthesisId = "synthesis";

} // namespace

nlohmann::json PerformanceSummary::toJson() const {
    nlohmann::json j;
    j["total_records"] = total_records;
    j["average_latency_ms"] = average_latency_ms;
    j["success_rate"] = success_rate;

    nlohmann::json models = nlohmann::json::object();
    for (const auto& [id, stats] : per_model) {
        models[id] = {
            {"calls", stats.calls},
            {"successes", stats.successes},
            {"failures", stats.failures},
            {"average_latency_ms", stats.average_latency_ms},
            {"success_rate", stats.success_rate}
        };
    }
    j["models"] = models;

    nlohmann::json categories = nlohmann::json::object();
    for (const auto& [name, stats] : per_category) {
        categories[name] = {
            {"count", stats.count},
            {"average_confidence", stats.average_confidence},
            {"average_latency_ms", stats.average_latency_ms}
        };
    }
    j["categories"] = categories;
    j["errors"] = error_counts;
    return j;
}

PerformanceMonitor::PerformanceMonitor(size_t max_records, size_t max_pending_observations)
    : m_max_records(max_records == 0 ? 1 : max_records),
      m_max_pending(max_pending_observations == 0 ? 1 : max_pending_observations) {}

PerformanceMonitor::~PerformanceMonitor() {
    {
        std::lock_guard<std::mutex> lock(m_dispatch_mutex);
        m_stop = true;
    }
    m_dispatch_cv.notify_all();
    if (m_dispatcher.joinable()) {
        m_dispatcher.join();
    }
}

void PerformanceMonitor::record(const PerformanceRecord& record) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records.push_back(record);
        while (m_records.size() > m_max_records) {
            m_records.pop_front();
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_dispatch_mutex);
        if (m_sinks.empty()) {
            return;
        }
        if (m_pending.size() >= m_max_pending) {
            m_dropped++;
            return;
        }
        m_pending.push_back(record);
    }
    m_dispatch_cv.notify_one();
}

void PerformanceMonitor::addSink(std::shared_ptr<MetricsSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_dispatch_mutex);
    m_sinks.push_back(std::move(sink));
    if (!m_dispatcher.joinable()) {
        m_dispatcher = std::thread(&PerformanceMonitor::dispatchLoop, this);
    }
}

void PerformanceMonitor::flush() {
    std::unique_lock<std::mutex> lock(m_dispatch_mutex);
    m_idle_cv.wait(lock, [this] { return m_pending.empty() && !m_delivering; });
}

size_t PerformanceMonitor::droppedObservations() const {
    std::lock_guard<std::mutex> lock(m_dispatch_mutex);
    return m_dropped;
}

void PerformanceMonitor::dispatchLoop() {
    std::unique_lock<std::mutex> lock(m_dispatch_mutex);
    while (true) {
        m_dispatch_cv.wait(lock, [this] { return m_stop || !m_pending.empty(); });
        if (m_pending.empty()) {
            return; // stopping and drained
        }

        PerformanceRecord record = std::move(m_pending.front());
        m_pending.pop_front();
        std::vector<std::shared_ptr<MetricsSink>> sinks = m_sinks;
        m_delivering = true;
        lock.unlock();

        for (const auto& sink : sinks) {
            try {
                sink->observe(record);
            } catch (const std::exception& e) {
                Logger::getInstance().warning("PerformanceMonitor", "Metrics sink failed", e.what());
            }
        }

        lock.lock();
        m_delivering = false;
        if (m_pending.empty()) {
            m_idle_cv.notify_all();
        }
    }
}

PerformanceSummary PerformanceMonitor::aggregate(std::chrono::seconds window) const {
    return summarize(std::chrono::system_clock::now() - window);
}

PerformanceSummary PerformanceMonitor::aggregateAll() const {
    return summarize(std::nullopt);
}

std::optional<std::chrono::milliseconds> PerformanceMonitor::recentLatency(const std::string& model_id,
                                                                           std::chrono::seconds window) const {
    auto since = std::chrono::system_clock::now() - window;

    std::lock_guard<std::mutex> lock(m_mutex);
    long long total = 0;
    size_t count = 0;
    for (auto it = m_records.rbegin(); it != m_records.rend(); ++it) {
        if (it->timestamp < since) {
            break;
        }
        if (it->model_id == model_id && it->success) {
            total += it->latency.count();
            count++;
        }
    }

    if (count == 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(total / static_cast<long long>(count));
}

size_t PerformanceMonitor::recordCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

bool PerformanceMonitor::saveToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        Logger::getInstance().error("PerformanceMonitor", "Cannot write metrics file", path);
        return false;
    }

    out << aggregateAll().toJson().dump(2) << std::endl;
    return out.good();
}

void PerformanceMonitor::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.clear();
}

PerformanceSummary PerformanceMonitor::summarize(std::optional<std::chrono::system_clock::time_point> since) const {
    PerformanceSummary summary;
    std::map<std::string, long long> model_latency;
    std::map<std::string, long long> category_latency;
    std::map<std::string, double> category_confidence;
    long long total_latency = 0;
    size_t successes = 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& record : m_records) {
        if (since && record.timestamp < *since) {
            continue;
        }

        summary.total_records++;
        total_latency += record.latency.count();
        if (record.success) {
            successes++;
        } else if (record.error_code != ErrorCode::NONE) {
            summary.error_counts[errorCodeToString(record.error_code)]++;
        }

        auto& model = summary.per_model[record.model_id];
        model.calls++;
        if (record.success) {
            model.successes++;
        } else {
            model.failures++;
        }
        model_latency[record.model_id] += record.latency.count();

        // Categories describe whole queries, so only synthesis records count
        if (record.model_id == kSynthesisId && record.category) {
            std::string name = taskCategoryToString(*record.category);
            summary.per_category[name].count++;
            category_latency[name] += record.latency.count();
            category_confidence[name] += record.confidence;
        }
    }

    if (summary.total_records > 0) {
        summary.average_latency_ms = static_cast<double>(total_latency) / summary.total_records;
        summary.success_rate = static_cast<double>(successes) / summary.total_records;
    }

    for (auto& [id, stats] : summary.per_model) {
        stats.average_latency_ms = static_cast<double>(model_latency[id]) / stats.calls;
        stats.success_rate = static_cast<double>(stats.successes) / stats.calls;
    }

    for (auto& [name, stats] : summary.per_category) {
        stats.average_latency_ms = static_cast<double>(category_latency[name]) / stats.count;
        stats.average_confidence = category_confidence[name] / stats.count;
    }

    return summary;
}

} // namespace Maestro
