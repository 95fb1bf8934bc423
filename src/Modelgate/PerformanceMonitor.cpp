// =================================================================
// src/Modelgate/PerformanceMonitor.cpp
// =================================================================
// Implementation of scheduled maintenance operations.

#include "Modelgate/PerformanceMonitor.hpp"
#include "Modelgate/Dispatcher.hpp"
#include "Modelgate/Logger.hpp"
#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace Modelgate {

namespace {

constexpr size_t MAX_TOP_CALLERS = 10;

} // namespace

PerformanceMonitor::PerformanceMonitor(Store& store, QuotaGate& quota_gate, HealthClassifier& health)
    : m_store(store), m_quota_gate(quota_gate), m_health(health) {
}

PerformanceMonitor::PerformanceMonitor(Dispatcher& dispatcher)
    : PerformanceMonitor(dispatcher.store(), dispatcher.quotaGate(), dispatcher.healthClassifier()) {
}

std::vector<HealthReport> PerformanceMonitor::runHealthChecks(const TimePoint& now) {
    std::vector<HealthReport> reports;
    auto pools = m_store.listPools();

    size_t updated = 0;
    for (const auto& endpoint : m_store.listEndpoints()) {
        if (!endpoint.is_active) {
            continue;
        }

        HealthReport report = m_health.runHealthCheck(endpoint.id, now);
        reports.push_back(report);

        // No recent traffic puts the endpoint back in rotation
        bool healthy = report.grade != HealthGrade::UNHEALTHY;
        for (const auto& pool : pools) {
            if (!pool.health_check_enabled) {
                continue;
            }
            for (const auto& member : pool.members) {
                if (member.endpoint.id != endpoint.id) {
                    continue;
                }
                if (m_store.setEndpointHealth(pool.id, endpoint.id, healthy, now)) {
                    updated++;
                }
                if (member.is_healthy != healthy) {
                    Logger::getInstance().info("PerformanceMonitor",
                        endpoint.id + " in pool " + pool.id + " is now " + (healthy ? "healthy" : "unhealthy"),
                        report.message);
                }
            }
        }
    }

    LOG_INFO("PerformanceMonitor", "Health check complete: " + std::to_string(reports.size()) +
             " endpoints checked, " + std::to_string(updated) + " memberships updated");
    return reports;
}

size_t PerformanceMonitor::resetDueQuotas(const TimePoint& now) {
    return m_quota_gate.resetDueQuotas(now);
}

std::vector<PerformanceSnapshot> PerformanceMonitor::updateDailyPerformance(const TimePoint& day) {
    TimePoint start = TimeUtils::startOfUtcDay(day);
    TimePoint end = start + std::chrono::hours(24);
    std::string date = TimeUtils::formatDate(start);

    std::map<std::string, std::vector<CallRecord>> by_endpoint;
    for (auto& record : m_store.queryAllCallRecords(start, end)) {
        by_endpoint[record.endpoint_id].push_back(std::move(record));
    }

    std::vector<PerformanceSnapshot> snapshots;
    for (const auto& endpoint : m_store.listEndpoints()) {
        if (!endpoint.is_active) {
            continue;
        }
        auto it = by_endpoint.find(endpoint.id);
        if (it == by_endpoint.end() || it->second.empty()) {
            continue;
        }

        PerformanceSnapshot snapshot;
        snapshot.endpoint_id = endpoint.id;
        snapshot.date = date;

        double total_latency = 0.0;
        for (const auto& record : it->second) {
            snapshot.total_calls++;
            snapshot.total_input_tokens += static_cast<int64_t>(record.input_tokens);
            snapshot.total_output_tokens += static_cast<int64_t>(record.output_tokens);
            snapshot.total_cost += record.cost;
            if (record.status == CallStatus::SUCCESS) {
                snapshot.successful_calls++;
                total_latency += static_cast<double>(record.latency.count());
            }
        }

        snapshot.failed_calls = snapshot.total_calls - snapshot.successful_calls;
        snapshot.success_rate = static_cast<double>(snapshot.successful_calls) / snapshot.total_calls * 100.0;
        snapshot.average_cost_per_call = snapshot.total_cost / snapshot.total_calls;
        if (snapshot.successful_calls > 0) {
            snapshot.average_latency_ms = total_latency / snapshot.successful_calls;
        }

        m_store.upsertPerformanceSnapshot(snapshot);
        snapshots.push_back(snapshot);
    }

    LOG_INFO("PerformanceMonitor", "Daily performance for " + date + " updated: " +
             std::to_string(snapshots.size()) + " endpoints");
    return snapshots;
}

size_t PerformanceMonitor::cleanupOldCallRecords(std::chrono::hours keep, const TimePoint& now) {
    TimePoint cutoff = now - keep;
    size_t deleted = m_store.deleteCallRecordsBefore(cutoff);

    Logger::getInstance().info("PerformanceMonitor",
        "Deleted " + std::to_string(deleted) + " call records",
        "Cutoff: " + TimeUtils::formatDate(cutoff));
    return deleted;
}

CostReport PerformanceMonitor::generateCostReport(const TimePoint& end, int days) {
    TimePoint last_day = TimeUtils::startOfUtcDay(end);
    TimePoint start = last_day - std::chrono::hours(24) * std::max(0, days);
    TimePoint until = last_day + std::chrono::hours(24);

    CostReport report;
    report.start_date = TimeUtils::formatDate(start);
    report.end_date = TimeUtils::formatDate(last_day);

    std::map<std::string, EndpointCost> endpoint_costs;
    std::map<std::string, CallerCost> caller_costs;

    for (const auto& record : m_store.queryAllCallRecords(start, until)) {
        if (record.status != CallStatus::SUCCESS) {
            continue;
        }

        EndpointCost& endpoint_cost = endpoint_costs[record.endpoint_id];
        endpoint_cost.endpoint_id = record.endpoint_id;
        endpoint_cost.calls++;
        endpoint_cost.input_tokens += static_cast<int64_t>(record.input_tokens);
        endpoint_cost.output_tokens += static_cast<int64_t>(record.output_tokens);
        endpoint_cost.cost += record.cost;

        if (!record.caller_id.empty()) {
            CallerCost& caller_cost = caller_costs[record.caller_id];
            caller_cost.caller_id = record.caller_id;
            caller_cost.calls++;
            caller_cost.tokens += static_cast<int64_t>(record.totalTokens());
            caller_cost.cost += record.cost;
        }

        report.total_calls++;
        report.total_tokens += static_cast<int64_t>(record.totalTokens());
        report.total_cost += record.cost;
    }

    for (auto& entry : endpoint_costs) {
        if (auto endpoint = m_store.getEndpoint(entry.first)) {
            entry.second.endpoint_name = endpoint->name;
        }
        report.endpoints.push_back(entry.second);
    }
    std::stable_sort(report.endpoints.begin(), report.endpoints.end(),
        [](const EndpointCost& a, const EndpointCost& b) { return a.cost > b.cost; });

    for (const auto& entry : caller_costs) {
        report.top_callers.push_back(entry.second);
    }
    std::stable_sort(report.top_callers.begin(), report.top_callers.end(),
        [](const CallerCost& a, const CallerCost& b) { return a.cost > b.cost; });
    if (report.top_callers.size() > MAX_TOP_CALLERS) {
        report.top_callers.resize(MAX_TOP_CALLERS);
    }

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(4) << report.total_cost;
    Logger::getInstance().info("PerformanceMonitor",
        "Cost report " + report.start_date + " to " + report.end_date + " generated",
        "Calls: " + std::to_string(report.total_calls) + ", Cost: " + summary.str());
    return report;
}

nlohmann::json toJson(const CostReport& report) {
    nlohmann::json endpoints = nlohmann::json::array();
    for (const auto& entry : report.endpoints) {
        endpoints.push_back({
            {"endpoint_id", entry.endpoint_id},
            {"name", entry.endpoint_name},
            {"calls", entry.calls},
            {"input_tokens", entry.input_tokens},
            {"output_tokens", entry.output_tokens},
            {"cost", entry.cost}
        });
    }

    nlohmann::json callers = nlohmann::json::array();
    for (const auto& entry : report.top_callers) {
        callers.push_back({
            {"caller_id", entry.caller_id},
            {"calls", entry.calls},
            {"tokens", entry.tokens},
            {"cost", entry.cost}
        });
    }

    return {
        {"start_date", report.start_date},
        {"end_date", report.end_date},
        {"endpoints", endpoints},
        {"top_callers", callers},
        {"total_calls", report.total_calls},
        {"total_tokens", report.total_tokens},
        {"total_cost", report.total_cost}
    };
}

} // namespace Modelgate
