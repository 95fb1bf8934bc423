// =================================================================
// src/Modelgate/HealthClassifier.cpp
// =================================================================
// Implementation of endpoint health classification.

#include "Modelgate/HealthClassifier.hpp"
#include "Modelgate/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace Modelgate {

HealthClassifier::HealthClassifier(Store& store, const HealthThresholds& thresholds)
    : m_store(store), m_thresholds(thresholds) {
}

HealthReport HealthClassifier::classify(const std::string& endpoint_id,
                                        const std::vector<CallRecord>& records) const {
    HealthReport report;
    report.endpoint_id = endpoint_id;
    report.checked_at = Clock::now();

    double total_latency = 0.0;
    for (const auto& record : records) {
        if (record.status == CallStatus::QUOTA_EXCEEDED || record.status == CallStatus::RATE_LIMITED) {
            continue;
        }

        report.total_calls++;
        if (record.status == CallStatus::SUCCESS) {
            report.successful_calls++;
            total_latency += static_cast<double>(record.latency.count());
        }
    }

    if (report.total_calls == 0) {
        report.grade = HealthGrade::UNKNOWN;
        report.message = "No calls in the last " + std::to_string(m_thresholds.window.count()) + " minutes";
        return report;
    }

    report.success_rate = static_cast<double>(report.successful_calls) / report.total_calls * 100.0;
    if (report.successful_calls > 0) {
        report.avg_latency_ms = total_latency / report.successful_calls;
    }

    // An endpoint with no successes has no meaningful latency; it can only be unhealthy
    bool has_latency = report.successful_calls > 0;

    if (has_latency &&
        report.success_rate >= m_thresholds.healthy_success_rate &&
        report.avg_latency_ms < static_cast<double>(m_thresholds.healthy_latency.count())) {
        report.grade = HealthGrade::HEALTHY;
    } else if (has_latency &&
               report.success_rate >= m_thresholds.degraded_success_rate &&
               report.avg_latency_ms < static_cast<double>(m_thresholds.degraded_latency.count())) {
        report.grade = HealthGrade::DEGRADED;
    } else {
        report.grade = HealthGrade::UNHEALTHY;
    }

    std::ostringstream message;
    message << std::fixed << std::setprecision(1)
            << report.success_rate << "% success over " << report.total_calls << " calls, "
            << std::setprecision(0) << report.avg_latency_ms << "ms average latency";
    report.message = message.str();

    return report;
}

HealthReport HealthClassifier::runHealthCheck(const std::string& endpoint_id, const TimePoint& now) {
    auto since = now - std::chrono::duration_cast<Clock::duration>(m_thresholds.window);
    auto records = m_store.queryCallRecords(endpoint_id, since);

    HealthReport report = classify(endpoint_id, records);
    report.checked_at = now;

    Logger::getInstance().logHealthReport(report);
    return report;
}

std::string HealthClassifier::gradeToString(HealthGrade grade) {
    switch (grade) {
        case HealthGrade::HEALTHY:
            return "healthy";
        case HealthGrade::DEGRADED:
            return "degraded";
        case HealthGrade::UNHEALTHY:
            return "unhealthy";
        default:
            return "unknown";
    }
}

nlohmann::json toJson(const HealthReport& report) {
    return {
        {"endpoint_id", report.endpoint_id},
        {"status", HealthClassifier::gradeToString(report.grade)},
        {"success_rate", report.success_rate},
        {"avg_latency_ms", report.avg_latency_ms},
        {"total_calls", report.total_calls},
        {"successful_calls", report.successful_calls},
        {"message", report.message},
        {"checked_at_ms", TimeUtils::toMillis(report.checked_at)}
    };
}

} // namespace Modelgate
