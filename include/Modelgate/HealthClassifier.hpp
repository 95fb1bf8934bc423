// =================================================================
// include/Modelgate/HealthClassifier.hpp
// =================================================================
// Grades endpoint health from recent call records.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include "Modelgate/Store.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Modelgate {

/**
 * @brief Health grade of an endpoint
 */
enum class HealthGrade {
    HEALTHY,
    DEGRADED,
    UNHEALTHY,
    UNKNOWN             ///< No qualifying records in the window
};

/**
 * @brief Classification thresholds
 */
struct HealthThresholds {
    double healthy_success_rate = 95.0;                 ///< Percent, inclusive
    std::chrono::milliseconds healthy_latency{5000};    ///< Exclusive
    double degraded_success_rate = 80.0;                ///< Percent, inclusive
    std::chrono::milliseconds degraded_latency{10000};  ///< Exclusive
    std::chrono::minutes window{60};                    ///< Trailing window examined
};

/**
 * @brief Result of one health check
 */
struct HealthReport {
    std::string endpoint_id;
    HealthGrade grade = HealthGrade::UNKNOWN;
    double success_rate = 0.0;              ///< Percent of backend attempts that succeeded
    double avg_latency_ms = 0.0;            ///< Mean latency of successful attempts
    size_t total_calls = 0;                 ///< Backend attempts in the window
    size_t successful_calls = 0;
    std::string message;
    TimePoint checked_at;
};

/**
 * @brief Maps recent call outcomes to a health grade
 *
 * Admission denials (quota-exceeded, rate-limited) are not backend attempts
 * and are ignored.
 */
class HealthClassifier {
public:
    HealthClassifier(Store& store, const HealthThresholds& thresholds = HealthThresholds());

    /**
     * @brief Classify a set of records
     * @param endpoint_id Endpoint the records belong to
     * @param records Records already restricted to the window
     */
    HealthReport classify(const std::string& endpoint_id, const std::vector<CallRecord>& records) const;

    /**
     * @brief Read the trailing window from the store and classify it
     */
    HealthReport runHealthCheck(const std::string& endpoint_id, const TimePoint& now = Clock::now());

    const HealthThresholds& getThresholds() const { return m_thresholds; }

    static std::string gradeToString(HealthGrade grade);

private:
    Store& m_store;
    HealthThresholds m_thresholds;
};

nlohmann::json toJson(const HealthReport& report);

} // namespace Modelgate
