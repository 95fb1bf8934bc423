// =================================================================
// include/Modelgate/PerformanceMonitor.hpp
// =================================================================
// Periodic maintenance: health write-back, quota resets, daily rollups,
// history cleanup and cost reports.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include "Modelgate/HealthClassifier.hpp"
#include "Modelgate/QuotaGate.hpp"
#include "Modelgate/Store.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Modelgate {

class Dispatcher;

/**
 * @brief Cost totals of one endpoint
 */
struct EndpointCost {
    std::string endpoint_id;
    std::string endpoint_name;
    size_t calls = 0;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    double cost = 0.0;
};

/**
 * @brief Cost totals of one caller
 */
struct CallerCost {
    std::string caller_id;
    size_t calls = 0;
    int64_t tokens = 0;
    double cost = 0.0;
};

/**
 * @brief Cost of successful calls over a period
 */
struct CostReport {
    std::string start_date;                 ///< First day, inclusive
    std::string end_date;                   ///< Last day, inclusive
    std::vector<EndpointCost> endpoints;    ///< Most expensive first
    std::vector<CallerCost> top_callers;    ///< At most 10, most expensive first
    size_t total_calls = 0;
    int64_t total_tokens = 0;
    double total_cost = 0.0;
};

/**
 * @brief Scheduler entry points operating on the store
 *
 * Each operation is self-contained so that an external scheduler (cron, a
 * CLI invocation) can trigger it independently of in-flight dispatches.
 */
class PerformanceMonitor {
public:
    PerformanceMonitor(Store& store, QuotaGate& quota_gate, HealthClassifier& health);

    /**
     * @brief Construct over a dispatcher's store, quota gate and classifier
     */
    explicit PerformanceMonitor(Dispatcher& dispatcher);

    /**
     * @brief Classify every active endpoint and write the result to its pool memberships
     *
     * Unhealthy clears the membership flag, every other grade sets it. Pools with
     * health checks disabled are skipped.
     */
    std::vector<HealthReport> runHealthChecks(const TimePoint& now = Clock::now());

    /**
     * @brief Reset every active quota whose reset time has passed
     */
    size_t resetDueQuotas(const TimePoint& now = Clock::now());

    /**
     * @brief Recompute the snapshots of one UTC day
     * @param day Any time point within the day
     * @return Snapshots written, one per active endpoint with calls that day
     */
    std::vector<PerformanceSnapshot> updateDailyPerformance(const TimePoint& day = Clock::now());

    /**
     * @brief Delete call records older than keep
     * @return Number of records deleted
     */
    size_t cleanupOldCallRecords(std::chrono::hours keep = std::chrono::hours(24 * 30),
                                 const TimePoint& now = Clock::now());

    /**
     * @brief Cost report for the days ending at end
     * @param end Any time point within the last day
     * @param days Number of days before the last day to include
     */
    CostReport generateCostReport(const TimePoint& end = Clock::now(), int days = 7);

private:
    Store& m_store;
    QuotaGate& m_quota_gate;
    HealthClassifier& m_health;
};

nlohmann::json toJson(const CostReport& report);

} // namespace Modelgate
