// =================================================================
// include/Modelgate/QuotaGate.hpp
// =================================================================
// Admission control: quota ceilings, daily endpoint caps and rate limits.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include "Modelgate/RateLimiter.hpp"
#include "Modelgate/Store.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Modelgate {

/**
 * @brief Admission verdict for one attempt
 */
struct AdmissionDecision {
    bool allowed = true;
    CallStatus denial_status = CallStatus::QUOTA_EXCEEDED; ///< Status recorded for a denial
    std::string reason;                     ///< Human-readable denial reason
    std::string quota_id;                   ///< Quota that denied, if any
};

/**
 * @brief Admission gate consulted before every attempt
 *
 * A request is denied when any active quota for (endpoint, caller) or
 * (endpoint, every caller) has reached a ceiling, when the endpoint's daily
 * call cap is used up, or when its per-minute request/token window is full.
 * Usage is committed only after a successful call; the window between check
 * and commit may let concurrent requests overshoot a ceiling slightly.
 */
class QuotaGate {
public:
    explicit QuotaGate(Store& store);

    /**
     * @brief Decide whether an attempt may proceed
     * @param endpoint Endpoint about to be called
     * @param caller_id Caller identity, may be empty
     * @param now Current time
     * @return Decision; an allowed decision has consumed one request slot of the rate window
     */
    AdmissionDecision check(const Endpoint& endpoint,
                            const std::string& caller_id,
                            const TimePoint& now = Clock::now());

    /**
     * @brief Charge a successful call to every applicable quota
     * @param tokens Input plus output tokens of the call
     * @param cost Price of the call
     */
    void commit(const Endpoint& endpoint,
                const std::string& caller_id,
                size_t tokens,
                double cost,
                const TimePoint& now = Clock::now());

    /**
     * @brief Zero a quota's counters and move its reset time into the future
     * @return False if the quota is unknown or is a lifetime quota
     */
    bool resetQuota(const std::string& quota_id, const TimePoint& now = Clock::now());

    /**
     * @brief Reset every active periodic quota whose reset time has passed
     * @return Number of quotas reset
     */
    size_t resetDueQuotas(const TimePoint& now = Clock::now());

    /**
     * @brief First reset time strictly after `now`, stepping from quota.reset_at in whole periods
     *
     * A reset time already in the future is returned unchanged.
     */
    static TimePoint nextResetAfter(const Quota& quota, const TimePoint& now);

private:
    Store& m_store;
    std::unordered_map<std::string, std::unique_ptr<RateLimiter>> m_limiters; ///< endpoint_id -> limiter
    std::mutex m_limiters_mutex;

    RateLimiter& limiterFor(const Endpoint& endpoint);
    size_t countSuccessfulCallsToday(const std::string& endpoint_id, const TimePoint& now);
};

} // namespace Modelgate
