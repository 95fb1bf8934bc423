// =================================================================
// src/Modelgate/QuotaGate.cpp
// =================================================================
// Implementation of admission control and quota resets.

#include "Modelgate/QuotaGate.hpp"
#include "Modelgate/Logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Modelgate {

namespace {

std::string describeExceeded(const Quota& quota, const std::string& dimension) {
    std::ostringstream reason;
    reason << GatewayTypeUtils::quotaPeriodToString(quota.period) << " quota " << quota.id
           << " exceeded (" << dimension << ": ";
    if (dimension == "calls") {
        reason << quota.used_calls << "/" << quota.max_calls;
    } else if (dimension == "tokens") {
        reason << quota.used_tokens << "/" << quota.max_tokens;
    } else {
        reason << std::fixed << std::setprecision(4) << quota.used_cost << "/" << quota.max_cost;
    }
    reason << ")";
    return reason.str();
}

} // namespace

QuotaGate::QuotaGate(Store& store)
    : m_store(store) {
}

AdmissionDecision QuotaGate::check(const Endpoint& endpoint,
                                   const std::string& caller_id,
                                   const TimePoint& now) {
    AdmissionDecision decision;

    for (const auto& quota : m_store.getActiveQuotas(endpoint.id, caller_id)) {
        std::string dimension = quota.exceededDimension();
        if (!dimension.empty()) {
            decision.allowed = false;
            decision.denial_status = CallStatus::QUOTA_EXCEEDED;
            decision.quota_id = quota.id;
            decision.reason = describeExceeded(quota, dimension);
            LOG_WARNING("QuotaGate", "Denied " + (caller_id.empty() ? std::string("anonymous caller") : caller_id) +
                        " on " + endpoint.id + ": " + decision.reason);
            return decision;
        }
    }

    if (endpoint.daily_quota > 0) {
        size_t used_today = countSuccessfulCallsToday(endpoint.id, now);
        if (static_cast<int64_t>(used_today) >= endpoint.daily_quota) {
            decision.allowed = false;
            decision.denial_status = CallStatus::QUOTA_EXCEEDED;
            decision.reason = "Daily call limit of endpoint " + endpoint.id + " reached (" +
                              std::to_string(used_today) + "/" + std::to_string(endpoint.daily_quota) + ")";
            LOG_WARNING("QuotaGate", decision.reason);
            return decision;
        }
    }

    // Last: an allowed check consumes a request slot
    RateDecision rate = limiterFor(endpoint).tryAcquire(now);
    if (!rate.allowed) {
        decision.allowed = false;
        decision.denial_status = CallStatus::RATE_LIMITED;
        decision.reason = rate.reason + " on " + endpoint.id;
        LOG_WARNING("QuotaGate", decision.reason);
        return decision;
    }

    return decision;
}

void QuotaGate::commit(const Endpoint& endpoint,
                       const std::string& caller_id,
                       size_t tokens,
                       double cost,
                       const TimePoint& now) {
    limiterFor(endpoint).recordTokens(now, static_cast<int64_t>(tokens));

    for (const auto& quota : m_store.getActiveQuotas(endpoint.id, caller_id)) {
        try {
            m_store.incrementQuotaUsage(quota.id, 1, static_cast<int64_t>(tokens), cost);
        } catch (const StoreError& e) {
            // The call itself already succeeded
            LOG_ERROR("QuotaGate", "Failed to commit usage to quota " + quota.id + ": " + e.what());
        }
    }
}

bool QuotaGate::resetQuota(const std::string& quota_id, const TimePoint& now) {
    auto quota = m_store.getQuota(quota_id);
    if (!quota) {
        LOG_WARNING("QuotaGate", "Cannot reset unknown quota: " + quota_id);
        return false;
    }

    if (!GatewayTypeUtils::periodLength(quota->period)) {
        LOG_WARNING("QuotaGate", "Lifetime quota " + quota_id + " is never reset");
        return false;
    }

    TimePoint next_reset = nextResetAfter(*quota, now);
    m_store.resetQuotaUsage(quota_id, next_reset, now);

    Logger::getInstance().info("QuotaGate", "Reset quota " + quota_id,
                               "Next reset: " + TimeUtils::formatDate(next_reset));
    return true;
}

size_t QuotaGate::resetDueQuotas(const TimePoint& now) {
    size_t reset_count = 0;

    for (const auto& quota : m_store.listQuotas()) {
        if (!quota.is_active || !GatewayTypeUtils::periodLength(quota.period)) {
            continue;
        }
        if (quota.reset_at > now) {
            continue;
        }
        if (resetQuota(quota.id, now)) {
            reset_count++;
        }
    }

    LOG_INFO("QuotaGate", "Quota reset complete: " + std::to_string(reset_count) + " quotas reset");
    return reset_count;
}

TimePoint QuotaGate::nextResetAfter(const Quota& quota, const TimePoint& now) {
    auto length = GatewayTypeUtils::periodLength(quota.period);
    if (!length || quota.reset_at > now) {
        return quota.reset_at;
    }

    auto period = std::chrono::duration_cast<Clock::duration>(*length);
    auto periods_elapsed = (now - quota.reset_at) / period + 1;
    return quota.reset_at + periods_elapsed * period;
}

RateLimiter& QuotaGate::limiterFor(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(m_limiters_mutex);

    auto it = m_limiters.find(endpoint.id);
    if (it == m_limiters.end()) {
        it = m_limiters.emplace(endpoint.id,
            std::make_unique<RateLimiter>(endpoint.rate_limit_rpm, endpoint.rate_limit_tpm)).first;
    } else {
        it->second->setLimits(endpoint.rate_limit_rpm, endpoint.rate_limit_tpm);
    }
    return *it->second;
}

size_t QuotaGate::countSuccessfulCallsToday(const std::string& endpoint_id, const TimePoint& now) {
    auto records = m_store.queryCallRecords(endpoint_id, TimeUtils::startOfUtcDay(now));
    return static_cast<size_t>(std::count_if(records.begin(), records.end(),
        [](const CallRecord& record) { return record.status == CallStatus::SUCCESS; }));
}

} // namespace Modelgate
