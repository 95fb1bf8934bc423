// =================================================================
// include/Modelgate/RateLimiter.hpp
// =================================================================
// Sliding one-minute request and token windows for one endpoint.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <utility>

namespace Modelgate {

/**
 * @brief Outcome of a rate-limit check
 */
struct RateDecision {
    bool allowed = true;
    std::string reason;                     ///< Set when denied
};

/**
 * @brief Per-endpoint requests-per-minute and tokens-per-minute limiter
 *
 * A limit of 0 is unlimited. Requests are counted when admitted, tokens when
 * a call completes, so a burst of concurrent calls may overshoot the token
 * window by the tokens still in flight.
 */
class RateLimiter {
public:
    RateLimiter(int64_t requests_per_minute, int64_t tokens_per_minute)
        : m_rpm(requests_per_minute), m_tpm(tokens_per_minute) {}

    /**
     * @brief Admit one request if both windows have room
     * @param now Current time, also recorded as the request timestamp
     */
    RateDecision tryAcquire(const TimePoint& now) {
        std::lock_guard<std::mutex> lock(m_mutex);
        prune(now);

        RateDecision decision;
        if (m_rpm > 0 && static_cast<int64_t>(m_requests.size()) >= m_rpm) {
            decision.allowed = false;
            decision.reason = "Rate limit exceeded: " + std::to_string(m_rpm) + " requests per minute";
            return decision;
        }
        if (m_tpm > 0 && m_window_tokens >= m_tpm) {
            decision.allowed = false;
            decision.reason = "Rate limit exceeded: " + std::to_string(m_tpm) + " tokens per minute";
            return decision;
        }

        m_requests.push_back(now);
        return decision;
    }

    /**
     * @brief Charge tokens of a completed call to the token window
     */
    void recordTokens(const TimePoint& now, int64_t tokens) {
        if (tokens <= 0) return;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_tokens.emplace_back(now, tokens);
        m_window_tokens += tokens;
    }

    /**
     * @brief Update limits after a configuration change; windows are kept
     */
    void setLimits(int64_t requests_per_minute, int64_t tokens_per_minute) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_rpm = requests_per_minute;
        m_tpm = tokens_per_minute;
    }

    size_t requestsInWindow(const TimePoint& now) {
        std::lock_guard<std::mutex> lock(m_mutex);
        prune(now);
        return m_requests.size();
    }

    int64_t tokensInWindow(const TimePoint& now) {
        std::lock_guard<std::mutex> lock(m_mutex);
        prune(now);
        return m_window_tokens;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.clear();
        m_tokens.clear();
        m_window_tokens = 0;
    }

private:
    int64_t m_rpm;
    int64_t m_tpm;
    std::mutex m_mutex;
    std::deque<TimePoint> m_requests;
    std::deque<std::pair<TimePoint, int64_t>> m_tokens;
    int64_t m_window_tokens = 0;

    // Caller holds m_mutex
    void prune(const TimePoint& now) {
        auto cutoff = now - std::chrono::seconds(60);

        while (!m_requests.empty() && m_requests.front() <= cutoff) {
            m_requests.pop_front();
        }
        while (!m_tokens.empty() && m_tokens.front().first <= cutoff) {
            m_window_tokens -= m_tokens.front().second;
            m_tokens.pop_front();
        }
    }
};

} // namespace Modelgate
