// =================================================================
// src/Modelgate/GatewayTypes.cpp
// =================================================================
// Implementation of gateway type conversions and calendar helpers.

#include "Modelgate/GatewayTypes.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace Modelgate {

namespace {

std::string normalizeKey(const std::string& str) {
    std::string key = str;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    return key;
}

} // namespace

std::string Quota::exceededDimension() const {
    if (max_calls > 0 && used_calls >= max_calls) {
        return "calls";
    }
    if (max_tokens > 0 && used_tokens >= max_tokens) {
        return "tokens";
    }
    if (max_cost > 0.0 && used_cost >= max_cost) {
        return "cost";
    }
    return "";
}

std::string GatewayTypeUtils::providerKindToString(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::OPENAI_COMPATIBLE:
            return "openai_compatible";
        case ProviderKind::ANTHROPIC_STYLE:
            return "anthropic_style";
        case ProviderKind::GENERIC_REST:
            return "generic_rest";
        case ProviderKind::CUSTOM:
            return "custom";
        default:
            throw std::invalid_argument("Unknown ProviderKind value");
    }
}

ProviderKind GatewayTypeUtils::stringToProviderKind(const std::string& str) {
    static const std::unordered_map<std::string, ProviderKind> kind_map = {
        {"openai_compatible", ProviderKind::OPENAI_COMPATIBLE},
        {"openai", ProviderKind::OPENAI_COMPATIBLE},
        {"azure", ProviderKind::OPENAI_COMPATIBLE},
        {"local", ProviderKind::OPENAI_COMPATIBLE},
        {"anthropic_style", ProviderKind::ANTHROPIC_STYLE},
        {"anthropic", ProviderKind::ANTHROPIC_STYLE},
        {"generic_rest", ProviderKind::GENERIC_REST},
        {"generic", ProviderKind::GENERIC_REST},
        {"baidu", ProviderKind::GENERIC_REST},
        {"alibaba", ProviderKind::GENERIC_REST},
        {"tencent", ProviderKind::GENERIC_REST},
        {"custom", ProviderKind::CUSTOM}
    };

    auto it = kind_map.find(normalizeKey(str));
    if (it != kind_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown provider kind: " + str);
}

std::string GatewayTypeUtils::strategyToString(BalancingStrategy strategy) {
    switch (strategy) {
        case BalancingStrategy::ROUND_ROBIN:
            return "round_robin";
        case BalancingStrategy::WEIGHTED:
            return "weighted";
        case BalancingStrategy::RANDOM:
            return "random";
        case BalancingStrategy::LEAST_CONNECTIONS:
            return "least_connections";
        case BalancingStrategy::RESPONSE_TIME:
            return "response_time";
        case BalancingStrategy::COST_OPTIMIZED:
            return "cost_optimized";
        default:
            return "unknown";
    }
}

BalancingStrategy GatewayTypeUtils::stringToStrategy(const std::string& str) {
    static const std::unordered_map<std::string, BalancingStrategy> strategy_map = {
        {"round_robin", BalancingStrategy::ROUND_ROBIN},
        {"weighted", BalancingStrategy::WEIGHTED},
        {"random", BalancingStrategy::RANDOM},
        {"least_connections", BalancingStrategy::LEAST_CONNECTIONS},
        {"response_time", BalancingStrategy::RESPONSE_TIME},
        {"cost_optimized", BalancingStrategy::COST_OPTIMIZED}
    };

    auto it = strategy_map.find(normalizeKey(str));
    return it != strategy_map.end() ? it->second : BalancingStrategy::UNKNOWN;
}

std::string GatewayTypeUtils::quotaPeriodToString(QuotaPeriod period) {
    switch (period) {
        case QuotaPeriod::DAILY:
            return "daily";
        case QuotaPeriod::WEEKLY:
            return "weekly";
        case QuotaPeriod::MONTHLY:
            return "monthly";
        case QuotaPeriod::LIFETIME:
            return "lifetime";
        default:
            throw std::invalid_argument("Unknown QuotaPeriod value");
    }
}

QuotaPeriod GatewayTypeUtils::stringToQuotaPeriod(const std::string& str) {
    static const std::unordered_map<std::string, QuotaPeriod> period_map = {
        {"daily", QuotaPeriod::DAILY},
        {"weekly", QuotaPeriod::WEEKLY},
        {"monthly", QuotaPeriod::MONTHLY},
        {"lifetime", QuotaPeriod::LIFETIME},
        {"total", QuotaPeriod::LIFETIME}
    };

    auto it = period_map.find(normalizeKey(str));
    if (it != period_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown quota type: " + str);
}

std::string GatewayTypeUtils::callStatusToString(CallStatus status) {
    switch (status) {
        case CallStatus::SUCCESS:
            return "success";
        case CallStatus::FAILED:
            return "failed";
        case CallStatus::TIMEOUT:
            return "timeout";
        case CallStatus::RATE_LIMITED:
            return "rate_limited";
        case CallStatus::QUOTA_EXCEEDED:
            return "quota_exceeded";
        default:
            throw std::invalid_argument("Unknown CallStatus value");
    }
}

CallStatus GatewayTypeUtils::stringToCallStatus(const std::string& str) {
    static const std::unordered_map<std::string, CallStatus> status_map = {
        {"success", CallStatus::SUCCESS},
        {"failed", CallStatus::FAILED},
        {"timeout", CallStatus::TIMEOUT},
        {"rate_limited", CallStatus::RATE_LIMITED},
        {"quota_exceeded", CallStatus::QUOTA_EXCEEDED}
    };

    auto it = status_map.find(normalizeKey(str));
    if (it != status_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown call status: " + str);
}

std::string GatewayTypeUtils::errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "none";
        case ErrorKind::QUOTA_EXCEEDED:
            return "quota_exceeded";
        case ErrorKind::ADAPTER_FAILURE:
            return "adapter_failure";
        case ErrorKind::TIMEOUT:
            return "timeout";
        case ErrorKind::NO_HEALTHY_ENDPOINTS:
            return "no_healthy_endpoints";
        case ErrorKind::MAX_RETRIES_EXCEEDED:
            return "max_retries_exceeded";
        default:
            return "unknown";
    }
}

std::optional<std::chrono::hours> GatewayTypeUtils::periodLength(QuotaPeriod period) {
    switch (period) {
        case QuotaPeriod::DAILY:
            return std::chrono::hours(24);
        case QuotaPeriod::WEEKLY:
            return std::chrono::hours(24 * 7);
        case QuotaPeriod::MONTHLY:
            return std::chrono::hours(24 * 30);
        default:
            return std::nullopt;
    }
}

TimePoint TimeUtils::startOfUtcDay(const TimePoint& time_point) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time_point.time_since_epoch()).count();
    constexpr int64_t seconds_per_day = 24 * 60 * 60;
    int64_t day_start = seconds - (((seconds % seconds_per_day) + seconds_per_day) % seconds_per_day);
    return TimePoint(std::chrono::seconds(day_start));
}

std::string TimeUtils::formatDate(const TimePoint& time_point) {
    std::time_t time_t = Clock::to_time_t(time_point);
    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%d");
    return oss.str();
}

TimePoint TimeUtils::parseDate(const std::string& date) {
    std::tm utc{};
    std::istringstream iss(date);
    iss >> std::get_time(&utc, "%Y-%m-%d");
    if (iss.fail()) {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + date);
    }
    return Clock::from_time_t(timegm(&utc));
}

int64_t TimeUtils::toMillis(const TimePoint& time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

TimePoint TimeUtils::fromMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

nlohmann::json toJson(const DispatchResult& result) {
    nlohmann::json json = {
        {"success", result.success},
        {"request_id", result.request_id},
        {"endpoint_id", result.endpoint_id},
        {"attempts", result.attempts},
        {"attempted_endpoints", result.attempted_endpoints},
        {"latency_ms", result.latency.count()}
    };

    if (result.success) {
        json["output_text"] = result.output_text;
        json["input_tokens"] = result.input_tokens;
        json["output_tokens"] = result.output_tokens;
        json["cost"] = result.cost;
    } else {
        json["error_kind"] = GatewayTypeUtils::errorKindToString(result.error_kind);
        json["error"] = result.error_message;
    }
    return json;
}

nlohmann::json toJson(const CallRecord& record) {
    return {
        {"id", record.id},
        {"request_id", record.request_id},
        {"endpoint_id", record.endpoint_id},
        {"pool_id", record.pool_id},
        {"caller_id", record.caller_id},
        {"status", GatewayTypeUtils::callStatusToString(record.status)},
        {"error", record.error_message},
        {"input_tokens", record.input_tokens},
        {"output_tokens", record.output_tokens},
        {"cost", record.cost},
        {"latency_ms", record.latency.count()},
        {"created_at_ms", TimeUtils::toMillis(record.created_at)}
    };
}

nlohmann::json toJson(const PerformanceSnapshot& snapshot) {
    return {
        {"endpoint_id", snapshot.endpoint_id},
        {"date", snapshot.date},
        {"total_calls", snapshot.total_calls},
        {"successful_calls", snapshot.successful_calls},
        {"failed_calls", snapshot.failed_calls},
        {"total_input_tokens", snapshot.total_input_tokens},
        {"total_output_tokens", snapshot.total_output_tokens},
        {"average_latency_ms", snapshot.average_latency_ms},
        {"success_rate", snapshot.success_rate},
        {"total_cost", snapshot.total_cost},
        {"average_cost_per_call", snapshot.average_cost_per_call}
    };
}

nlohmann::json toJson(const Quota& quota) {
    return {
        {"id", quota.id},
        {"endpoint_id", quota.endpoint_id},
        {"caller_id", quota.caller_id},
        {"type", GatewayTypeUtils::quotaPeriodToString(quota.period)},
        {"max_calls", quota.max_calls},
        {"max_tokens", quota.max_tokens},
        {"max_cost", quota.max_cost},
        {"used_calls", quota.used_calls},
        {"used_tokens", quota.used_tokens},
        {"used_cost", quota.used_cost},
        {"reset_at", TimeUtils::formatDate(quota.reset_at)},
        {"is_active", quota.is_active},
        {"exceeded", quota.isExceeded()}
    };
}

} // namespace Modelgate
