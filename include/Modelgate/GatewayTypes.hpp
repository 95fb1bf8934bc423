// =================================================================
// include/Modelgate/GatewayTypes.hpp
// =================================================================
// Defines endpoints, pools, quotas and call records shared by the gateway.

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Modelgate {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Backend protocol family of an endpoint
 */
enum class ProviderKind {
    OPENAI_COMPATIBLE,  ///< OpenAI chat-completions API (incl. Azure deployments)
    ANTHROPIC_STYLE,    ///< Anthropic messages API
    GENERIC_REST,       ///< Chat-shaped JSON posted to a full URL
    CUSTOM              ///< Free-form {model, input, parameters} API
};

/**
 * @brief Endpoint selection algorithm of a pool
 */
enum class BalancingStrategy {
    ROUND_ROBIN,
    WEIGHTED,
    RANDOM,
    LEAST_CONNECTIONS,
    RESPONSE_TIME,
    COST_OPTIMIZED,
    UNKNOWN             ///< Unrecognised configuration value
};

/**
 * @brief Quota reset period
 */
enum class QuotaPeriod {
    DAILY,
    WEEKLY,
    MONTHLY,
    LIFETIME
};

/**
 * @brief Outcome of one dispatch attempt
 */
enum class CallStatus {
    SUCCESS,
    FAILED,
    TIMEOUT,
    RATE_LIMITED,       ///< Denied by the endpoint's per-minute limits
    QUOTA_EXCEEDED      ///< Denied by a quota ceiling
};

/**
 * @brief Caller-visible failure kinds
 */
enum class ErrorKind {
    NONE,
    QUOTA_EXCEEDED,
    ADAPTER_FAILURE,
    TIMEOUT,
    NO_HEALTHY_ENDPOINTS,
    MAX_RETRIES_EXCEEDED
};

/**
 * @brief A callable backend model configuration
 */
struct Endpoint {
    std::string id;                         ///< Unique endpoint identifier
    std::string name;                       ///< Human-readable name
    ProviderKind provider_kind = ProviderKind::OPENAI_COMPATIBLE;
    std::string base_url;                   ///< Base address of the backend
    std::string api_key;                    ///< Credential sent with each request
    std::string api_version;                ///< Provider API version, if any
    std::string model_id;                   ///< Model identifier sent to the backend
    size_t max_tokens = 4096;               ///< Upper bound for generated tokens
    size_t context_window = 4096;           ///< Context window size
    double default_temperature = 0.7;
    double default_top_p = 1.0;
    double input_price_per_1k = 0.0;        ///< Price per 1000 input tokens
    double output_price_per_1k = 0.0;       ///< Price per 1000 output tokens
    int64_t rate_limit_rpm = 60;            ///< Requests per minute (0 = unlimited)
    int64_t rate_limit_tpm = 40000;         ///< Tokens per minute (0 = unlimited)
    int64_t daily_quota = 0;                ///< Calls per UTC day (0 = unlimited)
    bool is_active = true;
    int priority = 0;
    std::unordered_map<std::string, std::string> additional_config; ///< Provider extras
};

/**
 * @brief Pool membership of one endpoint
 */
struct PoolMember {
    Endpoint endpoint;
    int weight = 1;                         ///< Selection weight, 0..100
    bool is_healthy = true;
    std::optional<TimePoint> last_health_check;
};

/**
 * @brief A named, weighted, health-tracked group of endpoints
 */
struct Pool {
    std::string id;
    std::string name;
    BalancingStrategy strategy = BalancingStrategy::ROUND_ROBIN;
    std::vector<PoolMember> members;        ///< Members in pool order
    bool enable_fallback = true;            ///< Retry on another endpoint after a failure
    size_t max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
    bool health_check_enabled = true;
    std::chrono::seconds health_check_interval{60};
    bool is_active = true;
};

/**
 * @brief Usage ceiling for an endpoint, optionally scoped to one caller
 */
struct Quota {
    std::string id;
    std::string endpoint_id;
    std::string caller_id;                  ///< Empty applies to every caller
    QuotaPeriod period = QuotaPeriod::DAILY;
    int64_t max_calls = 0;                  ///< 0 = unlimited
    int64_t max_tokens = 0;                 ///< 0 = unlimited
    double max_cost = 0.0;                  ///< 0 = unlimited
    int64_t used_calls = 0;
    int64_t used_tokens = 0;
    double used_cost = 0.0;
    TimePoint reset_at;
    TimePoint last_reset;
    bool is_active = true;

    /**
     * @brief Name of the first exhausted dimension, empty if none
     */
    std::string exceededDimension() const;

    bool isExceeded() const { return !exceededDimension().empty(); }
};

/**
 * @brief Sampling parameters as requested by a caller
 */
struct SamplingParameters {
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<size_t> max_tokens;
    nlohmann::json extra = nlohmann::json::object(); ///< Provider-specific passthrough
};

/**
 * @brief Sampling parameters after clamping against an endpoint
 */
struct NormalizedParameters {
    double temperature = 0.7;
    double top_p = 1.0;
    size_t max_tokens = 1;
    nlohmann::json extra = nlohmann::json::object();
};

/**
 * @brief Immutable log entry for one dispatch attempt
 */
struct CallRecord {
    std::string id;
    std::string request_id;                 ///< Shared by all attempts of one request
    std::string endpoint_id;
    std::string pool_id;                    ///< Empty for direct calls
    std::string caller_id;
    std::string input_text;
    NormalizedParameters parameters;
    std::string output_text;
    CallStatus status = CallStatus::FAILED;
    std::string error_message;
    size_t input_tokens = 0;
    size_t output_tokens = 0;
    double cost = 0.0;
    std::chrono::milliseconds latency{0};
    TimePoint created_at;

    size_t totalTokens() const { return input_tokens + output_tokens; }
};

/**
 * @brief Daily rollup for one endpoint
 */
struct PerformanceSnapshot {
    std::string endpoint_id;
    std::string date;                       ///< UTC day, YYYY-MM-DD
    size_t total_calls = 0;
    size_t successful_calls = 0;
    size_t failed_calls = 0;
    int64_t total_input_tokens = 0;
    int64_t total_output_tokens = 0;
    double average_latency_ms = 0.0;        ///< Mean over successful calls
    double success_rate = 0.0;              ///< Percentage
    double total_cost = 0.0;
    double average_cost_per_call = 0.0;
};

/**
 * @brief Result returned to callers of the dispatcher
 */
struct DispatchResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
    std::string endpoint_id;                ///< Endpoint of the final attempt
    std::string request_id;
    std::string output_text;
    size_t input_tokens = 0;
    size_t output_tokens = 0;
    double cost = 0.0;
    std::chrono::milliseconds latency{0};
    size_t attempts = 0;
    std::vector<std::string> attempted_endpoints;
};

/**
 * @brief String conversions for gateway enums
 */
class GatewayTypeUtils {
public:
    static std::string providerKindToString(ProviderKind kind);

    /**
     * @brief Parse a provider kind, accepting vendor aliases ("openai", "azure", ...)
     * @throws std::invalid_argument for unknown names
     */
    static ProviderKind stringToProviderKind(const std::string& str);

    static std::string strategyToString(BalancingStrategy strategy);

    /**
     * @brief Parse a strategy; unknown names map to BalancingStrategy::UNKNOWN
     */
    static BalancingStrategy stringToStrategy(const std::string& str);

    static std::string quotaPeriodToString(QuotaPeriod period);

    /**
     * @throws std::invalid_argument for unknown names
     */
    static QuotaPeriod stringToQuotaPeriod(const std::string& str);

    static std::string callStatusToString(CallStatus status);
    static CallStatus stringToCallStatus(const std::string& str);

    static std::string errorKindToString(ErrorKind kind);

    /**
     * @brief Length of one quota period, nullopt for lifetime quotas
     */
    static std::optional<std::chrono::hours> periodLength(QuotaPeriod period);
};

/**
 * @brief UTC calendar helpers
 */
class TimeUtils {
public:
    static TimePoint startOfUtcDay(const TimePoint& time_point);

    /**
     * @brief Format as YYYY-MM-DD in UTC
     */
    static std::string formatDate(const TimePoint& time_point);

    /**
     * @brief Parse YYYY-MM-DD as UTC midnight
     * @throws std::invalid_argument on malformed input
     */
    static TimePoint parseDate(const std::string& date);

    static int64_t toMillis(const TimePoint& time_point);
    static TimePoint fromMillis(int64_t millis);
};

nlohmann::json toJson(const DispatchResult& result);
nlohmann::json toJson(const CallRecord& record);
nlohmann::json toJson(const PerformanceSnapshot& snapshot);
nlohmann::json toJson(const Quota& quota);

} // namespace Modelgate
