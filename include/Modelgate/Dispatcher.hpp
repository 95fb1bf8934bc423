// =================================================================
// include/Modelgate/Dispatcher.hpp
// =================================================================
// Public entry point: direct calls, pool dispatch with failover,
// comparison fan-out and benchmarks.

#pragma once

#include "Modelgate/CallExecutor.hpp"
#include "Modelgate/EndpointSelector.hpp"
#include "Modelgate/GatewayTypes.hpp"
#include "Modelgate/HealthClassifier.hpp"
#include "Modelgate/ProviderAdapter.hpp"
#include "Modelgate/QuotaGate.hpp"
#include "Modelgate/Store.hpp"
#include "Modelgate/WorkerPool.hpp"
#include <string>
#include <vector>

namespace Modelgate {

/**
 * @brief Dispatcher configuration
 */
struct DispatcherConfig {
    ExecutorConfig executor;
    SelectorConfig selector;
    HealthThresholds health;
    size_t compare_threads = 4;             ///< Concurrent branches of compare()
};

/**
 * @brief Outcome of running a set of prompts against one endpoint
 */
struct BenchmarkReport {
    std::string endpoint_id;
    std::vector<DispatchResult> results;    ///< One per test case, in input order
    size_t total_cases = 0;
    size_t successful_cases = 0;
    double success_rate = 0.0;              ///< Percentage
    double avg_latency_ms = 0.0;            ///< Mean over successful cases
    double total_cost = 0.0;
    size_t total_tokens = 0;
};

/**
 * @brief Routes requests to endpoints and pools
 *
 * Pool dispatch runs Selecting -> Executing -> {Success | Retrying | Exhausted}.
 * Every attempt is recorded before the next decision, and all attempts of one
 * request share a request id. Expected failures are reported through
 * DispatchResult; only storage failures raise.
 */
class Dispatcher {
public:
    /**
     * @brief Constructor
     * @param store Configuration and history store
     * @param config Dispatcher configuration
     */
    Dispatcher(Store& store, const DispatcherConfig& config = DispatcherConfig());

    /**
     * @brief Call one endpoint directly, without pool failover
     */
    DispatchResult dispatch(const std::string& endpoint_id,
                            const std::string& prompt,
                            const SamplingParameters& params = SamplingParameters(),
                            const std::string& caller_id = "");

    /**
     * @brief Call a pool, failing over across its members
     * @return Result of the final attempt; terminates after at most max_retries + 1 attempts
     */
    DispatchResult dispatchViaPool(const std::string& pool_id,
                                   const std::string& prompt,
                                   const SamplingParameters& params = SamplingParameters(),
                                   const std::string& caller_id = "");

    /**
     * @brief Send the same prompt to several endpoints concurrently
     * @return One result per endpoint, in input order; a failing branch never cancels the others
     */
    std::vector<DispatchResult> compare(const std::vector<std::string>& endpoint_ids,
                                        const std::string& prompt,
                                        const SamplingParameters& params = SamplingParameters(),
                                        const std::string& caller_id = "");

    /**
     * @brief Run each test prompt against one endpoint
     * @param concurrency Maximum cases in flight
     */
    BenchmarkReport benchmark(const std::string& endpoint_id,
                              const std::vector<std::string>& test_cases,
                              const SamplingParameters& params = SamplingParameters(),
                              const std::string& caller_id = "",
                              size_t concurrency = 1);

    HealthReport runHealthCheck(const std::string& endpoint_id);

    bool resetQuota(const std::string& quota_id);

    Store& store() { return m_store; }
    AdapterCache& adapterCache() { return m_adapters; }
    QuotaGate& quotaGate() { return m_quota_gate; }
    EndpointSelector& selector() { return m_selector; }
    HealthClassifier& healthClassifier() { return m_health; }
    const DispatcherConfig& getConfig() const { return m_config; }

private:
    enum class AttemptOutcome {
        SUCCEEDED,
        DENIED,
        FAILED
    };

    Store& m_store;
    DispatcherConfig m_config;
    AdapterCache m_adapters;
    QuotaGate m_quota_gate;
    CallExecutor m_executor;
    EndpointSelector m_selector;
    HealthClassifier m_health;
    WorkerPool m_compare_workers;

    /**
     * @brief Admission check plus one executor call, folded into result
     */
    AttemptOutcome attempt(const Endpoint& endpoint,
                           const std::string& prompt,
                           const SamplingParameters& params,
                           const CallContext& context,
                           DispatchResult& result);

    static DispatchResult failedResult(const std::string& request_id,
                                       const std::string& endpoint_id,
                                       ErrorKind kind,
                                       const std::string& message);
};

nlohmann::json toJson(const BenchmarkReport& report);

} // namespace Modelgate
