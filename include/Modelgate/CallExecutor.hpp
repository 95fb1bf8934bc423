// =================================================================
// include/Modelgate/CallExecutor.hpp
// =================================================================
// Executes one attempt against one endpoint and records its outcome.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include "Modelgate/ProviderAdapter.hpp"
#include "Modelgate/QuotaGate.hpp"
#include "Modelgate/Store.hpp"
#include "Modelgate/WorkerPool.hpp"
#include <chrono>
#include <string>

namespace Modelgate {

/**
 * @brief Call executor configuration
 */
struct ExecutorConfig {
    std::chrono::milliseconds call_timeout{60000};  ///< Upper bound for one adapter call
    size_t worker_threads = 8;                      ///< Concurrent adapter calls
};

/**
 * @brief Identity of the logical request an attempt belongs to
 */
struct CallContext {
    std::string request_id;
    std::string caller_id;
    std::string pool_id;                    ///< Empty for direct endpoint calls
};

/**
 * @brief Runs adapter calls under a timeout and appends one CallRecord per attempt
 *
 * A call exceeding call_timeout is recorded as a timeout; its worker keeps
 * running in the background and the late result is discarded.
 */
class CallExecutor {
public:
    CallExecutor(Store& store, AdapterCache& adapters, const ExecutorConfig& config = ExecutorConfig());

    /**
     * @brief Invoke the endpoint and record the attempt
     * @param endpoint Target endpoint
     * @param prompt Input text
     * @param params Requested sampling parameters, normalized against the endpoint
     * @param context Request identity
     * @return The appended record
     * @throws StoreError if the record cannot be stored
     */
    CallRecord execute(const Endpoint& endpoint,
                       const std::string& prompt,
                       const SamplingParameters& params,
                       const CallContext& context);

    /**
     * @brief Record an attempt that admission control turned away
     * @return The appended record, with the decision's denial status
     */
    CallRecord recordDenied(const Endpoint& endpoint,
                            const std::string& prompt,
                            const SamplingParameters& params,
                            const CallContext& context,
                            const AdmissionDecision& decision);

    const ExecutorConfig& getConfig() const { return m_config; }

    /**
     * @brief Unique identifier with a readable prefix, e.g. "call_1718000000000_42_a3f1"
     */
    static std::string generateId(const std::string& prefix);

private:
    Store& m_store;
    AdapterCache& m_adapters;
    ExecutorConfig m_config;
    WorkerPool m_workers;

    CallRecord newRecord(const Endpoint& endpoint,
                         const std::string& prompt,
                         const NormalizedParameters& params,
                         const CallContext& context) const;
    void appendRecord(const CallRecord& record);
};

} // namespace Modelgate
