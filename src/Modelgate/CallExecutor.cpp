// =================================================================
// src/Modelgate/CallExecutor.cpp
// =================================================================
// Implementation of single-attempt execution and call recording.

#include "Modelgate/CallExecutor.hpp"
#include "Modelgate/Logger.hpp"
#include "Modelgate/ParameterNormalizer.hpp"
#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

namespace Modelgate {

CallExecutor::CallExecutor(Store& store, AdapterCache& adapters, const ExecutorConfig& config)
    : m_store(store), m_adapters(adapters), m_config(config), m_workers(config.worker_threads) {
}

CallRecord CallExecutor::execute(const Endpoint& endpoint,
                                 const std::string& prompt,
                                 const SamplingParameters& params,
                                 const CallContext& context) {
    auto start_time = std::chrono::steady_clock::now();

    NormalizedParameters normalized = ParameterNormalizer::normalize(params, endpoint);
    CallRecord record = newRecord(endpoint, prompt, normalized, context);

    auto adapter = m_adapters.getAdapter(endpoint);
    if (!adapter) {
        record.status = CallStatus::FAILED;
        record.error_message = "No adapter available for provider kind " +
                               GatewayTypeUtils::providerKindToString(endpoint.provider_kind);
        appendRecord(record);
        return record;
    }

    // The task owns copies so an abandoned call never touches this frame
    auto future = m_workers.enqueue([adapter, endpoint, prompt, normalized]() {
        return adapter->invoke(endpoint, prompt, normalized);
    });

    if (future.wait_for(m_config.call_timeout) == std::future_status::timeout) {
        record.status = CallStatus::TIMEOUT;
        record.error_message = "Call timed out after " + std::to_string(m_config.call_timeout.count()) + "ms";
    } else {
        try {
            AdapterResult result = future.get();
            if (result.success) {
                record.status = CallStatus::SUCCESS;
                record.output_text = result.output_text;
                record.input_tokens = result.input_tokens;
                record.output_tokens = result.output_tokens;
                record.cost = ParameterNormalizer::computeCost(result.input_tokens, result.output_tokens, endpoint);
            } else {
                record.status = result.timed_out ? CallStatus::TIMEOUT : CallStatus::FAILED;
                record.error_message = result.error;
            }
        } catch (const std::exception& e) {
            record.status = CallStatus::FAILED;
            record.error_message = "Adapter " + adapter->getName() + " raised: " + e.what();
        }
    }

    record.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    appendRecord(record);
    return record;
}

CallRecord CallExecutor::recordDenied(const Endpoint& endpoint,
                                      const std::string& prompt,
                                      const SamplingParameters& params,
                                      const CallContext& context,
                                      const AdmissionDecision& decision) {
    CallRecord record = newRecord(endpoint, prompt, ParameterNormalizer::normalize(params, endpoint), context);
    record.status = decision.denial_status;
    record.error_message = decision.reason;

    appendRecord(record);
    return record;
}

std::string CallExecutor::generateId(const std::string& prefix) {
    static std::atomic<uint64_t> sequence{0};
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dis(0, 0xFFFF);

    std::ostringstream oss;
    oss << prefix << "_" << TimeUtils::toMillis(Clock::now()) << "_" << sequence.fetch_add(1) << "_"
        << std::hex << std::setfill('0') << std::setw(4) << dis(gen);
    return oss.str();
}

CallRecord CallExecutor::newRecord(const Endpoint& endpoint,
                                   const std::string& prompt,
                                   const NormalizedParameters& params,
                                   const CallContext& context) const {
    CallRecord record;
    record.id = generateId("call");
    record.request_id = context.request_id;
    record.endpoint_id = endpoint.id;
    record.pool_id = context.pool_id;
    record.caller_id = context.caller_id;
    record.input_text = prompt;
    record.parameters = params;
    record.created_at = Clock::now();
    return record;
}

void CallExecutor::appendRecord(const CallRecord& record) {
    m_store.appendCallRecord(record);
    Logger::getInstance().logCallAttempt(record);
}

} // namespace Modelgate
