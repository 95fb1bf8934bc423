// =================================================================
// src/Modelgate/Dispatcher.cpp
// =================================================================
// Implementation of request routing and failover.

#include "Modelgate/Dispatcher.hpp"
#include "Modelgate/Logger.hpp"
#include <algorithm>
#include <future>
#include <set>
#include <thread>

namespace Modelgate {

Dispatcher::Dispatcher(Store& store, const DispatcherConfig& config)
    : m_store(store),
      m_config(config),
      m_adapters(config.executor.call_timeout),
      m_quota_gate(store),
      m_executor(store, m_adapters, config.executor),
      m_selector(store, config.selector),
      m_health(store, config.health),
      m_compare_workers(config.compare_threads) {
    LOG_DEBUG("Dispatcher", "Initialized with " + std::to_string(config.executor.worker_threads) +
              " call workers and " + std::to_string(config.compare_threads) + " compare workers");
}

DispatchResult Dispatcher::dispatch(const std::string& endpoint_id,
                                    const std::string& prompt,
                                    const SamplingParameters& params,
                                    const std::string& caller_id) {
    auto start_time = std::chrono::steady_clock::now();
    std::string request_id = CallExecutor::generateId("req");

    auto endpoint = m_store.getEndpoint(endpoint_id);
    if (!endpoint || !endpoint->is_active) {
        DispatchResult result = failedResult(request_id, endpoint_id, ErrorKind::NO_HEALTHY_ENDPOINTS,
            endpoint ? "Endpoint is inactive: " + endpoint_id : "Unknown endpoint: " + endpoint_id);
        Logger::getInstance().logDispatchOutcome("endpoint " + endpoint_id, result);
        return result;
    }

    DispatchResult result;
    result.request_id = request_id;

    CallContext context{request_id, caller_id, ""};
    attempt(*endpoint, prompt, params, context, result);

    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    Logger::getInstance().logDispatchOutcome("endpoint " + endpoint_id, result);
    return result;
}

DispatchResult Dispatcher::dispatchViaPool(const std::string& pool_id,
                                           const std::string& prompt,
                                           const SamplingParameters& params,
                                           const std::string& caller_id) {
    auto start_time = std::chrono::steady_clock::now();
    std::string request_id = CallExecutor::generateId("req");
    std::string target = "pool " + pool_id;

    auto pool = m_store.getPool(pool_id);
    if (!pool || !pool->is_active) {
        DispatchResult result = failedResult(request_id, "", ErrorKind::NO_HEALTHY_ENDPOINTS,
            pool ? "Pool is inactive: " + pool_id : "Unknown pool: " + pool_id);
        Logger::getInstance().logDispatchOutcome(target, result);
        return result;
    }

    DispatchResult result;
    result.request_id = request_id;

    CallContext context{request_id, caller_id, pool_id};
    std::set<std::string> failed_endpoints;
    size_t retries = 0;

    while (true) {
        // Selecting
        auto candidates = EndpointSelector::routableMembers(*pool, failed_endpoints);
        if (candidates.empty()) {
            std::string last_error = result.error_message;
            result.success = false;
            result.error_kind = ErrorKind::NO_HEALTHY_ENDPOINTS;
            result.error_message = "No healthy endpoints in pool " + pool_id;
            if (!last_error.empty()) {
                result.error_message += " (last error: " + last_error + ")";
            }
            break;
        }

        SelectionResult selection = m_selector.select(*pool, candidates);
        const Endpoint endpoint = selection.member.endpoint;

        // Executing
        AttemptOutcome outcome = attempt(endpoint, prompt, params, context, result);
        if (outcome != AttemptOutcome::FAILED) {
            break;
        }

        if (!pool->enable_fallback) {
            break;
        }

        if (retries >= pool->max_retries) {
            result.error_kind = ErrorKind::MAX_RETRIES_EXCEEDED;
            result.error_message = "Max retries (" + std::to_string(pool->max_retries) +
                                   ") exceeded, last error: " + result.error_message;
            break;
        }

        // Retrying
        failed_endpoints.insert(endpoint.id);
        if (m_store.setEndpointHealth(pool_id, endpoint.id, false, Clock::now())) {
            LOG_WARNING("Dispatcher", "Marked " + endpoint.id + " unhealthy in pool " + pool_id +
                        " after failure: " + result.error_message);
        }

        if (pool->retry_delay.count() > 0) {
            std::this_thread::sleep_for(pool->retry_delay);
        }

        auto refreshed = m_store.getPool(pool_id);
        if (!refreshed || !refreshed->is_active) {
            result.error_kind = ErrorKind::NO_HEALTHY_ENDPOINTS;
            result.error_message = "Pool " + pool_id + " was removed or deactivated during retry";
            break;
        }
        pool = std::move(refreshed);
        retries++;
    }

    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    Logger::getInstance().logDispatchOutcome(target, result);
    return result;
}

std::vector<DispatchResult> Dispatcher::compare(const std::vector<std::string>& endpoint_ids,
                                                const std::string& prompt,
                                                const SamplingParameters& params,
                                                const std::string& caller_id) {
    std::vector<std::future<DispatchResult>> futures;
    futures.reserve(endpoint_ids.size());

    for (const auto& endpoint_id : endpoint_ids) {
        futures.push_back(m_compare_workers.enqueue([this, endpoint_id, prompt, params, caller_id]() {
            return dispatch(endpoint_id, prompt, params, caller_id);
        }));
    }

    std::vector<DispatchResult> results;
    results.reserve(endpoint_ids.size());

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatcher", "Comparison branch for " + endpoint_ids[i] + " raised: " + e.what());
            results.push_back(failedResult("", endpoint_ids[i], ErrorKind::ADAPTER_FAILURE,
                                           std::string("Comparison branch failed: ") + e.what()));
        }
    }

    size_t succeeded = 0;
    for (const auto& result : results) {
        if (result.success) succeeded++;
    }
    LOG_INFO("Dispatcher", "Comparison finished: " + std::to_string(succeeded) + "/" +
             std::to_string(results.size()) + " endpoints succeeded");

    return results;
}

BenchmarkReport Dispatcher::benchmark(const std::string& endpoint_id,
                                      const std::vector<std::string>& test_cases,
                                      const SamplingParameters& params,
                                      const std::string& caller_id,
                                      size_t concurrency) {
    BenchmarkReport report;
    report.endpoint_id = endpoint_id;
    report.total_cases = test_cases.size();

    {
        WorkerPool workers(std::max<size_t>(1, std::min(concurrency, std::max<size_t>(1, test_cases.size()))));
        std::vector<std::future<DispatchResult>> futures;
        futures.reserve(test_cases.size());

        for (const auto& test_case : test_cases) {
            futures.push_back(workers.enqueue([this, endpoint_id, test_case, params, caller_id]() {
                return dispatch(endpoint_id, test_case, params, caller_id);
            }));
        }

        for (auto& future : futures) {
            try {
                report.results.push_back(future.get());
            } catch (const std::exception& e) {
                LOG_ERROR("Dispatcher", std::string("Benchmark case raised: ") + e.what());
                report.results.push_back(failedResult("", endpoint_id, ErrorKind::ADAPTER_FAILURE,
                                                      std::string("Benchmark case failed: ") + e.what()));
            }
        }
    }

    double total_latency = 0.0;
    for (const auto& result : report.results) {
        if (!result.success) {
            continue;
        }
        report.successful_cases++;
        total_latency += static_cast<double>(result.latency.count());
        report.total_cost += result.cost;
        report.total_tokens += result.input_tokens + result.output_tokens;
    }

    if (report.total_cases > 0) {
        report.success_rate = static_cast<double>(report.successful_cases) / report.total_cases * 100.0;
    }
    if (report.successful_cases > 0) {
        report.avg_latency_ms = total_latency / report.successful_cases;
    }

    Logger::getInstance().info("Dispatcher", "Benchmark of " + endpoint_id + " finished",
                               std::to_string(report.successful_cases) + "/" +
                               std::to_string(report.total_cases) + " cases succeeded");
    return report;
}

HealthReport Dispatcher::runHealthCheck(const std::string& endpoint_id) {
    return m_health.runHealthCheck(endpoint_id);
}

bool Dispatcher::resetQuota(const std::string& quota_id) {
    return m_quota_gate.resetQuota(quota_id);
}

Dispatcher::AttemptOutcome Dispatcher::attempt(const Endpoint& endpoint,
                                               const std::string& prompt,
                                               const SamplingParameters& params,
                                               const CallContext& context,
                                               DispatchResult& result) {
    result.attempts++;
    result.attempted_endpoints.push_back(endpoint.id);
    result.endpoint_id = endpoint.id;

    AdmissionDecision decision = m_quota_gate.check(endpoint, context.caller_id);
    if (!decision.allowed) {
        m_executor.recordDenied(endpoint, prompt, params, context, decision);
        result.success = false;
        result.error_kind = ErrorKind::QUOTA_EXCEEDED;
        result.error_message = decision.reason;
        return AttemptOutcome::DENIED;
    }

    CallRecord record = m_executor.execute(endpoint, prompt, params, context);

    if (record.status == CallStatus::SUCCESS) {
        m_quota_gate.commit(endpoint, context.caller_id, record.totalTokens(), record.cost);

        result.success = true;
        result.error_kind = ErrorKind::NONE;
        result.error_message.clear();
        result.output_text = record.output_text;
        result.input_tokens = record.input_tokens;
        result.output_tokens = record.output_tokens;
        result.cost = record.cost;
        return AttemptOutcome::SUCCEEDED;
    }

    result.success = false;
    result.error_kind = record.status == CallStatus::TIMEOUT ? ErrorKind::TIMEOUT : ErrorKind::ADAPTER_FAILURE;
    result.error_message = record.error_message;
    return AttemptOutcome::FAILED;
}

DispatchResult Dispatcher::failedResult(const std::string& request_id,
                                        const std::string& endpoint_id,
                                        ErrorKind kind,
                                        const std::string& message) {
    DispatchResult result;
    result.request_id = request_id;
    result.endpoint_id = endpoint_id;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

nlohmann::json toJson(const BenchmarkReport& report) {
    nlohmann::json cases = nlohmann::json::array();
    for (const auto& result : report.results) {
        cases.push_back(toJson(result));
    }

    return {
        {"endpoint_id", report.endpoint_id},
        {"total_cases", report.total_cases},
        {"successful_cases", report.successful_cases},
        {"success_rate", report.success_rate},
        {"avg_latency_ms", report.avg_latency_ms},
        {"total_cost", report.total_cost},
        {"total_tokens", report.total_tokens},
        {"results", cases}
    };
}

} // namespace Modelgate
