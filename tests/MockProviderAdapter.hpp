// =================================================================
// tests/MockProviderAdapter.hpp
// =================================================================
// Scripted provider adapter and fixtures shared by the test suites.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include "Modelgate/ProviderAdapter.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * @brief Behaviour of the mock for one endpoint
 */
struct MockScript {
    bool success = true;
    std::string output = "mock response";
    size_t input_tokens = 10;
    size_t output_tokens = 20;
    std::string error = "mock backend failure";
    std::chrono::milliseconds delay{0};
    bool throws = false;                    ///< Break the adapter contract by throwing
};

/**
 * @brief Provider adapter answering from per-endpoint scripts
 */
class MockProviderAdapter : public Modelgate::ProviderAdapter {
public:
    Modelgate::AdapterResult invoke(const Modelgate::Endpoint& endpoint,
                                    const std::string& prompt,
                                    const Modelgate::NormalizedParameters& params) override {
        MockScript script;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_scripts.find(endpoint.id);
            script = it != m_scripts.end() ? it->second : m_default;
            m_calls[endpoint.id]++;
            m_last_prompt = prompt;
            m_last_params = params;
        }
        m_total_calls++;

        if (script.delay.count() > 0) {
            std::this_thread::sleep_for(script.delay);
        }

        if (script.throws) {
            throw std::runtime_error("mock adapter exploded");
        }

        Modelgate::AdapterResult result;
        result.success = script.success;
        if (script.success) {
            result.output_text = script.output;
            result.input_tokens = script.input_tokens;
            result.output_tokens = script.output_tokens;
        } else {
            result.error = script.error;
        }
        return result;
    }

    std::string getName() const override {
        return "mock";
    }

    void setDefault(const MockScript& script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_default = script;
    }

    void setScript(const std::string& endpoint_id, const MockScript& script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scripts[endpoint_id] = script;
    }

    void failEndpoint(const std::string& endpoint_id) {
        MockScript script;
        script.success = false;
        setScript(endpoint_id, script);
    }

    size_t callCount(const std::string& endpoint_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_calls.find(endpoint_id);
        return it != m_calls.end() ? it->second : 0;
    }

    size_t totalCalls() const {
        return m_total_calls.load();
    }

    Modelgate::NormalizedParameters lastParameters() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_params;
    }

    /**
     * @brief Route every provider kind of the cache to this mock
     */
    static void install(Modelgate::AdapterCache& cache, const std::shared_ptr<MockProviderAdapter>& mock) {
        auto factory = [mock](const Modelgate::Endpoint&) -> std::shared_ptr<Modelgate::ProviderAdapter> {
            return mock;
        };
        cache.registerFactory(Modelgate::ProviderKind::OPENAI_COMPATIBLE, factory);
        cache.registerFactory(Modelgate::ProviderKind::ANTHROPIC_STYLE, factory);
        cache.registerFactory(Modelgate::ProviderKind::GENERIC_REST, factory);
        cache.registerFactory(Modelgate::ProviderKind::CUSTOM, factory);
    }

private:
    mutable std::mutex m_mutex;
    MockScript m_default;
    std::map<std::string, MockScript> m_scripts;
    std::map<std::string, size_t> m_calls;
    std::atomic<size_t> m_total_calls{0};
    std::string m_last_prompt;
    Modelgate::NormalizedParameters m_last_params;
};

/**
 * @brief Endpoint without rate limits, suitable for heavy test traffic
 */
inline Modelgate::Endpoint makeTestEndpoint(const std::string& id,
                                            double input_price = 0.001,
                                            double output_price = 0.002) {
    Modelgate::Endpoint endpoint;
    endpoint.id = id;
    endpoint.name = "Test " + id;
    endpoint.provider_kind = Modelgate::ProviderKind::OPENAI_COMPATIBLE;
    endpoint.base_url = "http://127.0.0.1:1";
    endpoint.model_id = "test-model";
    endpoint.max_tokens = 1024;
    endpoint.input_price_per_1k = input_price;
    endpoint.output_price_per_1k = output_price;
    endpoint.rate_limit_rpm = 0;
    endpoint.rate_limit_tpm = 0;
    return endpoint;
}

inline Modelgate::PoolMember makeMember(const Modelgate::Endpoint& endpoint, int weight = 1, bool healthy = true) {
    Modelgate::PoolMember member;
    member.endpoint = endpoint;
    member.weight = weight;
    member.is_healthy = healthy;
    return member;
}

/**
 * @brief Call record with the given outcome, created at the given time
 */
inline Modelgate::CallRecord makeRecord(const std::string& endpoint_id,
                                        Modelgate::CallStatus status,
                                        std::chrono::milliseconds latency,
                                        const Modelgate::TimePoint& created_at) {
    static std::atomic<size_t> sequence{0};

    Modelgate::CallRecord record;
    record.id = "rec_" + std::to_string(sequence.fetch_add(1));
    record.request_id = "req_" + record.id;
    record.endpoint_id = endpoint_id;
    record.status = status;
    record.latency = latency;
    record.created_at = created_at;
    if (status == Modelgate::CallStatus::SUCCESS) {
        record.input_tokens = 100;
        record.output_tokens = 50;
    }
    return record;
}
