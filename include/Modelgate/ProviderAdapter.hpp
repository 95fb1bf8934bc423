// =================================================================
// include/Modelgate/ProviderAdapter.hpp
// =================================================================
// Abstract interface for backend model providers and the adapter cache.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Modelgate {

/**
 * @brief Outcome of one provider call
 */
struct AdapterResult {
    bool success = false;
    std::string output_text;
    size_t input_tokens = 0;
    size_t output_tokens = 0;
    std::string error;                      ///< Human-readable failure description
    bool timed_out = false;                 ///< Transport gave up waiting for the backend
};

/**
 * @brief Abstract interface for one provider family
 *
 * Implementations translate a prompt into the provider's request format and
 * its response back into an AdapterResult. They never throw: transport
 * errors, non-2xx statuses and malformed bodies are reported through
 * AdapterResult::success and AdapterResult::error.
 */
class ProviderAdapter {
public:
    virtual ~ProviderAdapter() = default;

    /**
     * @brief Send a prompt to the endpoint
     * @param endpoint Target endpoint configuration
     * @param prompt Input text
     * @param params Normalized sampling parameters
     * @return Result of the call
     */
    virtual AdapterResult invoke(const Endpoint& endpoint,
                                 const std::string& prompt,
                                 const NormalizedParameters& params) = 0;

    /**
     * @brief Get adapter name
     * @return Adapter identifier (e.g. "openai_compatible")
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Creates an adapter for an endpoint
 */
using AdapterFactory = std::function<std::shared_ptr<ProviderAdapter>(const Endpoint&)>;

/**
 * @brief Process-lifetime cache of adapter instances
 *
 * Instances are keyed by (provider kind, endpoint id). Factories for the four
 * built-in provider families are registered at construction and may be
 * replaced.
 */
class AdapterCache {
public:
    /**
     * @brief Constructor
     * @param request_timeout Transport timeout handed to the HTTP adapters
     */
    explicit AdapterCache(std::chrono::milliseconds request_timeout = std::chrono::milliseconds(60000));

    /**
     * @brief Register or replace the factory for a provider kind
     *
     * Cached instances of that kind are dropped.
     */
    void registerFactory(ProviderKind kind, AdapterFactory factory);

    /**
     * @brief Get the cached adapter for an endpoint, creating it on first use
     * @return Adapter instance, or nullptr if no factory serves the endpoint's kind
     */
    std::shared_ptr<ProviderAdapter> getAdapter(const Endpoint& endpoint);

    /**
     * @brief Drop cached instances of an endpoint after a configuration change
     */
    void invalidate(const std::string& endpoint_id);

    void clear();

    size_t size() const;

private:
    struct CachedAdapter {
        ProviderKind kind;
        std::string endpoint_id;
        std::shared_ptr<ProviderAdapter> adapter;
    };

    std::chrono::milliseconds m_request_timeout;
    std::unordered_map<ProviderKind, AdapterFactory> m_factories;
    std::unordered_map<std::string, CachedAdapter> m_adapters;
    mutable std::mutex m_mutex;

    static std::string cacheKey(ProviderKind kind, const std::string& endpoint_id);
};

} // namespace Modelgate
