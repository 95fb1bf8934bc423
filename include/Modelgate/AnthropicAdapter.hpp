// =================================================================
// include/Modelgate/AnthropicAdapter.hpp
// =================================================================
// Adapter for Anthropic-style messages APIs.

#pragma once

#include "Modelgate/HttpProviderAdapter.hpp"

namespace Modelgate {

/**
 * @brief Calls `{base}/v1/messages` with `x-api-key` and `anthropic-version` headers
 */
class AnthropicAdapter : public HttpProviderAdapter {
public:
    static constexpr const char* DEFAULT_API_VERSION = "2023-06-01";

    explicit AnthropicAdapter(std::chrono::milliseconds timeout);

    std::string getName() const override;

protected:
    std::string requestPath(const Endpoint& endpoint, const std::string& base_path) const override;
    HeaderList requestHeaders(const Endpoint& endpoint) const override;
    nlohmann::json buildPayload(const Endpoint& endpoint,
                                const std::string& prompt,
                                const NormalizedParameters& params) const override;

    /**
     * @brief Concatenates every text content block; usage is estimated when absent
     */
    AdapterResult parseResponse(const std::string& prompt, const nlohmann::json& body) const override;
};

} // namespace Modelgate
