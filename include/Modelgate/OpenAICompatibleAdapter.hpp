// =================================================================
// include/Modelgate/OpenAICompatibleAdapter.hpp
// =================================================================
// Adapter for OpenAI chat-completions APIs, including Azure deployments.

#pragma once

#include "Modelgate/HttpProviderAdapter.hpp"

namespace Modelgate {

/**
 * @brief Calls `{base}/chat/completions` with bearer authentication
 *
 * Endpoints with `additional_config.api_type: azure` are routed to
 * `{base}/openai/deployments/{model}/chat/completions?api-version=...`
 * and authenticate with the `api-key` header.
 */
class OpenAICompatibleAdapter : public HttpProviderAdapter {
public:
    static constexpr const char* DEFAULT_AZURE_API_VERSION = "2024-02-01";

    explicit OpenAICompatibleAdapter(std::chrono::milliseconds timeout);

    std::string getName() const override;

    static bool isAzure(const Endpoint& endpoint);

protected:
    std::string requestPath(const Endpoint& endpoint, const std::string& base_path) const override;
    HeaderList requestHeaders(const Endpoint& endpoint) const override;
    nlohmann::json buildPayload(const Endpoint& endpoint,
                                const std::string& prompt,
                                const NormalizedParameters& params) const override;
    AdapterResult parseResponse(const std::string& prompt, const nlohmann::json& body) const override;
};

} // namespace Modelgate
