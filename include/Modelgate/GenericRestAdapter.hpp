// =================================================================
// include/Modelgate/GenericRestAdapter.hpp
// =================================================================
// Adapter for chat-shaped REST APIs addressed by their full URL.

#pragma once

#include "Modelgate/HttpProviderAdapter.hpp"

namespace Modelgate {

/**
 * @brief POSTs a chat body to the base URL as given, with bearer authentication
 *
 * Responses are parsed like OpenAI chat completions; errors come from
 * `error.message`.
 */
class GenericRestAdapter : public HttpProviderAdapter {
public:
    explicit GenericRestAdapter(std::chrono::milliseconds timeout);

    std::string getName() const override;

protected:
    std::string requestPath(const Endpoint& endpoint, const std::string& base_path) const override;
    HeaderList requestHeaders(const Endpoint& endpoint) const override;
    nlohmann::json buildPayload(const Endpoint& endpoint,
                                const std::string& prompt,
                                const NormalizedParameters& params) const override;
    AdapterResult parseResponse(const std::string& prompt, const nlohmann::json& body) const override;
};

} // namespace Modelgate
