// =================================================================
// src/Modelgate/GenericRestAdapter.cpp
// =================================================================
// Implementation of the generic REST adapter.

#include "Modelgate/GenericRestAdapter.hpp"

namespace Modelgate {

GenericRestAdapter::GenericRestAdapter(std::chrono::milliseconds timeout)
    : HttpProviderAdapter(timeout) {
}

std::string GenericRestAdapter::getName() const {
    return "generic_rest";
}

std::string GenericRestAdapter::requestPath(const Endpoint& /*endpoint*/, const std::string& base_path) const {
    return base_path;
}

HeaderList GenericRestAdapter::requestHeaders(const Endpoint& endpoint) const {
    HeaderList headers;
    if (!endpoint.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + endpoint.api_key);
    }
    return headers;
}

nlohmann::json GenericRestAdapter::buildPayload(const Endpoint& endpoint,
                                                const std::string& prompt,
                                                const NormalizedParameters& params) const {
    return buildChatPayload(endpoint, prompt, params);
}

AdapterResult GenericRestAdapter::parseResponse(const std::string& prompt, const nlohmann::json& body) const {
    return parseChatCompletion(prompt, body);
}

} // namespace Modelgate
