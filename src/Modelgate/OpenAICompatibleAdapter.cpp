// =================================================================
// src/Modelgate/OpenAICompatibleAdapter.cpp
// =================================================================
// Implementation of the OpenAI-compatible adapter.

#include "Modelgate/OpenAICompatibleAdapter.hpp"

namespace Modelgate {

OpenAICompatibleAdapter::OpenAICompatibleAdapter(std::chrono::milliseconds timeout)
    : HttpProviderAdapter(timeout) {
}

std::string OpenAICompatibleAdapter::getName() const {
    return "openai_compatible";
}

bool OpenAICompatibleAdapter::isAzure(const Endpoint& endpoint) {
    auto it = endpoint.additional_config.find("api_type");
    return it != endpoint.additional_config.end() && it->second == "azure";
}

std::string OpenAICompatibleAdapter::requestPath(const Endpoint& endpoint, const std::string& base_path) const {
    if (isAzure(endpoint)) {
        std::string version = endpoint.api_version.empty() ? DEFAULT_AZURE_API_VERSION : endpoint.api_version;
        return base_path + "/openai/deployments/" + endpoint.model_id +
               "/chat/completions?api-version=" + version;
    }
    return base_path + "/chat/completions";
}

HeaderList OpenAICompatibleAdapter::requestHeaders(const Endpoint& endpoint) const {
    HeaderList headers;
    if (isAzure(endpoint)) {
        headers.emplace_back("api-key", endpoint.api_key);
    } else if (!endpoint.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + endpoint.api_key);
    }

    auto org = endpoint.additional_config.find("organization");
    if (org != endpoint.additional_config.end()) {
        headers.emplace_back("OpenAI-Organization", org->second);
    }
    return headers;
}

nlohmann::json OpenAICompatibleAdapter::buildPayload(const Endpoint& endpoint,
                                                     const std::string& prompt,
                                                     const NormalizedParameters& params) const {
    return buildChatPayload(endpoint, prompt, params);
}

AdapterResult OpenAICompatibleAdapter::parseResponse(const std::string& prompt, const nlohmann::json& body) const {
    return parseChatCompletion(prompt, body);
}

} // namespace Modelgate
