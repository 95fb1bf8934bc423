// =================================================================
// src/Modelgate/CustomAdapter.cpp
// =================================================================
// Implementation of the custom API adapter.

#include "Modelgate/CustomAdapter.hpp"
#include "Modelgate/ParameterNormalizer.hpp"

namespace Modelgate {

CustomAdapter::CustomAdapter(std::chrono::milliseconds timeout)
    : HttpProviderAdapter(timeout) {
}

std::string CustomAdapter::getName() const {
    return "custom";
}

std::string CustomAdapter::requestPath(const Endpoint& /*endpoint*/, const std::string& base_path) const {
    return base_path;
}

HeaderList CustomAdapter::requestHeaders(const Endpoint& endpoint) const {
    HeaderList headers;
    if (!endpoint.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + endpoint.api_key);
    }
    return headers;
}

nlohmann::json CustomAdapter::buildPayload(const Endpoint& endpoint,
                                           const std::string& prompt,
                                           const NormalizedParameters& params) const {
    nlohmann::json parameters = {
        {"temperature", params.temperature},
        {"top_p", params.top_p},
        {"max_tokens", params.max_tokens}
    };
    if (params.extra.is_object()) {
        for (const auto& [key, value] : params.extra.items()) {
            parameters[key] = value;
        }
    }

    nlohmann::json payload = {
        {"model", endpoint.model_id},
        {"input", prompt},
        {"parameters", parameters}
    };

    // Endpoint extras sit beside the standard fields
    for (const auto& [key, value] : endpoint.additional_config) {
        payload[key] = value;
    }
    return payload;
}

AdapterResult CustomAdapter::parseResponse(const std::string& prompt, const nlohmann::json& body) const {
    AdapterResult result;
    result.output_text = body.at("output").get<std::string>();

    if (body.contains("usage") && body["usage"].is_object()) {
        const auto& usage = body["usage"];
        result.input_tokens = usage.value("input_tokens", static_cast<size_t>(0));
        result.output_tokens = usage.value("output_tokens", static_cast<size_t>(0));
    } else {
        result.input_tokens = ParameterNormalizer::estimateTokens(prompt);
        result.output_tokens = ParameterNormalizer::estimateTokens(result.output_text);
    }
    return result;
}

} // namespace Modelgate
