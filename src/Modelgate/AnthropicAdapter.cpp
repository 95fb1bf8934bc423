// =================================================================
// src/Modelgate/AnthropicAdapter.cpp
// =================================================================
// Implementation of the Anthropic-style adapter.

#include "Modelgate/AnthropicAdapter.hpp"
#include "Modelgate/ParameterNormalizer.hpp"
#include <stdexcept>

namespace Modelgate {

AnthropicAdapter::AnthropicAdapter(std::chrono::milliseconds timeout)
    : HttpProviderAdapter(timeout) {
}

std::string AnthropicAdapter::getName() const {
    return "anthropic_style";
}

std::string AnthropicAdapter::requestPath(const Endpoint& /*endpoint*/, const std::string& base_path) const {
    return base_path + "/v1/messages";
}

HeaderList AnthropicAdapter::requestHeaders(const Endpoint& endpoint) const {
    return {
        {"x-api-key", endpoint.api_key},
        {"anthropic-version", endpoint.api_version.empty() ? DEFAULT_API_VERSION : endpoint.api_version}
    };
}

nlohmann::json AnthropicAdapter::buildPayload(const Endpoint& endpoint,
                                              const std::string& prompt,
                                              const NormalizedParameters& params) const {
    nlohmann::json payload = {
        {"model", endpoint.model_id},
        {"max_tokens", params.max_tokens},
        {"temperature", params.temperature},
        {"top_p", params.top_p},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", prompt}}
        })}
    };

    if (params.extra.is_object()) {
        for (const auto& [key, value] : params.extra.items()) {
            payload[key] = value;
        }
    }
    return payload;
}

AdapterResult AnthropicAdapter::parseResponse(const std::string& prompt, const nlohmann::json& body) const {
    AdapterResult result;

    const auto& content = body.at("content");
    if (!content.is_array()) {
        throw std::runtime_error("content is not an array");
    }

    bool found_text = false;
    for (const auto& block : content) {
        if (block.value("type", "") == "text" && block.contains("text")) {
            result.output_text += block["text"].get<std::string>();
            found_text = true;
        }
    }
    if (!found_text) {
        throw std::runtime_error("response contains no text content");
    }

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
