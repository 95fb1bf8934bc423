// =================================================================
// src/Modelgate/HttpProviderAdapter.cpp
// =================================================================
// HTTP transport and response mapping shared by provider adapters.

#include "Modelgate/HttpProviderAdapter.hpp"
#include "Modelgate/ParameterNormalizer.hpp"
#include "Modelgate/Logger.hpp"
#include "httplib.h"
#include <stdexcept>

namespace Modelgate {

namespace {

constexpr size_t MAX_ERROR_BODY = 200;

std::string truncateBody(const std::string& body) {
    if (body.length() <= MAX_ERROR_BODY) {
        return body;
    }
    return body.substr(0, MAX_ERROR_BODY) + "...";
}

} // namespace

HttpProviderAdapter::HttpProviderAdapter(std::chrono::milliseconds timeout)
    : m_timeout(timeout) {
}

AdapterResult HttpProviderAdapter::invoke(const Endpoint& endpoint,
                                          const std::string& prompt,
                                          const NormalizedParameters& params) {
    AdapterResult result;
    auto start_time = std::chrono::steady_clock::now();

    try {
        HttpTarget target = splitUrl(endpoint.base_url);

        httplib::Client client(target.scheme_host_port.c_str());
        client.set_connection_timeout(m_timeout);
        client.set_read_timeout(m_timeout);
        client.set_write_timeout(m_timeout);

        httplib::Headers headers;
        for (const auto& [name, value] : requestHeaders(endpoint)) {
            headers.emplace(name, value);
        }

        std::string path = requestPath(endpoint, target.path);
        if (path.empty()) {
            path = "/";
        }
        // Invalid UTF-8 in the prompt is sent as U+FFFD rather than failing the call
        std::string payload = buildPayload(endpoint, prompt, params)
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        Logger::getInstance().debug(getName(), "POST " + target.scheme_host_port + path,
                                    "Endpoint: " + endpoint.id + ", Payload: " +
                                    std::to_string(payload.length()) + " bytes");

        auto res = client.Post(path.c_str(), headers, payload, "application/json");

        if (!res) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
            result.timed_out = elapsed >= m_timeout;
            result.error = std::string(result.timed_out ? "Request timed out" : "Request failed") +
                           " (" + httplib::to_string(res.error()) + ") for " + target.scheme_host_port;
            return result;
        }

        if (res->status == 429) {
            result.error = "Rate limited by provider (HTTP 429)";
            try {
                std::string detail = extractError(nlohmann::json::parse(res->body));
                if (!detail.empty()) {
                    result.error += ": " + detail;
                }
            } catch (const nlohmann::json::exception&) {
                // Body was not JSON; status alone is enough
            }
            return result;
        }

        if (res->status < 200 || res->status >= 300) {
            std::string detail;
            try {
                detail = extractError(nlohmann::json::parse(res->body));
            } catch (const nlohmann::json::exception&) {
                detail = truncateBody(res->body);
            }
            result.error = "HTTP " + std::to_string(res->status) + ": " + detail;
            return result;
        }

        auto body = nlohmann::json::parse(res->body);
        result = parseResponse(prompt, body);
        result.success = true;

    } catch (const nlohmann::json::exception& e) {
        result = AdapterResult();
        result.error = "Malformed response from " + endpoint.id + ": " + std::string(e.what());
    } catch (const std::exception& e) {
        result = AdapterResult();
        result.error = "Error calling " + endpoint.id + ": " + std::string(e.what());
    }

    return result;
}

HttpTarget HttpProviderAdapter::splitUrl(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw std::invalid_argument("Base URL must include a scheme: " + url);
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    if (path_start == host_start) {
        throw std::invalid_argument("Base URL has no host: " + url);
    }

    HttpTarget target;
    if (path_start == std::string::npos) {
        target.scheme_host_port = url;
    } else {
        target.scheme_host_port = url.substr(0, path_start);
        target.path = url.substr(path_start);
    }

    while (!target.path.empty() && target.path.back() == '/') {
        target.path.pop_back();
    }
    if (target.scheme_host_port.length() == host_start) {
        throw std::invalid_argument("Base URL has no host: " + url);
    }

    return target;
}

std::string HttpProviderAdapter::extractError(const nlohmann::json& body) const {
    if (body.contains("error")) {
        const auto& error = body["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
        if (error.is_string()) {
            return error.get<std::string>();
        }
        return truncateBody(error.dump());
    }
    if (body.contains("message") && body["message"].is_string()) {
        return body["message"].get<std::string>();
    }
    return truncateBody(body.dump());
}

AdapterResult HttpProviderAdapter::parseChatCompletion(const std::string& prompt, const nlohmann::json& body) {
    AdapterResult result;

    const auto& choices = body.at("choices");
    if (!choices.is_array() || choices.empty()) {
        throw std::runtime_error("response contains no choices");
    }

    const auto& content = choices.at(0).at("message").at("content");
    result.output_text = content.is_null() ? std::string() : content.get<std::string>();

    if (body.contains("usage") && body["usage"].is_object()) {
        const auto& usage = body["usage"];
        result.input_tokens = usage.value("prompt_tokens", static_cast<size_t>(0));
        result.output_tokens = usage.value("completion_tokens", static_cast<size_t>(0));
    } else {
        result.input_tokens = ParameterNormalizer::estimateTokens(prompt);
        result.output_tokens = ParameterNormalizer::estimateTokens(result.output_text);
    }

    return result;
}

nlohmann::json HttpProviderAdapter::buildChatPayload(const Endpoint& endpoint,
                                                     const std::string& prompt,
                                                     const NormalizedParameters& params) {
    nlohmann::json payload = {
        {"model", endpoint.model_id},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", prompt}}
        })},
        {"temperature", params.temperature},
        {"top_p", params.top_p},
        {"max_tokens", params.max_tokens}
    };

    if (params.extra.is_object()) {
        for (const auto& [key, value] : params.extra.items()) {
            payload[key] = value;
        }
    }

    return payload;
}

} // namespace Modelgate
