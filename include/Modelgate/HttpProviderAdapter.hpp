// =================================================================
// include/Modelgate/HttpProviderAdapter.hpp
// =================================================================
// Shared HTTP/JSON transport for the built-in provider adapters.

#pragma once

#include "Modelgate/ProviderAdapter.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace Modelgate {

/**
 * @brief Base URL split into the part httplib connects to and a path prefix
 */
struct HttpTarget {
    std::string scheme_host_port;           ///< e.g. "https://api.openai.com"
    std::string path;                       ///< e.g. "/v1", empty for a bare host
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Template for adapters that POST one JSON document and parse one back
 *
 * Subclasses describe the request path, headers and payload and parse the
 * response body. The base class owns the transport and maps every failure
 * mode to an unsuccessful AdapterResult.
 */
class HttpProviderAdapter : public ProviderAdapter {
public:
    explicit HttpProviderAdapter(std::chrono::milliseconds timeout);

    AdapterResult invoke(const Endpoint& endpoint,
                         const std::string& prompt,
                         const NormalizedParameters& params) override;

    /**
     * @brief Split a base URL into connection target and path prefix
     * @throws std::invalid_argument if the URL has no scheme or host
     */
    static HttpTarget splitUrl(const std::string& url);

protected:
    /**
     * @brief Request path, including any query string
     * @param base_path Path component of the endpoint's base URL
     */
    virtual std::string requestPath(const Endpoint& endpoint, const std::string& base_path) const = 0;

    virtual HeaderList requestHeaders(const Endpoint& endpoint) const = 0;

    virtual nlohmann::json buildPayload(const Endpoint& endpoint,
                                        const std::string& prompt,
                                        const NormalizedParameters& params) const = 0;

    /**
     * @brief Parse a 2xx body
     * @throws nlohmann::json::exception or std::runtime_error when the body lacks the output
     */
    virtual AdapterResult parseResponse(const std::string& prompt, const nlohmann::json& body) const = 0;

    /**
     * @brief Extract a provider error description from a non-2xx body
     */
    virtual std::string extractError(const nlohmann::json& body) const;

    /**
     * @brief Parse OpenAI-style choices/usage, shared by chat-shaped providers
     */
    static AdapterResult parseChatCompletion(const std::string& prompt, const nlohmann::json& body);

    /**
     * @brief Chat body {model, messages, temperature, top_p, max_tokens} plus extras
     */
    static nlohmann::json buildChatPayload(const Endpoint& endpoint,
                                           const std::string& prompt,
                                           const NormalizedParameters& params);

    std::chrono::milliseconds m_timeout;
};

} // namespace Modelgate
