// =================================================================
// include/Modelgate/CustomAdapter.hpp
// =================================================================
// Adapter for free-form {model, input, parameters} APIs.

#pragma once

#include "Modelgate/HttpProviderAdapter.hpp"

namespace Modelgate {

/**
 * @brief POSTs `{model, input, parameters, ...additional_config}` to the base URL
 *
 * Parses `output` and `usage.input_tokens / usage.output_tokens`.
 */
class CustomAdapter : public HttpProviderAdapter {
public:
    explicit CustomAdapter(std::chrono::milliseconds timeout);

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
