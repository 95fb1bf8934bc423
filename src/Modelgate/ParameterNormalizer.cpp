// =================================================================
// src/Modelgate/ParameterNormalizer.cpp
// =================================================================
// Implementation of parameter normalization and pricing.

#include "Modelgate/ParameterNormalizer.hpp"
#include <algorithm>

namespace Modelgate {

NormalizedParameters ParameterNormalizer::normalize(const SamplingParameters& requested, const Endpoint& endpoint) {
    NormalizedParameters params;

    double temperature = requested.temperature.value_or(endpoint.default_temperature);
    params.temperature = std::clamp(temperature, MIN_TEMPERATURE, MAX_TEMPERATURE);

    double top_p = requested.top_p.value_or(endpoint.default_top_p);
    params.top_p = std::clamp(top_p, MIN_TOP_P, MAX_TOP_P);

    size_t upper = std::max<size_t>(endpoint.max_tokens, 1);
    size_t max_tokens = requested.max_tokens.value_or(upper);
    params.max_tokens = std::clamp<size_t>(max_tokens, 1, upper);

    if (requested.extra.is_object()) {
        params.extra = requested.extra;
    }

    return params;
}

double ParameterNormalizer::computeCost(size_t input_tokens, size_t output_tokens, const Endpoint& endpoint) {
    double input_cost = static_cast<double>(input_tokens) / 1000.0 * endpoint.input_price_per_1k;
    double output_cost = static_cast<double>(output_tokens) / 1000.0 * endpoint.output_price_per_1k;
    return input_cost + output_cost;
}

size_t ParameterNormalizer::estimateTokens(const std::string& text) {
    return (text.length() + 3) / 4;
}

} // namespace Modelgate
