// =================================================================
// include/Modelgate/ParameterNormalizer.hpp
// =================================================================
// Sampling parameter clamping, token estimation and call pricing.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include <string>

namespace Modelgate {

/**
 * @brief Stateless helpers shared by the executor and the adapters
 */
class ParameterNormalizer {
public:
    static constexpr double MIN_TEMPERATURE = 0.0;
    static constexpr double MAX_TEMPERATURE = 2.0;
    static constexpr double MIN_TOP_P = 0.0;
    static constexpr double MAX_TOP_P = 1.0;

    /**
     * @brief Fill unset fields from endpoint defaults and clamp to valid ranges
     * @param requested Caller supplied parameters
     * @param endpoint Endpoint the call is going to
     * @return Parameters safe to send to the endpoint
     *
     * temperature is clamped to [0, 2], top_p to [0, 1] and max_tokens to
     * [1, endpoint.max_tokens]. Extra parameters pass through untouched.
     */
    static NormalizedParameters normalize(const SamplingParameters& requested, const Endpoint& endpoint);

    /**
     * @brief Price a call from its token usage
     * @return input/1000 * input_price + output/1000 * output_price
     */
    static double computeCost(size_t input_tokens, size_t output_tokens, const Endpoint& endpoint);

    /**
     * @brief Approximate token count when a provider omits usage (chars / 4, rounded up)
     */
    static size_t estimateTokens(const std::string& text);
};

} // namespace Modelgate
