// =================================================================
// tests/ParameterNormalizerTest.cpp
// =================================================================
// Unit tests for parameter normalization and pricing.

#include "Modelgate/ParameterNormalizer.hpp"
#include "MockProviderAdapter.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace Modelgate;

class ParameterNormalizerTest {
private:
    static bool near(double a, double b, double epsilon = 1e-9) {
        return std::fabs(a - b) < epsilon;
    }

public:
    void testDefaultsFromEndpoint() {
        std::cout << "Testing defaults taken from the endpoint..." << std::endl;

        Endpoint endpoint = makeTestEndpoint("defaults");
        endpoint.default_temperature = 0.3;
        endpoint.default_top_p = 0.9;
        endpoint.max_tokens = 512;

        NormalizedParameters params = ParameterNormalizer::normalize(SamplingParameters(), endpoint);
        assert(near(params.temperature, 0.3));
        assert(near(params.top_p, 0.9));
        assert(params.max_tokens == 512);
        assert(params.extra.is_object() && params.extra.empty());

        std::cout << "✓ Endpoint defaults test passed" << std::endl;
    }

    void testClamping() {
        std::cout << "Testing clamping of out-of-range values..." << std::endl;

        Endpoint endpoint = makeTestEndpoint("clamp");
        endpoint.max_tokens = 256;

        SamplingParameters high;
        high.temperature = 3.5;
        high.top_p = 1.7;
        high.max_tokens = 10000;
        NormalizedParameters upper = ParameterNormalizer::normalize(high, endpoint);
        assert(near(upper.temperature, 2.0));
        assert(near(upper.top_p, 1.0));
        assert(upper.max_tokens == 256);

        SamplingParameters low;
        low.temperature = -1.0;
        low.top_p = -0.5;
        low.max_tokens = 0;
        NormalizedParameters lower = ParameterNormalizer::normalize(low, endpoint);
        assert(near(lower.temperature, 0.0));
        assert(near(lower.top_p, 0.0));
        assert(lower.max_tokens == 1);

        SamplingParameters inside;
        inside.temperature = 1.2;
        inside.top_p = 0.5;
        inside.max_tokens = 100;
        NormalizedParameters unchanged = ParameterNormalizer::normalize(inside, endpoint);
        assert(near(unchanged.temperature, 1.2));
        assert(near(unchanged.top_p, 0.5));
        assert(unchanged.max_tokens == 100);

        std::cout << "✓ Clamping test passed" << std::endl;
    }

    void testExtraPassthrough() {
        std::cout << "Testing provider-specific parameter passthrough..." << std::endl;

        SamplingParameters requested;
        requested.extra = {{"presence_penalty", 0.4}, {"stop", {"\n\n"}}};

        NormalizedParameters params = ParameterNormalizer::normalize(requested, makeTestEndpoint("extra"));
        assert(params.extra.size() == 2);
        assert(near(params.extra["presence_penalty"].get<double>(), 0.4));
        assert(params.extra["stop"][0] == "\n\n");

        std::cout << "✓ Passthrough test passed" << std::endl;
    }

    void testCost() {
        std::cout << "Testing cost computation..." << std::endl;

        Endpoint endpoint = makeTestEndpoint("priced", 0.001, 0.002);
        assert(near(ParameterNormalizer::computeCost(2000, 1000, endpoint), 0.004));
        assert(near(ParameterNormalizer::computeCost(0, 0, endpoint), 0.0));

        Endpoint free_endpoint = makeTestEndpoint("free", 0.0, 0.0);
        assert(near(ParameterNormalizer::computeCost(50000, 50000, free_endpoint), 0.0));

        std::cout << "✓ Cost test passed" << std::endl;
    }

    void testTokenEstimate() {
        std::cout << "Testing token estimation..." << std::endl;

        assert(ParameterNormalizer::estimateTokens("") == 0);
        assert(ParameterNormalizer::estimateTokens("abc") == 1);
        assert(ParameterNormalizer::estimateTokens("abcd") == 1);
        assert(ParameterNormalizer::estimateTokens("abcde") == 2);
        assert(ParameterNormalizer::estimateTokens(std::string(400, 'x')) == 100);

        std::cout << "✓ Token estimate test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ParameterNormalizer unit tests..." << std::endl;
        std::cout << "==========================================" << std::endl << std::endl;

        testDefaultsFromEndpoint();
        testClamping();
        testExtraPassthrough();
        testCost();
        testTokenEstimate();

        std::cout << std::endl << "All ParameterNormalizer tests passed!" << std::endl;
    }
};

int main() {
    try {
        ParameterNormalizerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
