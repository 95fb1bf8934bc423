// =================================================================
// tests/ProviderAdapterTest.cpp
// =================================================================
// Exercises the HTTP provider adapters against a local httplib server.

#include "Modelgate/AnthropicAdapter.hpp"
#include "Modelgate/CustomAdapter.hpp"
#include "Modelgate/GenericRestAdapter.hpp"
#include "Modelgate/Logger.hpp"
#include "Modelgate/OpenAICompatibleAdapter.hpp"
#include "Modelgate/ParameterNormalizer.hpp"
#include "Modelgate/ProviderAdapter.hpp"
#include "MockProviderAdapter.hpp"
#include "httplib.h"
#include <cassert>
#include <iostream>
#include <mutex>
#include <thread>

using namespace Modelgate;

class ProviderAdapterTest {
private:
    httplib::Server m_server;
    std::thread m_server_thread;
    int m_port = 0;

    std::mutex m_mutex;
    std::string m_last_path;
    std::string m_last_body;
    httplib::Headers m_last_headers;

    void remember(const httplib::Request& req) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_path = req.path;
        if (!req.params.empty()) {
            m_last_path += "?";
            for (const auto& [key, value] : req.params) {
                m_last_path += key + "=" + value;
            }
        }
        m_last_body = req.body;
        m_last_headers = req.headers;
    }

    nlohmann::json lastBody() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return nlohmann::json::parse(m_last_body);
    }

    std::string lastPath() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_path;
    }

    std::string lastHeader(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_last_headers.find(name);
        return it != m_last_headers.end() ? it->second : "";
    }

    std::string baseUrl(const std::string& path = "") const {
        return "http://127.0.0.1:" + std::to_string(m_port) + path;
    }

    void setupRoutes() {
        m_server.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            nlohmann::json response = {
                {"choices", nlohmann::json::array({{{"message", {{"role", "assistant"}, {"content", "Hello from openai"}}}}})},
                {"usage", {{"prompt_tokens", 12}, {"completion_tokens", 7}}}
            };
            res.set_content(response.dump(), "application/json");
        });

        m_server.Post("/azure/openai/deployments/gpt-4o/chat/completions",
                      [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            nlohmann::json response = {
                {"choices", nlohmann::json::array({{{"message", {{"content", "Hello from azure"}}}}})}
            };
            res.set_content(response.dump(), "application/json");
        });

        m_server.Post("/v1/messages", [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            nlohmann::json response = {
                {"content", nlohmann::json::array({{{"type", "text"}, {"text", "Hello "}}, {{"type", "text"}, {"text", "from claude"}}})},
                {"usage", {{"input_tokens", 9}, {"output_tokens", 4}}}
            };
            res.set_content(response.dump(), "application/json");
        });

        m_server.Post("/generic/generate", [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            nlohmann::json response = {
                {"choices", nlohmann::json::array({{{"message", {{"content", "Hello from generic"}}}}})},
                {"usage", {{"prompt_tokens", 3}, {"completion_tokens", 2}}}
            };
            res.set_content(response.dump(), "application/json");
        });

        m_server.Post("/custom/infer", [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            res.set_content(R"({"output": "Hello from custom"})", "application/json");
        });

        m_server.Post("/throttled/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            res.status = 429;
            res.set_content(R"({"error": {"message": "slow down"}})", "application/json");
        });

        m_server.Post("/broken/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{not json", "application/json");
        });

        m_server.Post("/empty/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"choices": []})", "application/json");
        });

        m_server.Post("/failing/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            res.status = 500;
            res.set_content(R"({"error": "model overloaded"})", "application/json");
        });
    }

    Endpoint endpointFor(const std::string& id, ProviderKind kind, const std::string& base_url) {
        Endpoint endpoint = makeTestEndpoint(id);
        endpoint.provider_kind = kind;
        endpoint.base_url = base_url;
        endpoint.api_key = "sk-test";
        return endpoint;
    }

    static NormalizedParameters params() {
        NormalizedParameters normalized;
        normalized.temperature = 0.5;
        normalized.top_p = 0.9;
        normalized.max_tokens = 64;
        return normalized;
    }

public:
    ProviderAdapterTest() {
        Logger::getInstance().setConsoleLogging(false);
        Logger::getInstance().setFileLogging(false);

        setupRoutes();
        m_port = m_server.bind_to_any_port("127.0.0.1");
        if (m_port <= 0) {
            throw std::runtime_error("Could not bind test server");
        }
        m_server_thread = std::thread([this]() { m_server.listen_after_bind(); });
        while (!m_server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~ProviderAdapterTest() {
        m_server.stop();
        if (m_server_thread.joinable()) {
            m_server_thread.join();
        }
    }

    void testSplitUrl() {
        std::cout << "Testing base URL splitting..." << std::endl;

        HttpTarget with_path = HttpProviderAdapter::splitUrl("https://api.openai.com/v1/");
        assert(with_path.scheme_host_port == "https://api.openai.com");
        assert(with_path.path == "/v1");

        HttpTarget bare = HttpProviderAdapter::splitUrl("http://localhost:8080");
        assert(bare.scheme_host_port == "http://localhost:8080");
        assert(bare.path.empty());

        bool threw = false;
        try {
            HttpProviderAdapter::splitUrl("api.openai.com/v1");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ URL splitting test passed" << std::endl;
    }

    void testOpenAICompatible() {
        std::cout << "Testing OpenAI-compatible adapter..." << std::endl;

        OpenAICompatibleAdapter adapter(std::chrono::milliseconds(2000));
        Endpoint endpoint = endpointFor("oa", ProviderKind::OPENAI_COMPATIBLE, baseUrl("/v1"));
        endpoint.model_id = "gpt-4o-mini";

        NormalizedParameters normalized = params();
        normalized.extra = {{"presence_penalty", 0.2}};

        AdapterResult result = adapter.invoke(endpoint, "Hi", normalized);
        assert(result.success);
        assert(result.output_text == "Hello from openai");
        assert(result.input_tokens == 12);
        assert(result.output_tokens == 7);

        nlohmann::json body = lastBody();
        assert(body["model"] == "gpt-4o-mini");
        assert(body["messages"][0]["role"] == "user");
        assert(body["messages"][0]["content"] == "Hi");
        assert(body["max_tokens"] == 64);
        assert(body["presence_penalty"] == 0.2);
        assert(lastHeader("Authorization") == "Bearer sk-test");

        std::cout << "✓ OpenAI-compatible test passed" << std::endl;
    }

    void testInvalidUtf8Prompt() {
        std::cout << "Testing prompts with invalid UTF-8..." << std::endl;

        OpenAICompatibleAdapter adapter(std::chrono::milliseconds(2000));
        Endpoint endpoint = endpointFor("oa", ProviderKind::OPENAI_COMPATIBLE, baseUrl("/v1"));

        // Latin-1 e-acute is not valid UTF-8
        AdapterResult result = adapter.invoke(endpoint, "caf\xe9", params());
        assert(result.success);
        assert(result.error.empty());
        assert(lastBody()["messages"][0]["content"] == "caf\xEF\xBF\xBD");

        std::cout << "✓ Invalid UTF-8 prompt test passed" << std::endl;
    }

    void testAzureDeployment() {
        std::cout << "Testing Azure deployment routing..." << std::endl;

        OpenAICompatibleAdapter adapter(std::chrono::milliseconds(2000));
        Endpoint endpoint = endpointFor("az", ProviderKind::OPENAI_COMPATIBLE, baseUrl("/azure"));
        endpoint.model_id = "gpt-4o";
        endpoint.api_version = "2024-02-01";
        endpoint.additional_config["api_type"] = "azure";

        AdapterResult result = adapter.invoke(endpoint, "What is two plus two?", params());
        assert(result.success);
        assert(result.output_text == "Hello from azure");
        // No usage block: counts are estimated from text length
        assert(result.input_tokens == ParameterNormalizer::estimateTokens("What is two plus two?"));
        assert(result.output_tokens == ParameterNormalizer::estimateTokens("Hello from azure"));

        assert(lastPath() == "/azure/openai/deployments/gpt-4o/chat/completions?api-version=2024-02-01");
        assert(lastHeader("api-key") == "sk-test");

        std::cout << "✓ Azure test passed" << std::endl;
    }

    void testAnthropicStyle() {
        std::cout << "Testing Anthropic-style adapter..." << std::endl;

        AnthropicAdapter adapter(std::chrono::milliseconds(2000));
        Endpoint endpoint = endpointFor("claude", ProviderKind::ANTHROPIC_STYLE, baseUrl());
        endpoint.model_id = "claude-sonnet";

        AdapterResult result = adapter.invoke(endpoint, "Hi", params());
        assert(result.success);
        assert(result.output_text == "Hello from claude");
        assert(result.input_tokens == 9);
        assert(result.output_tokens == 4);

        nlohmann::json body = lastBody();
        assert(body["model"] == "claude-sonnet");
        assert(body["max_tokens"] == 64);
        assert(body["messages"][0]["content"] == "Hi");
        assert(lastHeader("x-api-key") == "sk-test");
        assert(!lastHeader("anthropic-version").empty());

        std::cout << "✓ Anthropic-style test passed" << std::endl;
    }

    void testGenericRest() {
        std::cout << "Testing generic REST adapter..." << std::endl;

        GenericRestAdapter adapter(std::chrono::milliseconds(2000));
        Endpoint endpoint = endpointFor("generic", ProviderKind::GENERIC_REST, baseUrl("/generic/generate"));

        AdapterResult result = adapter.invoke(endpoint, "Hi", params());
        assert(result.success);
        assert(result.output_text == "Hello from generic");
        assert(result.input_tokens == 3 && result.output_tokens == 2);
        assert(lastPath() == "/generic/generate");

        std::cout << "✓ Generic REST test passed" << std::endl;
    }

    void testCustom() {
        std::cout << "Testing custom adapter..." << std::endl;

        CustomAdapter adapter(std::chrono::milliseconds(2000));
        Endpoint endpoint = endpointFor("custom", ProviderKind::CUSTOM, baseUrl("/custom/infer"));
        endpoint.model_id = "summarizer-v2";
        endpoint.additional_config["tenant"] = "research";

        AdapterResult result = adapter.invoke(endpoint, "Summarize this", params());
        assert(result.success);
        assert(result.output_text == "Hello from custom");

        nlohmann::json body = lastBody();
        assert(body["model"] == "summarizer-v2");
        assert(body["input"] == "Summarize this");
        assert(body["parameters"]["max_tokens"] == 64);
        assert(body["tenant"] == "research");

        std::cout << "✓ Custom adapter test passed" << std::endl;
    }

    void testProviderRateLimit() {
        std::cout << "Testing HTTP 429 mapping..." << std::endl;

        OpenAICompatibleAdapter adapter(std::chrono::milliseconds(2000));
        AdapterResult result = adapter.invoke(
            endpointFor("throttled", ProviderKind::OPENAI_COMPATIBLE, baseUrl("/throttled")), "Hi", params());
        assert(!result.success);
        assert(!result.timed_out);
        assert(result.error.find("Rate limited by provider") != std::string::npos);
        assert(result.error.find("slow down") != std::string::npos);

        std::cout << "✓ HTTP 429 test passed" << std::endl;
    }

    void testErrorResponses() {
        std::cout << "Testing malformed and failing responses..." << std::endl;

        OpenAICompatibleAdapter adapter(std::chrono::milliseconds(2000));

        AdapterResult broken = adapter.invoke(
            endpointFor("broken", ProviderKind::OPENAI_COMPATIBLE, baseUrl("/broken")), "Hi", params());
        assert(!broken.success);
        assert(broken.error.find("Malformed response") != std::string::npos);

        AdapterResult empty = adapter.invoke(
            endpointFor("empty", ProviderKind::OPENAI_COMPATIBLE, baseUrl("/empty")), "Hi", params());
        assert(!empty.success);
        assert(empty.error.find("no choices") != std::string::npos);

        AdapterResult failing = adapter.invoke(
            endpointFor("failing", ProviderKind::OPENAI_COMPATIBLE, baseUrl("/failing")), "Hi", params());
        assert(!failing.success);
        assert(failing.error == "HTTP 500: model overloaded");

        std::cout << "✓ Error response test passed" << std::endl;
    }

    void testUnreachableHost() {
        std::cout << "Testing unreachable backend..." << std::endl;

        OpenAICompatibleAdapter adapter(std::chrono::milliseconds(1000));
        // Port 1 on loopback refuses connections
        AdapterResult result = adapter.invoke(
            endpointFor("down", ProviderKind::OPENAI_COMPATIBLE, "http://127.0.0.1:1/v1"), "Hi", params());
        assert(!result.success);
        assert(!result.error.empty());

        AdapterResult bad_url = adapter.invoke(
            endpointFor("bad-url", ProviderKind::OPENAI_COMPATIBLE, "not a url"), "Hi", params());
        assert(!bad_url.success);
        assert(bad_url.error.find("scheme") != std::string::npos);

        std::cout << "✓ Unreachable host test passed" << std::endl;
    }

    void testAdapterCache() {
        std::cout << "Testing adapter cache..." << std::endl;

        AdapterCache cache(std::chrono::milliseconds(1000));
        Endpoint openai = endpointFor("a", ProviderKind::OPENAI_COMPATIBLE, baseUrl("/v1"));
        Endpoint claude = endpointFor("b", ProviderKind::ANTHROPIC_STYLE, baseUrl());

        auto first = cache.getAdapter(openai);
        auto again = cache.getAdapter(openai);
        assert(first && first == again);
        assert(first->getName() == "openai_compatible");
        assert(cache.getAdapter(claude)->getName() == "anthropic_style");
        assert(cache.size() == 2);

        // Same endpoint id under a different kind gets its own instance
        Endpoint switched = openai;
        switched.provider_kind = ProviderKind::CUSTOM;
        assert(cache.getAdapter(switched)->getName() == "custom");
        assert(cache.size() == 3);

        cache.invalidate("a");
        assert(cache.size() == 1);
        assert(cache.getAdapter(openai) != first);

        auto mock = std::make_shared<MockProviderAdapter>();
        MockProviderAdapter::install(cache, mock);
        assert(cache.size() == 0);
        assert(cache.getAdapter(claude) == mock);

        cache.clear();
        assert(cache.size() == 0);

        std::cout << "✓ Adapter cache test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ProviderAdapter tests..." << std::endl;
        std::cout << "===============================" << std::endl << std::endl;

        testSplitUrl();
        testOpenAICompatible();
        testInvalidUtf8Prompt();
        testAzureDeployment();
        testAnthropicStyle();
        testGenericRest();
        testCustom();
        testProviderRateLimit();
        testErrorResponses();
        testUnreachableHost();
        testAdapterCache();

        std::cout << std::endl << "All ProviderAdapter tests passed!" << std::endl;
    }
};

int main() {
    try {
        ProviderAdapterTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
