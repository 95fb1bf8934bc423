// =================================================================
// tests/GatewayConfigTest.cpp
// =================================================================
// Unit tests for YAML configuration loading.

#include "Modelgate/GatewayConfig.hpp"
#include "Modelgate/InMemoryStore.hpp"
#include "Modelgate/Logger.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace Modelgate;

namespace {

const char* SAMPLE_CONFIG = R"(
engine:
  call_timeout_ms: 15000
  worker_threads: 6
  compare_threads: 2
  database: /tmp/modelgate-test.db
  log_level: warning
  selector:
    random_seed: 1234
    connection_window_minutes: 10
  health:
    healthy_success_rate: 90
    window_minutes: 30

endpoints:
  gpt:
    provider: openai
    base_url: https://api.openai.com/v1
    api_key: sk-inline
    model: gpt-4o-mini
    input_price_per_1k: 0.00015
    output_price_per_1k: 0.0006
    rate_limit_rpm: 500
  azure-gpt:
    provider: azure
    base_url: https://example.openai.azure.com
    api_key_env: MODELGATE_TEST_AZURE_KEY
    model: gpt-4o
    api_version: 2024-02-01
  claude:
    provider: anthropic
    base_url: https://api.anthropic.com
    model: claude-sonnet
    max_tokens: 2048
    daily_quota: 1000
    additional_config:
      team: research

pools:
  chat:
    name: Chat traffic
    strategy: weighted
    max_retries: 2
    retry_delay_ms: 0
    members:
      - endpoint: gpt
        weight: 70
      - endpoint: claude
        weight: 30
        healthy: false
  experimental:
    strategy: fastest_first
    members:
      - endpoint: azure-gpt

quotas:
  alice-daily:
    endpoint: gpt
    caller: alice
    type: daily
    max_calls: 100
  claude-monthly:
    endpoint: claude
    type: monthly
    max_cost: 25.0
)";

} // namespace

class GatewayConfigTest {
private:
    static bool throwsConfigError(const std::string& yaml, const std::string& expected_fragment) {
        try {
            GatewayConfig::loadFromString(yaml);
        } catch (const ConfigError& e) {
            return std::string(e.what()).find(expected_fragment) != std::string::npos;
        }
        return false;
    }

public:
    GatewayConfigTest() {
        Logger::getInstance().setConsoleLogging(false);
        Logger::getInstance().setFileLogging(false);
    }

    void testEngineSettings() {
        std::cout << "Testing engine settings..." << std::endl;

        GatewayConfig config = GatewayConfig::loadFromString(SAMPLE_CONFIG);
        const EngineSettings& engine = config.engine();
        assert(engine.dispatcher.executor.call_timeout == std::chrono::milliseconds(15000));
        assert(engine.dispatcher.executor.worker_threads == 6);
        assert(engine.dispatcher.compare_threads == 2);
        assert(engine.database == "/tmp/modelgate-test.db");
        assert(engine.log_level == "warning");
        assert(engine.log_dir == ".modelgate/logs");
        assert(engine.dispatcher.selector.random_seed.has_value());
        assert(*engine.dispatcher.selector.random_seed == 1234);
        assert(engine.dispatcher.selector.connection_window == std::chrono::minutes(10));
        assert(engine.dispatcher.health.healthy_success_rate == 90.0);
        assert(engine.dispatcher.health.window == std::chrono::minutes(30));
        // Unset thresholds keep their defaults
        assert(engine.dispatcher.health.degraded_success_rate == 80.0);

        GatewayConfig empty = GatewayConfig::loadFromString("");
        assert(empty.endpoints().empty());
        assert(empty.engine().database == ".modelgate/modelgate.db");

        std::cout << "✓ Engine settings test passed" << std::endl;
    }

    void testEndpoints() {
        std::cout << "Testing endpoint parsing..." << std::endl;

        setenv("MODELGATE_TEST_AZURE_KEY", "azure-from-env", 1);
        GatewayConfig config = GatewayConfig::loadFromString(SAMPLE_CONFIG);
        assert(config.endpoints().size() == 3);

        const Endpoint& gpt = config.endpoints()[0];
        assert(gpt.id == "gpt");
        assert(gpt.name == "gpt");
        assert(gpt.provider_kind == ProviderKind::OPENAI_COMPATIBLE);
        assert(gpt.api_key == "sk-inline");
        assert(gpt.model_id == "gpt-4o-mini");
        assert(gpt.rate_limit_rpm == 500);
        assert(gpt.rate_limit_tpm == 40000);
        assert(gpt.input_price_per_1k == 0.00015);

        const Endpoint& azure = config.endpoints()[1];
        assert(azure.provider_kind == ProviderKind::OPENAI_COMPATIBLE);
        assert(azure.api_key == "azure-from-env");
        assert(azure.api_version == "2024-02-01");
        assert(azure.additional_config.at("api_type") == "azure");

        const Endpoint& claude = config.endpoints()[2];
        assert(claude.provider_kind == ProviderKind::ANTHROPIC_STYLE);
        assert(claude.max_tokens == 2048);
        assert(claude.daily_quota == 1000);
        assert(claude.additional_config.at("team") == "research");
        assert(claude.api_key.empty());

        unsetenv("MODELGATE_TEST_AZURE_KEY");
        GatewayConfig without_env = GatewayConfig::loadFromString(SAMPLE_CONFIG);
        assert(without_env.endpoints()[1].api_key.empty());

        std::cout << "✓ Endpoint parsing test passed" << std::endl;
    }

    void testPoolsAndQuotas() {
        std::cout << "Testing pool and quota parsing..." << std::endl;

        GatewayConfig config = GatewayConfig::loadFromString(SAMPLE_CONFIG);
        assert(config.pools().size() == 2);

        const Pool& chat = config.pools()[0];
        assert(chat.id == "chat");
        assert(chat.name == "Chat traffic");
        assert(chat.strategy == BalancingStrategy::WEIGHTED);
        assert(chat.max_retries == 2);
        assert(chat.retry_delay == std::chrono::milliseconds(0));
        assert(chat.members.size() == 2);
        assert(chat.members[0].endpoint.id == "gpt" && chat.members[0].weight == 70);
        assert(chat.members[1].endpoint.id == "claude" && !chat.members[1].is_healthy);

        // Unknown strategies load and fall back at selection time
        const Pool& experimental = config.pools()[1];
        assert(experimental.strategy == BalancingStrategy::UNKNOWN);
        assert(experimental.name == "experimental");

        assert(config.quotas().size() == 2);
        const Quota& alice = config.quotas()[0];
        assert(alice.endpoint_id == "gpt" && alice.caller_id == "alice");
        assert(alice.period == QuotaPeriod::DAILY && alice.max_calls == 100);
        const Quota& claude = config.quotas()[1];
        assert(claude.caller_id.empty());
        assert(claude.period == QuotaPeriod::MONTHLY && claude.max_cost == 25.0);

        std::cout << "✓ Pool and quota parsing test passed" << std::endl;
    }

    void testInvalidConfigurations() {
        std::cout << "Testing configuration errors..." << std::endl;

        assert(throwsConfigError(
            "endpoints:\n  x:\n    provider: carrier-pigeon\n    base_url: http://localhost\n",
            "carrier-pigeon"));
        assert(throwsConfigError(
            "endpoints:\n  x:\n    base_url: http://localhost\n",
            "has no provider"));
        assert(throwsConfigError(
            "endpoints:\n  x:\n    provider: openai\n",
            "has no base_url"));
        assert(throwsConfigError(
            "endpoints:\n  x:\n    provider: openai\n    base_url: http://localhost\n    max_tokens: 0\n",
            "max_tokens"));
        assert(throwsConfigError(
            "pools:\n  p:\n    members:\n      - endpoint: ghost\n",
            "unknown endpoint: ghost"));
        assert(throwsConfigError(
            "endpoints:\n  x:\n    provider: openai\n    base_url: http://localhost\n"
            "pools:\n  p:\n    members:\n      - endpoint: x\n        weight: 150\n",
            "0..100"));
        assert(throwsConfigError(
            "endpoints:\n  x:\n    provider: openai\n    base_url: http://localhost\n"
            "quotas:\n  q:\n    endpoint: x\n    type: hourly\n",
            "Quota q"));
        assert(throwsConfigError(
            "quotas:\n  q:\n    endpoint: ghost\n",
            "unknown endpoint: ghost"));
        assert(throwsConfigError("engine:\n  log_level: chatty\n", "chatty"));
        assert(throwsConfigError("engine:\n  call_timeout_ms: 0\n", "call_timeout_ms"));
        assert(throwsConfigError("- just\n- a list\n", "mapping"));
        assert(throwsConfigError("endpoints: [unclosed\n", "Failed to parse"));

        bool threw = false;
        try {
            GatewayConfig::loadFromFile("/nonexistent/modelgate/gateway.yml");
        } catch (const ConfigError& e) {
            threw = std::string(e.what()).find("not found") != std::string::npos;
        }
        assert(threw);

        std::cout << "✓ Configuration error test passed" << std::endl;
    }

    void testApplyToStore() {
        std::cout << "Testing configuration applied to a store..." << std::endl;

        GatewayConfig config = GatewayConfig::loadFromString(SAMPLE_CONFIG);
        InMemoryStore store;
        TimePoint now = TimeUtils::parseDate("2026-03-10") + std::chrono::hours(15);
        config.applyTo(store, now);

        assert(store.listEndpoints().size() == 3);
        assert(store.listPools().size() == 2);
        assert(store.getPool("chat")->members.size() == 2);

        auto daily = store.getQuota("alice-daily");
        assert(daily.has_value());
        assert(daily->reset_at == TimeUtils::parseDate("2026-03-11"));
        assert(daily->last_reset == now);

        // Usage survives a reload of the same configuration
        store.incrementQuotaUsage("alice-daily", 7, 700, 0.7);
        config.applyTo(store, now + std::chrono::hours(1));
        auto reloaded = store.getQuota("alice-daily");
        assert(reloaded->used_calls == 7);
        assert(reloaded->used_tokens == 700);
        assert(reloaded->reset_at == daily->reset_at);

        // Recorded member health survives a reload, new members take the config value
        TimePoint marked_at = now + std::chrono::hours(2);
        assert(store.setEndpointHealth("chat", "gpt", false, marked_at));
        config.applyTo(store, now + std::chrono::hours(3));
        auto chat = store.getPool("chat");
        assert(!chat->members[0].is_healthy);
        assert(chat->members[0].last_health_check == marked_at);
        assert(!chat->members[1].is_healthy);
        assert(store.getPool("experimental")->members[0].is_healthy);

        std::cout << "✓ Apply test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing loading from a file..." << std::endl;

        std::filesystem::path path = std::filesystem::temp_directory_path() / "modelgate_config_test.yml";
        {
            std::ofstream out(path);
            out << SAMPLE_CONFIG;
        }

        GatewayConfig config = GatewayConfig::loadFromFile(path.string());
        assert(config.endpoints().size() == 3);
        assert(config.pools().size() == 2);

        std::filesystem::remove(path);

        std::cout << "✓ File loading test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running GatewayConfig unit tests..." << std::endl;
        std::cout << "===================================" << std::endl << std::endl;

        testEngineSettings();
        testEndpoints();
        testPoolsAndQuotas();
        testInvalidConfigurations();
        testApplyToStore();
        testLoadFromFile();

        std::cout << std::endl << "All GatewayConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        GatewayConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
