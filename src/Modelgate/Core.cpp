// =================================================================
// src/Modelgate/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Modelgate/Core.hpp"
#include "Modelgate/Dispatcher.hpp"
#include "Modelgate/GatewayConfig.hpp"
#include "Modelgate/Logger.hpp"
#include "Modelgate/PerformanceMonitor.hpp"
#include "Modelgate/SqliteStore.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>

namespace Modelgate {

Core::Core(const Commands& commands)
    : m_commands(commands)
{
    m_config = std::make_unique<GatewayConfig>(GatewayConfig::loadFromFile(m_commands.config_path));
    const EngineSettings& engine = m_config->engine();

    Logger& logger = Logger::getInstance();
    logger.initialize(engine.log_dir);
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : Logger::parseLevel(engine.log_level));

    std::string database = m_commands.database_path.empty() ? engine.database : m_commands.database_path;
    m_store = SqliteStore::open(database);
    m_config->applyTo(*m_store);

    m_dispatcher = std::make_unique<Dispatcher>(*m_store, engine.dispatcher);
    m_monitor = std::make_unique<PerformanceMonitor>(*m_dispatcher);
}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command,
        m_commands.pool_id.empty() ? m_commands.endpoint_id : m_commands.pool_id);

    int exit_code = 1;
    if (m_commands.active_command == "call") {
        exit_code = handleCall();
    } else if (m_commands.active_command == "route") {
        exit_code = handleRoute();
    } else if (m_commands.active_command == "compare") {
        exit_code = handleCompare();
    } else if (m_commands.active_command == "benchmark") {
        exit_code = handleBenchmark();
    } else if (m_commands.active_command == "health") {
        exit_code = handleHealth();
    } else if (m_commands.active_command == "quota") {
        exit_code = handleQuota();
    } else if (m_commands.active_command == "report") {
        exit_code = handleReport();
    } else if (m_commands.active_command == "cleanup") {
        exit_code = handleCleanup();
    } else if (m_commands.active_command == "endpoints") {
        exit_code = handleEndpoints();
    } else {
        std::cerr << "Unknown command: " << m_commands.active_command << std::endl;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(duration.count()));
    return exit_code;
}

int Core::handleCall() {
    DispatchResult result = m_dispatcher->dispatch(m_commands.endpoint_id, m_commands.prompt,
                                                   samplingParameters(), m_commands.caller_id);
    printJson(toJson(result));
    return result.success ? 0 : 1;
}

int Core::handleRoute() {
    DispatchResult result = m_dispatcher->dispatchViaPool(m_commands.pool_id, m_commands.prompt,
                                                          samplingParameters(), m_commands.caller_id);
    printJson(toJson(result));
    return result.success ? 0 : 1;
}

int Core::handleCompare() {
    auto results = m_dispatcher->compare(m_commands.endpoint_ids, m_commands.prompt,
                                         samplingParameters(), m_commands.caller_id);

    nlohmann::json output = nlohmann::json::array();
    bool any_success = false;
    for (const auto& result : results) {
        output.push_back(toJson(result));
        any_success = any_success || result.success;
    }
    printJson(output);
    return any_success ? 0 : 1;
}

int Core::handleBenchmark() {
    std::vector<std::string> test_cases = m_commands.test_prompts;

    if (!m_commands.prompts_file.empty()) {
        std::ifstream file(m_commands.prompts_file);
        if (!file.is_open()) {
            std::cerr << "Cannot open prompts file: " << m_commands.prompts_file << std::endl;
            return 1;
        }
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty()) {
                test_cases.push_back(line);
            }
        }
    }

    if (test_cases.empty()) {
        std::cerr << "No test prompts given. Pass them as arguments or with --file." << std::endl;
        return 1;
    }

    BenchmarkReport report = m_dispatcher->benchmark(m_commands.endpoint_id, test_cases, samplingParameters(),
                                                     m_commands.caller_id, m_commands.concurrency);
    printJson(toJson(report));
    return report.successful_cases > 0 ? 0 : 1;
}

int Core::handleHealth() {
    if (!m_commands.endpoint_id.empty()) {
        if (!m_store->getEndpoint(m_commands.endpoint_id)) {
            std::cerr << "Unknown endpoint: " << m_commands.endpoint_id << std::endl;
            return 1;
        }
        printJson(toJson(m_dispatcher->runHealthCheck(m_commands.endpoint_id)));
        return 0;
    }

    nlohmann::json output = nlohmann::json::array();
    for (const auto& report : m_monitor->runHealthChecks()) {
        output.push_back(toJson(report));
    }
    printJson(output);
    return 0;
}

int Core::handleQuota() {
    if (m_commands.quota_subcommand == "list") {
        nlohmann::json output = nlohmann::json::array();
        for (const auto& quota : m_store->listQuotas()) {
            output.push_back(toJson(quota));
        }
        printJson(output);
        return 0;
    }

    if (m_commands.quota_subcommand == "reset") {
        bool reset = m_dispatcher->resetQuota(m_commands.quota_id);
        printJson({{"quota_id", m_commands.quota_id}, {"reset", reset}});
        return reset ? 0 : 1;
    }

    if (m_commands.quota_subcommand == "reset-due") {
        size_t count = m_monitor->resetDueQuotas();
        printJson({{"reset_count", count}});
        return 0;
    }

    std::cerr << "Unknown quota subcommand: " << m_commands.quota_subcommand << std::endl;
    return 1;
}

int Core::handleReport() {
    if (m_commands.report_subcommand == "daily") {
        nlohmann::json output = nlohmann::json::array();
        for (const auto& snapshot : m_monitor->updateDailyPerformance(reportDate())) {
            output.push_back(toJson(snapshot));
        }
        printJson(output);
        return 0;
    }

    if (m_commands.report_subcommand == "cost") {
        printJson(toJson(m_monitor->generateCostReport(reportDate(), m_commands.days)));
        return 0;
    }

    std::cerr << "Unknown report subcommand: " << m_commands.report_subcommand << std::endl;
    return 1;
}

int Core::handleCleanup() {
    size_t deleted = m_monitor->cleanupOldCallRecords(std::chrono::hours(24 * m_commands.keep_days));
    printJson({{"deleted_records", deleted}, {"keep_days", m_commands.keep_days}});
    return 0;
}

int Core::handleEndpoints() {
    nlohmann::json endpoints = nlohmann::json::array();
    for (const auto& endpoint : m_store->listEndpoints()) {
        endpoints.push_back({
            {"id", endpoint.id},
            {"name", endpoint.name},
            {"provider", GatewayTypeUtils::providerKindToString(endpoint.provider_kind)},
            {"base_url", endpoint.base_url},
            {"model", endpoint.model_id},
            {"active", endpoint.is_active},
            {"input_price_per_1k", endpoint.input_price_per_1k},
            {"output_price_per_1k", endpoint.output_price_per_1k}
        });
    }

    nlohmann::json pools = nlohmann::json::array();
    for (const auto& pool : m_store->listPools()) {
        nlohmann::json members = nlohmann::json::array();
        for (const auto& member : pool.members) {
            members.push_back({
                {"endpoint", member.endpoint.id},
                {"weight", member.weight},
                {"healthy", member.is_healthy}
            });
        }
        pools.push_back({
            {"id", pool.id},
            {"name", pool.name},
            {"strategy", GatewayTypeUtils::strategyToString(pool.strategy)},
            {"enable_fallback", pool.enable_fallback},
            {"max_retries", pool.max_retries},
            {"active", pool.is_active},
            {"members", members}
        });
    }

    printJson({{"endpoints", endpoints}, {"pools", pools}});
    return 0;
}

SamplingParameters Core::samplingParameters() const {
    SamplingParameters params;
    if (!std::isnan(m_commands.temperature)) {
        params.temperature = m_commands.temperature;
    }
    if (!std::isnan(m_commands.top_p)) {
        params.top_p = m_commands.top_p;
    }
    if (m_commands.max_tokens > 0) {
        params.max_tokens = m_commands.max_tokens;
    }
    return params;
}

TimePoint Core::reportDate() const {
    if (m_commands.date.empty()) {
        return Clock::now();
    }
    return TimeUtils::parseDate(m_commands.date);
}

void Core::printJson(const nlohmann::json& json) {
    std::cout << json.dump(2) << std::endl;
}

} // namespace Modelgate
