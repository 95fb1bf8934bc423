// =================================================================
// include/Modelgate/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Modelgate/CliParser.hpp"
#include "Modelgate/GatewayTypes.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Modelgate {
    class Dispatcher;
    class GatewayConfig;
    class PerformanceMonitor;
    class SqliteStore;
}

namespace Modelgate {

class Core {
public:
    /**
     * @brief Loads configuration, opens the store and builds the dispatcher.
     * @param commands The parsed command-line arguments.
     * @throws ConfigError, StoreError on startup failures
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleCall();
    int handleRoute();
    int handleCompare();
    int handleBenchmark();
    int handleHealth();
    int handleQuota();
    int handleReport();
    int handleCleanup();
    int handleEndpoints();

    SamplingParameters samplingParameters() const;
    TimePoint reportDate() const;
    static void printJson(const nlohmann::json& json);

    const Commands& m_commands;
    std::unique_ptr<GatewayConfig> m_config;
    std::unique_ptr<SqliteStore> m_store;
    std::unique_ptr<Dispatcher> m_dispatcher;
    std::unique_ptr<PerformanceMonitor> m_monitor;
};

} // namespace Modelgate
