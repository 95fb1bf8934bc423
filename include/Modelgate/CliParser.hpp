// =================================================================
// include/Modelgate/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace Modelgate {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path = "config/gateway.yml";
    std::string database_path;  // Overrides engine.database when set
    bool verbose = false;

    // Request options for 'call', 'route', 'compare' and 'benchmark'
    std::string prompt;
    std::string endpoint_id;
    std::string pool_id;
    std::string caller_id;
    std::vector<std::string> endpoint_ids;
    double temperature = std::numeric_limits<double>::quiet_NaN();
    double top_p = std::numeric_limits<double>::quiet_NaN();
    size_t max_tokens = 0;

    // Options for 'benchmark'
    std::vector<std::string> test_prompts;
    std::string prompts_file;
    size_t concurrency = 1;

    // Options for 'quota' and 'report'
    std::string quota_subcommand;   // list, reset, reset-due
    std::string quota_id;
    std::string report_subcommand;  // daily, cost
    std::string date;               // YYYY-MM-DD, today when empty
    int days = 7;

    // Options for 'cleanup'
    int keep_days = 30;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupSamplingOptions(CLI::App& sub);
    void setupCallCommand(CLI::App& app);
    void setupRouteCommand(CLI::App& app);
    void setupCompareCommand(CLI::App& app);
    void setupBenchmarkCommand(CLI::App& app);
    void setupHealthCommand(CLI::App& app);
    void setupQuotaCommand(CLI::App& app);
    void setupReportCommand(CLI::App& app);
    void setupCleanupCommand(CLI::App& app);
    void setupEndpointsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Modelgate
