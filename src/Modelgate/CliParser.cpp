// =================================================================
// src/Modelgate/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Modelgate/CliParser.hpp"

namespace Modelgate {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Modelgate: multi-tenant model invocation and load-balancing gateway.");
    m_app->require_subcommand(1);

    // Global options
    m_app->add_option("-c,--config", m_commands.config_path, "Path to the gateway configuration (default: config/gateway.yml)");
    m_app->add_option("--db", m_commands.database_path, "SQLite database path, overrides engine.database");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Print debug logs to the console");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupCallCommand(*m_app);
    setupRouteCommand(*m_app);
    setupCompareCommand(*m_app);
    setupBenchmarkCommand(*m_app);
    setupHealthCommand(*m_app);
    setupQuotaCommand(*m_app);
    setupReportCommand(*m_app);
    setupCleanupCommand(*m_app);
    setupEndpointsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupSamplingOptions(CLI::App& sub) {
    sub.add_option("--caller", m_commands.caller_id, "Caller identity used for quota accounting");
    sub.add_option("--temperature", m_commands.temperature, "Sampling temperature (clamped to 0..2)");
    sub.add_option("--top-p", m_commands.top_p, "Nucleus sampling (clamped to 0..1)");
    sub.add_option("--max-tokens", m_commands.max_tokens, "Maximum generated tokens (clamped to the endpoint limit)");
}

void CliParser::setupCallCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("call", "Sends a prompt to one endpoint.");
    sub->add_option("endpoint", m_commands.endpoint_id, "Endpoint identifier.")->required();
    sub->add_option("prompt", m_commands.prompt, "The prompt to send.")->required();
    setupSamplingOptions(*sub);
}

void CliParser::setupRouteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("route", "Sends a prompt through a pool with failover.");
    sub->add_option("pool", m_commands.pool_id, "Pool identifier.")->required();
    sub->add_option("prompt", m_commands.prompt, "The prompt to send.")->required();
    setupSamplingOptions(*sub);
}

void CliParser::setupCompareCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("compare", "Sends the same prompt to several endpoints concurrently.");
    sub->add_option("prompt", m_commands.prompt, "The prompt to send.")->required();
    sub->add_option("-e,--endpoint", m_commands.endpoint_ids, "Endpoint to compare (repeatable).")->required();
    setupSamplingOptions(*sub);
}

void CliParser::setupBenchmarkCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("benchmark", "Runs a set of prompts against one endpoint.");
    sub->add_option("endpoint", m_commands.endpoint_id, "Endpoint identifier.")->required();
    sub->add_option("prompts", m_commands.test_prompts, "Test prompts.");
    sub->add_option("-f,--file", m_commands.prompts_file, "File with one test prompt per line.")->check(CLI::ExistingFile);
    sub->add_option("-j,--concurrency", m_commands.concurrency, "Cases run concurrently (default: 1)");
    setupSamplingOptions(*sub);
}

void CliParser::setupHealthCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("health", "Classifies endpoint health and updates pool membership.");
    sub->add_option("endpoint", m_commands.endpoint_id, "Endpoint to check (leave empty to check all and write back)");
}

void CliParser::setupQuotaCommand(CLI::App& app) {
    auto* quota_cmd = app.add_subcommand("quota", "Inspect and reset quotas");
    quota_cmd->require_subcommand(1);

    auto* list_cmd = quota_cmd->add_subcommand("list", "List all quotas and their usage");
    list_cmd->callback([this]() { m_commands.quota_subcommand = "list"; });

    auto* reset_cmd = quota_cmd->add_subcommand("reset", "Reset one quota");
    reset_cmd->add_option("quota", m_commands.quota_id, "Quota identifier")->required();
    reset_cmd->callback([this]() { m_commands.quota_subcommand = "reset"; });

    auto* due_cmd = quota_cmd->add_subcommand("reset-due", "Reset every quota whose period has ended");
    due_cmd->callback([this]() { m_commands.quota_subcommand = "reset-due"; });
}

void CliParser::setupReportCommand(CLI::App& app) {
    auto* report_cmd = app.add_subcommand("report", "Performance and cost reports");
    report_cmd->require_subcommand(1);

    auto* daily_cmd = report_cmd->add_subcommand("daily", "Recompute the daily performance rollup");
    daily_cmd->add_option("--date", m_commands.date, "UTC day as YYYY-MM-DD (default: today)");
    daily_cmd->callback([this]() { m_commands.report_subcommand = "daily"; });

    auto* cost_cmd = report_cmd->add_subcommand("cost", "Cost of successful calls per endpoint and caller");
    cost_cmd->add_option("--date", m_commands.date, "Last UTC day of the report (default: today)");
    cost_cmd->add_option("--days", m_commands.days, "Days before the last day to include (default: 7)");
    cost_cmd->callback([this]() { m_commands.report_subcommand = "cost"; });
}

void CliParser::setupCleanupCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("cleanup", "Deletes old call records.");
    sub->add_option("--keep-days", m_commands.keep_days, "Days of history to keep (default: 30)")->check(CLI::PositiveNumber);
}

void CliParser::setupEndpointsCommand(CLI::App& app) {
    app.add_subcommand("endpoints", "Lists configured endpoints and pools.");
}

} // namespace Modelgate
