// =================================================================
// include/Modelgate/GatewayConfig.hpp
// =================================================================
// Loads engine settings, endpoints, pools and quotas from YAML.

#pragma once

#include "Modelgate/Dispatcher.hpp"
#include "Modelgate/GatewayTypes.hpp"
#include "Modelgate/Store.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace Modelgate {

/**
 * @brief Raised for malformed or inconsistent configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Process-level settings from the engine section
 */
struct EngineSettings {
    DispatcherConfig dispatcher;
    std::string database = ".modelgate/modelgate.db";
    std::string log_dir = ".modelgate/logs";
    std::string log_level = "info";
};

/**
 * @brief Parsed gateway configuration file
 *
 * Layout:
 * @code
 * engine:    {call_timeout_ms, worker_threads, compare_threads, database, log_dir, log_level,
 *             selector: {...}, health: {...}}
 * endpoints: {<id>: {provider, base_url, api_key | api_key_env, model, ...}}
 * pools:     {<id>: {name, strategy, ..., members: [{endpoint, weight, healthy}]}}
 * quotas:    {<id>: {endpoint, caller, type, max_calls, max_tokens, max_cost, active}}
 * @endcode
 */
class GatewayConfig {
public:
    /**
     * @brief Parse a configuration file
     * @throws ConfigError if the file is missing or invalid
     */
    static GatewayConfig loadFromFile(const std::string& path);

    /**
     * @brief Parse configuration text
     * @throws ConfigError if the text is invalid
     */
    static GatewayConfig loadFromString(const std::string& yaml);

    /**
     * @brief Write endpoints, pools and quotas into a store
     *
     * Usage counters and reset times of quotas already in the store are kept, and
     * so is the health of pool members already stored.
     * @param now Reference time for new quotas' first reset
     */
    void applyTo(Store& store, const TimePoint& now = Clock::now()) const;

    const EngineSettings& engine() const { return m_engine; }
    const std::vector<Endpoint>& endpoints() const { return m_endpoints; }
    const std::vector<Pool>& pools() const { return m_pools; }
    const std::vector<Quota>& quotas() const { return m_quotas; }

private:
    EngineSettings m_engine;
    std::vector<Endpoint> m_endpoints;
    std::vector<Pool> m_pools;
    std::vector<Quota> m_quotas;

    static GatewayConfig parse(const YAML::Node& root);
    void parseEngine(const YAML::Node& node);
    void parseEndpoints(const YAML::Node& node);
    void parsePools(const YAML::Node& node);
    void parseQuotas(const YAML::Node& node);
    const Endpoint* findEndpoint(const std::string& endpoint_id) const;
};

} // namespace Modelgate
