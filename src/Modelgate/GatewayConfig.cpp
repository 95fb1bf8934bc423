// =================================================================
// src/Modelgate/GatewayConfig.cpp
// =================================================================
// Implementation of YAML configuration loading.

#include "Modelgate/GatewayConfig.hpp"
#include "Modelgate/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>

namespace Modelgate {

namespace {

template <typename T>
T valueOr(const YAML::Node& node, const char* key, const T& fallback) {
    if (node[key]) {
        return node[key].as<T>();
    }
    return fallback;
}

void requireMap(const YAML::Node& node, const std::string& what) {
    if (node && !node.IsMap()) {
        throw ConfigError(what + " must be a mapping");
    }
}

TimePoint firstResetAfter(QuotaPeriod period, const TimePoint& now) {
    auto length = GatewayTypeUtils::periodLength(period);
    if (!length) {
        return now;
    }
    return TimeUtils::startOfUtcDay(now) + std::chrono::duration_cast<Clock::duration>(*length);
}

} // namespace

GatewayConfig GatewayConfig::loadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Configuration file not found: " + path);
    }

    try {
        GatewayConfig config = parse(YAML::LoadFile(path));
        Logger::getInstance().info("GatewayConfig", "Loaded configuration from " + path,
            std::to_string(config.m_endpoints.size()) + " endpoints, " +
            std::to_string(config.m_pools.size()) + " pools, " +
            std::to_string(config.m_quotas.size()) + " quotas");
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }
}

GatewayConfig GatewayConfig::loadFromString(const std::string& yaml) {
    try {
        return parse(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

GatewayConfig GatewayConfig::parse(const YAML::Node& root) {
    GatewayConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    // Endpoints first: pools and quotas refer to them
    config.parseEngine(root["engine"]);
    config.parseEndpoints(root["endpoints"]);
    config.parsePools(root["pools"]);
    config.parseQuotas(root["quotas"]);

    return config;
}

void GatewayConfig::parseEngine(const YAML::Node& node) {
    if (!node) {
        return;
    }
    requireMap(node, "engine");

    DispatcherConfig& dispatcher = m_engine.dispatcher;
    dispatcher.executor.call_timeout = std::chrono::milliseconds(
        valueOr<int64_t>(node, "call_timeout_ms", dispatcher.executor.call_timeout.count()));
    dispatcher.executor.worker_threads = valueOr<size_t>(node, "worker_threads", dispatcher.executor.worker_threads);
    dispatcher.compare_threads = valueOr<size_t>(node, "compare_threads", dispatcher.compare_threads);

    m_engine.database = valueOr<std::string>(node, "database", m_engine.database);
    m_engine.log_dir = valueOr<std::string>(node, "log_dir", m_engine.log_dir);
    m_engine.log_level = valueOr<std::string>(node, "log_level", m_engine.log_level);

    try {
        Logger::parseLevel(m_engine.log_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    if (dispatcher.executor.call_timeout.count() <= 0) {
        throw ConfigError("engine.call_timeout_ms must be positive");
    }

    if (YAML::Node selector = node["selector"]) {
        requireMap(selector, "engine.selector");
        dispatcher.selector.connection_window = std::chrono::minutes(
            valueOr<int64_t>(selector, "connection_window_minutes", dispatcher.selector.connection_window.count()));
        dispatcher.selector.response_time_window = std::chrono::minutes(
            valueOr<int64_t>(selector, "response_time_window_minutes", dispatcher.selector.response_time_window.count()));
        if (selector["random_seed"]) {
            dispatcher.selector.random_seed = selector["random_seed"].as<uint32_t>();
        }
    }

    if (YAML::Node health = node["health"]) {
        requireMap(health, "engine.health");
        HealthThresholds& thresholds = dispatcher.health;
        thresholds.healthy_success_rate = valueOr<double>(health, "healthy_success_rate", thresholds.healthy_success_rate);
        thresholds.healthy_latency = std::chrono::milliseconds(
            valueOr<int64_t>(health, "healthy_latency_ms", thresholds.healthy_latency.count()));
        thresholds.degraded_success_rate = valueOr<double>(health, "degraded_success_rate", thresholds.degraded_success_rate);
        thresholds.degraded_latency = std::chrono::milliseconds(
            valueOr<int64_t>(health, "degraded_latency_ms", thresholds.degraded_latency.count()));
        thresholds.window = std::chrono::minutes(
            valueOr<int64_t>(health, "window_minutes", thresholds.window.count()));
    }
}

void GatewayConfig::parseEndpoints(const YAML::Node& node) {
    if (!node) {
        return;
    }
    requireMap(node, "endpoints");

    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        Endpoint endpoint;
        endpoint.id = it->first.as<std::string>();

        YAML::Node endpoint_node = it->second;
        requireMap(endpoint_node, "endpoint " + endpoint.id);

        if (!endpoint_node["provider"]) {
            throw ConfigError("Endpoint " + endpoint.id + " has no provider");
        }
        std::string provider = endpoint_node["provider"].as<std::string>();
        try {
            endpoint.provider_kind = GatewayTypeUtils::stringToProviderKind(provider);
        } catch (const std::invalid_argument& e) {
            throw ConfigError("Endpoint " + endpoint.id + ": " + e.what());
        }

        if (!endpoint_node["base_url"]) {
            throw ConfigError("Endpoint " + endpoint.id + " has no base_url");
        }
        endpoint.base_url = endpoint_node["base_url"].as<std::string>();
        endpoint.name = valueOr<std::string>(endpoint_node, "name", endpoint.id);
        endpoint.model_id = valueOr<std::string>(endpoint_node, "model", "");
        endpoint.api_version = valueOr<std::string>(endpoint_node, "api_version", "");

        // Credentials
        if (endpoint_node["api_key"]) {
            endpoint.api_key = endpoint_node["api_key"].as<std::string>();
        } else if (endpoint_node["api_key_env"]) {
            std::string variable = endpoint_node["api_key_env"].as<std::string>();
            const char* value = std::getenv(variable.c_str());
            if (value) {
                endpoint.api_key = value;
            } else {
                LOG_WARNING("GatewayConfig", "Environment variable " + variable +
                            " for endpoint " + endpoint.id + " is not set");
            }
        }

        endpoint.max_tokens = valueOr<size_t>(endpoint_node, "max_tokens", endpoint.max_tokens);
        endpoint.context_window = valueOr<size_t>(endpoint_node, "context_window", endpoint.context_window);
        endpoint.default_temperature = valueOr<double>(endpoint_node, "temperature", endpoint.default_temperature);
        endpoint.default_top_p = valueOr<double>(endpoint_node, "top_p", endpoint.default_top_p);
        endpoint.input_price_per_1k = valueOr<double>(endpoint_node, "input_price_per_1k", endpoint.input_price_per_1k);
        endpoint.output_price_per_1k = valueOr<double>(endpoint_node, "output_price_per_1k", endpoint.output_price_per_1k);
        endpoint.rate_limit_rpm = valueOr<int64_t>(endpoint_node, "rate_limit_rpm", endpoint.rate_limit_rpm);
        endpoint.rate_limit_tpm = valueOr<int64_t>(endpoint_node, "rate_limit_tpm", endpoint.rate_limit_tpm);
        endpoint.daily_quota = valueOr<int64_t>(endpoint_node, "daily_quota", endpoint.daily_quota);
        endpoint.is_active = valueOr<bool>(endpoint_node, "active", endpoint.is_active);
        endpoint.priority = valueOr<int>(endpoint_node, "priority", endpoint.priority);

        if (YAML::Node extras = endpoint_node["additional_config"]) {
            requireMap(extras, "endpoint " + endpoint.id + " additional_config");
            for (YAML::const_iterator extra_it = extras.begin(); extra_it != extras.end(); ++extra_it) {
                endpoint.additional_config[extra_it->first.as<std::string>()] =
                    extra_it->second.as<std::string>();
            }
        }

        if (provider == "azure" && endpoint.additional_config.count("api_type") == 0) {
            endpoint.additional_config["api_type"] = "azure";
        }

        if (endpoint.max_tokens == 0) {
            throw ConfigError("Endpoint " + endpoint.id + ": max_tokens must be positive");
        }

        m_endpoints.push_back(endpoint);
    }
}

void GatewayConfig::parsePools(const YAML::Node& node) {
    if (!node) {
        return;
    }
    requireMap(node, "pools");

    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        Pool pool;
        pool.id = it->first.as<std::string>();

        YAML::Node pool_node = it->second;
        requireMap(pool_node, "pool " + pool.id);

        pool.name = valueOr<std::string>(pool_node, "name", pool.id);

        std::string strategy = valueOr<std::string>(pool_node, "strategy", "round_robin");
        pool.strategy = GatewayTypeUtils::stringToStrategy(strategy);
        if (pool.strategy == BalancingStrategy::UNKNOWN) {
            LOG_WARNING("GatewayConfig", "Pool " + pool.id + " uses unknown strategy '" + strategy +
                        "', selection will fall back to the first routable member");
        }

        pool.enable_fallback = valueOr<bool>(pool_node, "enable_fallback", pool.enable_fallback);
        pool.max_retries = valueOr<size_t>(pool_node, "max_retries", pool.max_retries);
        pool.retry_delay = std::chrono::milliseconds(
            valueOr<int64_t>(pool_node, "retry_delay_ms", pool.retry_delay.count()));
        pool.health_check_enabled = valueOr<bool>(pool_node, "health_check_enabled", pool.health_check_enabled);
        pool.health_check_interval = std::chrono::seconds(
            valueOr<int64_t>(pool_node, "health_check_interval_s", pool.health_check_interval.count()));
        pool.is_active = valueOr<bool>(pool_node, "active", pool.is_active);

        if (YAML::Node members = pool_node["members"]) {
            if (!members.IsSequence()) {
                throw ConfigError("Pool " + pool.id + ": members must be a list");
            }
            for (const auto& member_node : members) {
                if (!member_node["endpoint"]) {
                    throw ConfigError("Pool " + pool.id + ": member without endpoint");
                }
                std::string endpoint_id = member_node["endpoint"].as<std::string>();
                const Endpoint* endpoint = findEndpoint(endpoint_id);
                if (!endpoint) {
                    throw ConfigError("Pool " + pool.id + " references unknown endpoint: " + endpoint_id);
                }

                PoolMember member;
                member.endpoint = *endpoint;
                member.weight = valueOr<int>(member_node, "weight", member.weight);
                member.is_healthy = valueOr<bool>(member_node, "healthy", member.is_healthy);
                if (member.weight < 0 || member.weight > 100) {
                    throw ConfigError("Pool " + pool.id + ": weight of " + endpoint_id + " must be within 0..100");
                }
                pool.members.push_back(member);
            }
        }

        m_pools.push_back(pool);
    }
}

void GatewayConfig::parseQuotas(const YAML::Node& node) {
    if (!node) {
        return;
    }
    requireMap(node, "quotas");

    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        Quota quota;
        quota.id = it->first.as<std::string>();

        YAML::Node quota_node = it->second;
        requireMap(quota_node, "quota " + quota.id);

        if (!quota_node["endpoint"]) {
            throw ConfigError("Quota " + quota.id + " has no endpoint");
        }
        quota.endpoint_id = quota_node["endpoint"].as<std::string>();
        if (!findEndpoint(quota.endpoint_id)) {
            throw ConfigError("Quota " + quota.id + " references unknown endpoint: " + quota.endpoint_id);
        }

        quota.caller_id = valueOr<std::string>(quota_node, "caller", "");
        try {
            quota.period = GatewayTypeUtils::stringToQuotaPeriod(valueOr<std::string>(quota_node, "type", "daily"));
        } catch (const std::invalid_argument& e) {
            throw ConfigError("Quota " + quota.id + ": " + e.what());
        }
        quota.max_calls = valueOr<int64_t>(quota_node, "max_calls", 0);
        quota.max_tokens = valueOr<int64_t>(quota_node, "max_tokens", 0);
        quota.max_cost = valueOr<double>(quota_node, "max_cost", 0.0);
        quota.is_active = valueOr<bool>(quota_node, "active", true);

        m_quotas.push_back(quota);
    }
}

const Endpoint* GatewayConfig::findEndpoint(const std::string& endpoint_id) const {
    for (const auto& endpoint : m_endpoints) {
        if (endpoint.id == endpoint_id) {
            return &endpoint;
        }
    }
    return nullptr;
}

void GatewayConfig::applyTo(Store& store, const TimePoint& now) const {
    for (const auto& endpoint : m_endpoints) {
        store.putEndpoint(endpoint);
    }

    for (Pool pool : m_pools) {
        // Members already in the store keep their recorded health
        if (auto existing = store.getPool(pool.id)) {
            for (auto& member : pool.members) {
                for (const auto& stored : existing->members) {
                    if (stored.endpoint.id == member.endpoint.id) {
                        member.is_healthy = stored.is_healthy;
                        member.last_health_check = stored.last_health_check;
                        break;
                    }
                }
            }
        }
        store.putPool(pool);
    }

    for (Quota quota : m_quotas) {
        if (auto existing = store.getQuota(quota.id)) {
            quota.used_calls = existing->used_calls;
            quota.used_tokens = existing->used_tokens;
            quota.used_cost = existing->used_cost;
            quota.reset_at = existing->reset_at;
            quota.last_reset = existing->last_reset;
        } else {
            quota.reset_at = firstResetAfter(quota.period, now);
            quota.last_reset = now;
        }
        store.putQuota(quota);
    }

    LOG_INFO("GatewayConfig", "Applied " + std::to_string(m_endpoints.size()) + " endpoints, " +
             std::to_string(m_pools.size()) + " pools and " + std::to_string(m_quotas.size()) +
             " quotas to the store");
}

} // namespace Modelgate
