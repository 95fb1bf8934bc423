// =================================================================
// include/Modelgate/EndpointSelector.hpp
// =================================================================
// Strategy engine choosing one endpoint from a pool's routable members.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include "Modelgate/Store.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Modelgate {

/**
 * @brief Result of a selection
 */
struct SelectionResult {
    bool selected = false;                   ///< False when no candidate was available
    size_t index = 0;                        ///< Position in the candidate list
    PoolMember member;                       ///< Chosen member
    std::string strategy_name;               ///< Strategy that made the choice
    std::string selection_reason;            ///< Reason for selection
    bool fallback_used = false;              ///< Strategy unknown, first member taken
};

/**
 * @brief Selector configuration
 */
struct SelectorConfig {
    std::chrono::minutes connection_window{5};      ///< Window for least-connections
    std::chrono::minutes response_time_window{60};  ///< Window for response-time
    std::optional<uint32_t> random_seed;            ///< Fixed seed for reproducible draws
};

/**
 * @brief Selection strategy base class
 */
class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;

    /**
     * @brief Choose one of the candidates
     * @param pool_id Pool the candidates belong to
     * @param candidates Routable members in pool order, never empty
     * @return Index into candidates
     */
    virtual size_t selectMember(const std::string& pool_id, const std::vector<PoolMember>& candidates) = 0;

    /**
     * @brief Get strategy name
     * @return Strategy identifier
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Chooses endpoints for pool dispatch
 *
 * Round-robin counters and the random engines are shared across concurrent
 * dispatches and guarded by their strategies.
 */
class EndpointSelector {
public:
    /**
     * @brief Constructor
     * @param store Call history source for the load-aware strategies
     * @param config Selector configuration
     */
    EndpointSelector(Store& store, const SelectorConfig& config = SelectorConfig());

    ~EndpointSelector();

    /**
     * @brief Select one candidate under the pool's strategy
     * @param pool Pool whose strategy applies
     * @param candidates Routable members, usually from routableMembers()
     */
    SelectionResult select(const Pool& pool, const std::vector<PoolMember>& candidates);

    /**
     * @brief Register or replace a strategy implementation
     */
    void registerStrategy(BalancingStrategy strategy, std::shared_ptr<SelectionStrategy> implementation);

    /**
     * @brief Current round-robin counter of a pool (number of selections made)
     */
    uint64_t roundRobinCounter(const std::string& pool_id) const;

    /**
     * @brief Healthy, weight>0 members of active endpoints, minus excluded ids
     */
    static std::vector<PoolMember> routableMembers(const Pool& pool,
                                                   const std::set<std::string>& excluded = {});

    const SelectorConfig& getConfig() const { return m_config; }

private:
    Store& m_store;
    SelectorConfig m_config;

    std::map<BalancingStrategy, std::shared_ptr<SelectionStrategy>> m_strategies;
    mutable std::mutex m_strategies_mutex;

    // Built-in strategy classes
    class RoundRobinStrategy;
    class WeightedStrategy;
    class RandomStrategy;
    class LeastConnectionsStrategy;
    class ResponseTimeStrategy;
    class CostOptimizedStrategy;

    std::shared_ptr<RoundRobinStrategy> m_round_robin;
};

} // namespace Modelgate
