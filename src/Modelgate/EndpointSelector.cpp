// =================================================================
// src/Modelgate/EndpointSelector.cpp
// =================================================================
// Implementation of endpoint selection strategies.

#include "Modelgate/EndpointSelector.hpp"
#include "Modelgate/Logger.hpp"
#include <limits>
#include <random>
#include <unordered_map>

namespace Modelgate {

namespace {

std::mt19937 makeEngine(const std::optional<uint32_t>& seed) {
    if (seed) {
        return std::mt19937(*seed);
    }
    return std::mt19937(std::random_device{}());
}

} // namespace

// =================================================================
// Built-in Selection Strategies
// =================================================================

/**
 * @brief Cycles through candidates with a per-pool counter
 */
class EndpointSelector::RoundRobinStrategy : public SelectionStrategy {
private:
    std::unordered_map<std::string, uint64_t> m_counters; // pool_id -> counter
    mutable std::mutex m_mutex;

public:
    size_t selectMember(const std::string& pool_id, const std::vector<PoolMember>& candidates) override {
        std::lock_guard<std::mutex> lock(m_mutex);

        uint64_t& counter = m_counters[pool_id];
        size_t selected_index = static_cast<size_t>(counter % candidates.size());
        counter++;

        return selected_index;
    }

    uint64_t counter(const std::string& pool_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_counters.find(pool_id);
        return it != m_counters.end() ? it->second : 0;
    }

    std::string getName() const override {
        return "round_robin";
    }
};

/**
 * @brief Draws in proportion to member weight
 */
class EndpointSelector::WeightedStrategy : public SelectionStrategy {
private:
    std::mt19937 m_engine;
    std::mutex m_mutex;

public:
    explicit WeightedStrategy(const std::optional<uint32_t>& seed) : m_engine(makeEngine(seed)) {}

    size_t selectMember(const std::string& /*pool_id*/, const std::vector<PoolMember>& candidates) override {
        int64_t total_weight = 0;
        for (const auto& member : candidates) {
            total_weight += member.weight;
        }
        if (total_weight <= 0) {
            return 0;
        }

        int64_t draw;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::uniform_int_distribution<int64_t> dist(1, total_weight);
            draw = dist(m_engine);
        }

        int64_t cumulative = 0;
        for (size_t i = 0; i < candidates.size(); ++i) {
            cumulative += candidates[i].weight;
            if (draw <= cumulative) {
                return i;
            }
        }
        return candidates.size() - 1;
    }

    std::string getName() const override {
        return "weighted";
    }
};

/**
 * @brief Uniform choice ignoring weight
 */
class EndpointSelector::RandomStrategy : public SelectionStrategy {
private:
    std::mt19937 m_engine;
    std::mutex m_mutex;

public:
    explicit RandomStrategy(const std::optional<uint32_t>& seed) : m_engine(makeEngine(seed)) {}

    size_t selectMember(const std::string& /*pool_id*/, const std::vector<PoolMember>& candidates) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
        return dist(m_engine);
    }

    std::string getName() const override {
        return "random";
    }
};

/**
 * @brief Fewest recorded calls in the trailing connection window
 */
class EndpointSelector::LeastConnectionsStrategy : public SelectionStrategy {
private:
    Store& m_store;
    std::chrono::minutes m_window;

public:
    LeastConnectionsStrategy(Store& store, std::chrono::minutes window)
        : m_store(store), m_window(window) {}

    size_t selectMember(const std::string& /*pool_id*/, const std::vector<PoolMember>& candidates) override {
        auto since = Clock::now() - std::chrono::duration_cast<Clock::duration>(m_window);

        size_t best_index = 0;
        size_t best_count = std::numeric_limits<size_t>::max();

        for (size_t i = 0; i < candidates.size(); ++i) {
            size_t count = m_store.queryCallRecords(candidates[i].endpoint.id, since).size();
            // Strict comparison keeps pool order on ties
            if (count < best_count) {
                best_count = count;
                best_index = i;
            }
        }

        return best_index;
    }

    std::string getName() const override {
        return "least_connections";
    }
};

/**
 * @brief Lowest mean success latency in the trailing response-time window
 *
 * Members without recent successes rank after every member with data.
 */
class EndpointSelector::ResponseTimeStrategy : public SelectionStrategy {
private:
    Store& m_store;
    std::chrono::minutes m_window;

public:
    ResponseTimeStrategy(Store& store, std::chrono::minutes window)
        : m_store(store), m_window(window) {}

    size_t selectMember(const std::string& /*pool_id*/, const std::vector<PoolMember>& candidates) override {
        auto since = Clock::now() - std::chrono::duration_cast<Clock::duration>(m_window);

        std::optional<size_t> best_index;
        double best_latency = std::numeric_limits<double>::max();

        for (size_t i = 0; i < candidates.size(); ++i) {
            double total_latency = 0.0;
            size_t successes = 0;
            for (const auto& record : m_store.queryCallRecords(candidates[i].endpoint.id, since)) {
                if (record.status == CallStatus::SUCCESS) {
                    total_latency += static_cast<double>(record.latency.count());
                    successes++;
                }
            }
            if (successes == 0) {
                continue;
            }

            double average = total_latency / successes;
            if (average < best_latency) {
                best_latency = average;
                best_index = i;
            }
        }

        return best_index.value_or(0);
    }

    std::string getName() const override {
        return "response_time";
    }
};

/**
 * @brief Cheapest combined per-1k price
 */
class EndpointSelector::CostOptimizedStrategy : public SelectionStrategy {
public:
    size_t selectMember(const std::string& /*pool_id*/, const std::vector<PoolMember>& candidates) override {
        size_t best_index = 0;
        double best_price = std::numeric_limits<double>::max();

        for (size_t i = 0; i < candidates.size(); ++i) {
            const auto& endpoint = candidates[i].endpoint;
            double price = endpoint.input_price_per_1k + endpoint.output_price_per_1k;
            if (price < best_price) {
                best_price = price;
                best_index = i;
            }
        }

        return best_index;
    }

    std::string getName() const override {
        return "cost_optimized";
    }
};

// =================================================================
// EndpointSelector Implementation
// =================================================================

EndpointSelector::EndpointSelector(Store& store, const SelectorConfig& config)
    : m_store(store), m_config(config) {
    m_round_robin = std::make_shared<RoundRobinStrategy>();

    registerStrategy(BalancingStrategy::ROUND_ROBIN, m_round_robin);
    registerStrategy(BalancingStrategy::WEIGHTED,
                     std::make_shared<WeightedStrategy>(config.random_seed));
    registerStrategy(BalancingStrategy::RANDOM,
                     std::make_shared<RandomStrategy>(config.random_seed));
    registerStrategy(BalancingStrategy::LEAST_CONNECTIONS,
                     std::make_shared<LeastConnectionsStrategy>(m_store, config.connection_window));
    registerStrategy(BalancingStrategy::RESPONSE_TIME,
                     std::make_shared<ResponseTimeStrategy>(m_store, config.response_time_window));
    registerStrategy(BalancingStrategy::COST_OPTIMIZED,
                     std::make_shared<CostOptimizedStrategy>());
}

EndpointSelector::~EndpointSelector() = default;

SelectionResult EndpointSelector::select(const Pool& pool, const std::vector<PoolMember>& candidates) {
    SelectionResult result;

    if (candidates.empty()) {
        result.selection_reason = "No routable members in pool " + pool.id;
        return result;
    }

    std::shared_ptr<SelectionStrategy> strategy;
    {
        std::lock_guard<std::mutex> lock(m_strategies_mutex);
        auto it = m_strategies.find(pool.strategy);
        if (it != m_strategies.end()) {
            strategy = it->second;
        }
    }

    if (!strategy) {
        LOG_WARNING("EndpointSelector", "Unknown strategy for pool " + pool.id +
                    ", using first routable member");
        result.selected = true;
        result.index = 0;
        result.member = candidates.front();
        result.strategy_name = GatewayTypeUtils::strategyToString(pool.strategy);
        result.selection_reason = "Fallback to first routable member";
        result.fallback_used = true;
        return result;
    }

    size_t index = strategy->selectMember(pool.id, candidates);
    if (index >= candidates.size()) {
        LOG_WARNING("EndpointSelector", "Strategy " + strategy->getName() + " returned out-of-range index " +
                    std::to_string(index) + ", using first routable member");
        index = 0;
        result.fallback_used = true;
    }

    result.selected = true;
    result.index = index;
    result.member = candidates[index];
    result.strategy_name = strategy->getName();
    result.selection_reason = "Selected by " + strategy->getName() + " strategy";

    LOG_DEBUG("EndpointSelector", "Pool " + pool.id + ": selected " + result.member.endpoint.id +
              " (" + result.strategy_name + ", " + std::to_string(candidates.size()) + " candidates)");
    return result;
}

void EndpointSelector::registerStrategy(BalancingStrategy strategy,
                                        std::shared_ptr<SelectionStrategy> implementation) {
    std::lock_guard<std::mutex> lock(m_strategies_mutex);
    m_strategies[strategy] = std::move(implementation);
}

uint64_t EndpointSelector::roundRobinCounter(const std::string& pool_id) const {
    return m_round_robin->counter(pool_id);
}

std::vector<PoolMember> EndpointSelector::routableMembers(const Pool& pool,
                                                          const std::set<std::string>& excluded) {
    std::vector<PoolMember> routable;
    for (const auto& member : pool.members) {
        if (!member.is_healthy || member.weight <= 0 || !member.endpoint.is_active) {
            continue;
        }
        if (excluded.count(member.endpoint.id) > 0) {
            continue;
        }
        routable.push_back(member);
    }
    return routable;
}

} // namespace Modelgate
