// =================================================================
// src/Modelgate/InMemoryStore.cpp
// =================================================================
// Implementation of the in-process store.

#include "Modelgate/InMemoryStore.hpp"
#include <algorithm>

namespace Modelgate {

namespace {

void sortByCreation(std::vector<CallRecord>& records) {
    std::stable_sort(records.begin(), records.end(),
        [](const CallRecord& a, const CallRecord& b) {
            return a.created_at < b.created_at;
        });
}

} // namespace

std::optional<Endpoint> InMemoryStore::getEndpoint(const std::string& endpoint_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(endpoint_id);
    if (it == m_endpoints.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Endpoint> InMemoryStore::listEndpoints() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Endpoint> endpoints;
    for (const auto& [id, endpoint] : m_endpoints) {
        endpoints.push_back(endpoint);
    }
    return endpoints;
}

std::optional<Pool> InMemoryStore::getPool(const std::string& pool_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pools.find(pool_id);
    if (it == m_pools.end()) {
        return std::nullopt;
    }
    return resolvePool(it->second);
}

std::vector<Pool> InMemoryStore::listPools() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Pool> pools;
    for (const auto& [id, pool] : m_pools) {
        pools.push_back(resolvePool(pool));
    }
    return pools;
}

void InMemoryStore::putEndpoint(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_endpoints[endpoint.id] = endpoint;
}

void InMemoryStore::putPool(const Pool& pool) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& member : pool.members) {
        if (m_endpoints.find(member.endpoint.id) == m_endpoints.end()) {
            throw StoreError("Pool " + pool.id + " references unknown endpoint: " + member.endpoint.id);
        }
    }
    m_pools[pool.id] = pool;
}

void InMemoryStore::putQuota(const Quota& quota) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_endpoints.find(quota.endpoint_id) == m_endpoints.end()) {
        throw StoreError("Quota " + quota.id + " references unknown endpoint: " + quota.endpoint_id);
    }
    m_quotas[quota.id] = quota;
}

bool InMemoryStore::setEndpointHealth(const std::string& pool_id,
                                      const std::string& endpoint_id,
                                      bool healthy,
                                      const TimePoint& checked_at) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pools.find(pool_id);
    if (it == m_pools.end()) {
        return false;
    }

    for (auto& member : it->second.members) {
        if (member.endpoint.id == endpoint_id) {
            member.is_healthy = healthy;
            member.last_health_check = checked_at;
            return true;
        }
    }
    return false;
}

std::vector<Quota> InMemoryStore::getActiveQuotas(const std::string& endpoint_id,
                                                  const std::string& caller_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Quota> quotas;
    for (const auto& [id, quota] : m_quotas) {
        if (!quota.is_active || quota.endpoint_id != endpoint_id) {
            continue;
        }
        if (quota.caller_id.empty() || quota.caller_id == caller_id) {
            quotas.push_back(quota);
        }
    }
    return quotas;
}

std::optional<Quota> InMemoryStore::getQuota(const std::string& quota_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_quotas.find(quota_id);
    if (it == m_quotas.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Quota> InMemoryStore::listQuotas() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Quota> quotas;
    for (const auto& [id, quota] : m_quotas) {
        quotas.push_back(quota);
    }
    return quotas;
}

void InMemoryStore::incrementQuotaUsage(const std::string& quota_id,
                                        int64_t calls,
                                        int64_t tokens,
                                        double cost) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_quotas.find(quota_id);
    if (it == m_quotas.end()) {
        throw StoreError("Unknown quota: " + quota_id);
    }
    it->second.used_calls += calls;
    it->second.used_tokens += tokens;
    it->second.used_cost += cost;
}

void InMemoryStore::resetQuotaUsage(const std::string& quota_id,
                                    const TimePoint& reset_at,
                                    const TimePoint& last_reset) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_quotas.find(quota_id);
    if (it == m_quotas.end()) {
        throw StoreError("Unknown quota: " + quota_id);
    }
    it->second.used_calls = 0;
    it->second.used_tokens = 0;
    it->second.used_cost = 0.0;
    it->second.reset_at = reset_at;
    it->second.last_reset = last_reset;
}

void InMemoryStore::appendCallRecord(const CallRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_call_records.push_back(record);
}

std::vector<CallRecord> InMemoryStore::queryCallRecords(const std::string& endpoint_id,
                                                        const TimePoint& since) {
    std::vector<CallRecord> records;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& record : m_call_records) {
            if (record.endpoint_id == endpoint_id && record.created_at >= since) {
                records.push_back(record);
            }
        }
    }
    sortByCreation(records);
    return records;
}

std::vector<CallRecord> InMemoryStore::queryAllCallRecords(const TimePoint& since,
                                                           const TimePoint& until) {
    std::vector<CallRecord> records;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& record : m_call_records) {
            if (record.created_at >= since && record.created_at < until) {
                records.push_back(record);
            }
        }
    }
    sortByCreation(records);
    return records;
}

size_t InMemoryStore::deleteCallRecordsBefore(const TimePoint& cutoff) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t before = m_call_records.size();
    m_call_records.erase(
        std::remove_if(m_call_records.begin(), m_call_records.end(),
            [&cutoff](const CallRecord& record) { return record.created_at < cutoff; }),
        m_call_records.end());
    return before - m_call_records.size();
}

void InMemoryStore::upsertPerformanceSnapshot(const PerformanceSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshots[{snapshot.endpoint_id, snapshot.date}] = snapshot;
}

std::vector<PerformanceSnapshot> InMemoryStore::getPerformanceSnapshots(const std::string& endpoint_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PerformanceSnapshot> snapshots;
    // Map order is (endpoint, date), so dates come out ascending
    for (const auto& [key, snapshot] : m_snapshots) {
        if (key.first == endpoint_id) {
            snapshots.push_back(snapshot);
        }
    }
    return snapshots;
}

size_t InMemoryStore::callRecordCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_call_records.size();
}

Pool InMemoryStore::resolvePool(const Pool& stored) const {
    Pool pool = stored;
    pool.members.clear();
    for (const auto& member : stored.members) {
        auto endpoint_it = m_endpoints.find(member.endpoint.id);
        if (endpoint_it == m_endpoints.end()) {
            continue;
        }
        PoolMember resolved = member;
        resolved.endpoint = endpoint_it->second;
        pool.members.push_back(resolved);
    }
    return pool;
}

} // namespace Modelgate
