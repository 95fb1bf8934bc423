// =================================================================
// include/Modelgate/InMemoryStore.hpp
// =================================================================
// Mutex-guarded in-process implementation of the Store contract.

#pragma once

#include "Modelgate/Store.hpp"
#include <map>
#include <mutex>

namespace Modelgate {

/**
 * @brief Volatile store; the default for tests and one-shot CLI runs
 */
class InMemoryStore : public Store {
public:
    InMemoryStore() = default;

    std::optional<Endpoint> getEndpoint(const std::string& endpoint_id) override;
    std::vector<Endpoint> listEndpoints() override;
    std::optional<Pool> getPool(const std::string& pool_id) override;
    std::vector<Pool> listPools() override;

    void putEndpoint(const Endpoint& endpoint) override;
    void putPool(const Pool& pool) override;
    void putQuota(const Quota& quota) override;
    bool setEndpointHealth(const std::string& pool_id,
                           const std::string& endpoint_id,
                           bool healthy,
                           const TimePoint& checked_at) override;

    std::vector<Quota> getActiveQuotas(const std::string& endpoint_id,
                                       const std::string& caller_id) override;
    std::optional<Quota> getQuota(const std::string& quota_id) override;
    std::vector<Quota> listQuotas() override;
    void incrementQuotaUsage(const std::string& quota_id,
                             int64_t calls,
                             int64_t tokens,
                             double cost) override;
    void resetQuotaUsage(const std::string& quota_id,
                         const TimePoint& reset_at,
                         const TimePoint& last_reset) override;

    void appendCallRecord(const CallRecord& record) override;
    std::vector<CallRecord> queryCallRecords(const std::string& endpoint_id,
                                             const TimePoint& since) override;
    std::vector<CallRecord> queryAllCallRecords(const TimePoint& since,
                                                const TimePoint& until) override;
    size_t deleteCallRecordsBefore(const TimePoint& cutoff) override;

    void upsertPerformanceSnapshot(const PerformanceSnapshot& snapshot) override;
    std::vector<PerformanceSnapshot> getPerformanceSnapshots(const std::string& endpoint_id) override;

    size_t callRecordCount() const;

private:
    std::map<std::string, Endpoint> m_endpoints;
    std::map<std::string, Pool> m_pools;            ///< Member endpoints resolved on read
    std::map<std::string, Quota> m_quotas;
    std::vector<CallRecord> m_call_records;         ///< Append order
    std::map<std::pair<std::string, std::string>, PerformanceSnapshot> m_snapshots; ///< (endpoint, date)

    mutable std::mutex m_mutex;

    // Caller holds m_mutex
    Pool resolvePool(const Pool& stored) const;
};

} // namespace Modelgate
