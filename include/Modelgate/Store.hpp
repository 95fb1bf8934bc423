// =================================================================
// include/Modelgate/Store.hpp
// =================================================================
// Persistence contract for configuration, quotas and call records.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Modelgate {

/**
 * @brief Raised for storage failures and references to missing rows
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Abstract store used by the engine
 *
 * Implementations must be safe to call from concurrent dispatches.
 * Pool reads return members with their endpoint configuration resolved at
 * read time; members whose endpoint no longer exists are omitted.
 */
class Store {
public:
    virtual ~Store() = default;

    // Configuration reads
    virtual std::optional<Endpoint> getEndpoint(const std::string& endpoint_id) = 0;
    virtual std::vector<Endpoint> listEndpoints() = 0;
    virtual std::optional<Pool> getPool(const std::string& pool_id) = 0;
    virtual std::vector<Pool> listPools() = 0;

    // Configuration writes
    virtual void putEndpoint(const Endpoint& endpoint) = 0;

    /**
     * @brief Insert or replace a pool and its membership list
     * @throws StoreError if a member references an unknown endpoint
     */
    virtual void putPool(const Pool& pool) = 0;

    /**
     * @throws StoreError if the quota references an unknown endpoint
     */
    virtual void putQuota(const Quota& quota) = 0;

    /**
     * @brief Record the health verdict of one pool membership
     * @return False if the endpoint is not a member of the pool
     */
    virtual bool setEndpointHealth(const std::string& pool_id,
                                   const std::string& endpoint_id,
                                   bool healthy,
                                   const TimePoint& checked_at) = 0;

    // Quotas

    /**
     * @brief Active quotas scoped to the caller plus endpoint-wide quotas
     */
    virtual std::vector<Quota> getActiveQuotas(const std::string& endpoint_id,
                                               const std::string& caller_id) = 0;
    virtual std::optional<Quota> getQuota(const std::string& quota_id) = 0;
    virtual std::vector<Quota> listQuotas() = 0;

    /**
     * @brief Atomically add to the usage counters of a quota
     * @throws StoreError for unknown quota ids
     */
    virtual void incrementQuotaUsage(const std::string& quota_id,
                                     int64_t calls,
                                     int64_t tokens,
                                     double cost) = 0;

    /**
     * @brief Zero the usage counters and set the reset timestamps
     * @throws StoreError for unknown quota ids
     */
    virtual void resetQuotaUsage(const std::string& quota_id,
                                 const TimePoint& reset_at,
                                 const TimePoint& last_reset) = 0;

    // Call records (append-only)
    virtual void appendCallRecord(const CallRecord& record) = 0;

    /**
     * @brief Records of one endpoint created at or after `since`, oldest first
     */
    virtual std::vector<CallRecord> queryCallRecords(const std::string& endpoint_id,
                                                     const TimePoint& since) = 0;

    /**
     * @brief Records of every endpoint created in [since, until), oldest first
     */
    virtual std::vector<CallRecord> queryAllCallRecords(const TimePoint& since,
                                                        const TimePoint& until) = 0;

    /**
     * @return Number of records deleted
     */
    virtual size_t deleteCallRecordsBefore(const TimePoint& cutoff) = 0;

    // Performance rollups
    virtual void upsertPerformanceSnapshot(const PerformanceSnapshot& snapshot) = 0;

    /**
     * @brief Snapshots of one endpoint, oldest date first
     */
    virtual std::vector<PerformanceSnapshot> getPerformanceSnapshots(const std::string& endpoint_id) = 0;
};

} // namespace Modelgate
