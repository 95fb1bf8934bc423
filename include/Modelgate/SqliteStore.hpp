// =================================================================
// include/Modelgate/SqliteStore.hpp
// =================================================================
// Durable SQLite3 implementation of the Store contract.

#pragma once

#include "Modelgate/Store.hpp"
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace Modelgate {

/**
 * @brief Store backed by a single SQLite database file
 *
 * One connection is shared by all callers and guarded by a mutex. Times are
 * stored as milliseconds since the Unix epoch; parameter maps as JSON text.
 * Quota increments are single relative UPDATE statements.
 */
class SqliteStore : public Store {
public:
    /**
     * @brief Open (or create) a database and ensure the schema exists
     * @param path File path, or ":memory:" for a private in-memory database
     * @throws StoreError if the database cannot be opened or initialized
     */
    static std::unique_ptr<SqliteStore> open(const std::string& path);

    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

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

    const std::string& path() const { return m_path; }

private:
    SqliteStore(sqlite3* db, std::string path);

    class Statement;

    sqlite3* m_db = nullptr;
    std::string m_path;
    std::mutex m_mutex;

    void initializeSchema();
    void exec(const char* sql);
    bool endpointExists(const std::string& endpoint_id);
    std::vector<PoolMember> loadMembers(const std::string& pool_id);
    Pool readPool(Statement& stmt);
};

} // namespace Modelgate
