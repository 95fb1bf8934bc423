// =================================================================
// src/Modelgate/SqliteStore.cpp
// =================================================================
// Implementation of the SQLite3 store.

#include "Modelgate/SqliteStore.hpp"
#include "Modelgate/Logger.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace Modelgate {

// =================================================================
// Prepared statement wrapper
// =================================================================

/**
 * @brief Owns one prepared statement; finalized on destruction
 */
class SqliteStore::Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_db(db) {
        if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            std::string message = "Failed to prepare statement: ";
            message += sqlite3_errmsg(m_db);
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
            throw StoreError(message);
        }
    }

    ~Statement() {
        if (m_stmt != nullptr) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bindText(int index, const std::string& value) {
        check(sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bindInt(int index, int64_t value) {
        check(sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value)));
        return *this;
    }

    Statement& bindReal(int index, double value) {
        check(sqlite3_bind_double(m_stmt, index, value));
        return *this;
    }

    Statement& bindNull(int index) {
        check(sqlite3_bind_null(m_stmt, index));
        return *this;
    }

    /**
     * @return True while rows remain
     * @throws StoreError on any result other than ROW or DONE
     */
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw StoreError(std::string("SQLite step failed: ") + sqlite3_errmsg(m_db));
    }

    void run() {
        while (step()) {
        }
    }

    std::string text(int column) const {
        const unsigned char* value = sqlite3_column_text(m_stmt, column);
        return value != nullptr ? std::string(reinterpret_cast<const char*>(value)) : std::string();
    }

    int64_t integer(int column) const {
        return static_cast<int64_t>(sqlite3_column_int64(m_stmt, column));
    }

    double real(int column) const {
        return sqlite3_column_double(m_stmt, column);
    }

    bool isNull(int column) const {
        return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
    }

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("SQLite bind failed: ") + sqlite3_errmsg(m_db));
        }
    }
};

// =================================================================
// Row mapping helpers
// =================================================================

namespace {

std::string endpointColumns(const std::string& prefix) {
    static const char* columns[] = {
        "id", "name", "provider_kind", "base_url", "api_key", "api_version", "model_id",
        "max_tokens", "context_window", "default_temperature", "default_top_p",
        "input_price_per_1k", "output_price_per_1k", "rate_limit_rpm", "rate_limit_tpm",
        "daily_quota", "is_active", "priority", "additional_config"
    };

    std::string list;
    for (const char* column : columns) {
        if (!list.empty()) list += ", ";
        list += prefix + column;
    }
    return list;
}

const char* QUOTA_COLUMNS =
    "id, endpoint_id, caller_id, period, max_calls, max_tokens, max_cost, "
    "used_calls, used_tokens, used_cost, reset_at, last_reset, is_active";

const char* CALL_RECORD_COLUMNS =
    "id, request_id, endpoint_id, pool_id, caller_id, input_text, parameters, output_text, "
    "status, error_message, input_tokens, output_tokens, cost, latency_ms, created_at";

const char* SNAPSHOT_COLUMNS =
    "endpoint_id, date, total_calls, successful_calls, failed_calls, total_input_tokens, "
    "total_output_tokens, average_latency_ms, success_rate, total_cost, average_cost_per_call";

std::string configToJson(const std::unordered_map<std::string, std::string>& config) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [key, value] : config) {
        json[key] = value;
    }
    return json.dump();
}

std::unordered_map<std::string, std::string> configFromJson(const std::string& text) {
    std::unordered_map<std::string, std::string> config;
    if (text.empty()) {
        return config;
    }

    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw StoreError("Corrupt additional_config column: " + text);
    }
    for (const auto& [key, value] : json.items()) {
        config[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return config;
}

std::string parametersToJson(const NormalizedParameters& params) {
    nlohmann::json json = {
        {"temperature", params.temperature},
        {"top_p", params.top_p},
        {"max_tokens", params.max_tokens},
        {"extra", params.extra}
    };
    return json.dump();
}

NormalizedParameters parametersFromJson(const std::string& text) {
    NormalizedParameters params;
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return params;
    }
    params.temperature = json.value("temperature", params.temperature);
    params.top_p = json.value("top_p", params.top_p);
    params.max_tokens = json.value("max_tokens", params.max_tokens);
    if (json.contains("extra") && json["extra"].is_object()) {
        params.extra = json["extra"];
    }
    return params;
}

} // namespace

// =================================================================
// SqliteStore Implementation
// =================================================================

std::unique_ptr<SqliteStore> SqliteStore::open(const std::string& path) {
    if (path.empty()) {
        throw StoreError("Database path cannot be empty");
    }

    if (path != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw StoreError("Cannot create database directory " + parent.string() + ": " + ec.message());
            }
        }
    }

    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        std::string message = "Failed to open database " + path;
        if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
            message += std::string(": ") + sqlite3_errmsg(db);
        }
        if (db != nullptr) {
            sqlite3_close(db);
        }
        throw StoreError(message);
    }

    std::unique_ptr<SqliteStore> store(new SqliteStore(db, path));
    store->initializeSchema();

    Logger::getInstance().info("SqliteStore", "Opened database", path);
    return store;
}

SqliteStore::SqliteStore(sqlite3* db, std::string path)
    : m_db(db), m_path(std::move(path)) {
}

SqliteStore::~SqliteStore() {
    if (m_db != nullptr) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

void SqliteStore::exec(const char* sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
        sqlite3_free(err_msg);
        throw StoreError(message + " (" + m_path + ")");
    }
}

void SqliteStore::initializeSchema() {
    sqlite3_busy_timeout(m_db, 5000);

    exec("CREATE TABLE IF NOT EXISTS endpoints("
         "id TEXT PRIMARY KEY,"
         "name TEXT NOT NULL,"
         "provider_kind TEXT NOT NULL,"
         "base_url TEXT NOT NULL,"
         "api_key TEXT NOT NULL,"
         "api_version TEXT NOT NULL,"
         "model_id TEXT NOT NULL,"
         "max_tokens INTEGER NOT NULL,"
         "context_window INTEGER NOT NULL,"
         "default_temperature REAL NOT NULL,"
         "default_top_p REAL NOT NULL,"
         "input_price_per_1k REAL NOT NULL,"
         "output_price_per_1k REAL NOT NULL,"
         "rate_limit_rpm INTEGER NOT NULL,"
         "rate_limit_tpm INTEGER NOT NULL,"
         "daily_quota INTEGER NOT NULL,"
         "is_active INTEGER NOT NULL,"
         "priority INTEGER NOT NULL,"
         "additional_config TEXT NOT NULL"
         ")");

    exec("CREATE TABLE IF NOT EXISTS pools("
         "id TEXT PRIMARY KEY,"
         "name TEXT NOT NULL,"
         "strategy TEXT NOT NULL,"
         "enable_fallback INTEGER NOT NULL,"
         "max_retries INTEGER NOT NULL,"
         "retry_delay_ms INTEGER NOT NULL,"
         "health_check_enabled INTEGER NOT NULL,"
         "health_check_interval_s INTEGER NOT NULL,"
         "is_active INTEGER NOT NULL"
         ")");

    exec("CREATE TABLE IF NOT EXISTS pool_members("
         "pool_id TEXT NOT NULL,"
         "endpoint_id TEXT NOT NULL,"
         "position INTEGER NOT NULL,"
         "weight INTEGER NOT NULL,"
         "is_healthy INTEGER NOT NULL,"
         "last_health_check INTEGER,"
         "PRIMARY KEY(pool_id, endpoint_id)"
         ")");

    exec("CREATE TABLE IF NOT EXISTS quotas("
         "id TEXT PRIMARY KEY,"
         "endpoint_id TEXT NOT NULL,"
         "caller_id TEXT NOT NULL,"
         "period TEXT NOT NULL,"
         "max_calls INTEGER NOT NULL,"
         "max_tokens INTEGER NOT NULL,"
         "max_cost REAL NOT NULL,"
         "used_calls INTEGER NOT NULL,"
         "used_tokens INTEGER NOT NULL,"
         "used_cost REAL NOT NULL,"
         "reset_at INTEGER NOT NULL,"
         "last_reset INTEGER NOT NULL,"
         "is_active INTEGER NOT NULL"
         ")");

    exec("CREATE TABLE IF NOT EXISTS call_records("
         "seq INTEGER PRIMARY KEY AUTOINCREMENT,"
         "id TEXT NOT NULL,"
         "request_id TEXT NOT NULL,"
         "endpoint_id TEXT NOT NULL,"
         "pool_id TEXT NOT NULL,"
         "caller_id TEXT NOT NULL,"
         "input_text TEXT NOT NULL,"
         "parameters TEXT NOT NULL,"
         "output_text TEXT NOT NULL,"
         "status TEXT NOT NULL,"
         "error_message TEXT NOT NULL,"
         "input_tokens INTEGER NOT NULL,"
         "output_tokens INTEGER NOT NULL,"
         "cost REAL NOT NULL,"
         "latency_ms INTEGER NOT NULL,"
         "created_at INTEGER NOT NULL"
         ")");
    exec("CREATE INDEX IF NOT EXISTS idx_call_records_endpoint ON call_records(endpoint_id, created_at)");
    exec("CREATE INDEX IF NOT EXISTS idx_call_records_created ON call_records(created_at)");

    exec("CREATE TABLE IF NOT EXISTS performance_snapshots("
         "endpoint_id TEXT NOT NULL,"
         "date TEXT NOT NULL,"
         "total_calls INTEGER NOT NULL,"
         "successful_calls INTEGER NOT NULL,"
         "failed_calls INTEGER NOT NULL,"
         "total_input_tokens INTEGER NOT NULL,"
         "total_output_tokens INTEGER NOT NULL,"
         "average_latency_ms REAL NOT NULL,"
         "success_rate REAL NOT NULL,"
         "total_cost REAL NOT NULL,"
         "average_cost_per_call REAL NOT NULL,"
         "PRIMARY KEY(endpoint_id, date)"
         ")");
}

namespace {

template<typename Stmt>
Endpoint readEndpoint(Stmt& stmt, int offset) {
    auto text = [&stmt](int c) { return stmt.text(c); };
    auto integer = [&stmt](int c) { return stmt.integer(c); };
    auto real = [&stmt](int c) { return stmt.real(c); };

    Endpoint endpoint;
    endpoint.id = text(offset + 0);
    endpoint.name = text(offset + 1);
    endpoint.provider_kind = GatewayTypeUtils::stringToProviderKind(text(offset + 2));
    endpoint.base_url = text(offset + 3);
    endpoint.api_key = text(offset + 4);
    endpoint.api_version = text(offset + 5);
    endpoint.model_id = text(offset + 6);
    endpoint.max_tokens = static_cast<size_t>(integer(offset + 7));
    endpoint.context_window = static_cast<size_t>(integer(offset + 8));
    endpoint.default_temperature = real(offset + 9);
    endpoint.default_top_p = real(offset + 10);
    endpoint.input_price_per_1k = real(offset + 11);
    endpoint.output_price_per_1k = real(offset + 12);
    endpoint.rate_limit_rpm = integer(offset + 13);
    endpoint.rate_limit_tpm = integer(offset + 14);
    endpoint.daily_quota = integer(offset + 15);
    endpoint.is_active = integer(offset + 16) != 0;
    endpoint.priority = static_cast<int>(integer(offset + 17));
    endpoint.additional_config = configFromJson(text(offset + 18));
    return endpoint;
}

} // namespace

std::optional<Endpoint> SqliteStore::getEndpoint(const std::string& endpoint_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, "SELECT " + endpointColumns("") + " FROM endpoints WHERE id = ?1");
    stmt.bindText(1, endpoint_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readEndpoint(stmt, 0);
}

std::vector<Endpoint> SqliteStore::listEndpoints() {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, "SELECT " + endpointColumns("") + " FROM endpoints ORDER BY id");
    std::vector<Endpoint> endpoints;
    while (stmt.step()) {
        endpoints.push_back(readEndpoint(stmt, 0));
    }
    return endpoints;
}

std::vector<PoolMember> SqliteStore::loadMembers(const std::string& pool_id) {
    Statement stmt(m_db,
        "SELECT m.weight, m.is_healthy, m.last_health_check, " + endpointColumns("e.") +
        " FROM pool_members m JOIN endpoints e ON e.id = m.endpoint_id"
        " WHERE m.pool_id = ?1 ORDER BY m.position");
    stmt.bindText(1, pool_id);

    std::vector<PoolMember> members;
    while (stmt.step()) {
        PoolMember member;
        member.weight = static_cast<int>(stmt.integer(0));
        member.is_healthy = stmt.integer(1) != 0;
        if (!stmt.isNull(2)) {
            member.last_health_check = TimeUtils::fromMillis(stmt.integer(2));
        }
        member.endpoint = readEndpoint(stmt, 3);
        members.push_back(member);
    }
    return members;
}

Pool SqliteStore::readPool(Statement& stmt) {
    Pool pool;
    pool.id = stmt.text(0);
    pool.name = stmt.text(1);
    pool.strategy = GatewayTypeUtils::stringToStrategy(stmt.text(2));
    pool.enable_fallback = stmt.integer(3) != 0;
    pool.max_retries = static_cast<size_t>(stmt.integer(4));
    pool.retry_delay = std::chrono::milliseconds(stmt.integer(5));
    pool.health_check_enabled = stmt.integer(6) != 0;
    pool.health_check_interval = std::chrono::seconds(stmt.integer(7));
    pool.is_active = stmt.integer(8) != 0;
    pool.members = loadMembers(pool.id);
    return pool;
}

std::optional<Pool> SqliteStore::getPool(const std::string& pool_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        "SELECT id, name, strategy, enable_fallback, max_retries, retry_delay_ms, "
        "health_check_enabled, health_check_interval_s, is_active FROM pools WHERE id = ?1");
    stmt.bindText(1, pool_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readPool(stmt);
}

std::vector<Pool> SqliteStore::listPools() {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        "SELECT id, name, strategy, enable_fallback, max_retries, retry_delay_ms, "
        "health_check_enabled, health_check_interval_s, is_active FROM pools ORDER BY id");
    std::vector<Pool> pools;
    while (stmt.step()) {
        pools.push_back(readPool(stmt));
    }
    return pools;
}

void SqliteStore::putEndpoint(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        "INSERT OR REPLACE INTO endpoints(" + endpointColumns("") + ") VALUES "
        "(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19)");
    stmt.bindText(1, endpoint.id)
        .bindText(2, endpoint.name)
        .bindText(3, GatewayTypeUtils::providerKindToString(endpoint.provider_kind))
        .bindText(4, endpoint.base_url)
        .bindText(5, endpoint.api_key)
        .bindText(6, endpoint.api_version)
        .bindText(7, endpoint.model_id)
        .bindInt(8, static_cast<int64_t>(endpoint.max_tokens))
        .bindInt(9, static_cast<int64_t>(endpoint.context_window))
        .bindReal(10, endpoint.default_temperature)
        .bindReal(11, endpoint.default_top_p)
        .bindReal(12, endpoint.input_price_per_1k)
        .bindReal(13, endpoint.output_price_per_1k)
        .bindInt(14, endpoint.rate_limit_rpm)
        .bindInt(15, endpoint.rate_limit_tpm)
        .bindInt(16, endpoint.daily_quota)
        .bindInt(17, endpoint.is_active ? 1 : 0)
        .bindInt(18, endpoint.priority)
        .bindText(19, configToJson(endpoint.additional_config));
    stmt.run();
}

bool SqliteStore::endpointExists(const std::string& endpoint_id) {
    Statement stmt(m_db, "SELECT 1 FROM endpoints WHERE id = ?1");
    stmt.bindText(1, endpoint_id);
    return stmt.step();
}

void SqliteStore::putPool(const Pool& pool) {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (const auto& member : pool.members) {
        if (!endpointExists(member.endpoint.id)) {
            throw StoreError("Pool " + pool.id + " references unknown endpoint: " + member.endpoint.id);
        }
    }

    exec("BEGIN IMMEDIATE");
    try {
        Statement upsert(m_db,
            "INSERT OR REPLACE INTO pools(id, name, strategy, enable_fallback, max_retries, "
            "retry_delay_ms, health_check_enabled, health_check_interval_s, is_active) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
        upsert.bindText(1, pool.id)
            .bindText(2, pool.name)
            .bindText(3, GatewayTypeUtils::strategyToString(pool.strategy))
            .bindInt(4, pool.enable_fallback ? 1 : 0)
            .bindInt(5, static_cast<int64_t>(pool.max_retries))
            .bindInt(6, pool.retry_delay.count())
            .bindInt(7, pool.health_check_enabled ? 1 : 0)
            .bindInt(8, pool.health_check_interval.count())
            .bindInt(9, pool.is_active ? 1 : 0);
        upsert.run();

        Statement clear(m_db, "DELETE FROM pool_members WHERE pool_id = ?1");
        clear.bindText(1, pool.id);
        clear.run();

        int64_t position = 0;
        for (const auto& member : pool.members) {
            Statement insert(m_db,
                "INSERT OR REPLACE INTO pool_members(pool_id, endpoint_id, position, weight, "
                "is_healthy, last_health_check) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
            insert.bindText(1, pool.id)
                .bindText(2, member.endpoint.id)
                .bindInt(3, position++)
                .bindInt(4, member.weight)
                .bindInt(5, member.is_healthy ? 1 : 0);
            if (member.last_health_check) {
                insert.bindInt(6, TimeUtils::toMillis(*member.last_health_check));
            } else {
                insert.bindNull(6);
            }
            insert.run();
        }

        exec("COMMIT");
    } catch (const StoreError&) {
        exec("ROLLBACK");
        throw;
    }
}

void SqliteStore::putQuota(const Quota& quota) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!endpointExists(quota.endpoint_id)) {
        throw StoreError("Quota " + quota.id + " references unknown endpoint: " + quota.endpoint_id);
    }

    Statement stmt(m_db,
        std::string("INSERT OR REPLACE INTO quotas(") + QUOTA_COLUMNS + ") VALUES "
        "(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)");
    stmt.bindText(1, quota.id)
        .bindText(2, quota.endpoint_id)
        .bindText(3, quota.caller_id)
        .bindText(4, GatewayTypeUtils::quotaPeriodToString(quota.period))
        .bindInt(5, quota.max_calls)
        .bindInt(6, quota.max_tokens)
        .bindReal(7, quota.max_cost)
        .bindInt(8, quota.used_calls)
        .bindInt(9, quota.used_tokens)
        .bindReal(10, quota.used_cost)
        .bindInt(11, TimeUtils::toMillis(quota.reset_at))
        .bindInt(12, TimeUtils::toMillis(quota.last_reset))
        .bindInt(13, quota.is_active ? 1 : 0);
    stmt.run();
}

bool SqliteStore::setEndpointHealth(const std::string& pool_id,
                                    const std::string& endpoint_id,
                                    bool healthy,
                                    const TimePoint& checked_at) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        "UPDATE pool_members SET is_healthy = ?1, last_health_check = ?2 "
        "WHERE pool_id = ?3 AND endpoint_id = ?4");
    stmt.bindInt(1, healthy ? 1 : 0)
        .bindInt(2, TimeUtils::toMillis(checked_at))
        .bindText(3, pool_id)
        .bindText(4, endpoint_id);
    stmt.run();
    return sqlite3_changes(m_db) > 0;
}

namespace {

template<typename Stmt>
Quota readQuota(Stmt& stmt) {
    auto text = [&stmt](int c) { return stmt.text(c); };
    auto integer = [&stmt](int c) { return stmt.integer(c); };
    auto real = [&stmt](int c) { return stmt.real(c); };

    Quota quota;
    quota.id = text(0);
    quota.endpoint_id = text(1);
    quota.caller_id = text(2);
    quota.period = GatewayTypeUtils::stringToQuotaPeriod(text(3));
    quota.max_calls = integer(4);
    quota.max_tokens = integer(5);
    quota.max_cost = real(6);
    quota.used_calls = integer(7);
    quota.used_tokens = integer(8);
    quota.used_cost = real(9);
    quota.reset_at = TimeUtils::fromMillis(integer(10));
    quota.last_reset = TimeUtils::fromMillis(integer(11));
    quota.is_active = integer(12) != 0;
    return quota;
}

} // namespace

std::vector<Quota> SqliteStore::getActiveQuotas(const std::string& endpoint_id,
                                                const std::string& caller_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        std::string("SELECT ") + QUOTA_COLUMNS + " FROM quotas "
        "WHERE endpoint_id = ?1 AND is_active = 1 AND (caller_id = '' OR caller_id = ?2) "
        "ORDER BY id");
    stmt.bindText(1, endpoint_id).bindText(2, caller_id);

    std::vector<Quota> quotas;
    while (stmt.step()) {
        quotas.push_back(readQuota(stmt));
    }
    return quotas;
}

std::optional<Quota> SqliteStore::getQuota(const std::string& quota_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, std::string("SELECT ") + QUOTA_COLUMNS + " FROM quotas WHERE id = ?1");
    stmt.bindText(1, quota_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readQuota(stmt);
}

std::vector<Quota> SqliteStore::listQuotas() {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, std::string("SELECT ") + QUOTA_COLUMNS + " FROM quotas ORDER BY id");
    std::vector<Quota> quotas;
    while (stmt.step()) {
        quotas.push_back(readQuota(stmt));
    }
    return quotas;
}

void SqliteStore::incrementQuotaUsage(const std::string& quota_id,
                                      int64_t calls,
                                      int64_t tokens,
                                      double cost) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        "UPDATE quotas SET used_calls = used_calls + ?1, used_tokens = used_tokens + ?2, "
        "used_cost = used_cost + ?3 WHERE id = ?4");
    stmt.bindInt(1, calls).bindInt(2, tokens).bindReal(3, cost).bindText(4, quota_id);
    stmt.run();

    if (sqlite3_changes(m_db) == 0) {
        throw StoreError("Unknown quota: " + quota_id);
    }
}

void SqliteStore::resetQuotaUsage(const std::string& quota_id,
                                  const TimePoint& reset_at,
                                  const TimePoint& last_reset) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        "UPDATE quotas SET used_calls = 0, used_tokens = 0, used_cost = 0, "
        "reset_at = ?1, last_reset = ?2 WHERE id = ?3");
    stmt.bindInt(1, TimeUtils::toMillis(reset_at))
        .bindInt(2, TimeUtils::toMillis(last_reset))
        .bindText(3, quota_id);
    stmt.run();

    if (sqlite3_changes(m_db) == 0) {
        throw StoreError("Unknown quota: " + quota_id);
    }
}

void SqliteStore::appendCallRecord(const CallRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        std::string("INSERT INTO call_records(") + CALL_RECORD_COLUMNS + ") VALUES "
        "(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15)");
    stmt.bindText(1, record.id)
        .bindText(2, record.request_id)
        .bindText(3, record.endpoint_id)
        .bindText(4, record.pool_id)
        .bindText(5, record.caller_id)
        .bindText(6, record.input_text)
        .bindText(7, parametersToJson(record.parameters))
        .bindText(8, record.output_text)
        .bindText(9, GatewayTypeUtils::callStatusToString(record.status))
        .bindText(10, record.error_message)
        .bindInt(11, static_cast<int64_t>(record.input_tokens))
        .bindInt(12, static_cast<int64_t>(record.output_tokens))
        .bindReal(13, record.cost)
        .bindInt(14, record.latency.count())
        .bindInt(15, TimeUtils::toMillis(record.created_at));
    stmt.run();
}

namespace {

template<typename Stmt>
CallRecord readCallRecord(Stmt& stmt) {
    CallRecord record;
    record.id = stmt.text(0);
    record.request_id = stmt.text(1);
    record.endpoint_id = stmt.text(2);
    record.pool_id = stmt.text(3);
    record.caller_id = stmt.text(4);
    record.input_text = stmt.text(5);
    record.parameters = parametersFromJson(stmt.text(6));
    record.output_text = stmt.text(7);
    record.status = GatewayTypeUtils::stringToCallStatus(stmt.text(8));
    record.error_message = stmt.text(9);
    record.input_tokens = static_cast<size_t>(stmt.integer(10));
    record.output_tokens = static_cast<size_t>(stmt.integer(11));
    record.cost = stmt.real(12);
    record.latency = std::chrono::milliseconds(stmt.integer(13));
    record.created_at = TimeUtils::fromMillis(stmt.integer(14));
    return record;
}

template<typename Stmt>
PerformanceSnapshot readSnapshot(Stmt& stmt) {
    PerformanceSnapshot snapshot;
    snapshot.endpoint_id = stmt.text(0);
    snapshot.date = stmt.text(1);
    snapshot.total_calls = static_cast<size_t>(stmt.integer(2));
    snapshot.successful_calls = static_cast<size_t>(stmt.integer(3));
    snapshot.failed_calls = static_cast<size_t>(stmt.integer(4));
    snapshot.total_input_tokens = stmt.integer(5);
    snapshot.total_output_tokens = stmt.integer(6);
    snapshot.average_latency_ms = stmt.real(7);
    snapshot.success_rate = stmt.real(8);
    snapshot.total_cost = stmt.real(9);
    snapshot.average_cost_per_call = stmt.real(10);
    return snapshot;
}

} // namespace

std::vector<CallRecord> SqliteStore::queryCallRecords(const std::string& endpoint_id,
                                                      const TimePoint& since) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        std::string("SELECT ") + CALL_RECORD_COLUMNS + " FROM call_records "
        "WHERE endpoint_id = ?1 AND created_at >= ?2 ORDER BY created_at, seq");
    stmt.bindText(1, endpoint_id).bindInt(2, TimeUtils::toMillis(since));

    std::vector<CallRecord> records;
    while (stmt.step()) {
        records.push_back(readCallRecord(stmt));
    }
    return records;
}

std::vector<CallRecord> SqliteStore::queryAllCallRecords(const TimePoint& since,
                                                         const TimePoint& until) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        std::string("SELECT ") + CALL_RECORD_COLUMNS + " FROM call_records "
        "WHERE created_at >= ?1 AND created_at < ?2 ORDER BY created_at, seq");
    stmt.bindInt(1, TimeUtils::toMillis(since)).bindInt(2, TimeUtils::toMillis(until));

    std::vector<CallRecord> records;
    while (stmt.step()) {
        records.push_back(readCallRecord(stmt));
    }
    return records;
}

size_t SqliteStore::deleteCallRecordsBefore(const TimePoint& cutoff) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, "DELETE FROM call_records WHERE created_at < ?1");
    stmt.bindInt(1, TimeUtils::toMillis(cutoff));
    stmt.run();
    return static_cast<size_t>(sqlite3_changes(m_db));
}

void SqliteStore::upsertPerformanceSnapshot(const PerformanceSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        std::string("INSERT OR REPLACE INTO performance_snapshots(") + SNAPSHOT_COLUMNS + ") VALUES "
        "(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
    stmt.bindText(1, snapshot.endpoint_id)
        .bindText(2, snapshot.date)
        .bindInt(3, static_cast<int64_t>(snapshot.total_calls))
        .bindInt(4, static_cast<int64_t>(snapshot.successful_calls))
        .bindInt(5, static_cast<int64_t>(snapshot.failed_calls))
        .bindInt(6, snapshot.total_input_tokens)
        .bindInt(7, snapshot.total_output_tokens)
        .bindReal(8, snapshot.average_latency_ms)
        .bindReal(9, snapshot.success_rate)
        .bindReal(10, snapshot.total_cost)
        .bindReal(11, snapshot.average_cost_per_call);
    stmt.run();
}

std::vector<PerformanceSnapshot> SqliteStore::getPerformanceSnapshots(const std::string& endpoint_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        std::string("SELECT ") + SNAPSHOT_COLUMNS + " FROM performance_snapshots "
        "WHERE endpoint_id = ?1 ORDER BY date");
    stmt.bindText(1, endpoint_id);

    std::vector<PerformanceSnapshot> snapshots;
    while (stmt.step()) {
        snapshots.push_back(readSnapshot(stmt));
    }
    return snapshots;
}

} // namespace Modelgate
