//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SqlitePersistenceSink.cpp
// Purpose: SQLite capture store implementation
//==========================================================================================================

#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "ucw/SqlitePersistenceSink.hpp"

namespace ucw {

namespace {

constexpr const char* SchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS cognitive_events (
    event_id            TEXT PRIMARY KEY,
    session_id          TEXT,
    timestamp_ns        INTEGER NOT NULL,
    direction           TEXT NOT NULL,
    stage               TEXT NOT NULL,
    method              TEXT,
    request_id          TEXT,
    parent_event_id     TEXT,
    turn                INTEGER DEFAULT 0,
    raw_bytes           BLOB,
    parsed_json         TEXT,
    content_length      INTEGER DEFAULT 0,
    error               TEXT,
    data_content        TEXT,
    data_tokens_est     INTEGER,
    light_intent        TEXT,
    light_topic         TEXT,
    light_concepts      TEXT,
    light_summary       TEXT,
    instinct_coherence  REAL,
    instinct_indicators TEXT,
    instinct_gut_signal TEXT,
    coherence_sig       TEXT,
    platform            TEXT DEFAULT 'claude-desktop',
    protocol            TEXT DEFAULT 'mcp',
    created_at          TEXT DEFAULT (datetime('now'))
);

CREATE INDEX IF NOT EXISTS idx_events_timestamp ON cognitive_events(timestamp_ns);
CREATE INDEX IF NOT EXISTS idx_events_session ON cognitive_events(session_id);
CREATE INDEX IF NOT EXISTS idx_events_method ON cognitive_events(method);
CREATE INDEX IF NOT EXISTS idx_events_direction ON cognitive_events(direction);
CREATE INDEX IF NOT EXISTS idx_events_turn ON cognitive_events(turn);
CREATE INDEX IF NOT EXISTS idx_events_platform ON cognitive_events(platform);
CREATE INDEX IF NOT EXISTS idx_events_topic ON cognitive_events(light_topic);
CREATE INDEX IF NOT EXISTS idx_events_gut ON cognitive_events(instinct_gut_signal);

CREATE TABLE IF NOT EXISTS sessions (
    session_id  TEXT PRIMARY KEY,
    started_ns  INTEGER NOT NULL,
    ended_ns    INTEGER,
    platform    TEXT DEFAULT 'claude-desktop',
    event_count INTEGER DEFAULT 0,
    turn_count  INTEGER DEFAULT 0,
    topics      TEXT,
    summary     TEXT,
    created_at  TEXT DEFAULT (datetime('now'))
);
)SQL";

constexpr const char* InsertEventSql =
    "INSERT INTO cognitive_events ("
    " event_id, session_id, timestamp_ns, direction, stage,"
    " method, request_id, parent_event_id, turn,"
    " raw_bytes, parsed_json, content_length, error,"
    " data_content, data_tokens_est,"
    " light_intent, light_topic, light_concepts, light_summary,"
    " instinct_coherence, instinct_indicators, instinct_gut_signal,"
    " coherence_sig, platform, protocol"
    ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

// Column order read by readEvent().
constexpr const char* EventColumns =
    "event_id, session_id, timestamp_ns, direction, method, request_id, parent_event_id, turn,"
    " content_length, raw_bytes, parsed_json, error, platform,"
    " light_topic, light_intent, light_summary, instinct_gut_signal, instinct_coherence";

////////////////////////////////////////// sqlite3 wrappers //////////////////////////////////////////

// Prepared statement; finalized on destruction.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept : stmt_(other.stmt_), db_(other.db_) {
        other.stmt_ = nullptr;
    }

    void bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value), "int64");
    }

    void bind(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value), "double");
    }

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT), "text");
    }

    void bindBlob(int index, const std::string& bytes) {
        check(sqlite3_bind_blob(stmt_, index, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT), "blob");
    }

    void bindNull(int index) {
        check(sqlite3_bind_null(stmt_, index), "null");
    }

    template <typename T>
    void bindOptional(int index, const std::optional<T>& value) {
        if (value.has_value()) {
            bind(index, value.value());
        } else {
            bindNull(index);
        }
    }

    // true on SQLITE_ROW, false on SQLITE_DONE
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw std::runtime_error(std::format("Statement execution failed: {}", sqlite3_errmsg(db_)));
    }

    void execute() {
        if (step()) {
            throw std::runtime_error("Execute called on query that returns data");
        }
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int64_t getInt64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double getDouble(int col) const { return sqlite3_column_double(stmt_, col); }
    bool isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::string getString(int col) const {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return text ? std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col))) : std::string();
    }

    std::optional<std::string> getOptionalString(int col) const {
        if (isNull(col)) {
            return std::nullopt;
        }
        return getString(col);
    }

    std::string getBlob(int col) const {
        const void* data = sqlite3_column_blob(stmt_, col);
        const int size = sqlite3_column_bytes(stmt_, col);
        return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
    }

private:
    void check(int rc, const char* kind) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::format("Failed to bind {} parameter: {}", kind, sqlite3_errmsg(db_)));
        }
    }

    sqlite3_stmt* stmt_ = nullptr;
    sqlite3* db_ = nullptr;
};

// Connection handle; closed on destruction.
class Database {
public:
    Database(const std::string& path, int flags) {
        if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
            const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error(std::format("Failed to open database {}: {}", path, message));
        }
        sqlite3_busy_timeout(db_, 5000);
    }

    ~Database() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void execute(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error(std::format("SQL execution failed: {}", error));
        }
    }

    Statement prepare(const std::string& sql) { return Statement(db_, sql); }

private:
    sqlite3* db_ = nullptr;
};

////////////////////////////////////////// Row mapping //////////////////////////////////////////

std::optional<double> getNumber(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (std::holds_alternative<double>(v->value)) {
        return std::get<double>(v->value);
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return static_cast<double>(std::get<int64_t>(v->value));
    }
    return std::nullopt;
}

std::optional<std::string> serializedMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || v->isNull()) {
        return std::nullopt;
    }
    return SerializeJSONValue(*v);
}

StoredEvent readEvent(const Statement& row) {
    StoredEvent ev;
    ev.eventId = row.getString(0);
    ev.sessionId = row.getString(1);
    ev.timestampNs = row.getInt64(2);
    ev.direction = row.getString(3);
    ev.method = row.getString(4);
    ev.requestId = row.getOptionalString(5);
    ev.parentEventId = row.getOptionalString(6);
    ev.turn = row.getInt64(7);
    ev.contentLength = static_cast<uint64_t>(row.getInt64(8));
    ev.rawBytes = row.getBlob(9);
    ev.parsedJson = row.getOptionalString(10);
    ev.error = row.getOptionalString(11);
    ev.platform = row.getString(12);
    ev.topic = row.getOptionalString(13);
    ev.intent = row.getOptionalString(14);
    ev.summary = row.getOptionalString(15);
    ev.gutSignal = row.getOptionalString(16);
    if (!row.isNull(17)) {
        ev.coherence = row.getDouble(17);
    }
    return ev;
}

std::map<std::string, uint64_t> groupCounts(Database& db, const std::string& sql, const std::optional<std::string>& sessionId) {
    std::map<std::string, uint64_t> counts;
    auto stmt = db.prepare(sql);
    if (sessionId.has_value()) {
        stmt.bind(1, sessionId.value());
    }
    while (stmt.step()) {
        counts[stmt.getString(0)] = static_cast<uint64_t>(stmt.getInt64(1));
    }
    return counts;
}

SessionStats querySessionStats(Database& db, const std::string& sessionId, const std::string& platform) {
    SessionStats stats;
    stats.sessionId = sessionId;
    stats.platform = platform;

    auto totals = db.prepare("SELECT COUNT(*), COALESCE(MAX(turn), 0), COALESCE(SUM(content_length), 0)"
                             " FROM cognitive_events WHERE session_id = ?");
    totals.bind(1, sessionId);
    if (totals.step()) {
        stats.eventCount = static_cast<uint64_t>(totals.getInt64(0));
        stats.turnCount = totals.getInt64(1);
        stats.bytesCaptured = static_cast<uint64_t>(totals.getInt64(2));
    }
    stats.topics = groupCounts(db,
        "SELECT light_topic, COUNT(*) FROM cognitive_events"
        " WHERE session_id = ? AND light_topic IS NOT NULL GROUP BY light_topic", sessionId);
    stats.gutSignals = groupCounts(db,
        "SELECT instinct_gut_signal, COUNT(*) FROM cognitive_events"
        " WHERE session_id = ? AND instinct_gut_signal IS NOT NULL GROUP BY instinct_gut_signal", sessionId);
    return stats;
}

CaptureSummary querySummary(Database& db) {
    CaptureSummary summary;
    auto events = db.prepare("SELECT COUNT(*), COALESCE(SUM(content_length), 0) FROM cognitive_events");
    if (events.step()) {
        summary.eventCount = static_cast<uint64_t>(events.getInt64(0));
        summary.bytesCaptured = static_cast<uint64_t>(events.getInt64(1));
    }
    auto sessions = db.prepare("SELECT COUNT(*) FROM sessions");
    if (sessions.step()) {
        summary.sessionCount = static_cast<uint64_t>(sessions.getInt64(0));
    }
    auto last = db.prepare("SELECT session_id FROM sessions ORDER BY started_ns DESC, rowid DESC LIMIT 1");
    if (last.step()) {
        summary.lastSessionId = last.getString(0);
    }
    summary.gutSignals = groupCounts(db,
        "SELECT instinct_gut_signal, COUNT(*) FROM cognitive_events"
        " WHERE instinct_gut_signal IS NOT NULL GROUP BY instinct_gut_signal", std::nullopt);
    return summary;
}

bool sessionExists(Database& db, const std::string& sessionId) {
    auto stmt = db.prepare("SELECT 1 FROM sessions WHERE session_id = ?");
    stmt.bind(1, sessionId);
    return stmt.step();
}

} // namespace

////////////////////////////////////////// SqlitePersistenceSink //////////////////////////////////////////

class SqlitePersistenceSink::Impl {
public:
    std::string dbPath;
    std::string platform;
    std::string sessionId;

    mutable std::mutex mutex;
    std::unique_ptr<Database> db;
    std::unique_ptr<Statement> insertEvent; // must not outlive db
    SessionStats finalStats;
    bool opened{false};
    bool closed{false};

    Database& requireOpen() const {
        if (!db) {
            throw std::runtime_error("SqlitePersistenceSink is not open");
        }
        return *db;
    }

    void insert(const CaptureEvent& event) {
        Statement& stmt = *insertEvent;
        stmt.reset();

        const JSONValue none{};
        const JSONValue& data = event.dataLayer.has_value() ? event.dataLayer.value() : none;
        const JSONValue& light = event.lightLayer.has_value() ? event.lightLayer.value() : none;
        const JSONValue& instinct = event.instinctLayer.has_value() ? event.instinctLayer.value() : none;

        stmt.bind(1, event.eventId);
        stmt.bind(2, sessionId);
        stmt.bind(3, event.timestampNs);
        stmt.bind(4, std::string(DirectionName(event.direction)));
        stmt.bind(5, std::string(StageName(event.stage)));
        stmt.bind(6, event.method);
        stmt.bindOptional(7, event.requestId);
        stmt.bindOptional(8, event.parentEventId);
        stmt.bind(9, event.turn);
        stmt.bindBlob(10, event.rawBytes);
        if (event.frame.isNull()) {
            stmt.bindNull(11);
        } else {
            stmt.bind(11, SerializeJSONValue(event.frame));
        }
        stmt.bind(12, static_cast<int64_t>(event.contentLength));
        stmt.bindOptional(13, event.error);
        stmt.bindOptional(14, GetString(data, "content"));
        stmt.bindOptional(15, GetInt(data, "tokens_est"));
        stmt.bindOptional(16, GetString(light, "intent"));
        stmt.bindOptional(17, GetString(light, "topic"));
        stmt.bindOptional(18, serializedMember(light, "concepts"));
        stmt.bindOptional(19, GetString(light, "summary"));
        stmt.bindOptional(20, getNumber(instinct, "coherence_potential"));
        stmt.bindOptional(21, serializedMember(instinct, "emergence_indicators"));
        stmt.bindOptional(22, GetString(instinct, "gut_signal"));
        stmt.bindOptional(23, event.coherenceSignature);
        stmt.bind(24, platform);
        stmt.bind(25, std::string("mcp"));
        stmt.execute();
    }

    void finalizeSession() {
        finalStats = querySessionStats(*db, sessionId, platform);
        const JSONValue statsJson = finalStats.ToJSON();
        const JSONValue* topics = FindMember(statsJson, "topics");
        auto stmt = db->prepare(
            "UPDATE sessions SET ended_ns = ?,"
            " event_count = (SELECT COUNT(*) FROM cognitive_events WHERE session_id = ?),"
            " turn_count = (SELECT COALESCE(MAX(turn), 0) FROM cognitive_events WHERE session_id = ?),"
            " topics = ?"
            " WHERE session_id = ?");
        stmt.bind(1, NowNs());
        stmt.bind(2, sessionId);
        stmt.bind(3, sessionId);
        stmt.bind(4, topics ? SerializeJSONValue(*topics) : std::string("{}"));
        stmt.bind(5, sessionId);
        stmt.execute();
    }
};

SqlitePersistenceSink::SqlitePersistenceSink(std::string dbPath, std::string platform)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->dbPath = std::move(dbPath);
    pImpl->platform = std::move(platform);
    pImpl->sessionId = MakeSessionId();
}

SqlitePersistenceSink::~SqlitePersistenceSink() {
    try {
        Close().get();
    } catch (const std::exception& e) {
        LOG_ERROR("SqlitePersistenceSink: close on destruction failed: {}", e.what());
    }
}

void SqlitePersistenceSink::Open() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->opened) {
        return;
    }
    if (pImpl->closed) {
        throw std::runtime_error("SqlitePersistenceSink is closed");
    }

    auto db = std::make_unique<Database>(pImpl->dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX);
    db->execute("PRAGMA journal_mode=WAL");
    db->execute("PRAGMA synchronous=NORMAL");
    db->execute(SchemaSql);

    const std::string base = pImpl->sessionId;
    std::string sessionId = base;
    for (int n = 2; sessionExists(*db, sessionId); ++n) {
        sessionId = std::format("{}-{}", base, n);
    }

    auto insertSession = db->prepare("INSERT INTO sessions (session_id, started_ns, platform) VALUES (?, ?, ?)");
    insertSession.bind(1, sessionId);
    insertSession.bind(2, NowNs());
    insertSession.bind(3, pImpl->platform);
    insertSession.execute();

    pImpl->insertEvent = std::make_unique<Statement>(db->prepare(InsertEventSql));
    pImpl->db = std::move(db);
    pImpl->sessionId = sessionId;
    pImpl->opened = true;
    LOG_INFO("SqlitePersistenceSink: session {} -> {}", sessionId, pImpl->dbPath);
}

std::future<void> SqlitePersistenceSink::Store(const CaptureEvent& event) {
    std::promise<void> done;
    auto fut = done.get_future();
    try {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            throw std::runtime_error("SqlitePersistenceSink is closed");
        }
        pImpl->requireOpen();
        pImpl->insert(event);
        done.set_value();
    } catch (const std::exception&) {
        done.set_exception(std::current_exception());
    }
    return fut;
}

SessionStats SqlitePersistenceSink::GetSessionStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->closed) {
        return pImpl->finalStats;
    }
    SessionStats identity;
    identity.sessionId = pImpl->sessionId;
    identity.platform = pImpl->platform;
    if (!pImpl->db) {
        return identity;
    }
    try {
        return querySessionStats(*pImpl->db, pImpl->sessionId, pImpl->platform);
    } catch (const std::exception& e) {
        LOG_ERROR("SqlitePersistenceSink: session stats query failed: {}", e.what());
        return identity;
    }
}

std::future<void> SqlitePersistenceSink::Close() {
    std::promise<void> done;
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->closed) {
            pImpl->closed = true;
            pImpl->finalStats.sessionId = pImpl->sessionId;
            pImpl->finalStats.platform = pImpl->platform;
            if (pImpl->db) {
                try {
                    pImpl->finalizeSession();
                    LOG_INFO("SqlitePersistenceSink: session {} finalized ({} events, {} turns)",
                             pImpl->sessionId, pImpl->finalStats.eventCount, pImpl->finalStats.turnCount);
                } catch (const std::exception&) {
                    failure = std::current_exception();
                }
                pImpl->insertEvent.reset();
                pImpl->db.reset();
            }
        }
    }
    if (failure) {
        done.set_exception(failure);
    } else {
        done.set_value();
    }
    return done.get_future();
}

CaptureSummary SqlitePersistenceSink::GetAllTimeStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return querySummary(pImpl->requireOpen());
}

std::vector<StoredEvent> SqlitePersistenceSink::QueryTimeline(const TimelineQuery& query) const {
    std::string sql = std::format("SELECT {} FROM cognitive_events", EventColumns);
    if (query.platform.has_value() && query.sinceNs.has_value()) {
        sql += " WHERE platform = ? AND timestamp_ns > ?";
    } else if (query.platform.has_value()) {
        sql += " WHERE platform = ?";
    } else if (query.sinceNs.has_value()) {
        sql += " WHERE timestamp_ns > ?";
    }
    sql += " ORDER BY timestamp_ns DESC, rowid DESC LIMIT ?";

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto stmt = pImpl->requireOpen().prepare(sql);
    int index = 1;
    if (query.platform.has_value()) {
        stmt.bind(index++, query.platform.value());
    }
    if (query.sinceNs.has_value()) {
        stmt.bind(index++, query.sinceNs.value());
    }
    stmt.bind(index, std::max<int64_t>(query.limit, 0));

    std::vector<StoredEvent> rows;
    while (stmt.step()) {
        rows.push_back(readEvent(stmt));
    }
    std::reverse(rows.begin(), rows.end());
    return rows;
}

std::optional<StoredEvent> SqlitePersistenceSink::FindEvent(const std::string& eventId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto stmt = pImpl->requireOpen().prepare(std::format("SELECT {} FROM cognitive_events WHERE event_id = ?", EventColumns));
    stmt.bind(1, eventId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readEvent(stmt);
}

const std::string& SqlitePersistenceSink::GetDatabasePath() const {
    return pImpl->dbPath;
}

std::string SqlitePersistenceSink::GetSessionId() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->sessionId;
}

////////////////////////////////////////// Summaries //////////////////////////////////////////

JSONValue CaptureSummary::ToJSON() const {
    JSONValue::Object signals;
    for (const auto& [key, count] : gutSignals) {
        signals[key] = std::make_shared<JSONValue>(static_cast<int64_t>(count));
    }
    return MakeObject({
        {"total_sessions", JSONValue(static_cast<int64_t>(sessionCount))},
        {"total_events", JSONValue(static_cast<int64_t>(eventCount))},
        {"total_bytes_captured", JSONValue(static_cast<int64_t>(bytesCaptured))},
        {"last_session_id", JSONValue(lastSessionId)},
        {"gut_signals", JSONValue(signals)}
    });
}

CaptureSummary SummarizeCaptureDatabase(const std::string& dbPath) {
    if (!std::filesystem::exists(dbPath)) {
        return CaptureSummary{};
    }
    Database db(dbPath, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX);
    return querySummary(db);
}

} // namespace ucw
