#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace netsentry::infra {

namespace {

struct Migration {
    int version;
    const char* name;
    std::vector<const char*> statements;
};

const std::vector<Migration>& migrations() {
    static const std::vector<Migration> list{
        {1,
         "scan_jobs",
         {R"(CREATE TABLE IF NOT EXISTS scan_jobs (
                 scan_id TEXT PRIMARY KEY,
                 network TEXT NOT NULL,
                 scan_type TEXT NOT NULL,
                 status TEXT NOT NULL,
                 started_at INTEGER NOT NULL,
                 completed_at INTEGER,
                 payload TEXT NOT NULL
             ))",
          "CREATE INDEX IF NOT EXISTS idx_scan_jobs_started ON scan_jobs(started_at)"}},
        {2,
         "scan owner",
         {"ALTER TABLE scan_jobs ADD COLUMN owner_pid INTEGER",
          "CREATE INDEX IF NOT EXISTS idx_scan_jobs_status ON scan_jobs(status)"}},
    };
    return list;
}

} // namespace

Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

void Statement::bind(int index, const SqlValue& value) {
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::nullptr_t>(value)) {
        rc = sqlite3_bind_null(stmt_, index);
    } else if (const auto* number = std::get_if<int64_t>(&value)) {
        rc = sqlite3_bind_int64(stmt_, index, *number);
    } else {
        const auto& text = std::get<std::string>(value);
        rc = sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()),
                               SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to bind parameter " + std::to_string(index) + ": " +
                                 sqlite3_errstr(rc));
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errstr(rc));
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

Database::Database(const std::string& path) {
    spdlog::info("Opening database: {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }
    sqlite3_busy_timeout(db_, 5000);

    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

Statement Database::prepareLocked(const std::string& sql, const std::vector<SqlValue>& params) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") +
                                 sqlite3_errmsg(db_));
    }
    Statement stmt(raw);
    for (size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
    }
    return stmt;
}

Statement Database::query(const std::string& sql, const std::vector<SqlValue>& params) {
    std::lock_guard lock(mutex_);
    return prepareLocked(sql, params);
}

int Database::run(const std::string& sql, const std::vector<SqlValue>& params) {
    std::lock_guard lock(mutex_);
    auto stmt = prepareLocked(sql, params);
    while (stmt.step()) {
    }
    return sqlite3_changes(db_);
}

int Database::schemaVersion() {
    auto stmt = query("SELECT COALESCE(MAX(version), 0) FROM schema_migrations");
    return stmt.step() ? static_cast<int>(stmt.columnInt64(0)) : 0;
}

void Database::runMigrations() {
    int current = schemaVersion();
    for (const auto& migration : migrations()) {
        if (migration.version <= current) {
            continue;
        }
        spdlog::info("Applying migration {}: {}", migration.version, migration.name);
        transaction([&]() {
            for (const auto* sql : migration.statements) {
                execute(sql);
            }
            run("INSERT INTO schema_migrations (version) VALUES (?)",
                {static_cast<int64_t>(migration.version)});
        });
    }
    spdlog::debug("Database schema version {}", schemaVersion());
}

} // namespace netsentry::infra
