#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <variant>
#include <vector>

namespace netsentry::infra {

/**
 * @brief A value bound to a statement parameter: NULL, an integer or text.
 */
using SqlValue = std::variant<std::nullptr_t, int64_t, std::string>;

/**
 * @brief RAII handle of a prepared SQLite statement.
 *
 * Move-only. The statement is finalized on destruction.
 */
class Statement {
public:
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) = delete;

    /**
     * @brief Advances to the next result row.
     * @return True while a row is available.
     * @throws std::runtime_error on a step error.
     */
    bool step();

    int64_t columnInt64(int index) const; ///< Integer column of the current row (0-based)
    std::string columnText(int index) const; ///< Text column of the current row, "" for NULL

private:
    friend class Database;
    void bind(int index, const SqlValue& value);

    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection holding persisted scan jobs.
 *
 * Opens the file in serialized mode with WAL journaling and versions its
 * schema through the schema_migrations table. Statements take their
 * parameters as a list of SqlValue bound in order.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database.
     * @param path File path, or ":memory:" for a private in-memory database.
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes one or more statements without parameters or results.
     * @throws std::runtime_error on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a query and binds its parameters.
     * @param sql Query with ? placeholders.
     * @param params Values for the placeholders, in order.
     * @return Statement positioned before the first row.
     * @throws std::runtime_error if preparation or binding fails.
     */
    Statement query(const std::string& sql, const std::vector<SqlValue>& params = {});

    /**
     * @brief Runs a data-changing statement to completion.
     * @param sql Statement with ? placeholders.
     * @param params Values for the placeholders, in order.
     * @return Number of rows the statement changed.
     * @throws std::runtime_error on SQL error.
     */
    int run(const std::string& sql, const std::vector<SqlValue>& params = {});

    /**
     * @brief Runs a function inside a transaction.
     *
     * Commits when the function returns and rolls back if it throws.
     */
    template <typename Func>
    void transaction(Func&& func) {
        execute("BEGIN TRANSACTION");
        try {
            func();
            execute("COMMIT");
        } catch (...) {
            execute("ROLLBACK");
            throw;
        }
    }

    /**
     * @brief Applies pending schema migrations.
     *
     * 1. scan_jobs table with its started_at index.
     * 2. owner_pid column recording the process that runs a scan.
     */
    void runMigrations();

    /**
     * @brief Returns the highest applied migration version, 0 for a fresh file.
     */
    int schemaVersion();

private:
    Statement prepareLocked(const std::string& sql, const std::vector<SqlValue>& params);

    sqlite3* db_{nullptr};
    std::mutex mutex_;
};

} // namespace netsentry::infra
