/// @file database.hpp
/// @brief RAII wrapper over a SQLite connection

#pragma once

#include <artisan/core/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

struct sqlite3;

namespace artisan_catalog {

// =============================================================================
// Values & Rows
// =============================================================================

/// Sentinel type representing SQL NULL
struct DbNull {
    bool operator==(const DbNull&) const = default;
};

/// A single column value or bound parameter
using DbValue = std::variant<DbNull, std::int64_t, double, std::string>;

/// A single row: column name -> value
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set of a query
using QueryResult = std::vector<DbRow>;

/// Column as integer (REAL truncated), @p fallback if NULL or absent
[[nodiscard]] std::int64_t row_int(const DbRow& row, const std::string& column, std::int64_t fallback = 0);

/// Column as double, @p fallback if NULL or absent
[[nodiscard]] double row_double(const DbRow& row, const std::string& column, double fallback = 0.0);

/// Column as text, @p fallback if NULL or absent
[[nodiscard]] std::string row_string(const DbRow& row, const std::string& column,
                                     const std::string& fallback = {});

/// Column as text, nullopt if NULL or absent
[[nodiscard]] std::optional<std::string> row_optional_string(const DbRow& row, const std::string& column);

/// Text parameter, or NULL for nullopt
[[nodiscard]] DbValue optional_text(const std::optional<std::string>& value);

// =============================================================================
// Database
// =============================================================================

class Transaction;

/// Owning SQLite connection with foreign keys enabled
class Database {
public:
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /// Open (creating if needed) a database file, or ":memory:"
    [[nodiscard]] static artisan_core::Result<Database> open(const std::string& path);

    /// Run one or more statements without parameters
    [[nodiscard]] artisan_core::Result<void> execute_script(std::string_view sql);

    /// Run a statement with positional parameters, returning the changed row count
    [[nodiscard]] artisan_core::Result<std::int64_t> execute(std::string_view sql,
                                                             const std::vector<DbValue>& params = {});

    /// Run a query with positional parameters
    [[nodiscard]] artisan_core::Result<QueryResult> query(std::string_view sql,
                                                          const std::vector<DbValue>& params = {});

    /// Run a query expected to yield a single integer
    [[nodiscard]] artisan_core::Result<std::int64_t> query_int(std::string_view sql,
                                                               const std::vector<DbValue>& params = {});

    /// Begin a transaction that rolls back unless committed
    [[nodiscard]] artisan_core::Result<Transaction> begin();

    [[nodiscard]] std::int64_t last_insert_id() const;
    [[nodiscard]] const std::string& path() const { return m_path; }
    [[nodiscard]] bool is_open() const { return m_db != nullptr; }

private:
    Database(sqlite3* db, std::string path) : m_db(db), m_path(std::move(path)) {}

    void close();

    sqlite3* m_db{nullptr};
    std::string m_path;
};

// =============================================================================
// Transaction
// =============================================================================

/// RAII transaction guard
///
/// Rolls back on destruction if neither commit() nor rollback() was called.
/// A commit that fails leaves the guard active.
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    [[nodiscard]] artisan_core::Result<void> commit();
    [[nodiscard]] artisan_core::Result<void> rollback();

    [[nodiscard]] bool is_active() const noexcept { return m_db != nullptr; }

private:
    friend class Database;
    explicit Transaction(Database* db) : m_db(db) {}

    Database* m_db{nullptr};
};

} // namespace artisan_catalog
