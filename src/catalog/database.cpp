/// @file database.cpp
/// @brief SQLite connection wrapper implementation

#include <artisan/catalog/database.hpp>
#include <artisan/core/log.hpp>

#include <sqlite3.h>

#include <utility>

namespace artisan_catalog {

using artisan_core::Err;
using artisan_core::Ok;
using artisan_core::Result;
using artisan_core::StorageError;

// =============================================================================
// Row Helpers
// =============================================================================

std::int64_t row_int(const DbRow& row, const std::string& column, std::int64_t fallback) {
    auto it = row.find(column);
    if (it == row.end()) return fallback;
    if (auto* v = std::get_if<std::int64_t>(&it->second)) return *v;
    if (auto* v = std::get_if<double>(&it->second)) return static_cast<std::int64_t>(*v);
    return fallback;
}

double row_double(const DbRow& row, const std::string& column, double fallback) {
    auto it = row.find(column);
    if (it == row.end()) return fallback;
    if (auto* v = std::get_if<double>(&it->second)) return *v;
    if (auto* v = std::get_if<std::int64_t>(&it->second)) return static_cast<double>(*v);
    return fallback;
}

std::string row_string(const DbRow& row, const std::string& column, const std::string& fallback) {
    auto value = row_optional_string(row, column);
    return value ? *value : fallback;
}

std::optional<std::string> row_optional_string(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) return std::nullopt;
    if (auto* v = std::get_if<std::string>(&it->second)) return *v;
    if (auto* v = std::get_if<std::int64_t>(&it->second)) return std::to_string(*v);
    if (auto* v = std::get_if<double>(&it->second)) return std::to_string(*v);
    return std::nullopt;
}

DbValue optional_text(const std::optional<std::string>& value) {
    if (!value) return DbNull{};
    return *value;
}

// =============================================================================
// Statement (internal)
// =============================================================================

namespace {

/// Prepared statement owned for the duration of one call
class Statement {
public:
    Statement() = default;
    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> prepare(sqlite3* db, std::string_view sql) {
        int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            return Err(StorageError::query_failed(std::string(sql), sqlite3_errmsg(db)));
        }
        return Ok();
    }

    Result<void> bind(sqlite3* db, std::string_view sql, const std::vector<DbValue>& params) {
        for (std::size_t i = 0; i < params.size(); ++i) {
            const int index = static_cast<int>(i) + 1;
            int rc = std::visit([this, index](const auto& value) -> int {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, DbNull>) {
                    return sqlite3_bind_null(m_stmt, index);
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    return sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value));
                } else if constexpr (std::is_same_v<T, double>) {
                    return sqlite3_bind_double(m_stmt, index, value);
                } else {
                    return sqlite3_bind_text(m_stmt, index, value.data(),
                                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
                }
            }, params[i]);

            if (rc != SQLITE_OK) {
                return Err(StorageError::query_failed(std::string(sql), sqlite3_errmsg(db)));
            }
        }
        return Ok();
    }

    sqlite3_stmt* get() const { return m_stmt; }

private:
    sqlite3_stmt* m_stmt{nullptr};
};

DbValue column_value(sqlite3_stmt* stmt, int column) {
    switch (sqlite3_column_type(stmt, column)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, column));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, column);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
            return std::string(text ? text : "", static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, column));
            return std::string(data ? data : "", static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
        }
        default:
            return DbNull{};
    }
}

StorageError step_error(sqlite3* db, std::string_view sql, int rc) {
    const std::string reason = sqlite3_errmsg(db);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return StorageError::constraint(std::string(sql), reason);
    }
    return StorageError::query_failed(std::string(sql), reason);
}

} // anonymous namespace

// =============================================================================
// Database
// =============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : m_db(std::exchange(other.m_db, nullptr))
    , m_path(std::move(other.m_path))
{
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        m_db = std::exchange(other.m_db, nullptr);
        m_path = std::move(other.m_path);
    }
    return *this;
}

void Database::close() {
    if (m_db) {
        int rc = sqlite3_close(m_db);
        if (rc != SQLITE_OK) {
            artisan_core::catalog_logger()->warn("Closing '{}' left statements open: {}",
                                                 m_path, sqlite3_errstr(rc));
            sqlite3_close_v2(m_db);
        }
        m_db = nullptr;
    }
}

Result<Database> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        if (handle) {
            sqlite3_close(handle);
        }
        return Err<Database>(StorageError::open_failed(path, reason));
    }

    Database db(handle, path);
    auto pragmas = db.execute_script("PRAGMA foreign_keys = ON;");
    if (!pragmas) {
        return Err<Database>(std::move(pragmas.error()));
    }

    artisan_core::catalog_logger()->debug("Opened database '{}'", path);
    return Result<Database>(std::move(db));
}

Result<void> Database::execute_script(std::string_view sql) {
    const std::string script(sql);
    char* message = nullptr;
    int rc = sqlite3_exec(m_db, script.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string reason = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        return Err(StorageError::query_failed(script, reason));
    }
    return Ok();
}

Result<std::int64_t> Database::execute(std::string_view sql, const std::vector<DbValue>& params) {
    Statement stmt;
    if (auto r = stmt.prepare(m_db, sql); !r) {
        return Err<std::int64_t>(std::move(r.error()));
    }
    if (auto r = stmt.bind(m_db, sql, params); !r) {
        return Err<std::int64_t>(std::move(r.error()));
    }

    int rc = sqlite3_step(stmt.get());
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        return Err<std::int64_t>(step_error(m_db, sql, rc));
    }
    return Ok(static_cast<std::int64_t>(sqlite3_changes(m_db)));
}

Result<QueryResult> Database::query(std::string_view sql, const std::vector<DbValue>& params) {
    Statement stmt;
    if (auto r = stmt.prepare(m_db, sql); !r) {
        return Err<QueryResult>(std::move(r.error()));
    }
    if (auto r = stmt.bind(m_db, sql, params); !r) {
        return Err<QueryResult>(std::move(r.error()));
    }

    QueryResult rows;
    const int columns = sqlite3_column_count(stmt.get());

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        DbRow row;
        for (int c = 0; c < columns; ++c) {
            row.emplace(sqlite3_column_name(stmt.get(), c), column_value(stmt.get(), c));
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return Err<QueryResult>(step_error(m_db, sql, rc));
    }
    return Ok(std::move(rows));
}

Result<std::int64_t> Database::query_int(std::string_view sql, const std::vector<DbValue>& params) {
    auto rows = query(sql, params);
    if (!rows) {
        return Err<std::int64_t>(std::move(rows.error()));
    }
    if (rows->empty() || rows->front().empty()) {
        return Ok(std::int64_t{0});
    }
    const auto& row = rows->front();
    const auto& value = row.begin()->second;
    if (auto* v = std::get_if<std::int64_t>(&value)) return Ok(*v);
    if (auto* v = std::get_if<double>(&value)) return Ok(static_cast<std::int64_t>(*v));
    return Ok(std::int64_t{0});
}

Result<Transaction> Database::begin() {
    auto r = execute_script("BEGIN IMMEDIATE;");
    if (!r) {
        return Err<Transaction>(std::move(r.error()));
    }
    return Result<Transaction>(Transaction(this));
}

std::int64_t Database::last_insert_id() const {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(m_db));
}

// =============================================================================
// Transaction
// =============================================================================

Transaction::~Transaction() {
    if (m_db) {
        auto r = rollback();
        if (!r) {
            artisan_core::catalog_logger()->error("Rollback failed: {}", r.error().message());
        }
    }
}

Transaction::Transaction(Transaction&& other) noexcept
    : m_db(std::exchange(other.m_db, nullptr))
{
}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            auto r = rollback();
            if (!r) {
                artisan_core::catalog_logger()->error("Rollback failed: {}", r.error().message());
            }
        }
        m_db = std::exchange(other.m_db, nullptr);
    }
    return *this;
}

Result<void> Transaction::commit() {
    if (!m_db) {
        return Err(artisan_core::Error(artisan_core::ErrorCode::InvalidState, "Transaction is not active"));
    }
    // A failed COMMIT leaves the transaction open; stay active so it is rolled back
    auto r = m_db->execute_script("COMMIT;");
    if (r) {
        m_db = nullptr;
    }
    return r;
}

Result<void> Transaction::rollback() {
    if (!m_db) {
        return Err(artisan_core::Error(artisan_core::ErrorCode::InvalidState, "Transaction is not active"));
    }
    auto r = m_db->execute_script("ROLLBACK;");
    m_db = nullptr;
    return r;
}

} // namespace artisan_catalog
