#pragma once

/// @file error.hpp
/// @brief Error handling types for artisan_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace artisan_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidInput,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    IncompatibleVersion,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Crafting calculation errors
struct CraftingError {
    enum class Kind : std::uint8_t {
        RecipeNotFound,     // No recipe (or no components) for the output item
        ItemNotFound,       // Component item missing from the catalog
        InvalidQuantity,    // Quantity below one
        InvalidTaxRate,     // Tax rate outside [0, 1]
        InvalidOverride,    // Malformed override key or negative override price
        InvalidQuality,     // Negative quality rating
    };

    Kind kind;
    std::string message;
    std::string subject;    // Item id, key or value that caused the error

    [[nodiscard]] static CraftingError recipe_not_found(std::uint64_t output_item_id) {
        auto id = std::to_string(output_item_id);
        return CraftingError{Kind::RecipeNotFound, "Recipe not found for item " + id, id};
    }

    [[nodiscard]] static CraftingError item_not_found(std::uint64_t item_id) {
        auto id = std::to_string(item_id);
        return CraftingError{Kind::ItemNotFound, "Item not found: " + id, id};
    }

    [[nodiscard]] static CraftingError invalid_quantity(std::int64_t quantity) {
        auto q = std::to_string(quantity);
        return CraftingError{Kind::InvalidQuantity, "Quantity must be at least 1, got " + q, q};
    }

    [[nodiscard]] static CraftingError invalid_tax_rate(double rate) {
        auto r = std::to_string(rate);
        return CraftingError{Kind::InvalidTaxRate, "Tax rate must be within [0, 1], got " + r, r};
    }

    [[nodiscard]] static CraftingError invalid_override(const std::string& key, const std::string& reason) {
        return CraftingError{Kind::InvalidOverride, "Invalid price override '" + key + "': " + reason, key};
    }

    [[nodiscard]] static CraftingError invalid_quality(std::int64_t rating) {
        auto r = std::to_string(rating);
        return CraftingError{Kind::InvalidQuality, "Quality rating must not be negative, got " + r, r};
    }
};

/// Local store errors
struct StorageError {
    enum class Kind : std::uint8_t {
        OpenFailed,         // Database could not be opened
        QueryFailed,        // Statement preparation or execution failed
        Constraint,         // Constraint violation
        NotFound,           // Row not found
        MigrationFailed,    // Schema migration failed
    };

    Kind kind;
    std::string message;
    std::string statement;

    [[nodiscard]] static StorageError open_failed(const std::string& path, const std::string& reason) {
        return StorageError{Kind::OpenFailed, "Failed to open database '" + path + "': " + reason, {}};
    }

    [[nodiscard]] static StorageError query_failed(const std::string& sql, const std::string& reason) {
        return StorageError{Kind::QueryFailed, "Query failed: " + reason, sql};
    }

    [[nodiscard]] static StorageError constraint(const std::string& sql, const std::string& reason) {
        return StorageError{Kind::Constraint, "Constraint violation: " + reason, sql};
    }

    [[nodiscard]] static StorageError not_found(const std::string& what) {
        return StorageError{Kind::NotFound, "Not found: " + what, {}};
    }

    [[nodiscard]] static StorageError migration_failed(int version, const std::string& reason) {
        return StorageError{Kind::MigrationFailed,
            "Migration to schema version " + std::to_string(version) + " failed: " + reason, {}};
    }
};

/// API page import errors
struct ImportError {
    enum class Kind : std::uint8_t {
        InvalidDocument,    // Not valid JSON or wrong top-level shape
        MissingField,       // Required field absent
        InvalidField,       // Field present with the wrong type
        ReadFailed,         // Page file could not be read
    };

    Kind kind;
    std::string message;
    std::string source;     // File name or field path

    [[nodiscard]] static ImportError invalid_document(const std::string& reason) {
        return ImportError{Kind::InvalidDocument, "Invalid API document: " + reason, {}};
    }

    [[nodiscard]] static ImportError missing_field(const std::string& field) {
        return ImportError{Kind::MissingField, "Missing field: " + field, field};
    }

    [[nodiscard]] static ImportError invalid_field(const std::string& field, const std::string& expected) {
        return ImportError{Kind::InvalidField, "Field '" + field + "' is not " + expected, field};
    }

    [[nodiscard]] static ImportError read_failed(const std::string& path) {
        return ImportError{Kind::ReadFailed, "Failed to read page: " + path, path};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        ParseFailed,
        UnknownKey,
        InvalidValue,
        WriteFailed,
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Failed to parse '" + path + "': " + reason, {}};
    }

    [[nodiscard]] static ConfigError unknown_key(const std::string& key) {
        return ConfigError{Kind::UnknownKey, "Unknown setting: " + key, key};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }

    [[nodiscard]] static ConfigError write_failed(const std::string& path) {
        return ConfigError{Kind::WriteFailed, "Failed to write config: " + path, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        CraftingError,
        StorageError,
        ImportError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(CraftingError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(StorageError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ImportError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(CraftingError::Kind kind) {
        switch (kind) {
            case CraftingError::Kind::RecipeNotFound: return ErrorCode::NotFound;
            case CraftingError::Kind::ItemNotFound: return ErrorCode::NotFound;
            case CraftingError::Kind::InvalidQuantity: return ErrorCode::InvalidInput;
            case CraftingError::Kind::InvalidTaxRate: return ErrorCode::InvalidInput;
            case CraftingError::Kind::InvalidOverride: return ErrorCode::InvalidInput;
            case CraftingError::Kind::InvalidQuality: return ErrorCode::InvalidInput;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(StorageError::Kind kind) {
        switch (kind) {
            case StorageError::Kind::OpenFailed: return ErrorCode::IOError;
            case StorageError::Kind::QueryFailed: return ErrorCode::IOError;
            case StorageError::Kind::Constraint: return ErrorCode::ValidationError;
            case StorageError::Kind::NotFound: return ErrorCode::NotFound;
            case StorageError::Kind::MigrationFailed: return ErrorCode::IncompatibleVersion;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ImportError::Kind kind) {
        switch (kind) {
            case ImportError::Kind::InvalidDocument: return ErrorCode::ParseError;
            case ImportError::Kind::MissingField: return ErrorCode::ValidationError;
            case ImportError::Kind::InvalidField: return ErrorCode::ValidationError;
            case ImportError::Kind::ReadFailed: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::UnknownKey: return ErrorCode::NotFound;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidInput;
            case ConfigError::Kind::WriteFailed: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

} // namespace artisan_core
