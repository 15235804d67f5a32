/// @file error.cpp
/// @brief Error handling implementation for artisan_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <artisan/core/error.hpp>
#include <sstream>
#include <vector>

namespace artisan_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_crafting_error(const CraftingError& err) {
    std::ostringstream oss;
    oss << "[CraftingError] " << err.message;
    return oss.str();
}

std::string format_storage_error(const StorageError& err) {
    std::ostringstream oss;
    oss << "[StorageError] " << err.message;

    if (!err.statement.empty()) {
        oss << " (sql: " << err.statement << ")";
    }

    return oss.str();
}

std::string format_import_error(const ImportError& err) {
    std::ostringstream oss;
    oss << "[ImportError] " << err.message;

    if (!err.source.empty() && err.kind == ImportError::Kind::ReadFailed) {
        oss << " (source: " << err.source << ")";
    }

    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, CraftingError>) {
            oss << detail::format_crafting_error(err);
        } else if constexpr (std::is_same_v<T, StorageError>) {
            oss << detail::format_storage_error(err);
        } else if constexpr (std::is_same_v<T, ImportError>) {
            oss << detail::format_import_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::int64_t, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;

} // namespace artisan_core
