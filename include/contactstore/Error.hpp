#pragma once
/// @file Error.hpp
/// @brief Error codes and error kinds reported by the contact store

#include <string>
#include <system_error>
#include <type_traits>

namespace ContactStore {

/// @brief Store error codes. Each value names the step that failed.
enum class Errc {
    // Record validation
    EmptyName = 1,
    EmptyEmail,
    NameTooLong,
    EmailTooLong,
    PhoneTooLong,

    // Existing file is not a JSON array of well-formed records
    CorruptStore,

    // fcntl lock could not be acquired
    LockFailed,

    // I/O steps
    CreateDirectoryFailed,
    OpenFailed,
    ReadFailed,
    TempFileFailed,
    WriteFailed,
    SyncFailed,
    PermissionFailed,

    // Final rename of the fully written temp file failed
    PersistFailed,
};

/// @brief Coarse error kinds, usable as std::error_condition
/// @details `ec == ErrorKind::Io` holds for every I/O step code.
enum class ErrorKind {
    Validation = 1,
    CorruptStore,
    Lock,
    Io,
    Persist,
};

const std::error_category& storeCategory() noexcept;
const std::error_category& errorKindCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;
std::error_condition make_error_condition(ErrorKind k) noexcept;

/// @brief Maps an error code to its kind
ErrorKind kindOf(Errc e) noexcept;

/// @brief Human-readable name of an error kind ("ValidationError", ...)
const char* kindName(ErrorKind k) noexcept;

/// @brief Context attached to a failed store operation
struct ErrorInfo {
    std::string path;      ///< File or directory the failing step operated on
    std::string operation; ///< Failing step, e.g. "acquire exclusive lock"
    std::error_code cause; ///< Underlying OS error, if any
    std::string detail;    ///< Parser diagnostic or leftover temp file path

    void clear() {
        path.clear();
        operation.clear();
        cause.clear();
        detail.clear();
    }

    /// @brief Renders "<operation> '<path>': <cause>[ (<detail>)]"
    std::string message() const;
};

} // namespace ContactStore

namespace std {
template <> struct is_error_code_enum<ContactStore::Errc> : true_type {};
template <> struct is_error_condition_enum<ContactStore::ErrorKind> : true_type {};
} // namespace std
