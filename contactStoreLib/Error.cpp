/// @file Error.cpp
/// @brief std::error_category implementations for the contact store

#include <contactstore/Error.hpp>

namespace ContactStore {

namespace {

class StoreCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "contactstore"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
        case Errc::EmptyName:
            return "name must be non-empty";
        case Errc::EmptyEmail:
            return "email must be non-empty";
        case Errc::NameTooLong:
            return "name too long (max 200 chars)";
        case Errc::EmailTooLong:
            return "email too long (max 320 chars)";
        case Errc::PhoneTooLong:
            return "phone too long (max 50 chars)";
        case Errc::CorruptStore:
            return "data file is not a valid contact list";
        case Errc::LockFailed:
            return "could not acquire file lock";
        case Errc::CreateDirectoryFailed:
            return "could not create parent directory";
        case Errc::OpenFailed:
            return "could not open data file";
        case Errc::ReadFailed:
            return "could not read data file";
        case Errc::TempFileFailed:
            return "could not create temporary file";
        case Errc::WriteFailed:
            return "could not write temporary file";
        case Errc::SyncFailed:
            return "could not sync to disk";
        case Errc::PermissionFailed:
            return "could not set file permissions";
        case Errc::PersistFailed:
            return "failed to persist temp file";
        }
        return "unknown contactstore error";
    }

    bool equivalent(int code, const std::error_condition& cond) const noexcept override {
        if (cond.category() != errorKindCategory())
            return false;
        return static_cast<int>(kindOf(static_cast<Errc>(code))) == cond.value();
    }
};

class ErrorKindCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "contactstore.kind"; }

    std::string message(int ev) const override { return kindName(static_cast<ErrorKind>(ev)); }
};

} // namespace

const std::error_category& storeCategory() noexcept {
    static const StoreCategory category;
    return category;
}

const std::error_category& errorKindCategory() noexcept {
    static const ErrorKindCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), storeCategory()};
}

std::error_condition make_error_condition(ErrorKind k) noexcept {
    return {static_cast<int>(k), errorKindCategory()};
}

ErrorKind kindOf(Errc e) noexcept {
    switch (e) {
    case Errc::EmptyName:
    case Errc::EmptyEmail:
    case Errc::NameTooLong:
    case Errc::EmailTooLong:
    case Errc::PhoneTooLong:
        return ErrorKind::Validation;
    case Errc::CorruptStore:
        return ErrorKind::CorruptStore;
    case Errc::LockFailed:
        return ErrorKind::Lock;
    case Errc::PersistFailed:
        return ErrorKind::Persist;
    default:
        return ErrorKind::Io;
    }
}

const char* kindName(ErrorKind k) noexcept {
    switch (k) {
    case ErrorKind::Validation:
        return "ValidationError";
    case ErrorKind::CorruptStore:
        return "CorruptStoreError";
    case ErrorKind::Lock:
        return "LockError";
    case ErrorKind::Io:
        return "IoError";
    case ErrorKind::Persist:
        return "PersistError";
    }
    return "UnknownError";
}

std::string ErrorInfo::message() const {
    std::string out = operation.empty() ? std::string("operation failed") : operation;
    if (!path.empty())
        out += " '" + path + "'";
    if (cause) {
        out += ": ";
        out += cause.message();
    }
    if (!detail.empty())
        out += " (" + detail + ")";
    return out;
}

} // namespace ContactStore
