#pragma once
/// @file UniqueFd.hpp
/// @brief RAII owner of a POSIX file descriptor (internal implementation)

#include <unistd.h>

namespace ContactStore {
namespace detail {

/// @brief Move-only owner of a file descriptor
///
/// Closes the descriptor on destruction. Closing a descriptor also drops every
/// fcntl lock this process holds on the underlying file, so a UniqueFd must
/// outlive any FileLockGuard taken on it.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;

    /// @brief Takes ownership of a file descriptor
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    /// @return Owned fd, -1 if none
    int get() const noexcept { return fd_; }

    bool valid() const noexcept { return fd_ >= 0; }

    explicit operator bool() const noexcept { return valid(); }

    /// @brief Closes the current fd (ignoring errors) and adopts newFd
    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = newFd;
    }

    /// @brief Closes the current fd and reports the close() result
    /// @return 0 on success, -1 with errno set on failure
    /// @note Used on write paths where a failed close can mean lost data.
    int close() noexcept {
        if (fd_ < 0)
            return 0;
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace ContactStore
