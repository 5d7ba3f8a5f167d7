#pragma once
/// @file FileLockGuard.hpp
/// @brief Scoped fcntl lock over a whole data file (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace ContactStore {
namespace detail {

/// @brief Holds a whole-file fcntl lock for the lifetime of the guard
///
/// The store takes a Shared lock while reading the data file and an Exclusive
/// lock while serializing writers. The lock is dropped on every exit path of
/// the enclosing scope.
///
/// @note Waits (F_SETLKW) until the lock is granted, with no timeout.
/// @note fcntl locks belong to the process: they are not inherited by fork()
///       and are dropped when any fd of the process on that file is closed.
class FileLockGuard {
  public:
    enum class Mode {
        Shared,   ///< F_RDLCK, needs an fd open for reading
        Exclusive ///< F_WRLCK, needs an fd open for writing
    };

    /// @param ec Set if the lock could not be taken; locked() is then false
    FileLockGuard(int fd, Mode mode, std::error_code& ec) { acquire(fd, mode, ec); }

    ~FileLockGuard() { unlockIgnore(); }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    bool locked() const noexcept { return fd_ >= 0; }

    /// @brief Releases early, ignoring errors
    void unlockIgnore() noexcept {
        if (fd_ < 0)
            return;
        // 실패해도 전파하지 않는다. fd가 닫히면 커널이 어차피 해제한다.
        struct flock fl = wholeFile(F_UNLCK);
        ::fcntl(fd_, F_SETLK, &fl);
        fd_ = -1;
    }

  private:
    static struct flock wholeFile(short type) {
        // l_len=0 은 파일 끝까지. save 중 파일 크기가 변해도 범위가 따라간다.
        struct flock fl{};
        fl.l_type = type;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;
        return fl;
    }

    void acquire(int fd, Mode mode, std::error_code& ec) {
        ec.clear();
        if (fd < 0) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return;
        }
        struct flock fl = wholeFile(mode == Mode::Shared ? F_RDLCK : F_WRLCK);
        int rc;
        do {
            rc = ::fcntl(fd, F_SETLKW, &fl);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            ec = std::error_code(errno, std::generic_category());
            return;
        }
        fd_ = fd;
    }

    int fd_ = -1; ///< locked fd, -1 while not holding a lock
};

} // namespace detail
} // namespace ContactStore
