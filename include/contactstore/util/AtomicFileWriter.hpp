#pragma once
/// @file AtomicFileWriter.hpp
/// @brief Whole-document replace via temp file + rename (internal implementation)

#include "UniqueFd.hpp"

#include <sys/types.h>

#include <string>
#include <system_error>

namespace ContactStore {
namespace detail {

/// @brief Two-phase commit of a file's full content
///
/// The new content is built in a temporary file next to the target, then made
/// visible with a single rename(2). Observers of the target path see either the
/// old or the new content, never a mix. Locking is not this class's concern.
///
/// Typical sequence:
/// @code
///   AtomicFileWriter w;
///   w.create(target, ec) && w.write(data, ec) && w.setMode(0600, ec) &&
///       w.sync(ec) && w.close(ec) && w.commit(ec) && w.syncDirectory(ec);
/// @endcode
///
/// A writer destroyed before commit() unlinks its temp file.
class AtomicFileWriter {
  public:
    AtomicFileWriter() = default;
    ~AtomicFileWriter() { discard(); }

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    AtomicFileWriter(AtomicFileWriter&& other) noexcept;
    AtomicFileWriter& operator=(AtomicFileWriter&& other) noexcept;

    /// @brief Creates "<dir>/.<name>.tmp.XXXXXX" in the target's directory
    /// @details Same directory keeps the final rename on one filesystem.
    bool create(const std::string& target, std::error_code& ec);

    /// @brief Appends data, retrying short writes
    bool write(const std::string& data, std::error_code& ec);

    /// @brief fchmod on the temp file
    bool setMode(mode_t mode, std::error_code& ec);

    /// @brief fsync on the temp file
    bool sync(std::error_code& ec);

    /// @brief Closes the temp fd, reporting close() failures
    bool close(std::error_code& ec);

    /// @brief Renames the temp file over the target
    /// @note Closes the fd first if close() was not called.
    bool commit(std::error_code& ec);

    /// @brief fsync on the target's directory so the rename itself is durable
    bool syncDirectory(std::error_code& ec);

    /// @brief Drops an uncommitted temp file
    /// @return true if nothing is left behind on disk
    bool discard() noexcept;

    const std::string& target() const noexcept { return target_; }
    const std::string& tempPath() const noexcept { return tempPath_; }
    bool committed() const noexcept { return committed_; }

  private:
    std::string directoryOf() const;

    std::string target_;
    std::string tempPath_;
    UniqueFd fd_;
    bool committed_ = false;
};

} // namespace detail
} // namespace ContactStore
