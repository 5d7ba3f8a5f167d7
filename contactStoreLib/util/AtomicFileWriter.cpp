/// @file AtomicFileWriter.cpp
/// @brief POSIX implementation of the temp file + rename commit

#include <contactstore/util/AtomicFileWriter.hpp>
#include <contactstore/util/Log.hpp>

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <vector>

namespace ContactStore {
namespace detail {

namespace fs = std::filesystem;

namespace {

std::error_code lastError() { return std::error_code(errno, std::generic_category()); }

} // namespace

AtomicFileWriter::AtomicFileWriter(AtomicFileWriter&& other) noexcept
    : target_(std::move(other.target_)), tempPath_(std::move(other.tempPath_)),
      fd_(std::move(other.fd_)), committed_(other.committed_) {
    other.tempPath_.clear();
    other.committed_ = false;
}

AtomicFileWriter& AtomicFileWriter::operator=(AtomicFileWriter&& other) noexcept {
    if (this != &other) {
        discard();
        target_ = std::move(other.target_);
        tempPath_ = std::move(other.tempPath_);
        fd_ = std::move(other.fd_);
        committed_ = other.committed_;
        other.tempPath_.clear();
        other.committed_ = false;
    }
    return *this;
}

std::string AtomicFileWriter::directoryOf() const {
    fs::path dir = fs::path(target_).parent_path();
    return dir.empty() ? std::string(".") : dir.string();
}

bool AtomicFileWriter::create(const std::string& target, std::error_code& ec) {
    ec.clear();
    discard();
    target_ = target;
    committed_ = false;

    // rename(2)가 원자적이려면 temp 파일이 target과 같은 파일시스템에 있어야 한다.
    const std::string name = fs::path(target_).filename().string();
    std::string tmpl = directoryOf() + "/." + name + ".tmp.XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

#ifdef O_CLOEXEC
    int fd = ::mkostemp(buf.data(), O_CLOEXEC);
#else
    int fd = ::mkstemp(buf.data());
#endif
    if (fd < 0) {
        ec = lastError();
        return false;
    }
    fd_.reset(fd);
    tempPath_.assign(buf.data());
    CONTACTSTORE_LOG_DEBUG("created temp file '" << tempPath_ << "' for '" << target_ << "'");
    return true;
}

bool AtomicFileWriter::write(const std::string& data, std::error_code& ec) {
    ec.clear();
    if (!fd_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd_.get(), p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = lastError();
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool AtomicFileWriter::setMode(mode_t mode, std::error_code& ec) {
    ec.clear();
    if (!fd_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }
    if (::fchmod(fd_.get(), mode) < 0) {
        ec = lastError();
        return false;
    }
    return true;
}

bool AtomicFileWriter::sync(std::error_code& ec) {
    ec.clear();
    if (!fd_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }
    if (::fsync(fd_.get()) < 0) {
        ec = lastError();
        return false;
    }
    return true;
}

bool AtomicFileWriter::close(std::error_code& ec) {
    ec.clear();
    if (fd_.close() < 0) {
        ec = lastError();
        return false;
    }
    return true;
}

bool AtomicFileWriter::commit(std::error_code& ec) {
    ec.clear();
    if (tempPath_.empty() || committed_) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (fd_ && !close(ec))
        return false;

    if (::rename(tempPath_.c_str(), target_.c_str()) < 0) {
        ec = lastError();
        return false;
    }
    committed_ = true;
    CONTACTSTORE_LOG_DEBUG("renamed '" << tempPath_ << "' over '" << target_ << "'");
    tempPath_.clear();
    return true;
}

bool AtomicFileWriter::syncDirectory(std::error_code& ec) {
    ec.clear();
    const std::string dir = directoryOf();
    int flags = O_RDONLY | O_DIRECTORY;
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif
    UniqueFd dfd(::open(dir.c_str(), flags));
    if (!dfd) {
        ec = lastError();
        return false;
    }
    if (::fsync(dfd.get()) < 0) {
        ec = lastError();
        return false;
    }
    return true;
}

bool AtomicFileWriter::discard() noexcept {
    fd_.reset();
    if (committed_ || tempPath_.empty())
        return true;
    bool removed = true;
    if (::unlink(tempPath_.c_str()) < 0 && errno != ENOENT) {
        removed = false;
        CONTACTSTORE_LOG_WARN("could not remove temp file '" << tempPath_ << "'");
    }
    tempPath_.clear();
    return removed;
}

} // namespace detail
} // namespace ContactStore
