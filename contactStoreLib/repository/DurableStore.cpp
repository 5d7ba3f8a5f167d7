/// @file DurableStore.cpp
/// @brief Shared-lock load and lock + temp file + rename save

#include <contactstore/repository/DurableStore.hpp>
#include <contactstore/util/FileLockGuard.hpp>
#include <contactstore/util/Log.hpp>
#include <contactstore/util/UniqueFd.hpp>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>

namespace ContactStore {

namespace fs = std::filesystem;

namespace {

std::error_code lastError() { return std::error_code(errno, std::generic_category()); }

/// @brief Records a failed step in ec/info, logs it and returns false
bool fail(std::error_code& ec, ErrorInfo* info, Errc code, const std::string& path,
          const char* operation, const std::error_code& cause, std::string detail = {}) {
    ec = code;
    ErrorInfo local;
    ErrorInfo& ctx = info ? *info : local;
    ctx.path = path;
    ctx.operation = operation;
    ctx.cause = cause;
    ctx.detail = std::move(detail);
    CONTACTSTORE_LOG_ERROR(kindName(kindOf(code)) << ": " << ctx.message());
    return false;
}

int cloexec(int flags) {
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif
    return flags;
}

} // namespace

bool DurableStore::open(const std::string& path, ContactCollection& out, std::error_code& ec,
                        ErrorInfo* info) const {
    ec.clear();
    if (info)
        info->clear();
    out = ContactCollection();

    // stat 후 open 대신 open 결과의 ENOENT로 "파일 없음"을 판단한다. 첫 save 전까지 파일은 만들지 않는다.
    detail::UniqueFd fd(::open(path.c_str(), cloexec(O_RDONLY)));
    if (!fd) {
        if (errno == ENOENT) {
            CONTACTSTORE_LOG_DEBUG("no data file at '" << path << "', starting empty");
            return true;
        }
        return fail(ec, info, Errc::OpenFailed, path, "open data file", lastError());
    }

    std::string text;
    {
        // shared lock: reader끼리는 공존, writer의 exclusive lock과는 상호배제.
        std::error_code lec;
        detail::FileLockGuard lock(fd.get(), detail::FileLockGuard::Mode::Shared, lec);
        if (lec)
            return fail(ec, info, Errc::LockFailed, path, "acquire shared lock for read", lec);

        char buf[4096];
        for (;;) {
            ssize_t n = ::read(fd.get(), buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return fail(ec, info, Errc::ReadFailed, path, "read data file", lastError());
            }
            if (n == 0)
                break;
            text.append(buf, static_cast<size_t>(n));
        }
    }

    std::string diagnostic;
    std::error_code pec;
    if (!parse(text, out, pec, &diagnostic)) {
        out = ContactCollection();
        return fail(ec, info, Errc::CorruptStore, path, "parse data file", {},
                    std::move(diagnostic));
    }
    CONTACTSTORE_LOG_DEBUG("loaded " << out.size() << " contacts from '" << path << "'");
    return true;
}

bool DurableStore::save(const std::string& path, const ContactCollection& contacts,
                        std::error_code& ec, ErrorInfo* info) {
    ec.clear();
    if (info)
        info->clear();

    const fs::path dir = fs::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code fec;
        fs::create_directories(dir, fec);
        if (fec)
            return fail(ec, info, Errc::CreateDirectoryFailed, dir.string(),
                        "create parent directory", fec);
    }

    if (!serializeWriters(path, ec, info))
        return false;

    // 여기부터 target 파일 잠금은 이미 해제된 상태. 새 내용은 temp 파일에만 쓴다.
    detail::AtomicFileWriter writer;
    std::error_code wec;
    if (!writer.create(path, wec))
        return fail(ec, info, Errc::TempFileFailed, dir.empty() ? "." : dir.string(),
                    "create temporary file", wec);

    if (!writer.write(serialize(contacts, options_.jsonIndent), wec))
        return fail(ec, info, Errc::WriteFailed, writer.tempPath(), "write temporary file", wec);

    // rename 전에 권한을 좁혀 target 이름으로 노출되는 순간부터 0600이 되게 한다.
    // fsync보다 먼저 해야 mode 변경까지 디스크에 반영된다.
    if (!writer.setMode(options_.fileMode, wec))
        return fail(ec, info, Errc::PermissionFailed, writer.tempPath(),
                    "set permissions on temporary file", wec);

    if (!writer.sync(wec))
        return fail(ec, info, Errc::SyncFailed, writer.tempPath(), "sync temporary file", wec);

    if (!writer.close(wec))
        return fail(ec, info, Errc::WriteFailed, writer.tempPath(), "close temporary file", wec);

    const std::string tempPath = writer.tempPath();
    if (!publish(writer, wec)) {
        std::string detail = writer.discard()
                                 ? "temporary file " + tempPath + " was removed"
                                 : "temporary file left at " + tempPath + ", remove it manually";
        return fail(ec, info, Errc::PersistFailed, path, "rename temporary file over data file",
                    wec, std::move(detail));
    }

    if (options_.syncDirectory && !writer.syncDirectory(wec))
        return fail(ec, info, Errc::SyncFailed, dir.empty() ? "." : dir.string(),
                    "sync parent directory", wec);

    CONTACTSTORE_LOG_DEBUG("saved " << contacts.size() << " contacts to '" << path << "'");
    return true;
}

bool DurableStore::publish(detail::AtomicFileWriter& writer, std::error_code& ec) {
    return writer.commit(ec);
}

bool DurableStore::serializeWriters(const std::string& path, std::error_code& ec,
                                    ErrorInfo* info) const {
    detail::UniqueFd fd(::open(path.c_str(), cloexec(O_RDWR | O_CREAT), options_.fileMode));
    if (!fd)
        return fail(ec, info, Errc::OpenFailed, path, "open data file for locking", lastError());

    std::error_code lec;
    detail::FileLockGuard lock(fd.get(), detail::FileLockGuard::Mode::Exclusive, lec);
    if (lec)
        return fail(ec, info, Errc::LockFailed, path, "acquire exclusive lock for write", lec);

    CONTACTSTORE_LOG_DEBUG("exclusive lock acquired on '" << path << "'");
    // 잠금을 쥔 채로 rename하지 않는다. lock, fd 순으로 여기서 해제되고
    // 실제 쓰기는 temp 파일 + rename으로 진행된다.
    return true;
}

std::string DurableStore::serialize(const ContactCollection& contacts, int indent) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& c : contacts.list())
        arr.emplace_back(c);
    // 잘못된 UTF-8이 들어와도 dump가 예외를 던지지 않도록 U+FFFD로 치환한다.
    std::string out =
        arr.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    out.push_back('\n');
    return out;
}

bool DurableStore::parse(const std::string& text, ContactCollection& out, std::error_code& ec,
                         std::string* diagnostic) {
    ec.clear();
    // 빈 파일도 JSON이 아니므로 CorruptStore. 빈 store로 간주하면 다음 save가 내용을 덮어쓴다.
    try {
        const auto j = nlohmann::ordered_json::parse(text);
        if (!j.is_array()) {
            ec = Errc::CorruptStore;
            if (diagnostic)
                *diagnostic = std::string("top-level value must be an array, got ") + j.type_name();
            return false;
        }
        std::vector<Contact> contacts;
        contacts.reserve(j.size());
        for (const auto& el : j)
            contacts.push_back(el.get<Contact>());
        out = ContactCollection(std::move(contacts));
        return true;
    } catch (const nlohmann::ordered_json::exception& e) {
        ec = Errc::CorruptStore;
        if (diagnostic)
            *diagnostic = e.what();
        return false;
    }
}

} // namespace ContactStore
