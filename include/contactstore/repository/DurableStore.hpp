#pragma once
/// @file DurableStore.hpp
/// @brief Locked load and atomic save of a contact collection to one JSON file

#include "../Error.hpp"
#include "../util/AtomicFileWriter.hpp"
#include "ContactCollection.hpp"

#include <sys/types.h>

#include <string>
#include <system_error>

namespace ContactStore {

/// @brief Tunables of the persistence protocol
struct StoreOptions {
    mode_t fileMode = 0600;    ///< Mode of the data file after every save
    int jsonIndent = 2;        ///< Indentation of the written JSON, -1 for compact
    bool syncDirectory = true; ///< fsync the parent directory after the rename
};

/// @brief Persistence controller for one backing file per call
///
/// Holds no open handle between calls. Every open() reopens and share-locks the
/// file, every save() reopens and exclusively locks it.
///
/// @note The exclusive lock only serializes writers up to the point where the
///       replacement is written. It is released before the temp file is
///       created, so two concurrent savers may both reach the rename; the last
///       rename wins. Readers never see a partial file either way.
class DurableStore {
  public:
    explicit DurableStore(StoreOptions options = StoreOptions()) : options_(options) {}
    virtual ~DurableStore() = default;

    /// @brief Loads the collection stored at path
    /// @details A missing file yields an empty collection and creates nothing.
    ///          Any existing file must hold a JSON array; an empty file is corrupt.
    ///          The file is read under a shared lock.
    /// @param out Replaced by the loaded collection (left empty on failure)
    /// @param ec Errc::OpenFailed, LockFailed, ReadFailed or CorruptStore
    /// @param info Optional failure context
    /// @return true on success
    bool open(const std::string& path, ContactCollection& out, std::error_code& ec,
              ErrorInfo* info = nullptr) const;

    /// @brief Replaces the file at path with contacts
    /// @details Steps: create parent directory, take and drop the exclusive lock
    ///          on the target, write the temp file, chmod, fsync, rename, fsync
    ///          the directory. The target is modified only by the rename.
    /// @param ec Errc code of the failing step
    /// @param info Optional failure context
    /// @return true on success
    bool save(const std::string& path, const ContactCollection& contacts, std::error_code& ec,
              ErrorInfo* info = nullptr);

    /// @brief Renders contacts as a JSON array (trailing newline included)
    static std::string serialize(const ContactCollection& contacts, int indent);

    /// @brief Parses a JSON array of contacts
    /// @param diagnostic Receives the parser message on failure, may be nullptr
    /// @return false with ec = Errc::CorruptStore if text is not a contact array
    static bool parse(const std::string& text, ContactCollection& out, std::error_code& ec,
                      std::string* diagnostic = nullptr);

    const StoreOptions& options() const noexcept { return options_; }

  protected:
    /// @brief Makes the fully written temp file visible under its target name
    /// @details The single irrevocable step of save(). Overridden in tests to
    ///          simulate a crash or failure right before the rename.
    virtual bool publish(detail::AtomicFileWriter& writer, std::error_code& ec);

  private:
    /// @brief Opens (creating) the target and holds an exclusive lock on it
    ///        until return, serializing concurrent savers
    bool serializeWriters(const std::string& path, std::error_code& ec, ErrorInfo* info) const;

    StoreOptions options_;
};

} // namespace ContactStore
