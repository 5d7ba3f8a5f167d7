#pragma once
/// @file ContactBook.hpp
/// @brief One command's view of the contact file: load, mutate, save

#include "../Error.hpp"
#include "../record/Contact.hpp"
#include "ContactCollection.hpp"
#include "DurableStore.hpp"

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ContactStore {

/// @brief Contacts loaded from a path, plus the operations callers invoke on them
///
/// The constructor loads the file; mutations stay in memory until save() is
/// called. Nothing is kept open between calls, and save() does not check
/// whether the file changed since the load (last writer wins).
class ContactBook {
  public:
    /// @brief Loads the book stored at path with default StoreOptions
    /// @param ec Set if loading failed; the book is then empty
    ContactBook(std::string path, std::error_code& ec, ErrorInfo* info = nullptr);

    /// @brief Loads the book through a caller-provided store
    ContactBook(std::string path, std::unique_ptr<DurableStore> store, std::error_code& ec,
                ErrorInfo* info = nullptr);

    ContactBook(ContactBook&&) noexcept = default;
    ContactBook& operator=(ContactBook&&) noexcept = default;

    /// @brief Validates, creates and appends a contact
    /// @return The stored contact (with its new id), std::nullopt on ValidationError
    std::optional<Contact> add(const std::string& name, const std::string& email,
                               const std::optional<std::string>& phone, std::error_code& ec);

    /// @return true if a contact with this id was removed
    bool remove(const std::string& id);

    const std::vector<Contact>& list() const noexcept { return contacts_.list(); }

    std::vector<Contact> find(const std::string& query) const { return contacts_.find(query); }

    /// @brief Persists the whole book through the atomic save protocol
    bool save(std::error_code& ec, ErrorInfo* info = nullptr);

    /// @brief Discards in-memory changes and loads the file again
    bool reload(std::error_code& ec, ErrorInfo* info = nullptr);

    const std::string& path() const noexcept { return path_; }
    const ContactCollection& collection() const noexcept { return contacts_; }
    bool dirty() const noexcept { return dirty_; }

  private:
    std::string path_;
    std::unique_ptr<DurableStore> store_;
    ContactCollection contacts_;
    bool dirty_ = false;
};

} // namespace ContactStore
