#pragma once
/// @file ContactCollection.hpp
/// @brief Ordered in-memory set of contacts

#include "../record/Contact.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ContactStore {

/// @brief Contacts in insertion order
/// @details Pure in-memory state, no I/O and no validation. Id uniqueness is
///          expected from the producer of records, not enforced here.
class ContactCollection {
  public:
    ContactCollection() = default;
    explicit ContactCollection(std::vector<Contact> contacts) : contacts_(std::move(contacts)) {}

    /// @brief Appends to the end
    void add(Contact contact);

    /// @brief Removes every record whose id equals id
    /// @return true if at least one record was removed
    bool remove(const std::string& id);

    /// @brief Records whose name or email contains query, ignoring case
    /// @details Phone is not searched. An empty query matches every record.
    ///          Results keep insertion order.
    std::vector<Contact> find(const std::string& query) const;

    /// @brief Record with the given id, nullptr if none
    const Contact* findById(const std::string& id) const;

    const std::vector<Contact>& list() const noexcept { return contacts_; }
    size_t size() const noexcept { return contacts_.size(); }
    bool empty() const noexcept { return contacts_.empty(); }

  private:
    std::vector<Contact> contacts_;
};

} // namespace ContactStore
