#pragma once
/// @file Contact.hpp
/// @brief Contact record and its JSON mapping

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ContactStore {

/// @brief One contact entry
/// @details Construct through makeContact() so that fields are trimmed and
///          checked; the aggregate is also filled directly when loading from disk.
struct Contact {
    std::string id;                   ///< v4 UUID text, immutable after creation
    std::string name;
    std::string email;
    std::optional<std::string> phone; ///< absent is stored as JSON null

    bool operator==(const Contact& o) const {
        return id == o.id && name == o.name && email == o.email && phone == o.phone;
    }
    bool operator!=(const Contact& o) const { return !(*this == o); }
};

/// @brief Writes {"id", "name", "email", "phone"} in that key order
void to_json(nlohmann::ordered_json& j, const Contact& c);

/// @brief Reads a contact object
/// @throws nlohmann::json::exception if a required key is missing or has the wrong type
void from_json(const nlohmann::ordered_json& j, Contact& c);

} // namespace ContactStore
