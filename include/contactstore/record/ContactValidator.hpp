#pragma once
/// @file ContactValidator.hpp
/// @brief Field constraints and identifier generation for new contacts

#include "Contact.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

namespace ContactStore {

/// @brief Field length limits, in code points, applied after trimming
struct ContactLimits {
    static constexpr size_t kMaxName = 200;
    static constexpr size_t kMaxEmail = 320;
    static constexpr size_t kMaxPhone = 50;
};

/// @brief Validates and trims candidate fields and assigns a fresh id
/// @param phone Optional phone; whitespace-only is stored as absent
/// @param ec Set to an Errc validation code on failure
/// @return The new contact, or std::nullopt on failure
std::optional<Contact> makeContact(const std::string& name, const std::string& email,
                                   const std::optional<std::string>& phone,
                                   std::error_code& ec);

/// @brief Checks already-trimmed fields without building a record
/// @return true if all constraints hold
bool validateFields(const std::string& name, const std::string& email,
                    const std::optional<std::string>& phone, std::error_code& ec);

/// @brief Random RFC 4122 version 4 UUID, lowercase canonical text
/// @details Independent of any stored value; 122 random bits from std::random_device.
std::string generateContactId();

} // namespace ContactStore
