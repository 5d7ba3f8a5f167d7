/// @file ContactValidator.cpp
/// @brief Contact construction with trimming, length checks and id generation

#include <contactstore/Error.hpp>
#include <contactstore/record/ContactValidator.hpp>
#include <contactstore/util/textUtil.hpp>

#include <array>
#include <cstdint>
#include <random>

namespace ContactStore {

bool validateFields(const std::string& name, const std::string& email,
                    const std::optional<std::string>& phone, std::error_code& ec) {
    ec.clear();
    // 빈 값 검사를 길이 검사보다 먼저 한다. 공백만 있는 입력은 trim 후 빈 문자열이 된다.
    if (name.empty()) {
        ec = Errc::EmptyName;
        return false;
    }
    if (email.empty()) {
        ec = Errc::EmptyEmail;
        return false;
    }
    if (util::utf8Length(name) > ContactLimits::kMaxName) {
        ec = Errc::NameTooLong;
        return false;
    }
    if (util::utf8Length(email) > ContactLimits::kMaxEmail) {
        ec = Errc::EmailTooLong;
        return false;
    }
    if (phone && util::utf8Length(*phone) > ContactLimits::kMaxPhone) {
        ec = Errc::PhoneTooLong;
        return false;
    }
    return true;
}

std::optional<Contact> makeContact(const std::string& name, const std::string& email,
                                   const std::optional<std::string>& phone,
                                   std::error_code& ec) {
    Contact c;
    c.name = util::trim(name);
    c.email = util::trim(email);
    if (phone) {
        std::string p = util::trim(*phone);
        if (!p.empty())
            c.phone = std::move(p);
    }

    if (!validateFields(c.name, c.email, c.phone, ec))
        return std::nullopt;

    c.id = generateContactId();
    return c;
}

std::string generateContactId() {
    std::random_device rd;
    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 4) {
        uint32_t v = rd();
        bytes[i] = static_cast<uint8_t>(v);
        bytes[i + 1] = static_cast<uint8_t>(v >> 8);
        bytes[i + 2] = static_cast<uint8_t>(v >> 16);
        bytes[i + 3] = static_cast<uint8_t>(v >> 24);
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace ContactStore
