/// @file Contact.cpp
/// @brief JSON mapping of Contact

#include <contactstore/record/Contact.hpp>

namespace ContactStore {

void to_json(nlohmann::ordered_json& j, const Contact& c) {
    j = nlohmann::ordered_json::object();
    j["id"] = c.id;
    j["name"] = c.name;
    j["email"] = c.email;
    if (c.phone)
        j["phone"] = *c.phone;
    else
        j["phone"] = nullptr;
}

void from_json(const nlohmann::ordered_json& j, Contact& c) {
    // at()은 객체가 아니면 type_error, 키 누락 시 out_of_range를 던진다.
    // get<std::string>()은 값 타입이 맞지 않으면 type_error.
    c.id = j.at("id").get<std::string>();
    c.name = j.at("name").get<std::string>();
    c.email = j.at("email").get<std::string>();

    auto it = j.find("phone");
    if (it == j.end() || it->is_null())
        c.phone.reset();
    else
        c.phone = it->get<std::string>();
}

} // namespace ContactStore
