/// @file ContactCollection.cpp

#include <contactstore/repository/ContactCollection.hpp>
#include <contactstore/util/textUtil.hpp>

#include <algorithm>

namespace ContactStore {

void ContactCollection::add(Contact contact) { contacts_.push_back(std::move(contact)); }

bool ContactCollection::remove(const std::string& id) {
    // id 중복을 외부에서 보장한다고 가정하지 않고 일치하는 항목을 모두 제거한다.
    auto it = std::remove_if(contacts_.begin(), contacts_.end(),
                             [&id](const Contact& c) { return c.id == id; });
    bool removed = it != contacts_.end();
    contacts_.erase(it, contacts_.end());
    return removed;
}

std::vector<Contact> ContactCollection::find(const std::string& query) const {
    // query는 한 번만 접고 레코드 쪽은 매번 접는다.
    const std::string needle = util::foldCase(query);
    std::vector<Contact> result;
    for (const auto& c : contacts_) {
        if (util::foldCase(c.name).find(needle) != std::string::npos ||
            util::foldCase(c.email).find(needle) != std::string::npos)
            result.push_back(c);
    }
    return result;
}

const Contact* ContactCollection::findById(const std::string& id) const {
    for (const auto& c : contacts_) {
        if (c.id == id)
            return &c;
    }
    return nullptr;
}

} // namespace ContactStore
