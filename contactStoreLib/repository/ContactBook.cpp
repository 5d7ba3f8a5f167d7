/// @file ContactBook.cpp

#include <contactstore/record/ContactValidator.hpp>
#include <contactstore/repository/ContactBook.hpp>
#include <contactstore/util/Log.hpp>

namespace ContactStore {

ContactBook::ContactBook(std::string path, std::error_code& ec, ErrorInfo* info)
    : ContactBook(std::move(path), std::make_unique<DurableStore>(), ec, info) {}

ContactBook::ContactBook(std::string path, std::unique_ptr<DurableStore> store,
                         std::error_code& ec, ErrorInfo* info)
    : path_(std::move(path)), store_(std::move(store)) {
    if (!store_)
        store_ = std::make_unique<DurableStore>();
    reload(ec, info);
}

std::optional<Contact> ContactBook::add(const std::string& name, const std::string& email,
                                        const std::optional<std::string>& phone,
                                        std::error_code& ec) {
    auto contact = makeContact(name, email, phone, ec);
    if (!contact) {
        CONTACTSTORE_LOG_DEBUG("rejected contact: " << ec.message());
        return std::nullopt;
    }
    contacts_.add(*contact);
    dirty_ = true;
    return contact;
}

bool ContactBook::remove(const std::string& id) {
    bool removed = contacts_.remove(id);
    if (removed)
        dirty_ = true;
    return removed;
}

bool ContactBook::save(std::error_code& ec, ErrorInfo* info) {
    if (!store_->save(path_, contacts_, ec, info))
        return false;
    dirty_ = false;
    return true;
}

bool ContactBook::reload(std::error_code& ec, ErrorInfo* info) {
    dirty_ = false;
    return store_->open(path_, contacts_, ec, info);
}

} // namespace ContactStore
