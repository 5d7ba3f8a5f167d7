/**
 * @file ContactCollectionTest.cpp
 * @brief In-memory insertion, removal and search
 */

#include <gtest/gtest.h>

#include <contactstore/repository/ContactCollection.hpp>

using namespace ContactStore;

namespace {

Contact contact(const std::string& id, const std::string& name, const std::string& email,
                std::optional<std::string> phone = std::nullopt) {
    return Contact{id, name, email, std::move(phone)};
}

std::vector<std::string> idsOf(const std::vector<Contact>& contacts) {
    std::vector<std::string> ids;
    for (const auto& c : contacts)
        ids.push_back(c.id);
    return ids;
}

} // namespace

class ContactCollectionTest : public ::testing::Test {
  protected:
    void SetUp() override {
        col_.add(contact("1", "Alice Smith", "alice@x.com", "555-0100"));
        col_.add(contact("2", "Bob Brown", "bob@x.com"));
        col_.add(contact("3", "Carol", "carol@y.org", "alice-line"));
    }

    ContactCollection col_;
};

TEST_F(ContactCollectionTest, AddAppendsInInsertionOrder) {
    col_.add(contact("0", "Aaron", "aaron@x.com"));
    EXPECT_EQ(idsOf(col_.list()), (std::vector<std::string>{"1", "2", "3", "0"}));
    EXPECT_EQ(col_.size(), 4u);
}

TEST_F(ContactCollectionTest, AddDoesNotDeduplicate) {
    col_.add(contact("4", "Alice Smith", "alice@x.com"));
    EXPECT_EQ(col_.size(), 4u);
    EXPECT_EQ(col_.find("alice@x.com").size(), 2u);
}

TEST_F(ContactCollectionTest, RemoveById) {
    EXPECT_TRUE(col_.remove("2"));
    EXPECT_EQ(idsOf(col_.list()), (std::vector<std::string>{"1", "3"}));
}

TEST_F(ContactCollectionTest, RemoveMissingIdReturnsFalse) {
    EXPECT_FALSE(col_.remove("nope"));
    EXPECT_EQ(col_.size(), 3u);
}

TEST_F(ContactCollectionTest, RemoveDropsEveryDuplicateId) {
    col_.add(contact("2", "Bob Again", "bob2@x.com"));
    EXPECT_TRUE(col_.remove("2"));
    EXPECT_EQ(idsOf(col_.list()), (std::vector<std::string>{"1", "3"}));
    EXPECT_FALSE(col_.remove("2"));
}

TEST_F(ContactCollectionTest, FindIsCaseInsensitiveOnName) {
    EXPECT_EQ(idsOf(col_.find("ALICE")), (std::vector<std::string>{"1"}));
    EXPECT_EQ(idsOf(col_.find("brown")), (std::vector<std::string>{"2"}));
}

TEST_F(ContactCollectionTest, FindMatchesEmailAndKeepsOrder) {
    EXPECT_EQ(idsOf(col_.find("@x.com")), (std::vector<std::string>{"1", "2"}));
}

TEST_F(ContactCollectionTest, FindIgnoresPhone) {
    EXPECT_TRUE(col_.find("555").empty());
    // "alice-line" is Carol's phone, not a name or email
    EXPECT_EQ(idsOf(col_.find("alice")), (std::vector<std::string>{"1"}));
}

TEST_F(ContactCollectionTest, FindFoldsNonAsciiCase) {
    col_.add(contact("4", "\xC3\x89mile Zola", "emile@fr.org")); // "Émile Zola"
    col_.add(contact("5", "ZO\xC3\x8B", "zoe@x.com"));            // "ZOË"
    EXPECT_EQ(idsOf(col_.find("\xC3\xA9mile")), (std::vector<std::string>{"4"})); // "émile"
    EXPECT_EQ(idsOf(col_.find("zo\xC3\xAB")), (std::vector<std::string>{"5"}));   // "zoë"
    EXPECT_TRUE(col_.find("\xC3\xA9MILE ZOLA!").empty());
}

TEST_F(ContactCollectionTest, EmptyQueryMatchesEverything) {
    EXPECT_EQ(idsOf(col_.find("")), (std::vector<std::string>{"1", "2", "3"}));
}

TEST_F(ContactCollectionTest, FindByIdReturnsStoredRecord) {
    const Contact* c = col_.findById("3");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->name, "Carol");
    EXPECT_EQ(col_.findById("9"), nullptr);
}

TEST(ContactCollectionEmptyTest, EmptyCollection) {
    ContactCollection col;
    EXPECT_TRUE(col.empty());
    EXPECT_TRUE(col.find("").empty());
    EXPECT_FALSE(col.remove("1"));
}
