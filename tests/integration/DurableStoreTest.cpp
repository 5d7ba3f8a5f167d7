/**
 * @file DurableStoreTest.cpp
 * @brief Locked load and atomic save against real files
 */

#include <gtest/gtest.h>
#include <sys/stat.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <contactstore/Error.hpp>
#include <contactstore/record/ContactValidator.hpp>
#include <contactstore/repository/DurableStore.hpp>

#include "support/TempDir.hpp"

using namespace ContactStore;
namespace fs = std::filesystem;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeFile(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::trunc);
    out << data;
}

Contact make(const std::string& name, const std::string& email,
             std::optional<std::string> phone = std::nullopt) {
    std::error_code ec;
    auto c = makeContact(name, email, phone, ec);
    EXPECT_TRUE(c) << ec.message();
    return c ? *c : Contact{};
}

/// @brief Store whose final rename always fails, as if the process died right before it
class FailingPublishStore : public DurableStore {
  public:
    int publishCalls = 0;

  protected:
    bool publish(detail::AtomicFileWriter& writer, std::error_code& ec) override {
        ++publishCalls;
        // temp 파일은 완전히 기록되고 sync까지 끝난 상태여야 한다.
        EXPECT_TRUE(fs::exists(writer.tempPath()));
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
};

} // namespace

class DurableStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.valid());
        path_ = dir_.file("contacts.json");
    }

    ContactStoreTest::TempDir dir_;
    std::string path_;
    DurableStore store_;
};

// =============================================================================
// open
// =============================================================================

TEST_F(DurableStoreTest, OpenMissingFileIsEmptyAndCreatesNothing) {
    ContactCollection col;
    col.add(make("Stale", "stale@x.com"));
    std::error_code ec;

    ASSERT_TRUE(store_.open(path_, col, ec)) << ec.message();
    EXPECT_TRUE(col.empty());
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(DurableStoreTest, OpenEmptyFileIsCorrupt) {
    writeFile(path_, "");
    ContactCollection col;
    std::error_code ec;
    ErrorInfo info;
    EXPECT_FALSE(store_.open(path_, col, ec, &info));
    EXPECT_EQ(ec, Errc::CorruptStore);
    EXPECT_FALSE(info.detail.empty());
    EXPECT_TRUE(col.empty());
}

TEST_F(DurableStoreTest, OpenWhitespaceOnlyFileIsCorruptAndLeftAlone) {
    writeFile(path_, "   \n");
    ContactCollection col;
    std::error_code ec;
    EXPECT_FALSE(store_.open(path_, col, ec));
    EXPECT_EQ(ec, Errc::CorruptStore);
    EXPECT_EQ(readFile(path_), "   \n");
}

TEST_F(DurableStoreTest, OpenCorruptFileReportsDiagnosticAndLeavesFile) {
    const std::string garbage = "[{\"id\": \"1\", \"name\": ";
    writeFile(path_, garbage);

    ContactCollection col;
    std::error_code ec;
    ErrorInfo info;
    EXPECT_FALSE(store_.open(path_, col, ec, &info));
    EXPECT_EQ(ec, Errc::CorruptStore);
    EXPECT_TRUE(ec == ErrorKind::CorruptStore);
    EXPECT_EQ(info.path, path_);
    EXPECT_NE(info.detail.find("parse_error"), std::string::npos) << info.detail;
    EXPECT_TRUE(col.empty());
    EXPECT_EQ(readFile(path_), garbage);
}

TEST_F(DurableStoreTest, OpenDirectoryFailsWithIoError) {
    fs::create_directory(path_);
    ContactCollection col;
    std::error_code ec;
    ErrorInfo info;
    EXPECT_FALSE(store_.open(path_, col, ec, &info));
    EXPECT_TRUE(ec == ErrorKind::Io) << ec.message();
    EXPECT_TRUE(info.cause);
}

// =============================================================================
// save
// =============================================================================

TEST_F(DurableStoreTest, RoundTripPreservesRecordsAndOrder) {
    ContactCollection col;
    col.add(make("Zed", "z@x.com", std::string("1")));
    col.add(make("Amy", "a@x.com"));
    col.add(make("Zed", "z@x.com"));

    std::error_code ec;
    ASSERT_TRUE(store_.save(path_, col, ec)) << ec.message();

    ContactCollection back;
    ASSERT_TRUE(store_.open(path_, back, ec)) << ec.message();
    EXPECT_EQ(back.list(), col.list());
}

TEST_F(DurableStoreTest, SaveWithoutChangesIsIdempotent) {
    ContactCollection col;
    col.add(make("Alice", "a@x.com", std::string("123")));
    col.add(make("Bob", "b@x.com"));
    std::error_code ec;
    ASSERT_TRUE(store_.save(path_, col, ec));

    ContactCollection first;
    ASSERT_TRUE(store_.open(path_, first, ec));
    const std::string bytes = readFile(path_);
    ASSERT_TRUE(store_.save(path_, first, ec));

    ContactCollection second;
    ASSERT_TRUE(store_.open(path_, second, ec));
    EXPECT_EQ(second.list(), first.list());
    EXPECT_EQ(readFile(path_), bytes);
}

TEST_F(DurableStoreTest, SaveCreatesMissingParentDirectories) {
    const std::string nested = dir_.file("a/b/c/contacts.json");
    ContactCollection col;
    col.add(make("Alice", "a@x.com"));

    std::error_code ec;
    ASSERT_TRUE(store_.save(nested, col, ec)) << ec.message();
    EXPECT_TRUE(fs::is_regular_file(nested));
}

TEST_F(DurableStoreTest, SaveRelativePathInCurrentDirectory) {
    const fs::path cwd = fs::current_path();
    fs::current_path(dir_.path());

    ContactCollection col;
    col.add(make("Alice", "a@x.com"));
    std::error_code ec;
    bool saved = store_.save("relative.json", col, ec);
    ContactCollection back;
    bool opened = store_.open("relative.json", back, ec);
    fs::current_path(cwd);

    EXPECT_TRUE(saved);
    EXPECT_TRUE(opened);
    EXPECT_EQ(back.size(), 1u);
}

TEST_F(DurableStoreTest, SaveLeavesNoTempFilesBehind) {
    ContactCollection col;
    col.add(make("Alice", "a@x.com"));
    std::error_code ec;
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(store_.save(path_, col, ec));

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(dir_.path())) {
        EXPECT_EQ(e.path().filename().string(), "contacts.json");
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(DurableStoreTest, SaveOverCorruptFileReplacesIt) {
    writeFile(path_, "not json");
    ContactCollection col;
    col.add(make("Alice", "a@x.com"));
    std::error_code ec;
    ASSERT_TRUE(store_.save(path_, col, ec));

    ContactCollection back;
    ASSERT_TRUE(store_.open(path_, back, ec)) << ec.message();
    EXPECT_EQ(back.size(), 1u);
}

TEST_F(DurableStoreTest, ParentPathIsAFileFailsWithCreateDirectoryError) {
    writeFile(dir_.file("blocker"), "x");
    ContactCollection col;
    std::error_code ec;
    ErrorInfo info;
    EXPECT_FALSE(store_.save(dir_.file("blocker/contacts.json"), col, ec, &info));
    EXPECT_EQ(ec, Errc::CreateDirectoryFailed);
    EXPECT_TRUE(ec == ErrorKind::Io);
    EXPECT_EQ(info.path, dir_.file("blocker"));
}

TEST_F(DurableStoreTest, CompactIndentOption) {
    StoreOptions options;
    options.jsonIndent = -1;
    DurableStore compact(options);

    ContactCollection col;
    col.add(Contact{"1", "A", "a@x", std::nullopt});
    std::error_code ec;
    ASSERT_TRUE(compact.save(path_, col, ec));
    EXPECT_EQ(readFile(path_), "[{\"id\":\"1\",\"name\":\"A\",\"email\":\"a@x\",\"phone\":null}]\n");
}

// =============================================================================
// Atomicity
// =============================================================================

TEST_F(DurableStoreTest, FailedRenameKeepsPreviousFileIntact) {
    ContactCollection original;
    original.add(make("Alice", "a@x.com", std::string("123")));
    std::error_code ec;
    ASSERT_TRUE(store_.save(path_, original, ec));
    const std::string before = readFile(path_);

    ContactCollection changed = original;
    changed.add(make("Bob", "b@x.com"));

    FailingPublishStore failing;
    ErrorInfo info;
    EXPECT_FALSE(failing.save(path_, changed, ec, &info));
    EXPECT_EQ(failing.publishCalls, 1);
    EXPECT_EQ(ec, Errc::PersistFailed);
    EXPECT_TRUE(ec == ErrorKind::Persist);
    EXPECT_EQ(info.cause, std::errc::io_error);
    EXPECT_NE(info.detail.find("was removed"), std::string::npos) << info.detail;

    EXPECT_EQ(readFile(path_), before);
    ContactCollection back;
    ASSERT_TRUE(store_.open(path_, back, ec)) << ec.message();
    EXPECT_EQ(back.list(), original.list());

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(dir_.path())) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(DurableStoreTest, FailedFirstSaveLeavesEmptyTargetThatIsReportedCorrupt) {
    FailingPublishStore failing;
    ContactCollection col;
    col.add(make("Alice", "a@x.com"));
    std::error_code ec;
    EXPECT_FALSE(failing.save(path_, col, ec));

    // lock 단계에서 만들어진 빈 target은 빈 store가 아니라 손상된 파일로 보고된다.
    EXPECT_EQ(readFile(path_), "");
    ContactCollection back;
    EXPECT_FALSE(store_.open(path_, back, ec));
    EXPECT_EQ(ec, Errc::CorruptStore);
}
