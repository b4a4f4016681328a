#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/uuid.hpp"
#include "store/branch_store.hpp"

using namespace chatstore;
namespace fs = std::filesystem;

class BranchStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("chatstore_test_" + UUID::generate());
    store_ = std::make_unique<BranchStore>(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  void write_raw(const std::string& id, const std::string& filename, const std::string& content) {
    fs::create_directories(test_dir_ / id);
    std::ofstream file(test_dir_ / id / filename);
    file << content;
  }

  fs::path test_dir_;
  std::unique_ptr<BranchStore> store_;
};

TEST_F(BranchStoreTest, MissingBranchReadsEmpty) {
  EXPECT_TRUE(store_->read_messages("c1", {0}).empty());
  EXPECT_TRUE(store_->read_messages("c1", {3, 1}).empty());
  EXPECT_TRUE(store_->list_branch_keys("c1").empty());
}

TEST_F(BranchStoreTest, WriteAndReadMessages) {
  auto user = Message::user("hi");
  auto reply = Message::assistant("hello");
  reply.set_thinking(std::string("pondering"));

  ASSERT_TRUE(store_->write_messages("c1", {0}, {user, reply}).ok());

  auto loaded = store_->read_messages("c1", {0});
  ASSERT_EQ(loaded.size(), 2);
  EXPECT_EQ(loaded[0].id(), user.id());
  EXPECT_EQ(loaded[0].text(), "hi");
  EXPECT_EQ(loaded[1].role(), Role::Assistant);
  EXPECT_EQ(loaded[1].thinking(), std::optional<std::string>("pondering"));
}

TEST_F(BranchStoreTest, WriteIsFullOverwrite) {
  ASSERT_TRUE(store_->write_messages("c1", {0}, {Message::user("a"), Message::assistant("b")}).ok());
  ASSERT_TRUE(store_->write_messages("c1", {0}, {Message::user("c")}).ok());

  auto loaded = store_->read_messages("c1", {0});
  ASSERT_EQ(loaded.size(), 1);
  EXPECT_EQ(loaded[0].text(), "c");
}

TEST_F(BranchStoreTest, CanonicalFileNames) {
  ASSERT_TRUE(store_->write_messages("c1", {0, 1, 0}, {Message::user("x")}).ok());
  EXPECT_TRUE(fs::exists(test_dir_ / "c1" / "0_1.json"));
  EXPECT_TRUE(store_->exists("c1", {0, 1}));

  // Equivalent coordinates address the same document
  EXPECT_EQ(store_->read_messages("c1", {0, 1}).size(), 1);
  EXPECT_EQ(store_->branch_file("c1", {0, 0}).filename(), "0.json");
}

TEST_F(BranchStoreTest, ListBranchKeysSkipsOtherFiles) {
  ASSERT_TRUE(store_->write_messages("c1", {0}, {}).ok());
  ASSERT_TRUE(store_->write_messages("c1", {1}, {}).ok());
  ASSERT_TRUE(store_->write_messages("c1", {0, 2}, {}).ok());
  write_raw("c1", "metadata.json", "{}");
  write_raw("c1", "settings.json", "{}");
  write_raw("c1", "notes.txt", "hello");
  write_raw("c1", "0.json.tmp", "{");
  write_raw("c1", "draft.json", "{}");
  fs::create_directories(test_dir_ / "c1" / "workspace");

  auto keys = store_->list_branch_keys("c1");
  std::vector<BranchCoordinate> expected = {{0}, {0, 2}, {1}};
  EXPECT_EQ(keys, expected);
}

TEST_F(BranchStoreTest, ListPreservesNonCanonicalKeys) {
  write_raw("c1", "0_1_0.json", R"({"messages": []})");
  auto keys = store_->list_branch_keys("c1");
  ASSERT_EQ(keys.size(), 1);
  EXPECT_EQ(keys[0], BranchCoordinate({0, 1, 0}));
}

TEST_F(BranchStoreTest, CorruptDocumentReadsEmpty) {
  write_raw("c1", "0.json", "{\"messages\": [");
  EXPECT_TRUE(store_->read_messages("c1", {0}).empty());

  write_raw("c1", "1.json", "[1, 2, 3]");
  EXPECT_TRUE(store_->read_messages("c1", {1}).empty());
}

TEST_F(BranchStoreTest, NoTempFileLeftBehind) {
  ASSERT_TRUE(store_->write_messages("c1", {0}, {Message::user("a")}).ok());
  EXPECT_FALSE(fs::exists(test_dir_ / "c1" / "0.json.tmp"));
}

TEST_F(BranchStoreTest, CopyAll) {
  ASSERT_TRUE(store_->write_messages("src", {0}, {Message::user("a")}).ok());
  ASSERT_TRUE(store_->write_messages("src", {1}, {Message::user("b")}).ok());
  write_raw("src", "0_1_0.json", R"({"messages": []})");
  write_raw("src", "metadata.json", "{}");

  ASSERT_TRUE(store_->copy_all("src", "dst").ok());

  auto keys = store_->list_branch_keys("dst");
  std::vector<BranchCoordinate> expected = {{0}, {0, 1, 0}, {1}};
  EXPECT_EQ(keys, expected);
  EXPECT_FALSE(fs::exists(test_dir_ / "dst" / "metadata.json"));

  auto copied = store_->read_messages("dst", {1});
  ASSERT_EQ(copied.size(), 1);
  EXPECT_EQ(copied[0].text(), "b");
}

TEST_F(BranchStoreTest, ReservedFiles) {
  EXPECT_TRUE(BranchStore::is_reserved_file("metadata.json"));
  EXPECT_TRUE(BranchStore::is_reserved_file("settings.json"));
  EXPECT_FALSE(BranchStore::is_reserved_file("0.json"));
}
