#include <gtest/gtest.h>
#include "audience/data_store.hpp"
#include "audience/local_storage.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace audience;
namespace fs = std::filesystem;

class FileStorageTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("audience_" + std::string{info->name()} + "_" + std::to_string(::getpid()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write_file(const fs::path& path, const std::string& contents) {
        std::ofstream out(path);
        out << contents;
    }
};


TEST_F(FileStorageTest, MissingFileIsEmptyStore) {
    FileDataStore store{dir_ / "store.yaml"};
    EXPECT_EQ(store.size(), 0u);
    EXPECT_FALSE(fs::exists(store.path()));
}

TEST_F(FileStorageTest, ValuesSurviveReopen) {
    {
        FileDataStore store{dir_ / "store.yaml"};
        store.set_string("AAMUserId", "abc123");
        store.set_map("AAMUserProfile", {{"k", "v"}, {"empty", ""}});
        store.set_string("number", "0042");
    }

    FileDataStore reopened{dir_ / "store.yaml"};
    EXPECT_EQ(reopened.get_string("AAMUserId"), "abc123");
    EXPECT_EQ(reopened.get_string("number"), "0042");
    auto profile = reopened.get_map("AAMUserProfile");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->at("k"), "v");
    EXPECT_EQ(profile->at("empty"), "");
}

TEST_F(FileStorageTest, RemoveIsPersisted) {
    {
        FileDataStore store{dir_ / "store.yaml"};
        store.set_string("a", "1");
        store.set_string("b", "2");
        EXPECT_TRUE(store.remove("a"));
    }

    FileDataStore reopened{dir_ / "store.yaml"};
    EXPECT_FALSE(reopened.contains("a"));
    EXPECT_EQ(reopened.get_string("b"), "2");
}

TEST_F(FileStorageTest, LoadsHandWrittenFile) {
    write_file(dir_ / "store.yaml", "AAMUserId: from-disk\nAAMUserProfile:\n  segment: 12\n");

    FileDataStore store{dir_ / "store.yaml"};
    EXPECT_EQ(store.get_string("AAMUserId"), "from-disk");
    EXPECT_EQ(store.get_map("AAMUserProfile"), (StringMap{{"segment", "12"}}));
}

TEST_F(FileStorageTest, MalformedFileThrows) {
    write_file(dir_ / "list.yaml", "- a\n- b\n");
    EXPECT_THROW(FileDataStore{dir_ / "list.yaml"}, StorageError);

    write_file(dir_ / "broken.yaml", "key: [unterminated\n");
    EXPECT_THROW(FileDataStore{dir_ / "broken.yaml"}, StorageError);

    write_file(dir_ / "nested.yaml", "key:\n  - a\n");
    EXPECT_THROW(FileDataStore{dir_ / "nested.yaml"}, StorageError);
}

TEST_F(FileStorageTest, FailedReplaceLeavesNoTemporaryFile) {
    FileDataStore store{dir_ / "store.yaml"};

    // a non-empty directory in place of the file makes the rename fail
    fs::create_directories(dir_ / "store.yaml");
    write_file(dir_ / "store.yaml" / "blocker", "x");

    testing::internal::CaptureStderr();
    store.set_string("key", "value");
    std::string logged = testing::internal::GetCapturedStderr();

    EXPECT_NE(logged.find("flush - Failed to replace"), std::string::npos);
    EXPECT_FALSE(fs::exists(dir_ / "store.yaml.tmp"));
    EXPECT_EQ(store.get_string("key"), "value");
}

TEST_F(FileStorageTest, ServiceCachesStorePerName) {
    LocalStorageService service{dir_ / "stores"};
    EXPECT_TRUE(service.persistent());
    EXPECT_TRUE(fs::is_directory(dir_ / "stores"));

    auto first = service.data_store("AAMDataStore");
    auto second = service.data_store("AAMDataStore");
    auto other = service.data_store("Other");
    ASSERT_TRUE(first);
    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);

    first->set_string("AAMUserId", "abc");
    EXPECT_TRUE(fs::exists(dir_ / "stores" / "AAMDataStore.yaml"));
}

TEST_F(FileStorageTest, ServiceReturnsNullForInvalidName) {
    LocalStorageService service{dir_};
    EXPECT_EQ(service.data_store(""), nullptr);
    EXPECT_EQ(service.data_store("../escape"), nullptr);
    EXPECT_EQ(service.data_store(".."), nullptr);
    EXPECT_EQ(service.data_store("has space"), nullptr);
}

TEST_F(FileStorageTest, ServiceReturnsNullForUnreadableStore) {
    write_file(dir_ / "Broken.yaml", "- not\n- a map\n");
    LocalStorageService service{dir_};
    EXPECT_EQ(service.data_store("Broken"), nullptr);
}

TEST(LocalStorageServiceTest, EmptyRootIsMemoryOnly) {
    LocalStorageService service;
    EXPECT_FALSE(service.persistent());

    auto store = service.data_store("AAMDataStore");
    ASSERT_TRUE(store);
    store->set_string("key", "value");
    EXPECT_EQ(service.data_store("AAMDataStore")->get_string("key"), "value");
}

TEST(LocalStorageServiceTest, NameValidation) {
    EXPECT_TRUE(LocalStorageService::is_valid_name("AAMDataStore"));
    EXPECT_TRUE(LocalStorageService::is_valid_name("store-1.v2_x"));
    EXPECT_FALSE(LocalStorageService::is_valid_name(""));
    EXPECT_FALSE(LocalStorageService::is_valid_name("."));
    EXPECT_FALSE(LocalStorageService::is_valid_name("a/b"));
}
