#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/storage/disk_storage.hpp"

using namespace Vortex::Storage;
namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    static std::string read(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }
};

TEST_F(StorageTest, DiskStorageCreation) {
    DiskStorage storage("test_storage_out");
    EXPECT_TRUE(fs::is_directory("test_storage_out"));
    storage.save("test.json", "{\"a\":1}");

    EXPECT_TRUE(fs::exists("test_storage_out/test.json"));
    EXPECT_EQ(read("test_storage_out/test.json"), "{\"a\":1}");
}

TEST_F(StorageTest, NestedDirectoryCreation) {
    DiskStorage storage("test_storage_out");
    storage.save("deep/path/to/file.json", "{}");

    EXPECT_TRUE(fs::exists("test_storage_out/deep/path/to/file.json"));
}

TEST_F(StorageTest, OverwritesExistingKey) {
    DiskStorage storage("test_storage_out");
    storage.save("page.json", "first version, longer");
    storage.save("page.json", "second");
    EXPECT_EQ(read("test_storage_out/page.json"), "second");
}

TEST_F(StorageTest, BinarySafe) {
    DiskStorage storage("test_storage_out");
    std::string binary_data = {0x00, 0x01, 0x02, 0x03, (char)0xFF};
    storage.save("data.bin", binary_data);

    EXPECT_EQ(read("test_storage_out/data.bin"), binary_data);
}

TEST_F(StorageTest, RejectsKeysOutsideBase) {
    DiskStorage storage("test_storage_out");
    EXPECT_THROW(storage.save("../escape.json", "{}"), StorageError);
    EXPECT_THROW(storage.save("a/../../escape.json", "{}"), StorageError);
    EXPECT_FALSE(fs::exists("escape.json"));
}
