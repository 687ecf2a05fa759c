#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "store/file_store.hpp"
#include "test_utils.hpp"

using namespace ifs;
using namespace ifs::store;

class FileStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<FileStore> store;
  const ComponentId id{"a1b2c3d4-e5f6-4a7b-8c9d-0e1f2a3b4c5d"};

  void SetUp() override {
    init_logging();
    test_dir = make_temp_dir("file_store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    store = std::make_unique<FileStore>(test_dir.string());
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  uint64_t publish_string(Version version, const std::string& data) {
    std::stringstream input(data);
    return store->publish(id, version, input);
  }

  static std::string to_string(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
  }
};

TEST_F(FileStoreTest, PublishAndRead) {
  EXPECT_EQ(publish_string(3, "Hello, IFS image!"), 17u);

  EXPECT_TRUE(store->exists(id, 3));
  EXPECT_EQ(store->size(id, 3), 17u);
  EXPECT_EQ(to_string(store->read_range(id, 3, 0, 5)), "Hello");
  EXPECT_EQ(to_string(store->read_range(id, 3, 7, 100)), "IFS image!");
}

TEST_F(FileStoreTest, EmptyImage) {
  EXPECT_EQ(publish_string(1, ""), 0u);
  EXPECT_TRUE(store->exists(id, 1));
  EXPECT_EQ(store->size(id, 1), 0u);
  EXPECT_TRUE(store->read_range(id, 1, 0, 10).empty());
}

TEST_F(FileStoreTest, ReadRangeBounds) {
  publish_string(1, "0123456789");
  EXPECT_TRUE(store->read_range(id, 1, 10, 4).empty());
  EXPECT_THROW(store->read_range(id, 1, 11, 4), RangeError);
}

TEST_F(FileStoreTest, MissingImage) {
  EXPECT_FALSE(store->exists(id, 1));
  EXPECT_THROW(store->size(id, 1), NotFoundError);
  EXPECT_THROW(store->read_range(id, 1, 0, 1), NotFoundError);
  EXPECT_TRUE(store->list_versions(id).empty());
}

TEST_F(FileStoreTest, ListVersions) {
  publish_string(1, "one");
  publish_string(12, "twelve");
  publish_string(4, "four");

  EXPECT_EQ(store->list_versions(id), (std::set<Version>{1, 4, 12}));
  EXPECT_TRUE(store->list_versions(ComponentId("unknown")).empty());
}

TEST_F(FileStoreTest, ListVersionsSkipsNonCanonicalNames) {
  publish_string(0, "zero");
  publish_string(3, "three");

  std::filesystem::path version_dir;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (entry.path().filename() == "3.ifs") {
      version_dir = entry.path().parent_path();
    }
  }
  ASSERT_FALSE(version_dir.empty());
  std::filesystem::copy_file(version_dir / "3.ifs", version_dir / "007.ifs");
  std::filesystem::copy_file(version_dir / "3.ifs", version_dir / "00.ifs");

  // Every listed version must be readable, so "latest" never points at a missing image
  const auto versions = store->list_versions(id);
  EXPECT_EQ(versions, (std::set<Version>{0, 3}));
  for (const auto version : versions) {
    EXPECT_TRUE(store->exists(id, version)) << "version " << version;
  }
}

TEST_F(FileStoreTest, DuplicatePublishKeepsFirstImage) {
  publish_string(1, "first");
  EXPECT_THROW(publish_string(1, "replacement"), AlreadyExistsError);
  EXPECT_EQ(to_string(store->read_range(id, 1, 0, 100)), "first");
}

TEST_F(FileStoreTest, ContentAddressedLayout) {
  publish_string(5, "data");

  // One directory per component, nested by hash prefix, holding the version files and the id file
  std::filesystem::path image;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (entry.path().extension() == ".ifs") {
      image = entry.path();
    }
  }
  ASSERT_FALSE(image.empty());
  EXPECT_EQ(image.filename(), "5.ifs");

  auto relative = std::filesystem::relative(image, std::filesystem::canonical(test_dir));
  EXPECT_EQ(std::distance(relative.begin(), relative.end()), 5);
  EXPECT_EQ(relative.begin()->string().size(), 2u);

  std::ifstream id_file(image.parent_path() / "component_id");
  std::string stored_id;
  std::getline(id_file, stored_id);
  EXPECT_EQ(stored_id, id.str());
}

TEST_F(FileStoreTest, ReopenSeesPublishedImages) {
  publish_string(2, "persisted");
  store = std::make_unique<FileStore>(test_dir.string());
  EXPECT_TRUE(store->exists(id, 2));
  EXPECT_EQ(to_string(store->read_range(id, 2, 0, 100)), "persisted");
}

TEST_F(FileStoreTest, RejectsEmptyComponentId) {
  std::stringstream input("data");
  EXPECT_THROW(store->publish(ComponentId(""), 1, input), InvalidArgumentError);
}
