#include "storage/media_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/clock/time_provider.hpp"

namespace momento {
class MediaStoreTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;

  void                  SetUp() override {
    TimeProvider::Refresh();
    root_ = std::filesystem::temp_directory_path() / "momento_media_store_test";
    std::filesystem::remove_all(root_);
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  static auto ReadAll(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  }
};

TEST_F(MediaStoreTests, EnsureLayoutCreatesDirectories) {
  MediaStore store(root_);
  store.EnsureLayout();
  for (const char* dir : {"originals", "thumbnails", "previews", "imports"}) {
    EXPECT_TRUE(std::filesystem::is_directory(root_ / dir)) << dir;
  }
  EXPECT_EQ(store.StagingDir(), root_ / "imports");
  EXPECT_EQ(store.DownloadDir(), root_ / "imports" / ".webdav");
}

TEST_F(MediaStoreTests, OriginalPathUsesCaptureDateAndHashPrefix) {
  MediaStore store(root_);
  store.EnsureLayout();
  const std::string hash = "0123456789abcdef0123456789abcdef";
  auto rel = store.AllocateOriginalPath(hash, std::string("2024-05-12T10:15:00"), "IMG_1.JPG");
  EXPECT_EQ(rel, "originals/2024-05/20240512_101500_0123456789ab.jpg");
}

TEST_F(MediaStoreTests, OriginalPathAvoidsCollisions) {
  MediaStore store(root_);
  store.EnsureLayout();
  const std::string hash  = "fedcba9876543210fedcba9876543210";
  const auto        date  = std::optional<std::string>("2023-01-02T03:04:05");
  auto              first = store.AllocateOriginalPath(hash, date, "a.png");
  std::vector<uint8_t> bytes = {1, 2, 3};
  store.WriteDurably(first, bytes);

  auto second = store.AllocateOriginalPath(hash, date, "a.png");
  EXPECT_NE(first, second);
  EXPECT_EQ(second, "originals/2023-01/20230102_030405_fedcba987654_1.png");
}

TEST_F(MediaStoreTests, OriginalPathWithoutDateFallsUnderCurrentMonth) {
  MediaStore store(root_);
  auto rel   = store.AllocateOriginalPath("00000000000000000000000000000000", std::nullopt,
                                          "clip.MOV");
  auto month = TimeProvider::FormatUtc(TimeProvider::Now(), "%Y-%m");
  EXPECT_EQ(rel.rfind("originals/" + month + "/", 0), 0u);
  EXPECT_EQ(std::filesystem::path(rel).extension(), ".mov");
}

TEST_F(MediaStoreTests, DerivedPathsMirrorOriginalBucket) {
  EXPECT_EQ(MediaStore::ThumbnailRelPath("originals/2024-05/20240512_101500_abc.heic"),
            "thumbnails/2024-05/20240512_101500_abc.jpg");
  EXPECT_EQ(MediaStore::PreviewRelPath("originals/2024-05/20240512_101500_abc.heic"),
            "previews/2024-05/20240512_101500_abc.jpg");
  EXPECT_EQ(MediaStore::ThumbnailRelPath("originals/legacy.jpg"), "thumbnails/unsorted/legacy.jpg");
}

TEST_F(MediaStoreTests, WriteDurablyReplacesContentAndLeavesNoTempFiles) {
  MediaStore           store(root_);
  std::vector<uint8_t> first  = {'o', 'l', 'd'};
  std::vector<uint8_t> second = {'n', 'e', 'w', '!'};
  store.WriteDurably("thumbnails/2024-01/x.jpg", first);
  store.WriteDurably("thumbnails/2024-01/x.jpg", second);

  EXPECT_EQ(ReadAll(root_ / "thumbnails/2024-01/x.jpg"), "new!");
  size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(root_ / "thumbnails/2024-01")) {
    (void)entry;
    ++entries;
  }
  EXPECT_EQ(entries, 1u);
  EXPECT_TRUE(store.Exists(std::string("thumbnails/2024-01/x.jpg")));
  EXPECT_FALSE(store.Exists(std::nullopt));
  EXPECT_FALSE(store.Exists(std::string("thumbnails/2024-01/y.jpg")));
}

TEST_F(MediaStoreTests, WriteDurablyFailureLeavesNoTempFiles) {
  MediaStore store(root_);
  // A non-empty directory at the target path makes the final rename fail
  std::filesystem::create_directories(root_ / "thumbnails/2024-01/blocked.jpg/inner");
  std::vector<uint8_t> bytes = {'x'};
  EXPECT_THROW(store.WriteDurably("thumbnails/2024-01/blocked.jpg", bytes), std::runtime_error);

  size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(root_ / "thumbnails/2024-01")) {
    EXPECT_EQ(entry.path().filename(), "blocked.jpg");
    ++entries;
  }
  EXPECT_EQ(entries, 1u);
}

TEST_F(MediaStoreTests, MoveIntoCreatesParents) {
  MediaStore store(root_);
  store.EnsureLayout();
  auto staged = root_ / "imports" / "photo.jpg";
  {
    std::ofstream out(staged, std::ios::binary);
    out << "pixels";
  }
  auto target = store.Resolve("originals/2022-12/photo.jpg");
  MediaStore::MoveInto(staged, target);
  EXPECT_FALSE(std::filesystem::exists(staged));
  EXPECT_EQ(ReadAll(target), "pixels");

  EXPECT_THROW(MediaStore::MoveInto(staged, target), std::filesystem::filesystem_error);
  EXPECT_NO_THROW(MediaStore::RemoveQuietly(staged));
}
};  // namespace momento
