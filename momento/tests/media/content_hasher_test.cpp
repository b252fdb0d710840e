#include "media/content_hasher.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace momento {
class ContentHasherTests : public ::testing::Test {
 protected:
  std::filesystem::path dir_;

  void                  SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "momento_content_hasher_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  auto WriteFile(const std::string& name, const std::string& bytes) -> std::filesystem::path {
    auto          path = dir_ / name;
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return path;
  }
};

TEST_F(ContentHasherTests, IdenticalBytesHashEqualRegardlessOfName) {
  auto a = WriteFile("a.jpg", "same bytes");
  auto b = WriteFile("copy_of_a.png", "same bytes");
  EXPECT_EQ(ContentHasher::HashFile(a), ContentHasher::HashFile(b));
}

TEST_F(ContentHasherTests, DifferentBytesHashDiffer) {
  auto a = WriteFile("a.jpg", "first");
  auto b = WriteFile("b.jpg", "second");
  EXPECT_NE(ContentHasher::HashFile(a), ContentHasher::HashFile(b));
}

TEST_F(ContentHasherTests, StreamingMatchesOneShotForMultiBufferFiles) {
  std::string bytes(ContentHasher::kReadBufferSize * 3 + 17, '\0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<char>(i * 31 % 251);
  }
  auto path = WriteFile("large.mp4", bytes);
  EXPECT_EQ(ContentHasher::HashFile(path), Hash128::Compute(bytes.data(), bytes.size()));
}

TEST_F(ContentHasherTests, HexFormRoundTripsAndIs32Chars) {
  auto        path = WriteFile("hex.jpg", "hex");
  auto        hash = ContentHasher::HashFile(path);
  std::string hex  = hash.ToString();
  EXPECT_EQ(hex.size(), 32u);
  EXPECT_EQ(Hash128::FromString(hex), hash);
}

TEST_F(ContentHasherTests, MissingFileThrows) {
  EXPECT_THROW(ContentHasher::HashFile(dir_ / "nope.jpg"), std::runtime_error);
}
};  // namespace momento
