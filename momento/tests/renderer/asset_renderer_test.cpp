#include "renderer/asset_renderer.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <opencv2/imgcodecs.hpp>

namespace momento {
class AssetRendererTests : public ::testing::Test {
 protected:
  std::filesystem::path dir_;

  void                  SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "momento_asset_renderer_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  auto WriteImage(const std::string& name, int width, int height) -> std::filesystem::path {
    auto    path = dir_ / name;
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(10, 200, 90));
    cv::imwrite(path.string(), image);
    return path;
  }
};

TEST_F(AssetRendererTests, ThumbnailIsBoundedAndKeepsAspect) {
  auto                path = WriteImage("wide.png", 1000, 500);
  OpenCVAssetRenderer renderer{PreviewConfig{}};
  auto                bytes = renderer.RenderThumbnail(path, MediaKind::IMAGE, 400, 85);
  ASSERT_FALSE(bytes.empty());
  cv::Mat decoded = cv::imdecode(bytes, cv::IMREAD_COLOR);
  ASSERT_FALSE(decoded.empty());
  EXPECT_EQ(decoded.cols, 400);
  EXPECT_EQ(decoded.rows, 200);
}

TEST_F(AssetRendererTests, SmallImagesAreNotUpscaled) {
  auto                path = WriteImage("small.png", 120, 90);
  OpenCVAssetRenderer renderer{PreviewConfig{}};
  cv::Mat decoded = cv::imdecode(renderer.RenderThumbnail(path, MediaKind::IMAGE, 400, 85),
                                 cv::IMREAD_COLOR);
  EXPECT_EQ(decoded.cols, 120);
  EXPECT_EQ(decoded.rows, 90);
}

TEST_F(AssetRendererTests, PreviewUsesPreviewBound) {
  auto          path = WriteImage("tall.png", 300, 900);
  PreviewConfig config;
  config.max_size_ = 450;
  OpenCVAssetRenderer renderer{config};
  auto                preview = renderer.RenderPreview(path, MediaKind::IMAGE);
  ASSERT_TRUE(std::holds_alternative<std::vector<uint8_t>>(preview));
  cv::Mat decoded = cv::imdecode(std::get<std::vector<uint8_t>>(preview), cv::IMREAD_COLOR);
  EXPECT_EQ(decoded.rows, 450);
  EXPECT_EQ(decoded.cols, 150);
}

TEST_F(AssetRendererTests, VideoPreviewReferencesOriginal) {
  auto path = dir_ / "clip.mp4";
  {
    std::ofstream out(path, std::ios::binary);
    out << "stream";
  }
  OpenCVAssetRenderer renderer{PreviewConfig{}};
  auto                preview = renderer.RenderPreview(path, MediaKind::VIDEO);
  ASSERT_TRUE(std::holds_alternative<PreviewReference>(preview));
  EXPECT_EQ(std::get<PreviewReference>(preview).source_, path);
}

TEST_F(AssetRendererTests, ErrorsCarryCodes) {
  OpenCVAssetRenderer renderer{PreviewConfig{}};
  try {
    renderer.RenderThumbnail(dir_ / "missing.jpg", MediaKind::IMAGE, 400, 85);
    FAIL() << "expected RenderError";
  } catch (const RenderError& e) {
    EXPECT_EQ(e.Code(), RenderErrorCode::NOT_FOUND);
  }

  auto broken = dir_ / "broken.jpg";
  {
    std::ofstream out(broken, std::ios::binary);
    out << "not pixels";
  }
  try {
    renderer.RenderThumbnail(broken, MediaKind::IMAGE, 400, 85);
    FAIL() << "expected RenderError";
  } catch (const RenderError& e) {
    EXPECT_EQ(e.Code(), RenderErrorCode::DECODE_FAILED);
  }
}
};  // namespace momento
