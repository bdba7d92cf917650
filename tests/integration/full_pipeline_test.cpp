#include <covermock/app/config.hpp>
#include <covermock/app/cover_runner.hpp>
#include <covermock/core/frame.hpp>
#include <covermock/core/quad.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

namespace ca = covermock::app;
namespace cc = covermock::core;
namespace fs = std::filesystem;

constexpr int kTemplateWidth = 1300;
constexpr int kTemplateHeight = 1950;
const cv::Scalar kTemplateBgr(30, 20, 10);  // RGB (10, 20, 30)

std::vector<cv::Point> quad_polygon(const cc::QuadRegion& q, double scale) {
  auto pt = [scale](const cc::Point& p) {
    return cv::Point(static_cast<int>(p.x * scale), static_cast<int>(p.y * scale));
  };
  return {pt(q.top_left), pt(q.top_right), pt(q.bottom_right), pt(q.bottom_left)};
}

class FullPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = fs::temp_directory_path() / (std::string("covermock_full_") + info->name());
    fs::remove_all(root_);
    fs::create_directories(root_ / "originals");
    fs::create_directories(root_ / "covers");
  }
  void TearDown() override { fs::remove_all(root_); }

  /// Six full-size templates and a half-size mask covering the default face.
  ca::MockupConfig full_size_config() {
    for (const char* name : {"black", "blue", "green", "red", "grey", "white"}) {
      cv::imwrite((root_ / "originals" / (std::string(name) + ".png")).string(),
                  cv::Mat(kTemplateHeight, kTemplateWidth, CV_8UC3, kTemplateBgr));
    }
    cv::Mat mask(kTemplateHeight / 2, kTemplateWidth / 2, CV_8UC1, cv::Scalar(0));
    cv::fillConvexPoly(mask, quad_polygon(cc::default_quad(), 0.5), cv::Scalar(255));
    cv::imwrite((root_ / "mask.png").string(), mask);

    ca::MockupConfig config;
    config.templates_dir = (root_ / "originals").string();
    config.mask_path = (root_ / "mask.png").string();
    config.covers_dir = (root_ / "covers").string();
    config.output_dir = (root_ / "generated_books").string();
    return config;
  }

  /// Small templates with a matching face, for batch runs.
  ca::MockupConfig small_config() {
    for (const char* name : {"black", "blue", "green", "red", "grey", "white"}) {
      cv::imwrite((root_ / "originals" / (std::string(name) + ".png")).string(),
                  cv::Mat(200, 150, CV_8UC3, kTemplateBgr));
    }
    const cc::QuadRegion quad{{30, 40}, {120, 28}, {120, 180}, {30, 166}};
    cv::Mat mask(200, 150, CV_8UC1, cv::Scalar(0));
    cv::fillConvexPoly(mask, quad_polygon(quad, 1.0), cv::Scalar(255));
    cv::imwrite((root_ / "mask.png").string(), mask);

    ca::MockupConfig config;
    config.templates_dir = (root_ / "originals").string();
    config.mask_path = (root_ / "mask.png").string();
    config.covers_dir = (root_ / "covers").string();
    config.output_dir = (root_ / "generated_books").string();
    config.quad = quad;
    return config;
  }

  std::vector<fs::path> output_files() const {
    std::vector<fs::path> files;
    for (const auto& e : fs::directory_iterator(root_ / "generated_books")) {
      files.push_back(e.path());
    }
    return files;
  }

  fs::path root_;
};

}  // namespace

TEST_F(FullPipelineTest, SolidBlueCoverOnBlueTemplate) {
  const ca::MockupConfig config = full_size_config();
  auto context = ca::make_context(config);
  ASSERT_TRUE(context.has_value());

  const std::string cover = (root_ / "covers" / "solid_blue.png").string();
  ASSERT_TRUE(cv::imwrite(cover, cv::Mat(100, 100, CV_8UC3, cv::Scalar(180, 130, 70))));

  const auto outcome = ca::process_cover_file(cover, *context);
  ASSERT_TRUE(outcome.ok()) << covermock::core::to_string(*outcome.error);
  EXPECT_EQ(outcome.template_name, "blue");
  ASSERT_TRUE(outcome.color.has_value());
  EXPECT_EQ(*outcome.color, (cc::Rgb{70, 130, 180}));
  EXPECT_EQ(fs::path(outcome.output_path).filename().string(), "solid_blue_book.png");

  cv::Mat result = cv::imread(outcome.output_path, cv::IMREAD_UNCHANGED);
  ASSERT_FALSE(result.empty());
  ASSERT_EQ(result.cols, kTemplateWidth);
  ASSERT_EQ(result.rows, kTemplateHeight);
  ASSERT_EQ(result.channels(), 4);

  // Cover color inside the face (BGRA on disk).
  const cc::QuadRegion q = cc::default_quad();
  for (double u : {0.2, 0.5, 0.8}) {
    for (double v : {0.2, 0.5, 0.8}) {
      const double tx = q.top_left.x + u * (q.top_right.x - q.top_left.x);
      const double ty = q.top_left.y + u * (q.top_right.y - q.top_left.y);
      const double bx = q.bottom_left.x + u * (q.bottom_right.x - q.bottom_left.x);
      const double by = q.bottom_left.y + u * (q.bottom_right.y - q.bottom_left.y);
      const int x = static_cast<int>(tx + v * (bx - tx));
      const int y = static_cast<int>(ty + v * (by - ty));
      const auto px = result.at<cv::Vec4b>(y, x);
      EXPECT_EQ(px, cv::Vec4b(180, 130, 70, 255)) << "at " << x << "," << y;
    }
  }

  // Untouched template wherever the fitted mask is zero.
  cv::Mat mask = cv::imread(config.mask_path, cv::IMREAD_GRAYSCALE);
  cv::Mat fitted;
  cv::resize(mask, fitted, cv::Size(kTemplateWidth, kTemplateHeight), 0, 0, cv::INTER_LANCZOS4);
  std::size_t zero_pixels = 0;
  for (int y = 0; y < result.rows; ++y) {
    for (int x = 0; x < result.cols; ++x) {
      if (fitted.at<uchar>(y, x) != 0) continue;
      ++zero_pixels;
      ASSERT_EQ(result.at<cv::Vec4b>(y, x), cv::Vec4b(30, 20, 10, 255)) << "at " << x << "," << y;
    }
  }
  EXPECT_GT(zero_pixels, static_cast<std::size_t>(kTemplateWidth) * kTemplateHeight / 2);
}

TEST_F(FullPipelineTest, BatchWithCorruptCoverContinues) {
  const ca::MockupConfig config = small_config();
  cv::imwrite((root_ / "covers" / "first.png").string(),
              cv::Mat(80, 60, CV_8UC3, cv::Scalar(60, 60, 180)));
  cv::imwrite((root_ / "covers" / "second.jpg").string(),
              cv::Mat(80, 60, CV_8UC3, cv::Scalar(60, 120, 60)));
  std::ofstream(root_ / "covers" / "corrupt.png", std::ios::binary) << "\x89PNG not really";

  auto context = ca::make_context(config);
  ASSERT_TRUE(context.has_value());
  auto covers = ca::list_cover_files(config.covers_dir);
  ASSERT_TRUE(covers.has_value());
  ASSERT_EQ(covers->size(), 3u);

  std::vector<std::string> failed;
  const auto summary = ca::run_cover_batch(*covers, *context, [&](const ca::CoverOutcome& o) {
    if (!o.ok()) failed.push_back(fs::path(o.cover_path).filename().string());
  });

  EXPECT_EQ(summary.succeeded, 2u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(failed, std::vector<std::string>{"corrupt.png"});

  const auto outputs = output_files();
  ASSERT_EQ(outputs.size(), 2u);
  for (const auto& p : outputs) {
    EXPECT_EQ(p.extension().string(), ".png");
    EXPECT_NE(p.filename().string(), "corrupt_book.png");
  }
}

TEST_F(FullPipelineTest, ThreadedBatchWithCorruptCoverContinues) {
  const ca::MockupConfig config = small_config();
  cv::imwrite((root_ / "covers" / "one.bmp").string(),
              cv::Mat(50, 40, CV_8UC3, cv::Scalar(30, 30, 30)));
  cv::imwrite((root_ / "covers" / "two.png").string(),
              cv::Mat(50, 40, CV_8UC3, cv::Scalar(120, 120, 120)));
  std::ofstream(root_ / "covers" / "three.jpg", std::ios::binary) << "no jpeg here";

  auto context = ca::make_context(config);
  ASSERT_TRUE(context.has_value());
  auto covers = ca::list_cover_files(config.covers_dir);
  ASSERT_TRUE(covers.has_value());

  const auto summary = ca::run_cover_batch_parallel(*covers, *context, nullptr, 3);
  EXPECT_EQ(summary.succeeded, 2u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(output_files().size(), 2u);
}
