#include <covermock/app/config.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace ca = covermock::app;
namespace cc = covermock::core;
namespace fs = std::filesystem;

namespace {

std::string write_config(const std::string& name, const std::string& text) {
  const fs::path p = fs::temp_directory_path() / ("covermock_cfg_" + name + ".conf");
  std::ofstream f(p);
  f << text;
  return p.string();
}

}  // namespace

TEST(Config, Defaults) {
  const auto c = ca::default_config();
  EXPECT_EQ(c.templates_dir, "originals");
  EXPECT_EQ(c.mask_path, "book_cover_mask_large.png");
  EXPECT_EQ(c.output_dir, "generated_books");
  EXPECT_EQ(c.output_suffix, "_book");
  EXPECT_EQ(c.output_extension, ".png");
  EXPECT_EQ(c.quad, cc::default_quad());
  EXPECT_DOUBLE_EQ(c.warp.edge_expand, 0.02);
  EXPECT_EQ(c.warp.min_splat_radius, 1);
  EXPECT_EQ(c.sampler.grid, 50u);
  EXPECT_EQ(c.sampler.brightness_threshold, 700u);
  EXPECT_EQ(c.runner, ca::RunnerType::Sequential);
  EXPECT_TRUE(ca::validate_config(c).has_value());
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = ca::load_config("/nonexistent/covermock.conf");
  EXPECT_EQ(c.templates_dir, "originals");
}

TEST(Config, ParsesKeys) {
  const auto path = write_config("parses",
                                 "# book mockups\n"
                                 "templates_dir = /srv/books\n"
                                 "mask_path=/srv/mask.png\n"
                                 "\n"
                                 "output_dir = out\n"
                                 "output_suffix = _mock\n"
                                 "quad = 10,20, 30,40, 50,60, 70,80\n"
                                 "edge_expand = 0.05\n"
                                 "min_splat_radius = 2\n"
                                 "sample_grid = 32\n"
                                 "brightness_threshold = 650\n"
                                 "runner = threads\n"
                                 "num_workers = 3\n"
                                 "unknown_key = ignored\n");
  const auto c = ca::load_config(path);
  EXPECT_EQ(c.templates_dir, "/srv/books");
  EXPECT_EQ(c.mask_path, "/srv/mask.png");
  EXPECT_EQ(c.output_dir, "out");
  EXPECT_EQ(c.output_suffix, "_mock");
  EXPECT_EQ(c.quad, (cc::QuadRegion{{10, 20}, {30, 40}, {50, 60}, {70, 80}}));
  EXPECT_DOUBLE_EQ(c.warp.edge_expand, 0.05);
  EXPECT_EQ(c.warp.min_splat_radius, 2);
  EXPECT_EQ(c.sampler.grid, 32u);
  EXPECT_EQ(c.sampler.brightness_threshold, 650u);
  EXPECT_EQ(c.runner, ca::RunnerType::Threads);
  EXPECT_EQ(c.num_workers, 3u);
  fs::remove(path);
}

TEST(Config, MalformedNumberThrows) {
  const auto path = write_config("malformed", "sample_grid = many\n");
  EXPECT_THROW(ca::load_config(path), std::invalid_argument);
  fs::remove(path);
}

TEST(Config, UnknownRunnerThrows) {
  const auto path = write_config("runner", "runner = gpu\n");
  EXPECT_THROW(ca::load_config(path), std::invalid_argument);
  fs::remove(path);
}

TEST(Config, ParseQuadNeedsEightValues) {
  EXPECT_THROW(ca::parse_quad("1,2,3"), std::invalid_argument);
  EXPECT_THROW(ca::parse_quad("1,2,3,4,5,6,7,8,9"), std::invalid_argument);
  EXPECT_EQ(ca::parse_quad("614,374,1200,286,1200,1860,614,1730"), cc::default_quad());
}

TEST(Config, ParseQuadRejectsNonIntegers) {
  EXPECT_THROW(ca::parse_quad("614.9,374,1200,286,1200,1860,614,1730"), std::invalid_argument);
  EXPECT_THROW(ca::parse_quad("614abc,374,1200,286,1200,1860,614,1730"), std::invalid_argument);
  EXPECT_THROW(ca::parse_quad("614,,1200,286,1200,1860,614,1730"), std::invalid_argument);
  EXPECT_EQ(ca::parse_quad(" 614, 374 ,1200,286,1200,1860,614,1730 "), cc::default_quad());
}

TEST(Config, ParseRunnerType) {
  EXPECT_EQ(ca::parse_runner_type("sequential"), ca::RunnerType::Sequential);
  EXPECT_EQ(ca::parse_runner_type("tbb"), ca::RunnerType::Tbb);
  EXPECT_FALSE(ca::parse_runner_type("fast").has_value());
}

TEST(Config, ValidateRejectsOutOfRange) {
  auto c = ca::default_config();
  c.warp.edge_expand = 0.5;
  EXPECT_EQ(ca::validate_config(c).error(), cc::PipelineError::InvalidConfig);

  c = ca::default_config();
  c.sampler.grid = 0;
  EXPECT_EQ(ca::validate_config(c).error(), cc::PipelineError::InvalidConfig);

  c = ca::default_config();
  c.warp.min_splat_radius = -1;
  EXPECT_EQ(ca::validate_config(c).error(), cc::PipelineError::InvalidConfig);

  c = ca::default_config();
  c.output_extension = "png";
  EXPECT_EQ(ca::validate_config(c).error(), cc::PipelineError::InvalidConfig);
}
