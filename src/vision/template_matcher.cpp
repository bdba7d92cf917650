#include <covermock/vision/template_matcher.hpp>
#include <filesystem>
#include <limits>
#include <unordered_set>

namespace covermock::vision {

namespace cc = covermock::core;

std::expected<TemplatePalette, cc::PipelineError> TemplatePalette::create(
    std::vector<TemplateEntry> entries) {
  std::unordered_set<std::string> names;
  for (const auto& e : entries) {
    if (!names.insert(e.name).second) {
      return std::unexpected(cc::PipelineError::InvalidConfig);
    }
  }
  return TemplatePalette(std::move(entries));
}

TemplatePalette default_palette(const std::string& templates_dir, const std::string& extension) {
  const std::filesystem::path dir(templates_dir);
  auto entry = [&](const char* name, cc::Rgb color) {
    return TemplateEntry{name, color, (dir / (std::string(name) + extension)).string()};
  };
  // Names below are unique, so create() cannot fail.
  return TemplatePalette::create({
      entry("black", {30, 30, 30}),
      entry("blue", {70, 130, 180}),
      entry("green", {60, 120, 60}),
      entry("red", {180, 60, 60}),
      entry("grey", {120, 120, 120}),
      entry("white", {240, 240, 240}),
  }).value();
}

std::expected<TemplateEntry, cc::PipelineError> match_template(const cc::Rgb& sample,
                                                              const TemplatePalette& palette) {
  if (palette.empty()) {
    return std::unexpected(cc::PipelineError::NoTemplatesAvailable);
  }

  const TemplateEntry* best = nullptr;
  double best_distance = std::numeric_limits<double>::infinity();
  for (const auto& e : palette.entries()) {
    const double d = cc::color_distance(sample, e.color);
    if (d < best_distance) {
      best_distance = d;
      best = &e;
    }
  }
  return *best;
}

}  // namespace covermock::vision
