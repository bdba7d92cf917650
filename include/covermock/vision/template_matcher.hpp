#pragma once

#include <covermock/core/color.hpp>
#include <covermock/core/error.hpp>
#include <expected>
#include <string>
#include <vector>

namespace covermock::vision {

/// One book template: a name, the canonical color it is matched by, and its image file.
struct TemplateEntry {
  std::string name;
  covermock::core::Rgb color;
  std::string path;
};

/// Ordered, read-only set of templates. Build once, share across covers and threads.
/// Declaration order breaks distance ties.
class TemplatePalette {
 public:
  TemplatePalette() = default;

  /// InvalidConfig if two entries share a name.
  [[nodiscard]] static std::expected<TemplatePalette, covermock::core::PipelineError> create(
      std::vector<TemplateEntry> entries);

  [[nodiscard]] const std::vector<TemplateEntry>& entries() const noexcept { return entries_; }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  explicit TemplatePalette(std::vector<TemplateEntry> entries) : entries_(std::move(entries)) {}

  std::vector<TemplateEntry> entries_;
};

/// The six shipped book templates (black, blue, green, red, grey, white),
/// with files at <templates_dir>/<name><extension>.
[[nodiscard]] TemplatePalette default_palette(const std::string& templates_dir,
                                              const std::string& extension = ".png");

/// Entry whose canonical color is nearest \p sample (Euclidean RGB); first wins on ties.
/// NoTemplatesAvailable for an empty palette.
[[nodiscard]] std::expected<TemplateEntry, covermock::core::PipelineError> match_template(
    const covermock::core::Rgb& sample,
    const TemplatePalette& palette);

}  // namespace covermock::vision
