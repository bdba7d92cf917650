#include <covermock/app/config.hpp>
#include <array>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace covermock::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

}  // namespace

covermock::core::QuadRegion parse_quad(std::string_view text) {
  std::array<std::int32_t, 8> v{};
  std::stringstream ss{std::string(text)};
  std::string item;
  std::size_t n = 0;
  while (std::getline(ss, item, ',')) {
    trim(item);
    if (n >= v.size()) throw std::invalid_argument("quad: expected 8 integers");
    std::size_t used = 0;
    const int value = std::stoi(item, &used);
    if (used != item.size()) throw std::invalid_argument("quad: not an integer: " + item);
    v[n++] = static_cast<std::int32_t>(value);
  }
  if (n != v.size()) throw std::invalid_argument("quad: expected 8 integers");
  return covermock::core::QuadRegion{{v[0], v[1]}, {v[2], v[3]}, {v[4], v[5]}, {v[6], v[7]}};
}

std::optional<RunnerType> parse_runner_type(std::string_view text) {
  if (text == "sequential") return RunnerType::Sequential;
  if (text == "threads") return RunnerType::Threads;
  if (text == "tbb") return RunnerType::Tbb;
  return std::nullopt;
}

MockupConfig default_config() {
  return MockupConfig{};
}

MockupConfig load_config(const std::string& path) {
  MockupConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "templates_dir") c.templates_dir = value;
    else if (key == "template_extension") c.template_extension = value;
    else if (key == "mask_path") c.mask_path = value;
    else if (key == "covers_dir") c.covers_dir = value;
    else if (key == "output_dir") c.output_dir = value;
    else if (key == "output_suffix") c.output_suffix = value;
    else if (key == "output_extension") c.output_extension = value;
    else if (key == "quad") c.quad = parse_quad(value);
    else if (key == "edge_expand") c.warp.edge_expand = std::stod(value);
    else if (key == "min_splat_radius") c.warp.min_splat_radius = std::stoi(value);
    else if (key == "sample_grid") c.sampler.grid = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "brightness_threshold") {
      c.sampler.brightness_threshold = static_cast<std::uint32_t>(std::stoul(value));
    }
    else if (key == "num_workers") c.num_workers = static_cast<std::size_t>(std::stoul(value));
    else if (key == "runner") {
      if (auto r = parse_runner_type(value)) c.runner = *r;
      else throw std::invalid_argument("runner: expected sequential, threads or tbb");
    }
  }
  return c;
}

std::expected<void, covermock::core::PipelineError> validate_config(const MockupConfig& config) {
  using covermock::core::PipelineError;
  if (config.warp.edge_expand < 0.0 || config.warp.edge_expand >= 0.5) {
    return std::unexpected(PipelineError::InvalidConfig);
  }
  if (config.warp.min_splat_radius < 0) return std::unexpected(PipelineError::InvalidConfig);
  if (config.sampler.grid == 0) return std::unexpected(PipelineError::InvalidConfig);
  if (config.output_extension.empty() || config.output_extension.front() != '.') {
    return std::unexpected(PipelineError::InvalidConfig);
  }
  return {};
}

}  // namespace covermock::app
