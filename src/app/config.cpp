#include <fadegif/app/config.hpp>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fadegif::app {

namespace fc = fadegif::core;

namespace {

// GIF logical screen dimensions are 16-bit.
constexpr std::uint32_t kMaxGifDimension = 0xFFFF;

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

template <typename T>
std::optional<T> parse_number(std::string_view s) {
  T v{};
  const auto* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, v);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  return v;
}

std::optional<bool> parse_bool(std::string_view s) {
  if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
  if (s == "0" || s == "false" || s == "no" || s == "off") return false;
  return std::nullopt;
}

std::optional<std::vector<std::uint32_t>> parse_list(std::string_view s, std::size_t count) {
  std::vector<std::uint32_t> out;
  while (!s.empty()) {
    const auto comma = s.find(',');
    auto item = s.substr(0, comma);
    while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
    while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
    auto v = parse_number<std::uint32_t>(item);
    if (!v) return std::nullopt;
    out.push_back(*v);
    if (comma == std::string_view::npos) break;
    s.remove_prefix(comma + 1);
  }
  if (out.size() != count) return std::nullopt;
  return out;
}

fc::Error bad_value(std::string_view key, std::string_view value) {
  return fc::Error{fc::PipelineError::InvalidConfig,
                   "invalid value '" + std::string(value) + "' for " + std::string(key)};
}

}  // namespace

PipelineConfig default_config() {
  PipelineConfig c;
  c.canvas = {1920, 1080};
  c.preserve_original = false;
  c.resampling = fc::ResamplingFilter::Lanczos;
  c.quantize_method = fc::QuantizeMethod::MedianCut;
  c.dither = fc::DitherMethod::FloydSteinberg;
  c.palette_mode = fc::PerFramePalette{};
  c.sharpen_strength = 0.f;
  c.fade_steps = 15;
  c.hold_duration_ms = 1000;
  c.fade_duration_ms = 50;
  c.jpeg_quality = 95;
  c.optimize = true;
  return c;
}

std::expected<void, fc::Error> apply_setting(PipelineConfig& c, std::string_view key,
                                             std::string_view value) {
  auto set_u32 = [&](std::uint32_t& field) -> std::expected<void, fc::Error> {
    auto v = parse_number<std::uint32_t>(value);
    if (!v) return std::unexpected(bad_value(key, value));
    field = *v;
    return {};
  };
  auto set_bool = [&](bool& field) -> std::expected<void, fc::Error> {
    auto v = parse_bool(value);
    if (!v) return std::unexpected(bad_value(key, value));
    field = *v;
    return {};
  };

  if (key == "canvas_width") return set_u32(c.canvas.width);
  if (key == "canvas_height") return set_u32(c.canvas.height);
  if (key == "preserve_original") return set_bool(c.preserve_original);
  if (key == "fade_steps") return set_u32(c.fade_steps);
  if (key == "hold_ms") return set_u32(c.hold_duration_ms);
  if (key == "fade_ms") return set_u32(c.fade_duration_ms);
  if (key == "quality") return set_u32(c.jpeg_quality);
  if (key == "optimize") return set_bool(c.optimize);

  if (key == "sharpen") {
    auto v = parse_number<float>(value);
    if (!v) return std::unexpected(bad_value(key, value));
    c.sharpen_strength = *v;
    return {};
  }
  if (key == "resampling") {
    if (value == "lanczos") c.resampling = fc::ResamplingFilter::Lanczos;
    else if (value == "bicubic") c.resampling = fc::ResamplingFilter::Bicubic;
    else if (value == "bilinear") c.resampling = fc::ResamplingFilter::Bilinear;
    else if (value == "nearest") c.resampling = fc::ResamplingFilter::Nearest;
    else return std::unexpected(bad_value(key, value));
    return {};
  }
  if (key == "quantize") {
    if (value == "median-cut") c.quantize_method = fc::QuantizeMethod::MedianCut;
    else if (value == "max-coverage") c.quantize_method = fc::QuantizeMethod::MaximumCoverage;
    else if (value == "octree") c.quantize_method = fc::QuantizeMethod::FastOctree;
    else return std::unexpected(bad_value(key, value));
    return {};
  }
  if (key == "dither") {
    if (value == "floyd-steinberg") c.dither = fc::DitherMethod::FloydSteinberg;
    else if (value == "ordered") c.dither = fc::DitherMethod::Ordered;
    else if (value == "none") c.dither = fc::DitherMethod::None;
    else return std::unexpected(bad_value(key, value));
    return {};
  }
  if (key == "palette") {
    if (value == "per-frame") c.palette_mode = fc::PerFramePalette{};
    else if (value == "global") c.palette_mode = fc::GlobalPalette{};
    else return std::unexpected(bad_value(key, value));
    return {};
  }
  if (key == "crop") {
    if (value.empty() || value == "none") {
      c.crop.reset();
      return {};
    }
    auto v = parse_list(value, 4);
    if (!v) return std::unexpected(bad_value(key, value));
    c.crop = fc::CropRegion{(*v)[0], (*v)[1], (*v)[2], (*v)[3]};
    return {};
  }
  if (key == "crop_preset") {
    auto preset = fc::parse_aspect_preset(value);
    if (!preset) return std::unexpected(bad_value(key, value));
    c.crop = fc::crop_for_preset(*preset);
    return {};
  }
  if (key == "background") {
    auto v = parse_list(value, 3);
    if (!v || (*v)[0] > 255 || (*v)[1] > 255 || (*v)[2] > 255) {
      return std::unexpected(bad_value(key, value));
    }
    c.background = {static_cast<std::uint8_t>((*v)[0]), static_cast<std::uint8_t>((*v)[1]),
                    static_cast<std::uint8_t>((*v)[2])};
    return {};
  }
  if (key == "preview") {
    if (value.empty()) c.preview_path.reset();
    else c.preview_path = std::filesystem::path(std::string(value));
    return {};
  }
  return std::unexpected(fc::Error{fc::PipelineError::InvalidConfig,
                                   "unknown setting " + std::string(key)});
}

std::expected<PipelineConfig, fc::Error> load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (auto applied = apply_setting(c, key, value); !applied) {
      applied.error().message = path + ":" + std::to_string(line_no) + ": " + applied.error().message;
      return std::unexpected(std::move(applied.error()));
    }
  }
  return c;
}

std::expected<void, fc::Error> validate_config(const PipelineConfig& c) {
  auto out_of_range = [](const char* what) {
    return std::unexpected(fc::Error{fc::PipelineError::InvalidConfig,
                                     std::string(what) + " out of range"});
  };
  if (!c.preserve_original &&
      (c.canvas.width == 0 || c.canvas.height == 0 || c.canvas.width > kMaxGifDimension ||
       c.canvas.height > kMaxGifDimension)) {
    return out_of_range("canvas size (1-65535)");
  }
  if (!(c.sharpen_strength >= 0.f && c.sharpen_strength <= 2.f)) {
    return out_of_range("sharpen strength (0.0-2.0)");
  }
  if (c.fade_steps < 5 || c.fade_steps > 50) return out_of_range("fade steps (5-50)");
  if (c.hold_duration_ms < 100 || c.hold_duration_ms > 5000) {
    return out_of_range("hold duration (100-5000 ms)");
  }
  if (c.fade_duration_ms < 10 || c.fade_duration_ms > 500) {
    return out_of_range("fade duration (10-500 ms)");
  }
  if (c.jpeg_quality < 50 || c.jpeg_quality > 100) return out_of_range("quality (50-100)");
  if (c.crop && (c.crop->left >= c.crop->right || c.crop->top >= c.crop->bottom)) {
    return std::unexpected(fc::Error{fc::PipelineError::InvalidCrop,
                                     "crop rectangle is empty"});
  }
  if (const auto* global = std::get_if<fc::GlobalPalette>(&c.palette_mode);
      global && global->palette &&
      (global->palette->empty() || global->palette->size() > fc::kMaxPaletteSize)) {
    return out_of_range("global palette size (1-256)");
  }
  return {};
}

}  // namespace fadegif::app
