#include <fadegif/gif/quantizer.hpp>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace fadegif::gif {

namespace fc = fadegif::core;

namespace {

constexpr std::size_t kOctreeDepth = 5;
constexpr int kOrderedSpread = 24;

constexpr std::array<std::array<int, 8>, 8> kBayer8 = {{
    {0, 32, 8, 40, 2, 34, 10, 42},
    {48, 16, 56, 24, 50, 18, 58, 26},
    {12, 44, 4, 36, 14, 46, 6, 38},
    {60, 28, 52, 20, 62, 30, 54, 22},
    {3, 35, 11, 43, 1, 33, 9, 41},
    {51, 19, 59, 27, 49, 17, 57, 25},
    {15, 47, 7, 39, 13, 45, 5, 37},
    {63, 31, 55, 23, 61, 29, 53, 21},
}};

struct ColorCount {
  fc::Rgb color;
  std::uint32_t count{0};
};

std::uint32_t pack(fc::Rgb c) noexcept {
  return (static_cast<std::uint32_t>(c.r) << 16) | (static_cast<std::uint32_t>(c.g) << 8) | c.b;
}

fc::Rgb unpack(std::uint32_t key) noexcept {
  return {static_cast<std::uint8_t>(key >> 16), static_cast<std::uint8_t>(key >> 8),
          static_cast<std::uint8_t>(key)};
}

fc::Rgb pixel_at(const fc::Frame& frame, std::size_t i) noexcept {
  const auto px = frame.data().subspan(i * 3, 3);
  return {std::to_integer<std::uint8_t>(px[2]), std::to_integer<std::uint8_t>(px[1]),
          std::to_integer<std::uint8_t>(px[0])};
}

std::uint8_t clamp_channel(int v) noexcept {
  return static_cast<std::uint8_t>(std::clamp(v, 0, 255));
}

/// Distinct colors with pixel counts, sorted by packed key.
std::vector<ColorCount> histogram(const fc::Frame& frame) {
  const std::size_t n = static_cast<std::size_t>(frame.width()) * frame.height();
  std::vector<std::uint32_t> keys(n);
  for (std::size_t i = 0; i < n; ++i) keys[i] = pack(pixel_at(frame, i));
  std::sort(keys.begin(), keys.end());

  std::vector<ColorCount> hist;
  for (std::size_t i = 0; i < n;) {
    std::size_t j = i;
    while (j < n && keys[j] == keys[i]) ++j;
    hist.push_back({unpack(keys[i]), static_cast<std::uint32_t>(j - i)});
    i = j;
  }
  return hist;
}

std::uint8_t channel(fc::Rgb c, int ch) noexcept {
  return ch == 0 ? c.r : (ch == 1 ? c.g : c.b);
}

struct Box {
  std::size_t begin{0};
  std::size_t end{0};
  std::uint64_t pixels{0};
  std::array<std::uint8_t, 3> lo{};
  std::array<std::uint8_t, 3> hi{};

  [[nodiscard]] bool splittable() const noexcept { return end - begin > 1; }
  [[nodiscard]] int longest_channel() const noexcept {
    int best = 0;
    for (int ch = 1; ch < 3; ++ch) {
      if (hi[ch] - lo[ch] > hi[best] - lo[best]) best = ch;
    }
    return best;
  }
  [[nodiscard]] std::uint64_t volume() const noexcept {
    return static_cast<std::uint64_t>(hi[0] - lo[0] + 1) * (hi[1] - lo[1] + 1) *
           (hi[2] - lo[2] + 1);
  }
};

Box make_box(const std::vector<ColorCount>& hist, std::size_t begin, std::size_t end) {
  Box box{begin, end, 0, {255, 255, 255}, {0, 0, 0}};
  for (std::size_t i = begin; i < end; ++i) {
    box.pixels += hist[i].count;
    for (int ch = 0; ch < 3; ++ch) {
      const auto v = channel(hist[i].color, ch);
      box.lo[ch] = std::min(box.lo[ch], v);
      box.hi[ch] = std::max(box.hi[ch], v);
    }
  }
  return box;
}

fc::Rgb weighted_mean(const std::vector<ColorCount>& hist, std::size_t begin, std::size_t end) {
  std::uint64_t r = 0, g = 0, b = 0, total = 0;
  for (std::size_t i = begin; i < end; ++i) {
    r += static_cast<std::uint64_t>(hist[i].color.r) * hist[i].count;
    g += static_cast<std::uint64_t>(hist[i].color.g) * hist[i].count;
    b += static_cast<std::uint64_t>(hist[i].color.b) * hist[i].count;
    total += hist[i].count;
  }
  if (total == 0) return {};
  return {static_cast<std::uint8_t>((r + total / 2) / total),
          static_cast<std::uint8_t>((g + total / 2) / total),
          static_cast<std::uint8_t>((b + total / 2) / total)};
}

/// Box-splitting palette; MedianCut picks the box with most pixels,
/// MaximumCoverage the box with the largest color volume.
std::vector<fc::Rgb> split_boxes(std::vector<ColorCount> hist, fc::QuantizeMethod method) {
  std::vector<Box> boxes{make_box(hist, 0, hist.size())};

  while (boxes.size() < fc::kMaxPaletteSize) {
    std::size_t pick = boxes.size();
    for (std::size_t i = 0; i < boxes.size(); ++i) {
      if (!boxes[i].splittable()) continue;
      if (pick == boxes.size()) {
        pick = i;
        continue;
      }
      const bool better = method == fc::QuantizeMethod::MaximumCoverage
                              ? boxes[i].volume() > boxes[pick].volume()
                              : boxes[i].pixels > boxes[pick].pixels;
      if (better) pick = i;
    }
    if (pick == boxes.size()) break;

    const Box box = boxes[pick];
    const int ch = box.longest_channel();
    std::sort(hist.begin() + static_cast<std::ptrdiff_t>(box.begin),
              hist.begin() + static_cast<std::ptrdiff_t>(box.end),
              [ch](const ColorCount& a, const ColorCount& b) {
                const auto va = channel(a.color, ch);
                const auto vb = channel(b.color, ch);
                return va != vb ? va < vb : pack(a.color) < pack(b.color);
              });

    // Weighted median, keeping at least one color on each side.
    std::uint64_t acc = 0;
    std::size_t mid = box.begin + 1;
    for (std::size_t i = box.begin; i < box.end - 1; ++i) {
      acc += hist[i].count;
      mid = i + 1;
      if (acc * 2 >= box.pixels) break;
    }

    boxes[pick] = make_box(hist, box.begin, mid);
    boxes.push_back(make_box(hist, mid, box.end));
  }

  std::vector<fc::Rgb> colors;
  colors.reserve(boxes.size());
  for (const auto& box : boxes) colors.push_back(weighted_mean(hist, box.begin, box.end));
  return colors;
}

class Octree {
 public:
  explicit Octree(std::size_t depth) : depth_(depth), reducible_(depth) {
    nodes_.emplace_back();
    reducible_[0].push_back(0);
  }

  void insert(fc::Rgb c, std::uint32_t count) {
    std::size_t node = 0;
    for (std::size_t level = 0; level < depth_; ++level) {
      nodes_[node].count += count;
      const int shift = 7 - static_cast<int>(level);
      const int idx = (((c.r >> shift) & 1) << 2) | (((c.g >> shift) & 1) << 1) | ((c.b >> shift) & 1);
      if (nodes_[node].children[idx] < 0) {
        nodes_[node].children[idx] = static_cast<int>(nodes_.size());
        Node child;
        child.leaf = level + 1 == depth_;
        if (child.leaf) ++leaves_;
        else reducible_[level + 1].push_back(nodes_.size());
        nodes_.push_back(child);
      }
      node = static_cast<std::size_t>(nodes_[node].children[idx]);
    }
    Node& leaf = nodes_[node];
    leaf.count += count;
    leaf.r += static_cast<std::uint64_t>(c.r) * count;
    leaf.g += static_cast<std::uint64_t>(c.g) * count;
    leaf.b += static_cast<std::uint64_t>(c.b) * count;
  }

  void reduce_to(std::size_t max_leaves) {
    while (leaves_ > max_leaves) {
      std::size_t level = depth_;
      while (level > 0 && reducible_[level - 1].empty()) --level;
      if (level == 0) break;
      auto& candidates = reducible_[level - 1];
      auto it = std::min_element(candidates.begin(), candidates.end(),
                                 [this](std::size_t a, std::size_t b) {
                                   return nodes_[a].count != nodes_[b].count
                                              ? nodes_[a].count < nodes_[b].count
                                              : a < b;
                                 });
      fold(*it);
      candidates.erase(it);
    }
  }

  [[nodiscard]] std::vector<fc::Rgb> colors() const {
    std::vector<fc::Rgb> out;
    for (const auto& n : nodes_) {
      if (!n.leaf || n.count == 0) continue;
      out.push_back({static_cast<std::uint8_t>((n.r + n.count / 2) / n.count),
                     static_cast<std::uint8_t>((n.g + n.count / 2) / n.count),
                     static_cast<std::uint8_t>((n.b + n.count / 2) / n.count)});
    }
    return out;
  }

 private:
  struct Node {
    std::uint64_t r{0}, g{0}, b{0};
    std::uint64_t count{0};
    std::array<int, 8> children{-1, -1, -1, -1, -1, -1, -1, -1};
    bool leaf{false};
  };

  // Merge all (leaf) children into the node, which becomes a leaf.
  void fold(std::size_t index) {
    Node& node = nodes_[index];
    std::size_t merged = 0;
    node.r = node.g = node.b = 0;
    for (int& child : node.children) {
      if (child < 0) continue;
      const Node& c = nodes_[static_cast<std::size_t>(child)];
      node.r += c.r;
      node.g += c.g;
      node.b += c.b;
      nodes_[static_cast<std::size_t>(child)].count = 0;
      nodes_[static_cast<std::size_t>(child)].leaf = false;
      child = -1;
      ++merged;
    }
    node.leaf = true;
    leaves_ = leaves_ + 1 - merged;
  }

  std::size_t depth_;
  std::vector<Node> nodes_;
  std::vector<std::vector<std::size_t>> reducible_;  // internal nodes per level
  std::size_t leaves_{0};
};

std::vector<fc::Rgb> octree_colors(const std::vector<ColorCount>& hist) {
  Octree tree(kOctreeDepth);
  for (const auto& cc : hist) tree.insert(cc.color, cc.count);
  tree.reduce_to(fc::kMaxPaletteSize);
  return tree.colors();
}

/// Nearest-entry lookup memoized per packed color.
class PaletteMapper {
 public:
  explicit PaletteMapper(const fc::Palette& palette) : palette_(palette) {}

  std::uint8_t operator()(fc::Rgb c) {
    const auto key = pack(c);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
    const auto idx = palette_.nearest(c);
    cache_.emplace(key, idx);
    return idx;
  }

 private:
  const fc::Palette& palette_;
  std::unordered_map<std::uint32_t, std::uint8_t> cache_;
};

void map_plain(const fc::Frame& frame, const fc::Palette& palette,
               std::vector<std::uint8_t>& out) {
  PaletteMapper mapper(palette);
  for (std::size_t i = 0; i < out.size(); ++i) out[i] = mapper(pixel_at(frame, i));
}

void map_ordered(const fc::Frame& frame, const fc::Palette& palette,
                 std::vector<std::uint8_t>& out) {
  PaletteMapper mapper(palette);
  const std::size_t w = frame.width();
  for (std::size_t i = 0; i < out.size(); ++i) {
    const std::size_t x = i % w;
    const std::size_t y = i / w;
    // Threshold in (-spread/2, spread/2), applied equally to all channels.
    const int offset = ((2 * kBayer8[y & 7][x & 7] + 1) * kOrderedSpread) / 128 - kOrderedSpread / 2;
    const auto c = pixel_at(frame, i);
    out[i] = mapper({clamp_channel(c.r + offset), clamp_channel(c.g + offset),
                     clamp_channel(c.b + offset)});
  }
}

void map_floyd_steinberg(const fc::Frame& frame, const fc::Palette& palette,
                         std::vector<std::uint8_t>& out) {
  PaletteMapper mapper(palette);
  const std::size_t w = frame.width();
  const std::size_t h = frame.height();
  // Errors scaled by 16, with one guard column on each side.
  std::vector<std::array<int, 3>> current(w + 2, {0, 0, 0});
  std::vector<std::array<int, 3>> next(w + 2, {0, 0, 0});

  for (std::size_t y = 0; y < h; ++y) {
    for (std::size_t x = 0; x < w; ++x) {
      const std::size_t i = y * w + x;
      const auto c = pixel_at(frame, i);
      const auto& e = current[x + 1];
      const fc::Rgb want{clamp_channel(c.r + e[0] / 16), clamp_channel(c.g + e[1] / 16),
                         clamp_channel(c.b + e[2] / 16)};
      const auto idx = mapper(want);
      out[i] = idx;

      const auto got = palette.colors[idx];
      const std::array<int, 3> err = {want.r - got.r, want.g - got.g, want.b - got.b};
      for (int ch = 0; ch < 3; ++ch) {
        current[x + 2][ch] += err[ch] * 7;
        next[x][ch] += err[ch] * 3;
        next[x + 1][ch] += err[ch] * 5;
        next[x + 2][ch] += err[ch];
      }
    }
    std::swap(current, next);
    std::fill(next.begin(), next.end(), std::array<int, 3>{0, 0, 0});
  }
}

fc::Error bad_frame() {
  return fc::Error{fc::PipelineError::UnsupportedFormat, "quantizer expects a BGR8 frame"};
}

bool usable(const fc::Frame& frame) {
  return !frame.empty() && frame.format() == fc::PixelFormat::BGR8 &&
         frame.size_bytes() >= fc::Frame::min_bytes(frame.width(), frame.height(), frame.format());
}

}  // namespace

Quantizer::Quantizer(fc::QuantizeMethod method, fc::DitherMethod dither)
    : method_(method), dither_(dither) {}

Quantizer::Quantizer(const fc::PipelineConfig& config)
    : Quantizer(config.quantize_method, config.dither) {}

std::expected<fc::Palette, fc::Error> Quantizer::build_palette(const fc::Frame& frame) const {
  if (!usable(frame)) return std::unexpected(bad_frame());

  auto hist = histogram(frame);
  std::vector<fc::Rgb> colors;
  if (hist.size() <= fc::kMaxPaletteSize) {
    colors.reserve(hist.size());
    for (const auto& cc : hist) colors.push_back(cc.color);
  } else if (method_ == fc::QuantizeMethod::FastOctree) {
    colors = octree_colors(hist);
  } else {
    colors = split_boxes(std::move(hist), method_);
  }

  std::sort(colors.begin(), colors.end());
  colors.erase(std::unique(colors.begin(), colors.end()), colors.end());
  return fc::Palette{std::move(colors)};
}

std::expected<fc::IndexedFrame, fc::Error> Quantizer::quantize(
    const fc::Frame& frame, const fc::Palette* shared_palette) const {
  if (!usable(frame)) return std::unexpected(bad_frame());

  fc::IndexedFrame out;
  out.width = frame.width();
  out.height = frame.height();
  out.duration_ms = frame.duration_ms();

  if (shared_palette) {
    if (shared_palette->empty() || shared_palette->size() > fc::kMaxPaletteSize) {
      return std::unexpected(fc::Error{fc::PipelineError::InvalidConfig,
                                       "shared palette must have 1-256 entries"});
    }
    out.palette = *shared_palette;
    out.uses_global_palette = true;
  } else {
    auto palette = build_palette(frame);
    if (!palette) return std::unexpected(std::move(palette.error()));
    out.palette = std::move(*palette);
  }

  out.indices.resize(static_cast<std::size_t>(frame.width()) * frame.height());
  switch (dither_) {
    case fc::DitherMethod::FloydSteinberg:
      map_floyd_steinberg(frame, out.palette, out.indices);
      break;
    case fc::DitherMethod::Ordered:
      map_ordered(frame, out.palette, out.indices);
      break;
    case fc::DitherMethod::None:
    default:
      map_plain(frame, out.palette, out.indices);
      break;
  }
  return out;
}

}  // namespace fadegif::gif
