#include "iconsolve/algo/icon_captcha.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "iconsolve/core/logger.hpp"
#include "iconsolve/io/png_codec.hpp"
#include "iconsolve/io/reader.hpp"
#include "iconsolve/util/base64.hpp"

namespace iconsolve::algo {
using iconsolve::core::Logger;
using iconsolve::core::Rgba;

namespace {
bool is_divider(const Rgba& p) {
  auto gray = [&](std::uint8_t v) { return p.r == v && p.g == v && p.b == v; };
  return gray(IconCaptcha::kDividerDark) || gray(IconCaptcha::kDividerLight);
}
}

Result<IconCaptcha> IconCaptcha::from_file(const std::string& path) {
  return io::make_file_reader()->read_all(path).and_then(&IconCaptcha::from_bytes);
}

Result<IconCaptcha> IconCaptcha::from_bytes(const Bytes& data) {
  auto img = io::decode_png(data);
  if (!img) {
    Logger::instance().debug("decode failed: " + img.error());
    return Result<IconCaptcha>::err("invalid image");
  }
  return Result<IconCaptcha>::ok(IconCaptcha(std::move(img.value())));
}

Result<IconCaptcha> IconCaptcha::from_base64(const std::string& text) {
  return util::base64::decode(text).and_then(&IconCaptcha::from_bytes);
}

Result<std::size_t> IconCaptcha::save(const std::string& path) const {
  return io::write_png(img_, path);
}

std::vector<Icon> IconCaptcha::locate() const {
  const std::uint32_t width = img_.width();
  const std::uint32_t height = img_.height();

  std::vector<std::uint32_t> delimiters{0};
  for (std::uint32_t x = 0; height > 0 && x < width; ++x) {
    if (is_divider(img_.at(x, 0))) delimiters.push_back(x);
  }
  delimiters.push_back(width);

  std::vector<Icon> slots;
  for (std::size_t i = 0; i + 1 < delimiters.size(); ++i) {
    std::uint32_t a = delimiters[i];
    std::uint32_t b = delimiters[i + 1];
    // 相邻分隔线之间没有像素列
    if (b < a + 2) continue;

    Icon icon;
    icon.position = static_cast<std::uint32_t>(slots.size()) + 1;
    icon.start = a + 1;
    icon.end = b - 1;
    icon.center_x = (icon.end - icon.start) / 2 + a + 1;
    icon.center_y = height / 2;
    slots.push_back(icon);
  }
  return slots;
}

std::vector<RgbaImage> IconCaptcha::crop_icons(const std::vector<Icon>& slots) const {
  std::vector<RgbaImage> icons;
  icons.reserve(slots.size());
  for (const Icon& s : slots) {
    icons.push_back(img_.crop(s.start, 0, s.end - s.start, kCropHeight).trim_transparent());
  }
  return icons;
}

Result<Icon> IconCaptcha::solve() const {
  std::vector<Icon> slots = locate();
  if (slots.empty()) return Result<Icon>::err("invalid image");
  std::vector<RgbaImage> icons = crop_icons(slots);

  std::vector<std::vector<RgbaImage>> forms_of;
  forms_of.reserve(icons.size());
  for (const RgbaImage& icon : icons) forms_of.push_back(variants(icon));

  std::vector<int> repeats(icons.size(), 0);
  for (std::size_t i = 0; i < icons.size(); ++i) {
    for (std::size_t j = 0; j < icons.size(); ++j) {
      if (i == j) continue;
      const auto& forms = forms_of[j];
      bool hit = std::any_of(forms.begin(), forms.end(),
                             [&](const RgbaImage& f) { return same_silhouette(icons[i], f); });
      if (hit) ++repeats[i];
    }
  }

  // 严格小于：并列时取最左边的
  std::size_t best = 0;
  for (std::size_t i = 1; i < repeats.size(); ++i) {
    if (repeats[i] < repeats[best]) best = i;
  }

  Logger::instance().debug("repeats resolved, picked " + std::to_string(slots[best].position) +
                           " of " + std::to_string(slots.size()));
  return Result<Icon>::ok(slots[best]);
}

std::vector<RgbaImage> variants(const RgbaImage& icon) {
  std::vector<RgbaImage> out{icon, icon.rotate90(), icon.rotate180(), icon.rotate270()};
  out.reserve(8);
  for (std::size_t k = 0; k < 4; ++k) out.push_back(out[k].flip_horizontal());
  return out;
}

bool same_silhouette(const RgbaImage& a, const RgbaImage& b) {
  const auto& pa = a.pixels();
  const auto& pb = b.pixels();
  std::size_t n = std::min(pa.size(), pb.size());
  for (std::size_t k = 0; k < n; ++k) {
    if (pa[k].a != pb[k].a) return false;
  }
  return true;
}

} // namespace iconsolve::algo
