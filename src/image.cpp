#include "iconsolve/core/image.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace iconsolve::core {

RgbaImage::RgbaImage(std::uint32_t width, std::uint32_t height)
    : width_(width), height_(height),
      pixels_(static_cast<std::size_t>(width) * height) {}

RgbaImage::RgbaImage(std::uint32_t width, std::uint32_t height, std::vector<Rgba> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
  if (pixels_.size() != static_cast<std::size_t>(width) * height) {
    throw std::invalid_argument("pixel count does not match image size");
  }
}

RgbaImage RgbaImage::crop(std::uint32_t x, std::uint32_t y, std::uint32_t w,
                          std::uint32_t h) const {
  if (x >= width_ || y >= height_) return {};
  std::uint32_t cw = std::min(w, width_ - x);
  std::uint32_t ch = std::min(h, height_ - y);
  if (cw == 0 || ch == 0) return {};

  RgbaImage out(cw, ch);
  for (std::uint32_t j = 0; j < ch; ++j) {
    for (std::uint32_t i = 0; i < cw; ++i) {
      out.put(i, j, at(x + i, y + j));
    }
  }
  return out;
}

RgbaImage RgbaImage::trim_transparent() const {
  std::uint32_t min_x = width_, min_y = height_, max_x = 0, max_y = 0;
  bool any = false;
  for (std::uint32_t y = 0; y < height_; ++y) {
    for (std::uint32_t x = 0; x < width_; ++x) {
      if (at(x, y).a == 0) continue;
      any = true;
      min_x = std::min(min_x, x);
      min_y = std::min(min_y, y);
      max_x = std::max(max_x, x);
      max_y = std::max(max_y, y);
    }
  }
  if (!any) return {};

  // 包围盒内只保留不透明像素，其余保持全透明
  RgbaImage out(max_x - min_x + 1, max_y - min_y + 1);
  for (std::uint32_t y = min_y; y <= max_y; ++y) {
    for (std::uint32_t x = min_x; x <= max_x; ++x) {
      const Rgba& p = at(x, y);
      if (p.a != 0) out.put(x - min_x, y - min_y, p);
    }
  }
  return out;
}

RgbaImage RgbaImage::rotate90() const {
  RgbaImage out(height_, width_);
  for (std::uint32_t y = 0; y < height_; ++y) {
    for (std::uint32_t x = 0; x < width_; ++x) {
      out.put(height_ - 1 - y, x, at(x, y));
    }
  }
  return out;
}

RgbaImage RgbaImage::rotate180() const {
  RgbaImage out(width_, height_);
  for (std::uint32_t y = 0; y < height_; ++y) {
    for (std::uint32_t x = 0; x < width_; ++x) {
      out.put(width_ - 1 - x, height_ - 1 - y, at(x, y));
    }
  }
  return out;
}

RgbaImage RgbaImage::rotate270() const {
  RgbaImage out(height_, width_);
  for (std::uint32_t y = 0; y < height_; ++y) {
    for (std::uint32_t x = 0; x < width_; ++x) {
      out.put(y, width_ - 1 - x, at(x, y));
    }
  }
  return out;
}

RgbaImage RgbaImage::flip_horizontal() const {
  RgbaImage out(width_, height_);
  for (std::uint32_t y = 0; y < height_; ++y) {
    for (std::uint32_t x = 0; x < width_; ++x) {
      out.put(width_ - 1 - x, y, at(x, y));
    }
  }
  return out;
}

} // namespace iconsolve::core
