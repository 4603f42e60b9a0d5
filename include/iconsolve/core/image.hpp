#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @file
 * @brief RGBA8 图像缓冲与几何变换
 * @ingroup Core
 */

namespace iconsolve::core {

/// @brief 单个像素（RGBA，各 8 位）
struct Rgba {
  std::uint8_t r = 0, g = 0, b = 0, a = 0;
  friend bool operator==(const Rgba&, const Rgba&) = default;
};

/**
 * @brief 行优先存储的 RGBA8 图像
 *
 * 所有变换都返回新图像，不修改自身。
 */
class RgbaImage {
public:
  RgbaImage() = default;
  RgbaImage(std::uint32_t width, std::uint32_t height);
  RgbaImage(std::uint32_t width, std::uint32_t height, std::vector<Rgba> pixels);

  std::uint32_t width() const noexcept { return width_; }
  std::uint32_t height() const noexcept { return height_; }
  bool empty() const noexcept { return pixels_.empty(); }
  const std::vector<Rgba>& pixels() const noexcept { return pixels_; }

  const Rgba& at(std::uint32_t x, std::uint32_t y) const { return pixels_[index(x, y)]; }
  void put(std::uint32_t x, std::uint32_t y, Rgba p) { pixels_[index(x, y)] = p; }

  /// 裁剪；超出边界的部分被截掉（与起点越界时得到空图）
  RgbaImage crop(std::uint32_t x, std::uint32_t y, std::uint32_t w, std::uint32_t h) const;
  /// 收缩到 alpha != 0 像素的包围盒；全透明时返回空图
  RgbaImage trim_transparent() const;

  RgbaImage rotate90() const;   ///< 顺时针 90°
  RgbaImage rotate180() const;
  RgbaImage rotate270() const;  ///< 顺时针 270°
  RgbaImage flip_horizontal() const;

private:
  std::size_t index(std::uint32_t x, std::uint32_t y) const {
    return static_cast<std::size_t>(y) * width_ + x;
  }

  std::uint32_t width_ = 0;
  std::uint32_t height_ = 0;
  std::vector<Rgba> pixels_;
};

} // namespace iconsolve::core
