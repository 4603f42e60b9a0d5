#pragma once
#include <string>
#include <utility>
#include <vector>

#include "iconsolve/core/icon.hpp"
#include "iconsolve/core/image.hpp"
#include "iconsolve/util/bytes.hpp"
#include "iconsolve/util/result.hpp"

/**
 * @file
 * @brief IconCaptcha 挑战图求解
 * @ingroup Algo
 */

namespace iconsolve::algo {
using iconsolve::core::Icon;
using iconsolve::core::RgbaImage;
using iconsolve::util::Bytes;
using iconsolve::util::Result;

/**
 * @brief 一张 IconCaptcha 挑战图
 *
 * 图像是一排被 1 像素分隔线隔开的图标，只有一个图标只出现一次，
 * 其余图标（可能经过旋转、镜像）至少重复一次。solve() 找出那个唯一的图标。
 *
 * @dot
 * digraph solve {
 *   rankdir=LR;
 *   node [shape=plaintext];
 *   locate[label="locate()\n第 0 行找分隔线"];
 *   crop[label="crop_icons()\n裁剪 + 去透明边"];
 *   cmp[label="两两比较 8 种变换"];
 *   pick[label="重复次数最少者"];
 *   locate -> crop -> cmp -> pick;
 * }
 * @enddot
 */
class IconCaptcha {
public:
  /// 分隔线颜色（只比较 RGB）
  static constexpr std::uint8_t kDividerDark = 64;
  static constexpr std::uint8_t kDividerLight = 240;
  /// 每个图标裁剪的最大高度
  static constexpr std::uint32_t kCropHeight = 50;

  explicit IconCaptcha(RgbaImage img) : img_(std::move(img)) {}

  static Result<IconCaptcha> from_file(const std::string& path);
  static Result<IconCaptcha> from_bytes(const Bytes& data);
  static Result<IconCaptcha> from_base64(const std::string& text);

  const RgbaImage& image() const noexcept { return img_; }

  /// 以 PNG 保存挑战图
  Result<std::size_t> save(const std::string& path) const;

  /// 按分隔线划分出的全部图标槽位（从左到右）
  std::vector<Icon> locate() const;

  /// 每个槽位裁剪后的图标（已去掉透明边）
  std::vector<RgbaImage> crop_icons(const std::vector<Icon>& slots) const;

  /// 找出只出现一次的图标；一个槽位都没有时返回 "invalid image"
  Result<Icon> solve() const;

private:
  RgbaImage img_;
};

/// 图标的 8 种变换：4 个旋转角度，以及各自的水平镜像
std::vector<RgbaImage> variants(const RgbaImage& icon);

/// 逐像素比较 alpha，按行优先取两者中较短的长度，完全一致时为 true
bool same_silhouette(const RgbaImage& a, const RgbaImage& b);

} // namespace iconsolve::algo
