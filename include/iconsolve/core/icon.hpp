#pragma once
#include <cstdint>
#include <ostream>

/**
 * @file
 * @brief 求解结果：被选中的图标位置
 * @ingroup Core
 */

namespace iconsolve::core {

/**
 * @brief 挑战图中一个图标的槽位
 *
 * position 从 1 开始；start/end 为图标列范围（不含分隔线），
 * center_x/center_y 为建议的点击坐标。
 */
struct Icon {
  std::uint32_t position = 0;
  std::uint32_t start = 0;
  std::uint32_t end = 0;
  std::uint32_t center_x = 0;
  std::uint32_t center_y = 0;

  friend bool operator==(const Icon&, const Icon&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const Icon& i) {
  return os << "Icon { position: " << i.position << ", start: " << i.start
            << ", end: " << i.end << ", center_x: " << i.center_x
            << ", center_y: " << i.center_y << " }";
}

} // namespace iconsolve::core
