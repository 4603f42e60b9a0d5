#pragma once
#include <cstdint>
#include <vector>

/**
 * @file
 * @brief 原始字节块
 * @ingroup Util
 */

namespace iconsolve::util {

using Bytes = std::vector<std::uint8_t>;

} // namespace iconsolve::util
