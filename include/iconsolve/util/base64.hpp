#pragma once
#include <string>
#include <string_view>

#include "iconsolve/util/bytes.hpp"
#include "iconsolve/util/result.hpp"

/**
 * @file
 * @brief Base64 编解码（RFC 4648 标准字母表，带 '=' 填充）
 * @ingroup Util
 */

namespace iconsolve::util::base64 {

/** @brief 编码任意字节 */
std::string encode(const Bytes& data);

/**
 * @brief 严格解码
 *
 * 长度必须是 4 的倍数，填充只能出现在末尾且最多两个；
 * 任何非字母表字符都视为错误（"invalid base64"）。
 */
Result<Bytes> decode(std::string_view text);

} // namespace iconsolve::util::base64
