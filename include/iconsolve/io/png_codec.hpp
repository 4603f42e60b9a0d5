#pragma once
#include <cstddef>
#include <string>

#include "iconsolve/core/image.hpp"
#include "iconsolve/util/bytes.hpp"
#include "iconsolve/util/result.hpp"

/**
 * @file
 * @brief PNG 编解码（libpng simplified API）
 * @ingroup IO
 */

namespace iconsolve::io {
using iconsolve::core::RgbaImage;
using iconsolve::util::Bytes;
using iconsolve::util::Result;

/// 解码时允许的最大像素数（RGBA8 下约 512 MiB）
constexpr std::size_t kMaxPixels = std::size_t{512} * 1024 * 1024 / 4;

/**
 * 内存中的 PNG -> RGBA8；任何格式问题都返回 libpng 的错误消息。
 * 头部声明的像素数超过 kMaxPixels 时，在分配缓冲区之前就返回 "image too large"。
 */
Result<RgbaImage> decode_png(const Bytes& data);

/// RGBA8 -> PNG 字节
Result<Bytes> encode_png(const RgbaImage& img);

/// 编码并写入文件，返回写入的字节数
Result<std::size_t> write_png(const RgbaImage& img, const std::string& path);

} // namespace iconsolve::io
