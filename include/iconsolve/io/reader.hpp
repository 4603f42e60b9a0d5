#pragma once
#include <memory>
#include <string>
#include <vector>

#include "iconsolve/util/bytes.hpp"
#include "iconsolve/util/result.hpp"

/**
 * @file
 * @brief IO Reader 接口与目录枚举
 * @ingroup IO
 */

namespace iconsolve::io {
using iconsolve::util::Bytes;
using iconsolve::util::Result;

/// @brief 目录中的一项
struct Entry {
  std::string name;  ///< 文件名（不含目录）
  std::string path;  ///< 可直接打开的路径
};

/** @brief 把一个文件完整读成字节 */
struct Reader {
  virtual ~Reader() = default;
  virtual Result<Bytes> read_all(const std::string& path) = 0;
};

std::unique_ptr<Reader> make_file_reader();

/**
 * @brief 列出目录下所有条目（含子目录等非普通文件），按文件名排序
 *
 * 路径不存在或不是目录时返回错误。
 */
Result<std::vector<Entry>> list_directory(const std::string& dir);

} // namespace iconsolve::io
