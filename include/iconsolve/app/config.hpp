#pragma once
#include <optional>
#include <string>

#include "iconsolve/algo/pipeline.hpp"
#include "iconsolve/core/logger.hpp"
#include "iconsolve/util/result.hpp"

/**
 * @file
 * @brief 命令行配置
 * @ingroup App
 */

namespace iconsolve::app {
using iconsolve::algo::OutputFormat;
using iconsolve::core::Level;
using iconsolve::util::Result;

/// @brief 一次运行的全部配置
struct Config {
  std::string directory = "./captchas";  ///< 批处理目录
  std::optional<std::string> image;      ///< 设置后只求解这一张 base64 图像
  OutputFormat format = OutputFormat::Object;
  Level log_level = Level::Error;
  bool help = false;
};

/**
 * @brief 用 getopt_long 解析参数
 *
 * -d/--dir DIR，-i/--img BASE64（也接受 --img=BASE64，去掉引号），
 * -f/--format object|xy，-v/--verbose，-h/--help。
 * 未知选项、多余的位置参数或非法取值返回错误。
 */
Result<Config> parse_args(int argc, char* argv[]);

/// 帮助文本
std::string usage(const std::string& prog);

} // namespace iconsolve::app
