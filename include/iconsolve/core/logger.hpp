#pragma once
#include <iosfwd>
#include <memory>
#include <string>

/**
 * @file
 * @brief 线程安全 Logger（PImpl）
 * @ingroup Core
 */

namespace iconsolve::core {

/// @brief 日志级别，数值越小越详细
enum class Level { Debug = 0, Info = 1, Error = 2 };

/**
 * @brief 线程安全的 Logger（PImpl）
 *
 * 每条日志一行：`[TAG] message`。默认输出到 std::cerr，只打印 Error。
 */
class Logger {
public:
  static Logger& instance();                  ///< 单例
  void set_level(Level level);
  Level level() const;
  void set_sink(std::ostream& os);            ///< 替换输出流（测试用）
  void reset_sink();                          ///< 恢复为 std::cerr

  void debug(const std::string& msg) const;
  void info(const std::string& msg) const;
  void error(const std::string& msg) const;

  Logger(Logger&&) noexcept;
  Logger& operator=(Logger&&) noexcept;
  ~Logger();

  // 不可拷贝
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
  Logger();                                   // 私有构造
};

} // namespace iconsolve::core
