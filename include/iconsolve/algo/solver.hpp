#pragma once
#include <concepts>
#include <string>
#include <utility>

#include "iconsolve/core/icon.hpp"
#include "iconsolve/util/result.hpp"

/**
 * @file
 * @brief 可注入的求解能力
 * @ingroup Algo
 */

namespace iconsolve::algo {
using iconsolve::core::Icon;
using iconsolve::util::Result;

/**
 * @brief 求解接口：base64 图像 -> 图标
 *
 * 无法识别的输入应返回错误 Result；实现也可以抛出 std::exception，
 * Pipeline 对两者都按单个文件处理。
 */
struct Solver {
  virtual ~Solver() = default;
  virtual Result<Icon> solve(const std::string& base64) = 0;
};

/** @brief 可调用对象必须能把 base64 文本变成 Result<Icon> */
template <class F>
concept SolveFn = requires(F f, const std::string& s) {
    { f(s) } -> std::convertible_to<Result<Icon>>;
};

/**
 * @brief 把任意满足 SolveFn 的可调用对象包装成 Solver
 * @tparam F lambda、函数指针等
 */
template <SolveFn F>
class FunctionSolver final : public Solver {
   public:
    explicit FunctionSolver(F f) : f_(std::move(f)) {}
    Result<Icon> solve(const std::string& base64) override { return f_(base64); }

   private:
    F f_;
};

/// 内置实现：IconCaptcha 求解
class IconCaptchaSolver final : public Solver {
   public:
    Result<Icon> solve(const std::string& base64) override;
};

} // namespace iconsolve::algo
