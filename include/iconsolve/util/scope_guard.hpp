#pragma once
#include <type_traits>
#include <utility>

/**
 * @file
 * @brief 作用域守卫（RAII）
 * @ingroup Util
 */

namespace iconsolve::util {

/**
 * @brief 作用域守卫：确保作用域退出时执行清理
 *
 * 用于包裹 C 库资源（如 libpng 的 png_image），失败分支提前 return 时也会释放。
 */
class ScopeGuard {
public:
  template<class F>
  explicit ScopeGuard(F&& f) : fn_(new Model<F>(std::forward<F>(f))) {}

  // 不可拷贝，可移动
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&& other) noexcept : fn_(other.fn_) { other.fn_ = nullptr; }
  ScopeGuard& operator=(ScopeGuard&& other) noexcept {
    if (this != &other) { release(); fn_ = other.fn_; other.fn_ = nullptr; }
    return *this;
  }

  ~ScopeGuard() { release(); }

  /// 放弃清理（资源所有权已转交）
  void dismiss() noexcept { delete fn_; fn_ = nullptr; }

private:
  struct Concept { virtual ~Concept() = default; virtual void call() noexcept = 0; };
  template<class F> struct Model : Concept {
    std::decay_t<F> f;
    explicit Model(F&& ff): f(std::forward<F>(ff)) {}
    void call() noexcept override { f(); }
  };

  void release() noexcept {
    if (fn_) { fn_->call(); delete fn_; fn_ = nullptr; }
  }

  Concept* fn_ = nullptr;
};

} // namespace iconsolve::util
