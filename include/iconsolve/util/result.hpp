#pragma once
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

/**
 * @file
 * @brief 轻量 Result<T>：值或错误消息
 * @ingroup Util
 */

namespace iconsolve::util {

template<class T> class Result;

namespace detail {
template<class R> struct is_result : std::false_type {};
template<class U> struct is_result<Result<U>> : std::true_type {};
}

/**
 * @brief 成功时含值，失败时含错误消息
 *
 * 失败沿调用链原样传递：and_then() 只在成功时继续，
 * forward_error() 用于换成另一种值类型后提前返回。
 */
template<class T>
class Result {
public:
  using value_type = T;

  static Result ok(T v) { return Result(std::move(v), {}); }
  static Result err(std::string e) { return Result(std::nullopt, std::move(e)); }

  bool has_value() const noexcept { return val_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  T& value() { return *val_; }
  const T& value() const { return *val_; }
  const std::string& error() const { return err_; }

  T value_or(T fallback) const { return val_ ? *val_ : std::move(fallback); }

  template<class U>
  Result<U> forward_error() const { return Result<U>::err(err_); }

  /// 成功时把值交给 f（f 必须返回某种 Result），失败时直接转发错误
  template<class F>
  auto and_then(F&& f) const -> std::invoke_result_t<F, const T&> {
    using R = std::invoke_result_t<F, const T&>;
    static_assert(detail::is_result<R>::value, "and_then() needs a function returning Result");
    if (!val_) return R::err(err_);
    return std::forward<F>(f)(*val_);
  }

private:
  std::optional<T> val_;
  std::string err_;
  Result(std::optional<T> v, std::string e): val_(std::move(v)), err_(std::move(e)) {}
};

} // namespace iconsolve::util
