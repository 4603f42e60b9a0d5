#include "iconsolve/algo/solver.hpp"

#include "iconsolve/algo/icon_captcha.hpp"

namespace iconsolve::algo {

Result<Icon> IconCaptchaSolver::solve(const std::string& base64) {
  return IconCaptcha::from_base64(base64).and_then(
      [](const IconCaptcha& captcha) { return captcha.solve(); });
}

} // namespace iconsolve::algo
