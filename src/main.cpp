#include <iostream>

#include "iconsolve/algo/pipeline.hpp"
#include "iconsolve/algo/solver.hpp"
#include "iconsolve/app/config.hpp"
#include "iconsolve/core/logger.hpp"
#include "iconsolve/io/reader.hpp"
#include "iconsolve/util/scope_guard.hpp"

using iconsolve::algo::IconCaptchaSolver;
using iconsolve::algo::Pipeline;
using iconsolve::algo::format_outcome;
using iconsolve::app::Config;
using iconsolve::core::Logger;
using iconsolve::io::make_file_reader;
using iconsolve::util::ScopeGuard;

namespace {

/// @brief 单张图像模式
int solve_one(const Config& cfg, IconCaptchaSolver& solver) {
  auto outcome = solver.solve(*cfg.image);
  std::cout << format_outcome(outcome, cfg.format) << "\n";
  return outcome ? 0 : 1;
}

/// @brief 目录批处理模式
int solve_dir(const Config& cfg, IconCaptchaSolver& solver) {
  auto reader = make_file_reader();
  Pipeline p{*reader, solver, std::cout, cfg.format};
  auto sum = p.run(cfg.directory);
  return sum ? 0 : 1;
}

}

int main(int argc, char* argv[]) {
  auto cfg = iconsolve::app::parse_args(argc, argv);
  if (!cfg) {
    Logger::instance().error(cfg.error());
    std::cerr << iconsolve::app::usage(argv[0]);
    return 1;
  }
  if (cfg.value().help) {
    std::cout << iconsolve::app::usage(argv[0]);
    return 0;
  }

  Logger::instance().set_level(cfg.value().log_level);
  auto flush = ScopeGuard([] { std::cout.flush(); });

  IconCaptchaSolver solver;
  if (cfg.value().image) return solve_one(cfg.value(), solver);
  return solve_dir(cfg.value(), solver);
}
