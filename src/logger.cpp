#include "iconsolve/core/logger.hpp"
#include <iostream>
#include <mutex>

namespace iconsolve::core {

struct Logger::Impl {
  Level level = Level::Error;
  std::ostream* sink = &std::cerr;
  mutable std::mutex m;

  void log(Level at, const char* tag, const std::string& msg) const {
    std::lock_guard<std::mutex> lk(m);
    if (at < level) return;
    *sink << "[" << tag << "] " << msg << "\n";
    sink->flush();
  }
};

Logger::Logger(): p_(std::make_unique<Impl>()) {}
Logger::~Logger() = default;
Logger::Logger(Logger&& o) noexcept = default;
Logger& Logger::operator=(Logger&& o) noexcept = default;

Logger& Logger::instance() {
  static Logger g;
  return g;
}

void Logger::set_level(Level level) {
  std::lock_guard<std::mutex> lk(p_->m);
  p_->level = level;
}

Level Logger::level() const {
  std::lock_guard<std::mutex> lk(p_->m);
  return p_->level;
}

void Logger::set_sink(std::ostream& os) {
  std::lock_guard<std::mutex> lk(p_->m);
  p_->sink = &os;
}

void Logger::reset_sink() { set_sink(std::cerr); }

void Logger::debug(const std::string& msg) const { p_->log(Level::Debug, "DEBUG", msg); }
void Logger::info(const std::string& msg) const { p_->log(Level::Info, "INFO", msg); }
void Logger::error(const std::string& msg) const { p_->log(Level::Error, "ERROR", msg); }

} // namespace iconsolve::core
