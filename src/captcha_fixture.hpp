#pragma once
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "iconsolve/core/image.hpp"

// 测试共用：合成挑战图、临时目录

namespace iconsolve::fixture {
using iconsolve::core::Rgba;
using iconsolve::core::RgbaImage;

/// '#' 为不透明像素，其余透明
using Shape = std::vector<std::string>;

inline const Shape kL = {
    "#..",
    "#..",
    "#..",
    "###",
};
inline const Shape kLMirrored = {
    "..#",
    "..#",
    "..#",
    "###",
};
inline const Shape kLRotated = {
    "####",
    "#...",
    "#...",
};
inline const Shape kSquare = {
    "###",
    "###",
    "###",
};

constexpr Rgba kDark{64, 64, 64, 255};
constexpr Rgba kLight{240, 240, 240, 255};
constexpr Rgba kInk{200, 30, 30, 255};

inline void paint(RgbaImage& img, std::uint32_t x0, std::uint32_t y0, const Shape& s) {
  for (std::uint32_t y = 0; y < s.size(); ++y) {
    for (std::uint32_t x = 0; x < s[y].size(); ++x) {
      if (s[y][x] == '#') img.put(x0 + x, y0 + y, kInk);
    }
  }
}

/**
 * 每个图标占 slot 列，第 k 个分隔线画在 x = slot * k（整列）。
 * 图标画在槽内偏移 (5, 15) 处。
 */
inline RgbaImage make_captcha(const std::vector<Shape>& shapes, std::uint32_t slot = 20,
                              std::uint32_t height = 50, Rgba divider = kDark) {
  const auto n = static_cast<std::uint32_t>(shapes.size());
  RgbaImage img(slot * n, height);
  for (std::uint32_t k = 1; k < n; ++k) {
    for (std::uint32_t y = 0; y < height; ++y) img.put(slot * k, y, divider);
  }
  for (std::uint32_t k = 0; k < n; ++k) paint(img, slot * k + 5, 15, shapes[k]);
  return img;
}

/// RAII 临时目录
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("iconsolve_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }

  void write(const std::string& name, const std::string& content) const {
    std::ofstream(path_ / name, std::ios::binary) << content;
  }
  void write(const std::string& name, const std::vector<std::uint8_t>& content) const {
    std::ofstream ofs(path_ / name, std::ios::binary);
    ofs.write(reinterpret_cast<const char*>(content.data()),
              static_cast<std::streamsize>(content.size()));
  }

private:
  std::filesystem::path path_;
};

} // namespace iconsolve::fixture
