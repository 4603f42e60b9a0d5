#include "iconsolve/io/png_codec.hpp"

#include <png.h>

#include <cstring>
#include <fstream>
#include <utility>
#include <vector>

#include "iconsolve/util/scope_guard.hpp"

namespace iconsolve::io {
using iconsolve::core::Rgba;
using iconsolve::util::ScopeGuard;

namespace {
static_assert(sizeof(Rgba) == 4, "Rgba must be tightly packed");

png_image blank_image() {
  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;
  return image;
}
}

Result<RgbaImage> decode_png(const Bytes& data) {
  if (data.empty()) return Result<RgbaImage>::err("empty input");

  png_image image = blank_image();
  ScopeGuard free_image([&] { png_image_free(&image); });

  if (!png_image_begin_read_from_memory(&image, data.data(), data.size())) {
    return Result<RgbaImage>::err(image.message);
  }
  if (static_cast<std::size_t>(image.width) * image.height > kMaxPixels) {
    return Result<RgbaImage>::err("image too large");
  }
  image.format = PNG_FORMAT_RGBA;

  std::vector<Rgba> pixels(static_cast<std::size_t>(image.width) * image.height);
  if (!png_image_finish_read(&image, nullptr, pixels.data(), 0, nullptr)) {
    return Result<RgbaImage>::err(image.message);
  }
  return Result<RgbaImage>::ok(RgbaImage(image.width, image.height, std::move(pixels)));
}

Result<Bytes> encode_png(const RgbaImage& img) {
  if (img.empty()) return Result<Bytes>::err("cannot encode an empty image");

  png_image image = blank_image();
  ScopeGuard free_image([&] { png_image_free(&image); });
  image.width = img.width();
  image.height = img.height();
  image.format = PNG_FORMAT_RGBA;

  // 先求所需大小，再真正写入
  png_alloc_size_t size = 0;
  if (!png_image_write_to_memory(&image, nullptr, &size, 0, img.pixels().data(), 0, nullptr)) {
    return Result<Bytes>::err(image.message);
  }
  Bytes out(size);
  if (!png_image_write_to_memory(&image, out.data(), &size, 0, img.pixels().data(), 0,
                                 nullptr)) {
    return Result<Bytes>::err(image.message);
  }
  out.resize(size);
  return Result<Bytes>::ok(std::move(out));
}

Result<std::size_t> write_png(const RgbaImage& img, const std::string& path) {
  auto png = encode_png(img);
  if (!png) return png.forward_error<std::size_t>();

  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return Result<std::size_t>::err("open failed: " + path);
  const Bytes& bytes = png.value();
  if (!ofs.write(reinterpret_cast<const char*>(bytes.data()),
                 static_cast<std::streamsize>(bytes.size()))) {
    return Result<std::size_t>::err("write failed: " + path);
  }
  return Result<std::size_t>::ok(bytes.size());
}

} // namespace iconsolve::io
