#include "iconsolve/io/reader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace iconsolve::io {

namespace {
struct FileReader : Reader {
  Result<Bytes> read_all(const std::string& path) override {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return Result<Bytes>::err("not a regular file");

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return Result<Bytes>::err("open failed");

    ifs.seekg(0, std::ios::end);
    std::streamoff size = ifs.tellg();
    if (size < 0) return Result<Bytes>::err("read failed");
    ifs.seekg(0, std::ios::beg);

    Bytes data(static_cast<std::size_t>(size));
    if (size > 0 && !ifs.read(reinterpret_cast<char*>(data.data()), size)) {
      return Result<Bytes>::err("read failed");
    }
    return Result<Bytes>::ok(std::move(data));
  }
};
}

std::unique_ptr<Reader> make_file_reader() {
  return std::make_unique<FileReader>();
}

Result<std::vector<Entry>> list_directory(const std::string& dir) {
  using R = Result<std::vector<Entry>>;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return R::err("not a directory: " + dir);

  std::vector<Entry> entries;
  fs::directory_iterator it(dir, ec);
  if (ec) return R::err("open failed: " + dir + ": " + ec.message());

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const fs::path& p = it->path();
    entries.push_back({p.filename().string(), p.string()});
  }
  if (ec) return R::err("list failed: " + dir + ": " + ec.message());

  std::sort(entries.begin(), entries.end(),
            [](const Entry& a, const Entry& b) { return a.name < b.name; });
  return R::ok(std::move(entries));
}

} // namespace iconsolve::io
