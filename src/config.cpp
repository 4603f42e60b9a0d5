#include "iconsolve/app/config.hpp"

#include <getopt.h>

#include <algorithm>
#include <utility>

namespace iconsolve::app {

namespace {
std::string strip_quotes(std::string s) {
  s.erase(std::remove(s.begin(), s.end(), '"'), s.end());
  return s;
}
}

Result<Config> parse_args(int argc, char* argv[]) {
  // 长选项数组最后一个元素必须全 0
  static const struct option long_options[] = {
      {"dir", required_argument, nullptr, 'd'},
      {"img", required_argument, nullptr, 'i'},
      {"format", required_argument, nullptr, 'f'},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  Config cfg;
  // getopt 使用全局状态，允许重复解析（测试中多次调用）
  optind = 0;
  opterr = 0;

  int c;
  int option_index = 0;
  while ((c = getopt_long(argc, argv, "d:i:f:vh", long_options, &option_index)) != -1) {
    switch (c) {
      case 'd':
        cfg.directory = optarg;
        break;
      case 'i':
        cfg.image = strip_quotes(optarg);
        break;
      case 'f': {
        std::string f = optarg;
        if (f == "object") {
          cfg.format = OutputFormat::Object;
        } else if (f == "xy") {
          cfg.format = OutputFormat::Xy;
        } else {
          return Result<Config>::err("unknown format: " + f);
        }
        break;
      }
      case 'v':
        cfg.log_level = core::Level::Debug;
        break;
      case 'h':
        cfg.help = true;
        break;
      case '?':
      default:
        if (optopt) {
          return Result<Config>::err(std::string("invalid or incomplete option: -") +
                                     static_cast<char>(optopt));
        }
        return Result<Config>::err(std::string("invalid option: ") + argv[optind - 1]);
    }
  }

  if (optind < argc) {
    return Result<Config>::err(std::string("unexpected argument: ") + argv[optind]);
  }
  if (cfg.image && cfg.image->empty()) return Result<Config>::err("empty image");
  return Result<Config>::ok(std::move(cfg));
}

std::string usage(const std::string& prog) {
  return "usage: " + prog +
         " [-d DIR] [-i BASE64 | --img=BASE64] [-f object|xy] [-v] [-h]\n"
         "  -d, --dir DIR        solve every file in DIR (default ./captchas)\n"
         "  -i, --img BASE64     solve a single base64-encoded image\n"
         "  -f, --format FMT     output format: object (default) or xy\n"
         "  -v, --verbose        debug logging on stderr\n"
         "  -h, --help           show this help\n";
}

} // namespace iconsolve::app
