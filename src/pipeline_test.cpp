// pipeline_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "captcha_fixture.hpp"
#include "iconsolve/algo/pipeline.hpp"
#include "iconsolve/core/logger.hpp"
#include "iconsolve/io/png_codec.hpp"
#include "iconsolve/util/base64.hpp"

using iconsolve::algo::FunctionSolver;
using iconsolve::algo::IconCaptchaSolver;
using iconsolve::algo::OutputFormat;
using iconsolve::algo::Pipeline;
using iconsolve::algo::format_outcome;
using iconsolve::core::Icon;
using iconsolve::core::Level;
using iconsolve::core::Logger;
using iconsolve::util::Result;
using namespace iconsolve::fixture;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream is(text);
  for (std::string line; std::getline(is, line);) out.push_back(line);
  return out;
}

// 解码文件内容：首字节作为 position；"boom" 抛 std::exception，"odd" 抛 int，"bad" 返回错误
Result<Icon> fake_solve(const std::string& b64) {
  auto bytes = iconsolve::util::base64::decode(b64);
  if (!bytes) return bytes.forward_error<Icon>();
  std::string text(bytes.value().begin(), bytes.value().end());
  if (text == "boom") throw std::runtime_error("solver exploded");
  if (text == "odd") throw 42;
  if (text == "bad") return Result<Icon>::err("invalid image");
  Icon i;
  i.position = text.empty() ? 0u : static_cast<std::uint32_t>(text[0] - '0');
  return Result<Icon>::ok(i);
}

// 把 Logger 和结果输出收集到同一个流里
class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::instance().set_sink(out_);
    Logger::instance().set_level(Level::Error);
  }
  void TearDown() override { Logger::instance().reset_sink(); }

  std::ostringstream out_;
  TempDir dir_;
  std::unique_ptr<iconsolve::io::Reader> reader_ = iconsolve::io::make_file_reader();
};

}

TEST_F(PipelineTest, EmptyDirectoryPrintsNothing) {
  FunctionSolver solver(fake_solve);
  Pipeline p{*reader_, solver, out_};
  auto sum = p.run(dir_.str());

  ASSERT_TRUE(sum.has_value()) << sum.error();
  EXPECT_EQ(sum.value().entries, 0u);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(PipelineTest, OneLinePerEntryInNameOrder) {
  dir_.write("c.bin", "3");
  dir_.write("a.bin", "1");
  dir_.write("b.bin", "2");

  FunctionSolver solver(fake_solve);
  Pipeline p{*reader_, solver, out_};
  auto sum = p.run(dir_.str());
  ASSERT_TRUE(sum.has_value());

  auto lines = lines_of(out_.str());
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_NE(lines[0].find("position: 1,"), std::string::npos);
  EXPECT_NE(lines[1].find("position: 2,"), std::string::npos);
  EXPECT_NE(lines[2].find("position: 3,"), std::string::npos);
  EXPECT_EQ(sum.value().solved, 3u);
}

TEST_F(PipelineTest, FailuresAreIsolatedPerEntry) {
  dir_.write("1_ok", "1");
  std::filesystem::create_directory(dir_.path() / "2_subdir");
  dir_.write("3_boom", "boom");
  dir_.write("4_bad", "bad");
  dir_.write("5_ok", "5");
  dir_.write("6_odd", "odd");
  dir_.write("7_ok", "7");

  FunctionSolver solver(fake_solve);
  Pipeline p{*reader_, solver, out_};
  auto sum = p.run(dir_.str());
  ASSERT_TRUE(sum.has_value());

  auto lines = lines_of(out_.str());
  ASSERT_EQ(lines.size(), 7u);
  EXPECT_NE(lines[0].find("success: true"), std::string::npos);
  EXPECT_EQ(lines[1], "[ERROR] 2_subdir: not a regular file");
  EXPECT_EQ(lines[2], "[ERROR] 3_boom: solver exploded");
  EXPECT_EQ(lines[3], "{ message: 'invalid image', success: false }");
  EXPECT_NE(lines[4].find("position: 5,"), std::string::npos);
  EXPECT_EQ(lines[5], "[ERROR] 6_odd: unknown error");
  EXPECT_NE(lines[6].find("position: 7,"), std::string::npos);

  EXPECT_EQ(sum.value().entries, 7u);
  EXPECT_EQ(sum.value().solved, 3u);
  EXPECT_EQ(sum.value().rejected, 1u);
  EXPECT_EQ(sum.value().failed, 3u);
}

TEST_F(PipelineTest, MissingDirectoryIsAnError) {
  FunctionSolver solver(fake_solve);
  Pipeline p{*reader_, solver, out_};
  auto sum = p.run((dir_.path() / "nope").string());

  EXPECT_FALSE(sum.has_value());
  EXPECT_EQ(lines_of(out_.str()).size(), 1u);
}

TEST_F(PipelineTest, SolvesRealChallengesEndToEnd) {
  auto a = iconsolve::io::encode_png(make_captcha({kL, kLRotated, kSquare, kLMirrored, kL}));
  auto b = iconsolve::io::encode_png(make_captcha({kSquare, kL, kL}));
  ASSERT_TRUE(a.has_value() && b.has_value());
  dir_.write("a.png", a.value());
  dir_.write("b.png", b.value());
  dir_.write("c.png", "definitely not a png");

  IconCaptchaSolver solver;
  Pipeline p{*reader_, solver, out_, OutputFormat::Xy};
  ASSERT_TRUE(p.run(dir_.str()).has_value());

  auto lines = lines_of(out_.str());
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "x: 50, y: 25");
  EXPECT_EQ(lines[1], "x: 10, y: 25");
  EXPECT_EQ(lines[2], "error: invalid image");
}

TEST(FormatOutcomeTest, ObjectAndXyForms) {
  Icon i{3, 41, 59, 50, 25};
  EXPECT_EQ(format_outcome(Result<Icon>::ok(i), OutputFormat::Object),
            "{ position: 3, start: 41, end: 59, center_x: 50, center_y: 25, success: true }");
  EXPECT_EQ(format_outcome(Result<Icon>::ok(i), OutputFormat::Xy), "x: 50, y: 25");
  EXPECT_EQ(format_outcome(Result<Icon>::err("invalid image"), OutputFormat::Object),
            "{ message: 'invalid image', success: false }");
}
