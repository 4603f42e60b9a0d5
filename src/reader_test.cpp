// reader_test.cpp
#include <gtest/gtest.h>

#include "captcha_fixture.hpp"
#include "iconsolve/io/reader.hpp"

using iconsolve::fixture::TempDir;
using iconsolve::io::list_directory;
using iconsolve::io::make_file_reader;

TEST(ReaderTest, ReadsWholeFileAsBytes) {
  TempDir dir;
  dir.write("blob", std::string("\x00\x01\xff\n", 4));

  auto r = make_file_reader()->read_all((dir.path() / "blob").string());
  ASSERT_TRUE(r.has_value()) << r.error();
  EXPECT_EQ(r.value(), (iconsolve::util::Bytes{0x00, 0x01, 0xff, '\n'}));
}

TEST(ReaderTest, EmptyFileIsNotAnError) {
  TempDir dir;
  dir.write("empty", "");
  auto r = make_file_reader()->read_all((dir.path() / "empty").string());
  ASSERT_TRUE(r.has_value()) << r.error();
  EXPECT_TRUE(r.value().empty());
}

TEST(ReaderTest, NonRegularFilesAreErrors) {
  TempDir dir;
  auto reader = make_file_reader();

  auto missing = reader->read_all((dir.path() / "missing").string());
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), "not a regular file");

  EXPECT_FALSE(reader->read_all(dir.str()).has_value());
}

TEST(ListDirectoryTest, ListsEverythingSortedByName) {
  TempDir dir;
  dir.write("b", "x");
  dir.write("a", "x");
  std::filesystem::create_directory(dir.path() / "c");

  auto r = list_directory(dir.str());
  ASSERT_TRUE(r.has_value()) << r.error();
  ASSERT_EQ(r.value().size(), 3u);
  EXPECT_EQ(r.value()[0].name, "a");
  EXPECT_EQ(r.value()[1].name, "b");
  EXPECT_EQ(r.value()[2].name, "c");
  EXPECT_EQ(r.value()[0].path, (dir.path() / "a").string());
}

TEST(ListDirectoryTest, NotADirectory) {
  TempDir dir;
  dir.write("file", "x");
  EXPECT_FALSE(list_directory((dir.path() / "file").string()).has_value());
  EXPECT_FALSE(list_directory((dir.path() / "missing").string()).has_value());
}
