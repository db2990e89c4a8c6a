#include "url.hpp"

#include <gtest/gtest.h>

TEST(Url, Parse) {
  repostore::url url("http://www.example.com:8080/path/to/file.html");
  EXPECT_EQ(url.scheme(), "http");
  EXPECT_EQ(url.host(), "www.example.com:8080");
  EXPECT_EQ(url.path(), "/path/to/file.html");
}

TEST(Url, Parse_Query) {
  repostore::url url("https://api.github.com/repos/o/r/contents/a?ref=main");
  EXPECT_EQ(url.scheme(), "https");
  EXPECT_EQ(url.host(), "api.github.com");
  EXPECT_EQ(url.path(), "/repos/o/r/contents/a");
}

TEST(Url, Parse_NoPath) {
  repostore::url url("http://www.example.com");
  EXPECT_EQ(url.scheme(), "http");
  EXPECT_EQ(url.host(), "www.example.com");
  EXPECT_EQ(url.path(), "/");
}

TEST(Url, Parse_NoPath_NoScheme) {
  repostore::url url("www.example.com");
  EXPECT_EQ(url.scheme(), "");
  EXPECT_EQ(url.host(), "www.example.com");
  EXPECT_EQ(url.path(), "/");
}

TEST(Url, Append) {
  repostore::url base("https://api.github.com/");
  EXPECT_EQ(base.append("repos/owner/repo/contents").string(), "https://api.github.com/repos/owner/repo/contents");
  EXPECT_EQ(base.append("").string(), "https://api.github.com");
  EXPECT_EQ(base.append("/docs//sub/").string(), "https://api.github.com/docs/sub");
}

TEST(Url, AppendEscapesSegments) {
  repostore::url base("https://api.github.com/contents");
  EXPECT_EQ(base.append("my docs/a+b.txt").string(), "https://api.github.com/contents/my%20docs/a%2Bb.txt");
  EXPECT_EQ(base.append("q?x#y").string(), "https://api.github.com/contents/q%3Fx%23y");
}

TEST(Url, WithQuery) {
  repostore::url base("https://api.github.com/contents/a");
  EXPECT_EQ(base.with_query("ref", "main").string(), "https://api.github.com/contents/a?ref=main");
  EXPECT_EQ(
      base.with_query("ref", "feature/x").with_query("n", "1").string(),
      "https://api.github.com/contents/a?ref=feature%2Fx&n=1");
}

TEST(Url, Escape) {
  EXPECT_EQ(repostore::escape("AZaz09-_.~"), "AZaz09-_.~");
  EXPECT_EQ(repostore::escape("a b/c"), "a%20b%2Fc");
  EXPECT_EQ(repostore::escape("\xC3\xA9"), "%C3%A9");
}

TEST(Path, Join) {
  EXPECT_EQ(repostore::join_path({"docs", "a.txt"}), "docs/a.txt");
  EXPECT_EQ(repostore::join_path({"", "a.txt"}), "a.txt");
  EXPECT_EQ(repostore::join_path({"/docs/", "/sub/", "b.txt"}), "docs/sub/b.txt");
  EXPECT_EQ(repostore::join_path({"", ""}), "");
}
