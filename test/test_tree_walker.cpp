#include "exception.hpp"
#include "fake_remote.hpp"
#include "tree_walker.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

using namespace repostore;

namespace {

std::vector<std::string> paths(const std::vector<file_descriptor>& files) {
  std::vector<std::string> result;
  for (const auto& file : files) result.push_back(file.path);
  return result;
}

}  // namespace

TEST(TreeWalker, EmptyRoot) {
  fake_remote remote;
  EXPECT_TRUE(tree_walker(remote).walk("").empty());
}

TEST(TreeWalker, FlatDirectory) {
  fake_remote remote;
  remote.add_file("a.txt", "a");
  remote.add_file("b.txt", "b");

  auto files = tree_walker(remote).walk("");
  EXPECT_EQ(paths(files), (std::vector<std::string>{"a.txt", "b.txt"}));
  EXPECT_EQ(remote.lists, 1u);
}

TEST(TreeWalker, NestedDirectoriesDepthFirst) {
  fake_remote remote;
  remote.add_file("root/z.txt", "z");
  remote.add_file("root/d1/x.txt", "x");
  remote.add_file("root/d1/d2/d3/deep.txt", "deep");
  remote.add_file("root/a.txt", "a");
  remote.add_file("root/d1/y.txt", "y");

  auto files = tree_walker(remote).walk("root");

  // Listing order, not alphabetical order
  EXPECT_EQ(
      paths(files),
      (std::vector<std::string>{"root/z.txt", "root/d1/x.txt", "root/d1/d2/d3/deep.txt", "root/d1/y.txt", "root/a.txt"}));
  EXPECT_EQ(remote.lists, 4u);
}

TEST(TreeWalker, NoDirectoriesNoDuplicates) {
  fake_remote remote;
  remote.add_file("docs/a.txt", "hello");
  remote.add_file("docs/sub/b.txt", "world");
  remote.add_file("docs/sub/c/d.txt", "!");
  remote.add_file("other/e.txt", "not below docs");

  auto files = tree_walker(remote).walk("docs");

  std::set<std::string> unique;
  for (const auto& file : files) {
    EXPECT_TRUE(file.is_file()) << file.path;
    EXPECT_TRUE(file.url.has_value()) << file.path;
    unique.insert(file.path);
  }
  EXPECT_EQ(unique.size(), files.size());
  EXPECT_EQ(unique, (std::set<std::string>{"docs/a.txt", "docs/sub/b.txt", "docs/sub/c/d.txt"}));
}

TEST(TreeWalker, DirectoryWithOnlySubdirectories) {
  fake_remote remote;
  remote.add_file("a/b/c/file.txt", "x");

  auto files = tree_walker(remote).walk("a");
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].name, "file.txt");
}

TEST(TreeWalker, ListingFailureAbortsWalk) {
  fake_remote remote;
  remote.add_file("docs/a.txt", "hello");
  remote.add_file("docs/sub/deeper/b.txt", "world");
  remote.add_file("docs/z.txt", "z");
  remote.fail_list.insert("docs/sub/deeper");

  EXPECT_THROW(tree_walker(remote).walk("docs"), transport_error);
}

TEST(TreeWalker, MissingRoot) {
  fake_remote remote;
  remote.add_file("docs/a.txt", "hello");

  EXPECT_THROW(tree_walker(remote).walk("nothing"), not_found);
}
