/**
 * 工作区文件列表、读取与结构资源。
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "core/Errors.h"
#include "core/FileQueryEngine.h"
#include "core/Workspace.h"

namespace fs = std::filesystem;

namespace {
void writeFile(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  out << content;
}

class FileQueryEngineTest : public ::testing::Test {
protected:
  fs::path root;
  Workspace workspace;
  std::unique_ptr<FileQueryEngine> engine;

  void SetUp() override {
    root = fs::temp_directory_path() / "tether_file_query_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
    writeFile(root / "README.md", "hello\n");
    writeFile(root / "src" / "main.cpp", "int main() {}\n");
    writeFile(root / "src" / "util" / "a.h", "#pragma once\n");
    writeFile(root / "node_modules" / "pkg" / "index.js", "x");
    writeFile(root / "lines.txt", "zero\none\ntwo\nthree");
    workspace.open(root);
    engine = std::make_unique<FileQueryEngine>(workspace, std::make_shared<ScanIgnoreRules>());
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  static long indexOf(const std::vector<FileEntry>& entries, const std::string& path) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const FileEntry& e) { return e.path == path; });
    return it == entries.end() ? -1 : static_cast<long>(it - entries.begin());
  }
};
}

TEST_F(FileQueryEngineTest, NonRecursiveListsDirectChildrenOnly) {
  auto entries = engine->listFiles(".", false);
  EXPECT_GE(indexOf(entries, "README.md"), 0);
  EXPECT_GE(indexOf(entries, "src"), 0);
  EXPECT_EQ(indexOf(entries, "src/main.cpp"), -1);
  EXPECT_EQ(indexOf(entries, "node_modules"), -1);
}

TEST_F(FileQueryEngineTest, RecursiveListsParentsBeforeChildren) {
  auto entries = engine->listFiles(".", true);
  long src = indexOf(entries, "src");
  long util = indexOf(entries, "src/util");
  long header = indexOf(entries, "src/util/a.h");
  ASSERT_GE(src, 0);
  ASSERT_GE(util, 0);
  ASSERT_GE(header, 0);
  EXPECT_LT(src, util);
  EXPECT_LT(util, header);
  EXPECT_TRUE(entries[static_cast<size_t>(util)].isDirectory);
  EXPECT_EQ(indexOf(entries, "node_modules/pkg/index.js"), -1);

  auto json = FileQueryEngine::toJson(entries);
  EXPECT_EQ(json[static_cast<size_t>(src)]["type"], "directory");
}

TEST_F(FileQueryEngineTest, ListingMissingDirectoryIsNotFound) {
  EXPECT_THROW(engine->listFiles("nope", false), NotFoundError);
  EXPECT_THROW(engine->listFiles("README.md", false), NotFoundError);
}

TEST_F(FileQueryEngineTest, PathsOutsideWorkspaceAreRejected) {
  EXPECT_THROW(engine->listFiles("../..", false), PreconditionError);
  EXPECT_THROW(engine->readFile("../outside.txt"), PreconditionError);
}

TEST_F(FileQueryEngineTest, NoWorkspaceIsPrecondition) {
  Workspace closed;
  FileQueryEngine unopened(closed, nullptr);
  EXPECT_THROW(unopened.listFiles(".", false), PreconditionError);
  EXPECT_THROW(unopened.readFile("README.md"), PreconditionError);
}

TEST_F(FileQueryEngineTest, ReadsWholeFileAndLineRanges) {
  EXPECT_EQ(engine->readFile("README.md"), "hello\n");
  EXPECT_EQ(engine->readFile("lines.txt", "utf-8", 1000, 1, 2), "one\ntwo");
  EXPECT_EQ(engine->readFile("lines.txt", "utf-8", 1000, 2, -1), "two\nthree");
  EXPECT_EQ(engine->readFile("lines.txt", "utf-8", 1000, -1, 0), "zero");
  EXPECT_EQ(engine->readFile("lines.txt", "utf-8", 1000, 3, 99), "three");
}

TEST_F(FileQueryEngineTest, SizeLimitIsCheckedBeforeSlicing) {
  EXPECT_THROW(engine->readFile("lines.txt", "utf-8", 5, 0, 0), ValidationError);
  EXPECT_EQ(engine->readFile("lines.txt", "utf-8", 19, 0, 0), "zero");
}

TEST_F(FileQueryEngineTest, ReadsBase64AndRejectsMissingFile) {
  EXPECT_EQ(engine->readFile("README.md", "base64"), "aGVsbG8K");
  EXPECT_THROW(engine->readFile("missing.txt"), NotFoundError);
  EXPECT_THROW(engine->readFile("src"), NotFoundError);
}

TEST_F(FileQueryEngineTest, StructureSkipsDotEntries) {
  writeFile(root / ".hidden" / "x", "x");
  auto tree = engine->workspaceStructure();
  EXPECT_FALSE(tree.contains(".hidden"));
  ASSERT_TRUE(tree.contains("src"));
  EXPECT_EQ(tree["src"]["type"], "directory");
  EXPECT_EQ(tree["src"]["children"]["main.cpp"]["extension"], ".cpp");
  EXPECT_EQ(tree["README.md"]["size"], 6);
}
