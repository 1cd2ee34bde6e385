/**
 * 编辑工具:create_file / replace_lines / type_into_file。
 * 宿主编辑器用记录调用的假实现替换。
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/Errors.h"
#include "mcp/McpServer.h"
#include "tools/EditTools.h"
#include "tools/SchemaValidator.h"
#include "tools/ToolRegistry.h"
#include "tools/ToolContext.h"

namespace fs = std::filesystem;

namespace {
std::string readAll(const fs::path& p) {
  std::ifstream f(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

class RecordingHost : public IEditorHost {
public:
  std::vector<fs::path> shown;
  size_t revealed = 0;
  size_t failAfter = 0;   // 0: 不失败

  void showDocument(const fs::path& path) override { shown.push_back(path); }
  void openFolder(const fs::path&) override {}
  void focus() override {}
  std::vector<std::string> typed;

  void revealTypedCharacter(const fs::path&, size_t, size_t, const std::string& ch) override {
    if (failAfter > 0 && revealed == failAfter) {
      throw std::runtime_error("editor closed");
    }
    ++revealed;
    typed.push_back(ch);
  }
};

class NullShell : public IShellSession {
public:
  bool supportsOutputCapture() const override { return true; }
  std::string execute(const std::string&, std::chrono::milliseconds) override { return ""; }
  void sendText(const std::string&) override {}
};

class EditToolsTest : public ::testing::Test {
protected:
  fs::path root;
  std::shared_ptr<RecordingHost> host = std::make_shared<RecordingHost>();
  std::shared_ptr<ToolContext> ctx;

  void SetUp() override {
    root = fs::temp_directory_path() / "tether_edit_tools_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
    ctx = ToolContext::create(Config::defaults(), std::make_shared<Workspace>(root), host,
                              std::make_shared<NullShell>(), {root});
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void write(const std::string& rel, const std::string& content) {
    std::ofstream out(root / rel, std::ios::binary);
    out << content;
  }

  ToolResult run(ITool& tool, const nlohmann::json& args) {
    auto validation = SchemaValidator::validate(tool.getSchema(), args);
    EXPECT_TRUE(validation.valid) << validation.error;
    return tool.execute(validation.args);
  }
};
}

TEST_F(EditToolsTest, CreateFileMakesParentsAndOpensDocument) {
  CreateFileTool tool(ctx);
  auto result = run(tool, {{"path", "a/b/new.txt"}, {"content", "hi"}});
  EXPECT_FALSE(result.isError);
  EXPECT_EQ(readAll(root / "a" / "b" / "new.txt"), "hi");
  ASSERT_EQ(host->shown.size(), 1u);
  EXPECT_EQ(host->shown[0].filename(), "new.txt");
  EXPECT_NE(result.content[0]["text"].get<std::string>().find("created"), std::string::npos);
}

TEST_F(EditToolsTest, CreateFileConflictRules) {
  write("x.txt", "old");
  CreateFileTool tool(ctx);

  EXPECT_THROW(run(tool, {{"path", "x.txt"}, {"content", "new"}}), PreconditionError);
  EXPECT_EQ(readAll(root / "x.txt"), "old");

  auto kept = run(tool, {{"path", "x.txt"}, {"content", "new"}, {"ignoreIfExists", true}});
  EXPECT_NE(kept.content[0]["text"].get<std::string>().find("left unchanged"), std::string::npos);
  EXPECT_EQ(readAll(root / "x.txt"), "old");

  run(tool, {{"path", "x.txt"}, {"content", "new"}, {"overwrite", true}, {"ignoreIfExists", true}});
  EXPECT_EQ(readAll(root / "x.txt"), "new");
}

TEST_F(EditToolsTest, ReplaceLinesSwapsMatchingRange) {
  write("f.txt", "one\ntwo\nthree\nfour\n");
  ReplaceLinesTool tool(ctx);
  auto result = run(tool, {{"path", "f.txt"}, {"startLine", 2}, {"endLine", 3},
                           {"content", "TWO"}, {"originalCode", "two\nthree"}});
  EXPECT_EQ(result.content[0]["text"], "Lines 2-3 in file f.txt replaced and file opened in editor");
  EXPECT_EQ(readAll(root / "f.txt"), "one\nTWO\nfour\n");
}

TEST_F(EditToolsTest, ReplaceLinesRejectsStaleOriginal) {
  write("f.txt", "one\ntwo\nthree\n");
  ReplaceLinesTool tool(ctx);
  try {
    run(tool, {{"path", "f.txt"}, {"startLine", 2}, {"endLine", 2},
               {"content", "X"}, {"originalCode", "TWO"}});
    FAIL() << "expected StaleStateError";
  } catch (const StaleStateError& e) {
    EXPECT_EQ(e.expected(), "TWO");
    EXPECT_EQ(e.actual(), "two");
  }
  EXPECT_EQ(readAll(root / "f.txt"), "one\ntwo\nthree\n");
}

TEST_F(EditToolsTest, ReplaceLinesRejectsOutOfRange) {
  write("f.txt", "a\nb\nc");
  ReplaceLinesTool tool(ctx);
  try {
    run(tool, {{"path", "f.txt"}, {"startLine", 10}, {"endLine", 12},
               {"content", "x"}, {"originalCode", ""}});
    FAIL() << "expected PreconditionError";
  } catch (const PreconditionError& e) {
    EXPECT_NE(std::string(e.what()).find("out of range (1-3)"), std::string::npos);
  }
  EXPECT_THROW(run(tool, {{"path", "f.txt"}, {"startLine", 0}, {"endLine", 1},
                          {"content", "x"}, {"originalCode", "a"}}), PreconditionError);
  EXPECT_THROW(run(tool, {{"path", "f.txt"}, {"startLine", 2}, {"endLine", 1},
                          {"content", "x"}, {"originalCode", "b"}}), PreconditionError);
  EXPECT_THROW(run(tool, {{"path", "f.txt"}, {"startLine", std::numeric_limits<long>::min()}, {"endLine", 1},
                          {"content", "x"}, {"originalCode", "a"}}), PreconditionError);
  EXPECT_EQ(readAll(root / "f.txt"), "a\nb\nc");
}

TEST_F(EditToolsTest, StaleReplaceOnLatin1FileIsReportedThroughServer) {
  write("f.txt", "caf\xE9\n");
  McpServer server([this](ToolRegistry& registry) {
    registry.registerTool(std::make_unique<ReplaceLinesTool>(ctx));
  });
  nlohmann::json request = {
    {"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
    {"params", {{"name", toolKindName(ToolKind::ReplaceLines)},
                {"arguments", {{"path", "f.txt"}, {"startLine", 1}, {"endLine", 1},
                               {"content", "x"}, {"originalCode", "cafe"}}}}}
  };
  auto response = server.handleText(request.dump());
  ASSERT_TRUE(response.has_value());
  ASSERT_FALSE(response->error.has_value());
  auto res = JsonRpc::toJson(*response);
  EXPECT_EQ(res["result"]["isError"], true);
  EXPECT_NE(res["result"]["content"][0]["text"].get<std::string>().find("StaleState"), std::string::npos);
  EXPECT_EQ(readAll(root / "f.txt"), "caf\xE9\n");
}

TEST_F(EditToolsTest, TypeIntoFileAppendsByDefault) {
  write("t.txt", "start");
  TypeIntoFileTool tool(ctx);
  auto result = run(tool, {{"path", "t.txt"}, {"content", "!\nend"}, {"speedMsPerChar", 0}});
  EXPECT_FALSE(result.isError);
  EXPECT_EQ(readAll(root / "t.txt"), "start!\nend");
  EXPECT_EQ(host->revealed, 5u);
}

TEST_F(EditToolsTest, TypeIntoFileAtLineAndColumn) {
  write("t.txt", "abc\ndef\n");
  TypeIntoFileTool tool(ctx);
  run(tool, {{"path", "t.txt"}, {"content", "XY"}, {"speedMsPerChar", 0},
             {"insertAtLine", 2}, {"insertAtColumn", 1}});
  EXPECT_EQ(readAll(root / "t.txt"), "abc\ndXYef\n");

  run(tool, {{"path", "t.txt"}, {"content", "!"}, {"speedMsPerChar", 0}, {"insertAtLine", 1}});
  EXPECT_EQ(readAll(root / "t.txt"), "abc!\ndXYef\n");
}

TEST_F(EditToolsTest, InterruptedTypingKeepsTypedPrefix) {
  write("t.txt", "");
  host->failAfter = 3;
  TypeIntoFileTool tool(ctx);
  EXPECT_THROW(run(tool, {{"path", "t.txt"}, {"content", "0123456789"}, {"speedMsPerChar", 0}}),
               std::runtime_error);
  EXPECT_EQ(readAll(root / "t.txt"), "012");
}

TEST_F(EditToolsTest, TypeIntoFileStepsByCharacterNotByte) {
  write("t.txt", "");
  TypeIntoFileTool tool(ctx);
  run(tool, {{"path", "t.txt"}, {"content", "\xC3\xA9\xE4\xB8\xAD"}, {"speedMsPerChar", 0}});
  EXPECT_EQ(host->revealed, 2u);
  ASSERT_EQ(host->typed.size(), 2u);
  EXPECT_EQ(host->typed[0], "\xC3\xA9");
  EXPECT_EQ(host->typed[1], "\xE4\xB8\xAD");
  EXPECT_EQ(readAll(root / "t.txt"), "\xC3\xA9\xE4\xB8\xAD");
}

TEST_F(EditToolsTest, InterruptedTypingNeverSplitsACharacter) {
  write("t.txt", "");
  host->failAfter = 1;
  TypeIntoFileTool tool(ctx);
  EXPECT_THROW(run(tool, {{"path", "t.txt"}, {"content", "\xC3\xA9\xE4\xB8\xAD"}, {"speedMsPerChar", 0}}),
               std::runtime_error);
  EXPECT_EQ(readAll(root / "t.txt"), "\xC3\xA9");
}

TEST_F(EditToolsTest, TypeIntoFileRejectsNegativeSpeedAndMissingFile) {
  write("t.txt", "");
  TypeIntoFileTool tool(ctx);
  EXPECT_THROW(run(tool, {{"path", "t.txt"}, {"content", "x"}, {"speedMsPerChar", -5}}), ValidationError);
  EXPECT_THROW(run(tool, {{"path", "missing.txt"}, {"content", "x"}, {"speedMsPerChar", 0}}), NotFoundError);
}

TEST_F(EditToolsTest, EditsOutsideWorkspaceAreRejected) {
  CreateFileTool tool(ctx);
  EXPECT_THROW(run(tool, {{"path", "../escape.txt"}, {"content", "x"}}), PreconditionError);
  EXPECT_FALSE(fs::exists(root.parent_path() / "escape.txt"));
}
