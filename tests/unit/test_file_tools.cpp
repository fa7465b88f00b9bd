#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "tools/file_tools.hpp"

namespace {

using nlohmann::json;
using toolwire::tools::FileTools;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_file_tools_" + toolwire::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::string read_back(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TEST(FileToolsTest, ReadFileReturnsFormattedContent) {
    TempWorkspace workspace;
    write_file(workspace.root() / "notes.txt", "hello tool server");

    FileTools tools(workspace.root());
    const auto reply = tools.read_file("notes.txt");
    ASSERT_TRUE(reply.success);
    EXPECT_EQ(reply.output,
              "File: notes.txt\nSize: 17 characters\n\nContent:\nhello tool server");
    EXPECT_TRUE(reply.error_message.empty());
}

TEST(FileToolsTest, ReadFileReportsMissingFile) {
    TempWorkspace workspace;
    FileTools tools(workspace.root());
    const auto reply = tools.read_file("missing.py");
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.error_message, "Error: File 'missing.py' does not exist");
}

TEST(FileToolsTest, ReadFileRejectsPathOutsideRoot) {
    TempWorkspace workspace;
    FileTools tools(workspace.root());
    const auto reply = tools.read_file("../../etc/passwd");
    EXPECT_FALSE(reply.success);
    EXPECT_NE(reply.error_message.find("outside the allowed directory"), std::string::npos);
}

TEST(FileToolsTest, WriteFileCreatesParentDirectories) {
    TempWorkspace workspace;
    FileTools tools(workspace.root());
    const auto reply = tools.write_file("out/deep/result.txt", "abc");
    ASSERT_TRUE(reply.success) << reply.error_message;
    EXPECT_EQ(reply.output, "Successfully wrote 3 characters to 'out/deep/result.txt'");
    EXPECT_EQ(read_back(workspace.root() / "out/deep/result.txt"), "abc");
}

TEST(FileToolsTest, ListDirectoryIsSorted) {
    TempWorkspace workspace;
    write_file(workspace.root() / "b.txt", "12");
    write_file(workspace.root() / "a.txt", "1");
    std::filesystem::create_directories(workspace.root() / "sub");

    FileTools tools(workspace.root());
    const auto reply = tools.list_directory(".");
    ASSERT_TRUE(reply.success);
    EXPECT_EQ(reply.output,
              "Directory listing for '.':\n[file] a.txt (1 bytes)\n[file] b.txt (2 bytes)\n"
              "[dir]  sub/");
}

TEST(FileToolsTest, ListDirectoryReportsEmptyAndMissing) {
    TempWorkspace workspace;
    FileTools tools(workspace.root());
    EXPECT_EQ(tools.list_directory(".").output, "Directory '.' is empty");

    const auto missing = tools.list_directory("nope");
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error_message, "Error: Directory 'nope' does not exist");
}

TEST(FileToolsTest, FileExistsDescribesPath) {
    TempWorkspace workspace;
    write_file(workspace.root() / "data.json", "{}");
    std::filesystem::create_directories(workspace.root() / "dir");

    FileTools tools(workspace.root());
    EXPECT_EQ(tools.file_exists("data.json").output, "File 'data.json' exists (2 bytes)");
    EXPECT_EQ(tools.file_exists("dir").output, "Directory 'dir' exists");
    EXPECT_EQ(tools.file_exists("ghost.txt").output, "Path 'ghost.txt' does not exist");
}

TEST(FileToolsTest, FindFilesReportsExactMatchesAndSkipsDependencies) {
    TempWorkspace workspace;
    write_file(workspace.root() / "src" / "config.py", "a = 1\n");
    write_file(workspace.root() / "tests" / "config.py", "b = 22\n");
    write_file(workspace.root() / "node_modules" / "pkg" / "config.py", "ignored");
    write_file(workspace.root() / ".git" / "config.py", "ignored");

    FileTools tools(workspace.root());
    const auto reply = tools.find_files("config.py");
    ASSERT_TRUE(reply.success) << reply.error_message;
    const json found = json::parse(reply.output);
    EXPECT_EQ(found["file_name"], "config.py");
    ASSERT_EQ(found["exact"].size(), 2u);
    EXPECT_EQ(found["exact"][0]["path"], "src/config.py");
    EXPECT_EQ(found["exact"][0]["size"], 6);
    EXPECT_EQ(found["exact"][1]["path"], "tests/config.py");
    EXPECT_TRUE(found["similar"].empty());

    const json narrowed = json::parse(tools.find_files("config.py", "tests").output);
    ASSERT_EQ(narrowed["exact"].size(), 1u);
    EXPECT_EQ(narrowed["exact"][0]["path"], "tests/config.py");

    // A context that matches nothing keeps every match.
    const json unnarrowed = json::parse(tools.find_files("config.py", "docs").output);
    EXPECT_EQ(unnarrowed["exact"].size(), 2u);
}

TEST(FileToolsTest, FindFilesSuggestsSimilarNames) {
    TempWorkspace workspace;
    write_file(workspace.root() / "app" / "utils.py", "");
    write_file(workspace.root() / "app" / "helpers.py", "");
    write_file(workspace.root() / "main.py", "");

    FileTools tools(workspace.root());
    const json typo = json::parse(tools.find_files("utlis.py").output);
    EXPECT_TRUE(typo["exact"].empty());
    EXPECT_EQ(typo["similar"], json::array({"app/utils.py"}));

    const json prefix = json::parse(tools.find_files("main").output);
    EXPECT_EQ(prefix["similar"], json::array({"main.py"}));

    const json nothing = json::parse(tools.find_files("database.sql").output);
    EXPECT_TRUE(nothing["exact"].empty());
    EXPECT_TRUE(nothing["similar"].empty());
}

TEST(FileToolsTest, ServedToolsDeclareSchemas) {
    TempWorkspace workspace;
    write_file(workspace.root() / "main.py", "print('hi')\n");

    FileTools tools(workspace.root());
    const auto served = tools.served_tools();
    ASSERT_EQ(served.size(), 5u);
    EXPECT_EQ(served[4].name, "find_files");
    EXPECT_EQ(served[4].input_schema["required"], json::array({"file_name"}));
    EXPECT_EQ(served[0].name, "read_file");
    EXPECT_EQ(served[0].input_schema["required"], json::array({"file_path"}));
    EXPECT_EQ(served[1].input_schema["required"], json::array({"file_path", "content"}));

    const auto reply = served[0].handler(json{{"file_path", "main.py"}});
    EXPECT_TRUE(reply.success);

    const auto wrong_type = served[0].handler(json{{"file_path", 42}});
    EXPECT_FALSE(wrong_type.success);
    EXPECT_EQ(wrong_type.error_message, "Error: argument 'file_path' must be a string");
}

}  // namespace
