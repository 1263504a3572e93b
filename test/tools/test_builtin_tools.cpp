#include <catch2/catch_test_macros.hpp>

#include <stdio_mcp/tools/builtin_tools.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using namespace stdio_mcp;
using json = nlohmann::json;

// ===========================================================================
// Helper: scratch directories under the system temp dir
// ===========================================================================

namespace {

namespace fs = std::filesystem;

// Removes the directory tree on destruction.
struct TempDirGuard {
    fs::path dir;

    TempDirGuard() {
        static int counter = 0;
        dir = fs::temp_directory_path() / "stdio_mcp_test" /
              std::to_string(++counter);
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir);
    }
    ~TempDirGuard() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

const std::string& Text(const CallResult& result) {
    REQUIRE(result.content.size() == 1);
    return result.content[0].text;
}

} // namespace

// ===========================================================================
// echo
// ===========================================================================

TEST_CASE("echo: repeats the text", "[tools][echo]") {
    EchoTool tool;
    auto result = tool.Invoke({{"text", "hi"}});
    CHECK_FALSE(result.is_error);
    CHECK(Text(result) == "Echo: hi");
}

TEST_CASE("echo: missing text has a placeholder", "[tools][echo]") {
    EchoTool tool;
    auto result = tool.Invoke(json::object());
    CHECK_FALSE(result.is_error);
    CHECK(Text(result) == "Echo: No text provided");
}

TEST_CASE("echo: schema requires text", "[tools][echo]") {
    EchoTool tool;
    auto schema = tool.InputSchema();
    CHECK(schema["type"] == "object");
    CHECK(schema["properties"]["text"]["type"] == "string");
    CHECK(schema["required"] == json::array({"text"}));
}

// ===========================================================================
// get_system_info
// ===========================================================================

TEST_CASE("get_system_info: reports OS, architecture and hostname", "[tools][sysinfo]") {
    SystemInfoTool tool;
    auto result = tool.Invoke(json::object());
    CHECK_FALSE(result.is_error);
    const auto& text = Text(result);
    CHECK(text.rfind("System Information:\n- OS: ", 0) == 0);
    CHECK(text.find("\n- Architecture: ") != std::string::npos);
    CHECK(text.find("\n- Hostname: ") != std::string::npos);
}

// ===========================================================================
// list_files
// ===========================================================================

TEST_CASE("list_files: sorted entries with their kinds", "[tools][list_files]") {
    TempDirGuard tmp;
    WriteFile(tmp.dir / "b.txt", "b");
    WriteFile(tmp.dir / "a.txt", "a");
    fs::create_directory(tmp.dir / "sub");

    ListFilesTool tool;
    auto result = tool.Invoke({{"path", tmp.dir.string()}});
    CHECK_FALSE(result.is_error);
    CHECK(Text(result) == "Files in " + tmp.dir.string() + ":\n"
                          "a.txt (file)\n"
                          "b.txt (file)\n"
                          "sub (directory)");
}

TEST_CASE("list_files: empty directory", "[tools][list_files]") {
    TempDirGuard tmp;
    ListFilesTool tool;
    auto result = tool.Invoke({{"path", tmp.dir.string()}});
    CHECK_FALSE(result.is_error);
    CHECK(Text(result) == "Directory is empty");
}

TEST_CASE("list_files: missing directory is a tool error", "[tools][list_files]") {
    TempDirGuard tmp;
    ListFilesTool tool;
    auto result = tool.Invoke({{"path", (tmp.dir / "nope").string()}});
    CHECK(result.is_error);
    CHECK(Text(result).rfind("Error listing directory: ", 0) == 0);
}

TEST_CASE("list_files: defaults to the current directory", "[tools][list_files]") {
    ListFilesTool tool;
    auto result = tool.Invoke(json::object());
    CHECK_FALSE(result.is_error);
    // The test runs from a non-empty directory (source or build tree).
    CHECK(Text(result).rfind("Files in .:", 0) == 0);
}

// ===========================================================================
// read_file
// ===========================================================================

TEST_CASE("read_file: returns the contents", "[tools][read_file]") {
    TempDirGuard tmp;
    auto path = (tmp.dir / "hello.txt").string();
    WriteFile(path, "line one\nline two\n");

    ReadFileTool tool(1024);
    auto result = tool.Invoke({{"path", path}});
    CHECK_FALSE(result.is_error);
    CHECK(Text(result) == "Contents of " + path + ":\nline one\nline two\n");
}

TEST_CASE("read_file: empty file", "[tools][read_file]") {
    TempDirGuard tmp;
    auto path = (tmp.dir / "empty.txt").string();
    WriteFile(path, "");

    ReadFileTool tool(1024);
    auto result = tool.Invoke({{"path", path}});
    CHECK_FALSE(result.is_error);
    CHECK(Text(result) == "Contents of " + path + ":\n");
}

TEST_CASE("read_file: size limits", "[tools][read_file]") {
    TempDirGuard tmp;
    auto path = (tmp.dir / "ten.txt").string();
    WriteFile(path, "0123456789");

    SECTION("default limit from construction") {
        ReadFileTool tool(5);
        auto result = tool.Invoke({{"path", path}});
        CHECK(result.is_error);
        CHECK(Text(result) == "File is too large (10 bytes, max: 5 bytes)");
    }
    SECTION("max_size argument overrides the default") {
        ReadFileTool tool(5);
        auto result = tool.Invoke({{"path", path}, {"max_size", 10}});
        CHECK_FALSE(result.is_error);
    }
    SECTION("max_size smaller than the file") {
        ReadFileTool tool(1024);
        auto result = tool.Invoke({{"path", path}, {"max_size", 3}});
        CHECK(result.is_error);
        CHECK(Text(result) == "File is too large (10 bytes, max: 3 bytes)");
    }
    SECTION("invalid max_size") {
        ReadFileTool tool(1024);
        for (const auto& bad : {json(0), json(-4), json("big"), json(2.5)}) {
            auto result = tool.Invoke({{"path", path}, {"max_size", bad}});
            CHECK(result.is_error);
            CHECK(Text(result) == "Invalid parameter: max_size must be a positive integer");
        }
    }
}

TEST_CASE("read_file: missing path argument", "[tools][read_file]") {
    ReadFileTool tool(1024);
    auto result = tool.Invoke(json::object());
    CHECK(result.is_error);
    CHECK(Text(result) == "Missing required parameter: path");
}

TEST_CASE("read_file: nonexistent file", "[tools][read_file]") {
    TempDirGuard tmp;
    ReadFileTool tool(1024);
    auto result = tool.Invoke({{"path", (tmp.dir / "missing.txt").string()}});
    CHECK(result.is_error);
    CHECK(Text(result).rfind("Error accessing file: ", 0) == 0);
}

TEST_CASE("read_file: binary content is rejected", "[tools][read_file]") {
    TempDirGuard tmp;
    auto path = (tmp.dir / "blob.bin").string();
    WriteFile(path, std::string("\x89PNG\r\n\x1a\n\xff\xfe", 10));

    ReadFileTool tool(1024);
    auto result = tool.Invoke({{"path", path}});
    CHECK(result.is_error);
    CHECK(Text(result) == "Error reading file: file is not valid UTF-8 text");
}

TEST_CASE("read_file: multi-byte UTF-8 is accepted", "[tools][read_file]") {
    TempDirGuard tmp;
    auto path = (tmp.dir / "utf8.txt").string();
    WriteFile(path, "gr\xc3\xbc\xc3\x9f \xe2\x82\xac \xf0\x9f\x98\x80");

    ReadFileTool tool(1024);
    auto result = tool.Invoke({{"path", path}});
    CHECK_FALSE(result.is_error);
}

// ===========================================================================
// execute_command
// ===========================================================================

#ifndef _WIN32

TEST_CASE("execute_command: runs an allowed command", "[tools][execute_command]") {
    ExecuteCommandTool tool({"echo"}, std::chrono::seconds(5));
    auto result = tool.Invoke({{"command", "echo"}, {"args", json::array({"hello", "there"})}});
    CHECK_FALSE(result.is_error);
    CHECK(Text(result) == "Command: echo hello there\nOutput:\nhello there\n");
}

TEST_CASE("execute_command: refuses commands outside the allow-list",
          "[tools][execute_command]") {
    ExecuteCommandTool tool({"echo", "date"}, std::chrono::seconds(5));
    auto result = tool.Invoke({{"command", "rm"}, {"args", json::array({"-rf", "/"})}});
    CHECK(result.is_error);
    CHECK(Text(result) == "Command 'rm' is not allowed. Allowed commands: echo, date");
}

TEST_CASE("execute_command: path-qualified commands are not allowed",
          "[tools][execute_command]") {
    ExecuteCommandTool tool({"echo"}, std::chrono::seconds(5));
    auto result = tool.Invoke({{"command", "/bin/echo"}});
    CHECK(result.is_error);
}

TEST_CASE("execute_command: missing command", "[tools][execute_command]") {
    ExecuteCommandTool tool({"echo"}, std::chrono::seconds(5));
    auto result = tool.Invoke(json::object());
    CHECK(result.is_error);
    CHECK(Text(result) == "Missing required parameter: command");
}

TEST_CASE("execute_command: non-string args are skipped", "[tools][execute_command]") {
    ExecuteCommandTool tool({"echo"}, std::chrono::seconds(5));
    auto result = tool.Invoke({{"command", "echo"}, {"args", json::array({"a", 1, "b"})}});
    CHECK_FALSE(result.is_error);
    CHECK(Text(result) == "Command: echo a b\nOutput:\na b\n");
}

TEST_CASE("execute_command: failing command reports stderr and an error",
          "[tools][execute_command]") {
    TempDirGuard tmp;
    ExecuteCommandTool tool({"ls"}, std::chrono::seconds(5));
    auto result = tool.Invoke(
        {{"command", "ls"}, {"args", json::array({(tmp.dir / "missing").string()})}});
    CHECK(result.is_error);
    const auto& text = Text(result);
    CHECK(text.find("STDOUT:\n") != std::string::npos);
    CHECK(text.find("\nSTDERR:\n") != std::string::npos);
}

TEST_CASE("execute_command: timeout kills the command", "[tools][execute_command]") {
    ExecuteCommandTool tool({"sleep"}, std::chrono::seconds(1));
    auto result = tool.Invoke({{"command", "sleep"}, {"args", json::array({"30"})}});
    CHECK(result.is_error);
    CHECK(Text(result) == "Command timed out after 1 seconds");
}

#endif

// ===========================================================================
// RegisterBuiltinTools
// ===========================================================================

TEST_CASE("RegisterBuiltinTools: registers all tools in order", "[tools]") {
    ToolRegistry registry;
    REQUIRE(RegisterBuiltinTools(registry, ToolsConfig{}).IsOk());

    const auto& tools = registry.Tools();
    REQUIRE(tools.size() == 5);
    CHECK(tools[0].name == "echo");
    CHECK(tools[1].name == "get_system_info");
    CHECK(tools[2].name == "list_files");
    CHECK(tools[3].name == "read_file");
    CHECK(tools[4].name == "execute_command");

    CHECK(tools[3].input_schema["properties"]["max_size"]["default"] == 1048576);
}

TEST_CASE("RegisterBuiltinTools: second registration fails on duplicates", "[tools]") {
    ToolRegistry registry;
    REQUIRE(RegisterBuiltinTools(registry, ToolsConfig{}).IsOk());
    CHECK(RegisterBuiltinTools(registry, ToolsConfig{}).IsErr());
}

TEST_CASE("RegisterBuiltinTools: allow-list comes from config", "[tools]") {
    ToolsConfig config;
    config.allowed_commands = {"pwd"};

    ToolRegistry registry;
    REQUIRE(RegisterBuiltinTools(registry, config).IsOk());

    auto result = registry.Execute("execute_command", {{"command", "echo"}});
    CHECK(result.is_error);
    CHECK(Text(result) == "Command 'echo' is not allowed. Allowed commands: pwd");
}
