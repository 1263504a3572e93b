#include <catch2/catch_test_macros.hpp>

#include <stdio_mcp/mcp/tool_registry.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace stdio_mcp;

namespace {

nlohmann::json QuerySchema() {
    return {
        {"type", "object"},
        {"properties", {
            {"query", {{"type", "string"}}}
        }},
        {"required", nlohmann::json::array({"query"})}
    };
}

class CountingTool : public ITool {
public:
    explicit CountingTool(std::string name) : name_(std::move(name)) {}

    std::string Name() const override { return name_; }
    std::string Description() const override { return "Counts invocations"; }
    nlohmann::json InputSchema() const override {
        return {{"type", "object"}, {"properties", nlohmann::json::object()}};
    }

    CallResult Invoke(const nlohmann::json&) override {
        ++calls_;
        return CallResult::Text("call " + std::to_string(calls_));
    }

private:
    std::string name_;
    int calls_ = 0;
};

} // anonymous namespace

TEST_CASE("ToolRegistry: register and list tools", "[mcp][registry]") {
    ToolRegistry registry;

    auto registered = registry.Register(
        "search", "Search for things", QuerySchema(),
        [](const nlohmann::json& args) {
            return CallResult::Text("found: " + args["query"].get<std::string>());
        });
    REQUIRE(registered.IsOk());

    REQUIRE(registry.Tools().size() == 1);
    CHECK(registry.Size() == 1);
    CHECK(registry.Tools()[0].name == "search");
    CHECK(registry.Tools()[0].description == "Search for things");
    CHECK(registry.Tools()[0].input_schema == QuerySchema());
}

TEST_CASE("ToolRegistry: execute registered tool", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register("echo", "Echo input", nlohmann::json::object(),
        [](const nlohmann::json& args) {
            return CallResult::Text(args.dump());
        }).IsOk());

    auto result = registry.Execute("echo", {{"msg", "hello"}});
    CHECK_FALSE(result.is_error);
    REQUIRE(result.content.size() == 1);
    CHECK(result.content[0].type == "text");
    CHECK(result.content[0].text == R"({"msg":"hello"})");
}

TEST_CASE("ToolRegistry: execute unknown tool returns error", "[mcp][registry]") {
    ToolRegistry registry;

    auto result = registry.Execute("nonexistent", nlohmann::json::object());
    CHECK(result.is_error);
    REQUIRE(result.content.size() == 1);
    CHECK(result.content[0].text == "Unknown tool: nonexistent");
}

TEST_CASE("ToolRegistry: HasTool", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(std::make_unique<CountingTool>("foo")).IsOk());

    CHECK(registry.HasTool("foo"));
    CHECK_FALSE(registry.HasTool("bar"));
}

TEST_CASE("ToolRegistry: duplicate name is rejected and registry unchanged", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(std::make_unique<CountingTool>("dup")).IsOk());

    auto again = registry.Register(std::make_unique<CountingTool>("dup"));
    REQUIRE(again.IsErr());
    CHECK(again.Error().target == "dup");
    CHECK(again.Error().message == "Tool is already registered");
    CHECK(registry.Size() == 1);
    CHECK(registry.Tools().size() == 1);
}

TEST_CASE("ToolRegistry: empty name, null tool and empty handler are rejected", "[mcp][registry]") {
    ToolRegistry registry;
    CHECK(registry.Register(std::make_unique<CountingTool>("")).IsErr());
    CHECK(registry.Register(std::unique_ptr<ITool>{}).IsErr());
    CHECK(registry.Register("x", "d", nlohmann::json::object(), ToolHandler{}).IsErr());
    CHECK(registry.Size() == 0);
}

TEST_CASE("ToolRegistry: listing keeps registration order", "[mcp][registry]") {
    ToolRegistry registry;
    for (const char* name : {"zeta", "alpha", "mid"}) {
        REQUIRE(registry.Register(std::make_unique<CountingTool>(name)).IsOk());
    }

    const auto& tools = registry.Tools();
    REQUIRE(tools.size() == 3);
    CHECK(tools[0].name == "zeta");
    CHECK(tools[1].name == "alpha");
    CHECK(tools[2].name == "mid");
}

TEST_CASE("ToolRegistry: tools keep state between calls", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(std::make_unique<CountingTool>("count")).IsOk());

    CHECK(registry.Execute("count", {}).content[0].text == "call 1");
    CHECK(registry.Execute("count", {}).content[0].text == "call 2");
}

TEST_CASE("ToolRegistry: exception from tool becomes an error result", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register("boom", "Throws", nlohmann::json::object(),
        [](const nlohmann::json&) -> CallResult {
            throw std::runtime_error("kaboom");
        }).IsOk());

    auto result = registry.Execute("boom", nlohmann::json::object());
    CHECK(result.is_error);
    CHECK(result.content[0].text == "Tool error: kaboom");
}

TEST_CASE("ToolRegistry: non-standard exception becomes an error result", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register("boom", "Throws an int", nlohmann::json::object(),
        [](const nlohmann::json&) -> CallResult {
            throw 42;
        }).IsOk());

    auto result = registry.Execute("boom", nlohmann::json::object());
    CHECK(result.is_error);
    CHECK(result.content[0].text == "Tool error: unknown exception");

    // The registry stays usable afterwards.
    CHECK(registry.Execute("boom", nlohmann::json::object()).is_error);
}

TEST_CASE("ToolRegistry: moved registry keeps its tools", "[mcp][registry]") {
    ToolRegistry source;
    REQUIRE(source.Register(std::make_unique<CountingTool>("kept")).IsOk());

    ToolRegistry moved(std::move(source));
    CHECK(moved.HasTool("kept"));
    CHECK(moved.Execute("kept", {}).content[0].text == "call 1");
}

TEST_CASE("CallResult: wire form always carries isError", "[mcp][registry]") {
    auto ok = CallResult::Text("hi").ToJson();
    REQUIRE(ok["content"].is_array());
    REQUIRE(ok["content"].size() == 1);
    CHECK(ok["content"][0]["type"] == "text");
    CHECK(ok["content"][0]["text"] == "hi");
    CHECK(ok["isError"] == false);

    auto failed = CallResult::Failure("nope").ToJson();
    CHECK(failed["isError"] == true);
    CHECK(failed["content"][0]["text"] == "nope");
}

TEST_CASE("ToolDefinition: wire form uses inputSchema", "[mcp][registry]") {
    ToolDefinition def{"t", "desc", QuerySchema()};
    auto j = def.ToJson();
    CHECK(j["name"] == "t");
    CHECK(j["description"] == "desc");
    CHECK(j["inputSchema"] == QuerySchema());
    CHECK_FALSE(j.contains("input_schema"));
}
