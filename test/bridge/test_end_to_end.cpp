#include <catch2/catch_test_macros.hpp>

#include <tool_bridge/bridge/lifecycle_manager.hpp>
#include <tool_bridge/bridge/tool_registry.hpp>

#include "mocks/log_capture.hpp"

#include <algorithm>
#include <cstdlib>

using namespace tool_bridge;
using namespace tool_bridge::testing;
using nlohmann::json;

// Runs the bridge against the scripted fake_tool_server over real pipes.

namespace {

ServerSpec FakeServer(const std::string& name, std::vector<std::string> args = {}) {
    ServerSpec spec;
    spec.name = name;
    spec.command = TOOL_BRIDGE_FAKE_SERVER;
    spec.args = std::move(args);
    return spec;
}

LifecycleOptions Options(bool parallel = false) {
    LifecycleOptions options;
    options.connection.client = ClientInfo{"tool-bridge", "test"};
    options.connection.handshake_timeout = std::chrono::milliseconds(5000);
    options.connection.invoke_timeout = std::chrono::milliseconds(5000);
    options.connection.shutdown_grace = std::chrono::milliseconds(500);
    options.parallel = parallel;
    return options;
}

ToolRegistry Registry(const std::vector<std::shared_ptr<RemoteTool>>& tools) {
    ToolRegistry registry;
    registry.RegisterAll(tools);
    return registry;
}

} // anonymous namespace

// ===========================================================================
// Discovery
// ===========================================================================

TEST_CASE("EndToEnd: discovers the fake server's tools", "[e2e]") {
    StdioLauncher launcher;
    LifecycleManager manager(launcher, Options());

    auto tools = manager.ConnectAll({FakeServer("fake")});
    REQUIRE(tools.size() == 6);
    CHECK(tools[0]->Name() == "echo");
    CHECK(tools[0]->Description() == "Echo the given text back");
    CHECK(tools[0]->ParametersSchema()["properties"].contains("text"));

    // "fail" advertises no inputSchema.
    auto fail = std::find_if(tools.begin(), tools.end(),
                             [](const auto& tool) { return tool->Name() == "fail"; });
    REQUIRE(fail != tools.end());
    CHECK((*fail)->ParametersSchema() ==
          json({{"type", "object"}, {"properties", json::object()}}));

    auto connections = manager.Connections();
    REQUIRE(connections.size() == 1);
    REQUIRE(connections[0]->Info().has_value());
    CHECK(connections[0]->Info()->name == "fake-tool-server");
    CHECK(connections[0]->Info()->version == "1.0.0");
}

TEST_CASE("EndToEnd: paginated tools/list", "[e2e]") {
    StdioLauncher launcher;
    LifecycleManager manager(launcher, Options());
    CHECK(manager.ConnectAll({FakeServer("paged", {"--paginate"})}).size() == 6);
}

TEST_CASE("EndToEnd: noise on stdout is tolerated", "[e2e]") {
    StdioLauncher launcher;
    LifecycleManager manager(launcher, Options());
    CHECK(manager.ConnectAll({FakeServer("noisy", {"--noise"})}).size() == 6);
}

// ===========================================================================
// Invocation
// ===========================================================================

TEST_CASE("EndToEnd: invoke tools through the registry", "[e2e]") {
    StdioLauncher launcher;
    LifecycleManager manager(launcher, Options());
    auto registry = Registry(manager.ConnectAll({FakeServer("fake")}));

    auto echo = registry.Execute("echo", {{"text", "hello"}});
    CHECK(echo.ok);
    CHECK(echo.content == "hello");

    auto add = registry.Execute("add", {{"a", 2}, {"b", 40}});
    CHECK(add.ok);
    CHECK(add.content == "42");

    auto fail = registry.Execute("fail", json::object());
    CHECK_FALSE(fail.ok);
    CHECK(fail.content == "boom");
    REQUIRE(fail.error_message.has_value());
    CHECK(*fail.error_message == kToolReturnedError);

    auto mixed = registry.Execute("mixed", json::object());
    CHECK(mixed.ok);
    CHECK(mixed.content.rfind("caption\n", 0) == 0);
    CHECK(mixed.content.find("\"type\":\"image\"") != std::string::npos);
}

TEST_CASE("EndToEnd: invocation timeout", "[e2e]") {
    StdioLauncher launcher;
    auto options = Options();
    options.connection.invoke_timeout = std::chrono::milliseconds(100);
    LifecycleManager manager(launcher, options);
    auto registry = Registry(manager.ConnectAll({FakeServer("fake")}));

    auto result = registry.Execute("slow", {{"ms", 2000}});
    CHECK_FALSE(result.ok);
    REQUIRE(result.error_message.has_value());
    CHECK(result.error_message->rfind(kExecutionFailedPrefix, 0) == 0);
}

TEST_CASE("EndToEnd: two servers with prefixed tools", "[e2e]") {
    StdioLauncher launcher;
    LifecycleManager manager(launcher, Options(true));
    auto registry = Registry(manager.ConnectAll({
        FakeServer("one", {"--prefix", "one_"}),
        FakeServer("two", {"--prefix", "two_"})}));

    CHECK(registry.Tools().size() == 12);
    CHECK(registry.Execute("one_echo", {{"text", "a"}}).content == "a");
    CHECK(registry.Execute("two_add", {{"a", 1}, {"b", 1}}).content == "2");
}

// ===========================================================================
// Environment
// ===========================================================================

TEST_CASE("EndToEnd: server sees configured env, not the ambient one", "[e2e]") {
    setenv("TOOL_BRIDGE_E2E_AMBIENT", "leaked", 1);

    auto spec = FakeServer("fake");
    spec.env["TOOL_BRIDGE_E2E_CONFIGURED"] = "configured";

    StdioLauncher launcher;
    LifecycleManager manager(launcher, Options());
    auto registry = Registry(manager.ConnectAll({spec}));

    CHECK(registry.Execute("env", {{"name", "TOOL_BRIDGE_E2E_CONFIGURED"}}).content ==
          "configured");
    CHECK(registry.Execute("env", {{"name", "TOOL_BRIDGE_E2E_AMBIENT"}}).content ==
          "<unset>");

    unsetenv("TOOL_BRIDGE_E2E_AMBIENT");
}

// ===========================================================================
// Failure isolation and teardown
// ===========================================================================

TEST_CASE("EndToEnd: failing servers are skipped", "[e2e]") {
    LogCapture logs;
    StdioLauncher launcher;
    auto options = Options();
    options.connection.handshake_timeout = std::chrono::milliseconds(300);
    LifecycleManager manager(launcher, options);

    auto tools = manager.ConnectAll({
        FakeServer("refuses", {"--fail-initialize"}),
        FakeServer("hangs", {"--hang-initialize"}),
        FakeServer("malformed", {"--malformed-tools"}),
        FakeServer("quits", {"--exit-after-init"}),
        FakeServer("good", {"--prefix", "g_"})});

    REQUIRE(tools.size() == 6);
    CHECK(tools[0]->Name() == "g_echo");
    CHECK(manager.ConnectionCount() == 1);
    CHECK(logs.Contains("Failed to connect to MCP server 'refuses'"));
    CHECK(logs.Contains("Failed to connect to MCP server 'hangs'"));
    CHECK(logs.Contains("Failed to connect to MCP server 'malformed'"));
    CHECK(logs.Contains("Failed to connect to MCP server 'quits'"));
}

TEST_CASE("EndToEnd: disconnect stops servers that ignore EOF and SIGTERM", "[e2e]") {
    StdioLauncher launcher;
    auto options = Options();
    options.connection.shutdown_grace = std::chrono::milliseconds(200);
    LifecycleManager manager(launcher, options);

    auto tools = manager.ConnectAll({
        FakeServer("stubborn", {"--ignore-eof", "--ignore-sigterm"})});
    REQUIRE(tools.size() == 6);

    manager.DisconnectAll();
    CHECK(manager.ConnectionCount() == 0);

    auto result = tools[0]->Invoke({{"text", "late"}});
    CHECK_FALSE(result.ok);
}
