#include <catch2/catch_test_macros.hpp>

#include <tool_bridge/bridge/connection.hpp>

#include "mocks/log_capture.hpp"
#include "mocks/mock_launcher.hpp"

#include <cerrno>
#include <thread>

using namespace tool_bridge;
using namespace tool_bridge::testing;
using nlohmann::json;

namespace {

using JsonResult = Result<json, Error>;

ServerSpec Spec(const std::string& name) {
    ServerSpec spec;
    spec.name = name;
    spec.command = "unused";
    return spec;
}

ConnectionOptions Options() {
    ConnectionOptions options;
    options.client = ClientInfo{"tool-bridge", "test"};
    options.handshake_timeout = std::chrono::milliseconds(1000);
    options.shutdown_grace = std::chrono::milliseconds(10);
    return options;
}

} // anonymous namespace

// ===========================================================================
// Connect
// ===========================================================================

TEST_CASE("Connection: successful connect publishes tools", "[bridge][connection]") {
    MockLauncher launcher;
    launcher.Script("files").channel = ReadyChannel({"read", "write"});

    Connection connection(Spec("files"), launcher, Options());
    CHECK(connection.State() == ConnectionState::Disconnected);
    REQUIRE(connection.Connect());

    CHECK(connection.State() == ConnectionState::Ready);
    auto tools = connection.Tools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]->Name() == "read");
    CHECK(tools[0]->Server() == "files");
    REQUIRE(connection.Info().has_value());
    CHECK(connection.Info()->name == "mock-server");
    CHECK_FALSE(connection.LastError().has_value());
}

TEST_CASE("Connection: handshake uses the configured timeout", "[bridge][connection]") {
    MockLauncher launcher;
    auto channel = ReadyChannel({"t"});
    launcher.Script("s").channel = channel;

    Connection connection(Spec("s"), launcher, Options());
    REQUIRE(connection.Connect());

    for (const auto& call : channel->Calls()) {
        REQUIRE(call.timeout.has_value());
        CHECK(call.timeout->count() == 1000);
    }
}

TEST_CASE("Connection: launch failure", "[bridge][connection]") {
    LogCapture logs;
    MockLauncher launcher;
    launcher.Script("broken").launch_error = Error{
        "Spawn", "broken", "No such file or directory", ErrorCategory::Spawn, ENOENT};

    Connection connection(Spec("broken"), launcher, Options());
    CHECK_FALSE(connection.Connect());
    CHECK(connection.State() == ConnectionState::Failed);
    REQUIRE(connection.LastError().has_value());
    CHECK(connection.LastError()->category == ErrorCategory::Spawn);
    CHECK(connection.Tools().empty());
    CHECK(logs.Contains("Failed to connect to MCP server 'broken'"));
}

TEST_CASE("Connection: handshake failure releases channel and process", "[bridge][connection]") {
    MockLauncher launcher;
    auto& script = launcher.Script("bad");
    script.channel->Enqueue("initialize", JsonResult::Err(Error{
        "initialize", "bad", "Server returned error: nope",
        ErrorCategory::Protocol, std::nullopt}));

    Connection connection(Spec("bad"), launcher, Options());
    CHECK_FALSE(connection.Connect());
    CHECK(connection.State() == ConnectionState::Failed);
    REQUIRE(connection.LastError().has_value());
    CHECK(connection.LastError()->category == ErrorCategory::Handshake);

    CHECK(script.channel->CloseCalls() == 1);
    CHECK(script.process->terminate_calls == 1);
    CHECK(script.channel->RequestCount("tools/list") == 0);
}

TEST_CASE("Connection: discovery failure releases resources", "[bridge][connection]") {
    MockLauncher launcher;
    auto& script = launcher.Script("bad");
    script.channel->Enqueue("initialize", JsonResult::Ok(InitializeResult()));
    script.channel->Enqueue("tools/list", JsonResult::Ok(json{{"tools", "nope"}}));

    Connection connection(Spec("bad"), launcher, Options());
    CHECK_FALSE(connection.Connect());
    REQUIRE(connection.LastError().has_value());
    CHECK(connection.LastError()->category == ErrorCategory::Discovery);
    CHECK(script.channel->CloseCalls() == 1);
    CHECK(script.process->terminate_calls == 1);
}

TEST_CASE("Connection: connect twice is refused", "[bridge][connection]") {
    MockLauncher launcher;
    launcher.Script("s").channel = ReadyChannel({"t"});

    Connection connection(Spec("s"), launcher, Options());
    REQUIRE(connection.Connect());
    CHECK_FALSE(connection.Connect());
    CHECK(connection.State() == ConnectionState::Ready);
    CHECK(launcher.Launched().size() == 1);
}

// ===========================================================================
// Disconnect
// ===========================================================================

TEST_CASE("Connection: disconnect closes channel before terminating", "[bridge][connection]") {
    MockLauncher launcher;
    auto& script = launcher.Script("s");
    script.channel = ReadyChannel({"t"});

    Connection connection(Spec("s"), launcher, Options());
    REQUIRE(connection.Connect());
    auto tools = connection.Tools();

    connection.Disconnect();
    CHECK(connection.State() == ConnectionState::Closed);
    CHECK(connection.Tools().empty());
    CHECK(script.channel->CloseCalls() == 1);
    CHECK(script.process->terminate_calls == 1);

    // Tools handed out earlier fail instead of reaching the server.
    auto result = tools[0]->Invoke(json::object());
    CHECK_FALSE(result.ok);
    CHECK(script.channel->RequestCount("tools/call") == 1);
}

TEST_CASE("Connection: disconnect is idempotent", "[bridge][connection]") {
    MockLauncher launcher;
    auto& script = launcher.Script("s");
    script.channel = ReadyChannel({"t"});

    Connection connection(Spec("s"), launcher, Options());
    REQUIRE(connection.Connect());
    connection.Disconnect();
    connection.Disconnect();
    CHECK(script.channel->CloseCalls() == 1);
    CHECK(script.process->terminate_calls == 1);
}

TEST_CASE("Connection: disconnect before connect", "[bridge][connection]") {
    MockLauncher launcher;
    Connection connection(Spec("s"), launcher, Options());
    connection.Disconnect();
    CHECK(connection.State() == ConnectionState::Closed);
    CHECK_FALSE(connection.Connect());
    CHECK(launcher.Launched().empty());
}

TEST_CASE("Connection: destructor disconnects", "[bridge][connection]") {
    MockLauncher launcher;
    auto& script = launcher.Script("s");
    script.channel = ReadyChannel({"t"});
    {
        Connection connection(Spec("s"), launcher, Options());
        REQUIRE(connection.Connect());
    }
    CHECK(script.channel->CloseCalls() == 1);
    CHECK(script.process->terminate_calls == 1);
}

TEST_CASE("Connection: disconnect from another thread aborts a blocked handshake",
          "[bridge][connection]") {
    MockLauncher launcher;
    auto& script = launcher.Script("slow");
    script.channel->BlockOn("initialize");
    auto channel = script.channel;
    auto process = script.process;

    Connection connection(Spec("slow"), launcher, Options());
    bool connected = true;
    std::thread connector([&] { connected = connection.Connect(); });

    channel->WaitUntilBlocked();
    connection.Disconnect();
    connector.join();

    CHECK_FALSE(connected);
    CHECK(connection.State() == ConnectionState::Closed);
    CHECK(connection.Tools().empty());
    REQUIRE(connection.LastError().has_value());
    CHECK(connection.LastError()->category == ErrorCategory::ChannelClosed);
    CHECK(channel->CloseCalls() == 1);
    CHECK(process->terminate_calls == 1);
}

// ===========================================================================
// Teardown errors
// ===========================================================================

TEST_CASE("Connection: benign teardown errors are logged at debug", "[bridge][connection]") {
    LogCapture logs;
    MockLauncher launcher;
    auto& script = launcher.Script("s");
    script.channel = ReadyChannel({"t"});
    script.channel->SetCloseError(Error{"CloseChannel", "s", "close failed",
                                        ErrorCategory::Cancelled, EINTR});
    script.process->terminate_error = Error{"Terminate", "s", "waitpid failed",
                                            ErrorCategory::ForeignContext, ECHILD};

    Connection connection(Spec("s"), launcher, Options());
    REQUIRE(connection.Connect());
    connection.Disconnect();

    CHECK(logs.Count("Ignoring teardown error") == 2);
    CHECK(logs.CountAt(LogLevel::Warn) == 0);
    CHECK(connection.State() == ConnectionState::Closed);
}

TEST_CASE("Connection: other teardown errors are warnings", "[bridge][connection]") {
    LogCapture logs;
    MockLauncher launcher;
    auto& script = launcher.Script("s");
    script.channel = ReadyChannel({"t"});
    script.process->terminate_error = Error{"Terminate", "s", "kill failed",
                                            ErrorCategory::Teardown, EPERM};

    Connection connection(Spec("s"), launcher, Options());
    REQUIRE(connection.Connect());
    connection.Disconnect();

    CHECK(logs.Contains("Teardown error"));
    CHECK(logs.CountAt(LogLevel::Warn) == 1);
}

TEST_CASE("Connection: throwing terminate does not escape disconnect", "[bridge][connection]") {
    LogCapture logs;
    MockLauncher launcher;
    auto& script = launcher.Script("s");
    script.channel = ReadyChannel({"t"});
    script.process->throw_on_terminate = true;

    Connection connection(Spec("s"), launcher, Options());
    REQUIRE(connection.Connect());
    CHECK_NOTHROW(connection.Disconnect());
    CHECK(connection.State() == ConnectionState::Closed);
    CHECK(logs.Contains("terminate exploded"));
}

TEST_CASE("StateName: all states", "[bridge][connection]") {
    CHECK(std::string(StateName(ConnectionState::Disconnected)) == "disconnected");
    CHECK(std::string(StateName(ConnectionState::Connecting)) == "connecting");
    CHECK(std::string(StateName(ConnectionState::Ready)) == "ready");
    CHECK(std::string(StateName(ConnectionState::Failed)) == "failed");
    CHECK(std::string(StateName(ConnectionState::Closed)) == "closed");
}
