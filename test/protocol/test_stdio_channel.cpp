#include <catch2/catch_test_macros.hpp>

#include <tool_bridge/protocol/stdio_channel.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace tool_bridge;
using nlohmann::json;

namespace {

// The test plays the server: it writes canned lines into the channel's read
// pipe and reads what the channel sent from the other one.
struct FakeServerPipes {
    int to_server[2] = {-1, -1};
    int from_server[2] = {-1, -1};
    std::shared_ptr<StdioChannel> channel;

    FakeServerPipes() {
        REQUIRE(pipe(to_server) == 0);
        REQUIRE(pipe(from_server) == 0);
        auto opened = StdioChannel::Open(to_server[1], from_server[0], "fake");
        REQUIRE(opened.IsOk());
        channel = opened.Value();
    }

    ~FakeServerPipes() {
        channel.reset();
        if (to_server[0] != -1) close(to_server[0]);
        if (from_server[1] != -1) close(from_server[1]);
    }

    void Emit(const std::string& line) {
        const std::string data = line + "\n";
        REQUIRE(write(from_server[1], data.data(), data.size()) ==
                static_cast<ssize_t>(data.size()));
    }

    void CloseServerStdout() {
        close(from_server[1]);
        from_server[1] = -1;
    }

    // Read `count` newline-terminated messages the channel wrote.
    std::vector<json> Received(size_t count) {
        std::vector<json> messages;
        std::string line;
        char c = 0;
        while (messages.size() < count && read(to_server[0], &c, 1) == 1) {
            if (c == '\n') {
                messages.push_back(json::parse(line));
                line.clear();
            } else {
                line += c;
            }
        }
        return messages;
    }
};

const auto kShort = std::chrono::milliseconds(2000);

} // anonymous namespace

// ===========================================================================
// Request / response matching
// ===========================================================================

TEST_CASE("StdioChannel: request returns the matching result", "[protocol][channel]") {
    FakeServerPipes pipes;
    pipes.Emit(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})");

    auto result = pipes.channel->Request("tools/list", json::object(), kShort);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["tools"].is_array());

    auto sent = pipes.Received(1);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0]["method"] == "tools/list");
    CHECK(sent[0]["id"] == 1);
    CHECK(sent[0]["jsonrpc"] == "2.0");
}

TEST_CASE("StdioChannel: skips noise and unmatched messages", "[protocol][channel]") {
    FakeServerPipes pipes;
    pipes.Emit("Starting server on stdio...");
    pipes.Emit(R"({"jsonrpc":"2.0","method":"notifications/message","params":{}})");
    pipes.Emit(R"({"jsonrpc":"2.0","id":99,"result":{}})");
    pipes.Emit("");
    pipes.Emit(R"({"jsonrpc":"2.0","id":1,"result":{"ok":true}})");

    auto result = pipes.channel->Request("initialize", json::object(), kShort);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["ok"] == true);
}

TEST_CASE("StdioChannel: CRLF line endings", "[protocol][channel]") {
    FakeServerPipes pipes;
    pipes.Emit("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"n\":1}}\r");

    auto result = pipes.channel->Request("x", json::object(), kShort);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["n"] == 1);
}

TEST_CASE("StdioChannel: request ids increase", "[protocol][channel]") {
    FakeServerPipes pipes;
    pipes.Emit(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    pipes.Emit(R"({"jsonrpc":"2.0","id":2,"result":{"second":true}})");

    REQUIRE(pipes.channel->Request("a", json::object(), kShort).IsOk());
    auto second = pipes.channel->Request("b", json::object(), kShort);
    REQUIRE(second.IsOk());
    CHECK(second.Value()["second"] == true);

    auto sent = pipes.Received(2);
    REQUIRE(sent.size() == 2);
    CHECK(sent[1]["id"] == 2);
}

TEST_CASE("StdioChannel: answers server ping", "[protocol][channel]") {
    FakeServerPipes pipes;
    pipes.Emit(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    pipes.Emit(R"({"jsonrpc":"2.0","id":"srv-2","method":"sampling/createMessage"})");
    pipes.Emit(R"({"jsonrpc":"2.0","id":1,"result":{}})");

    REQUIRE(pipes.channel->Request("tools/list", json::object(), kShort).IsOk());

    auto sent = pipes.Received(3);
    REQUIRE(sent.size() == 3);
    CHECK(sent[0]["method"] == "tools/list");
    CHECK(sent[1]["id"] == "srv-1");
    CHECK(sent[1]["result"] == json::object());
    CHECK(sent[2]["id"] == "srv-2");
    CHECK(sent[2]["error"]["code"] == -32601);
}

TEST_CASE("StdioChannel: error response is a Protocol error", "[protocol][channel]") {
    FakeServerPipes pipes;
    pipes.Emit(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32602,"message":"bad"}})");

    auto result = pipes.channel->Request("tools/call", json::object(), kShort);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Protocol);
    CHECK(result.Error().server == "fake");
    CHECK(pipes.channel->IsOpen());
}

TEST_CASE("StdioChannel: notify writes a message without id", "[protocol][channel]") {
    FakeServerPipes pipes;
    REQUIRE(pipes.channel->Notify("notifications/initialized", json::object()).IsOk());

    auto sent = pipes.Received(1);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0]["method"] == "notifications/initialized");
    CHECK_FALSE(sent[0].contains("id"));
}

// ===========================================================================
// Failure modes
// ===========================================================================

TEST_CASE("StdioChannel: timeout", "[protocol][channel]") {
    FakeServerPipes pipes;
    auto result = pipes.channel->Request("initialize", json::object(),
                                         std::chrono::milliseconds(50));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
}

TEST_CASE("StdioChannel: server closing stdout is a transport error", "[protocol][channel]") {
    FakeServerPipes pipes;
    pipes.CloseServerStdout();

    auto result = pipes.channel->Request("initialize", json::object(), kShort);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
    CHECK(result.Error().message == "Server closed stdout");
    CHECK_FALSE(pipes.channel->IsOpen());

    auto again = pipes.channel->Request("tools/list", json::object(), kShort);
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::Transport);
}

TEST_CASE("StdioChannel: close wakes a blocked request", "[protocol][channel]") {
    FakeServerPipes pipes;
    auto channel = pipes.channel;

    Result<json, Error> result = Result<json, Error>::Ok(json());
    std::thread requester([&] {
        result = channel->Request("initialize", json::object(), std::nullopt);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(channel->Close().IsOk());
    requester.join();

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ChannelClosed);
    CHECK_FALSE(channel->IsOpen());
}

TEST_CASE("StdioChannel: close is idempotent and rejects later requests", "[protocol][channel]") {
    FakeServerPipes pipes;
    CHECK(pipes.channel->Close().IsOk());
    CHECK(pipes.channel->Close().IsOk());

    auto result = pipes.channel->Request("tools/list", json::object(), kShort);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ChannelClosed);

    auto note = pipes.channel->Notify("notifications/initialized", json::object());
    REQUIRE(note.IsErr());
    CHECK(note.Error().category == ErrorCategory::ChannelClosed);
}

TEST_CASE("StdioChannel: open rejects invalid descriptors", "[protocol][channel]") {
    auto result = StdioChannel::Open(-1, -1, "broken");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
}
