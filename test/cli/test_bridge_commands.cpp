#include <catch2/catch_test_macros.hpp>

#include <tool_bridge/cli/bridge_commands.hpp>

#include <sstream>

using namespace tool_bridge;
using nlohmann::json;

namespace {

ToolRegistry SampleRegistry() {
    ToolRegistry registry;
    registry.Register("echo", "Echo the given text back",
        json{{"type", "object"}, {"properties", {{"text", {{"type", "string"}}}}}},
        [](const json& args) {
            return InvocationResult::Success(args.value("text", ""));
        });
    registry.Register("fail", "Always fails", json::object(),
        [](const json&) {
            return InvocationResult::Failure("Tool returned error", "partial output");
        });
    return registry;
}

} // anonymous namespace

// ===========================================================================
// list
// ===========================================================================

TEST_CASE("RunList: one line per tool", "[cli][list]") {
    std::ostringstream out;
    CHECK(RunList(SampleRegistry(), out, false) == kExitSuccess);
    CHECK(out.str() == "echo: Echo the given text back\nfail: Always fails\n");
}

TEST_CASE("RunList: empty registry", "[cli][list]") {
    std::ostringstream out;
    CHECK(RunList(ToolRegistry{}, out, false) == kExitSuccess);
    CHECK(out.str() == "No tools available.\n");
}

TEST_CASE("RunList: JSON listing carries the schemas", "[cli][list]") {
    std::ostringstream out;
    CHECK(RunList(SampleRegistry(), out, true) == kExitSuccess);

    auto listing = json::parse(out.str());
    REQUIRE(listing.is_array());
    REQUIRE(listing.size() == 2);
    CHECK(listing[0]["name"] == "echo");
    CHECK(listing[0]["description"] == "Echo the given text back");
    CHECK(listing[0]["inputSchema"]["properties"].contains("text"));
}

TEST_CASE("RunList: empty registry as JSON", "[cli][list]") {
    std::ostringstream out;
    CHECK(RunList(ToolRegistry{}, out, true) == kExitSuccess);
    CHECK(json::parse(out.str()) == json::array());
}

// ===========================================================================
// call
// ===========================================================================

TEST_CASE("RunCall: successful call prints the content", "[cli][call]") {
    std::ostringstream out;
    CHECK(RunCall(SampleRegistry(), "echo", R"({"text":"hi"})", out, false) == kExitSuccess);
    CHECK(out.str() == "hi\n");
}

TEST_CASE("RunCall: failed call exits with tool failure", "[cli][call]") {
    std::ostringstream out;
    CHECK(RunCall(SampleRegistry(), "fail", "{}", out, false) == kExitToolFailed);
    CHECK(out.str() == "partial output\n");
}

TEST_CASE("RunCall: JSON result document", "[cli][call]") {
    std::ostringstream out;
    CHECK(RunCall(SampleRegistry(), "fail", "{}", out, true) == kExitToolFailed);

    auto doc = json::parse(out.str());
    CHECK(doc["ok"] == false);
    CHECK(doc["content"] == "partial output");
    CHECK(doc["error"] == "Tool returned error");
}

TEST_CASE("RunCall: JSON success has no error member", "[cli][call]") {
    std::ostringstream out;
    CHECK(RunCall(SampleRegistry(), "echo", R"({"text":"x"})", out, true) == kExitSuccess);

    auto doc = json::parse(out.str());
    CHECK(doc["ok"] == true);
    CHECK(doc["content"] == "x");
    CHECK_FALSE(doc.contains("error"));
}

TEST_CASE("RunCall: unknown tool", "[cli][call]") {
    std::ostringstream out;
    CHECK(RunCall(SampleRegistry(), "ghost", "{}", out, false) == kExitToolFailed);
    CHECK(out.str().empty());
}

TEST_CASE("RunCall: arguments must be a JSON object", "[cli][call]") {
    std::ostringstream out;
    CHECK(RunCall(SampleRegistry(), "echo", "[1,2]", out, false) == kExitConfig);
    CHECK(RunCall(SampleRegistry(), "echo", "not json", out, false) == kExitConfig);
    CHECK(out.str().empty());
}

// ===========================================================================
// Errors and logging setup
// ===========================================================================

TEST_CASE("PrintError: text and JSON forms", "[cli][error]") {
    Error error{"initialize", "search", "Timed out", ErrorCategory::Timeout, std::nullopt};

    std::ostringstream text;
    PrintError(error, false, text);
    CHECK(text.str().rfind("Error: ", 0) == 0);
    CHECK(text.str().find("Timed out") != std::string::npos);

    std::ostringstream doc;
    PrintError(error, true, doc);
    auto parsed = json::parse(doc.str());
    CHECK(parsed.is_object());
}

TEST_CASE("EffectiveLogLevel: flags override the configured level", "[cli][log]") {
    LogSettings settings;
    settings.level = "warn";

    SECTION("configured level") {
        auto level = EffectiveLogLevel(settings);
        REQUIRE(level.IsOk());
        CHECK(level.Value() == LogLevel::Warn);
    }
    SECTION("verbose") {
        settings.verbose = true;
        CHECK(EffectiveLogLevel(settings).Value() == LogLevel::Debug);
    }
    SECTION("quiet") {
        settings.quiet = true;
        CHECK(EffectiveLogLevel(settings).Value() == LogLevel::Error);
    }
    SECTION("unknown level") {
        settings.level = "loud";
        CHECK(EffectiveLogLevel(settings).IsErr());
    }
}

TEST_CASE("ResolveLogColor: explicit modes", "[cli][log]") {
    CHECK(ResolveLogColor(ColorMode::Always));
    CHECK_FALSE(ResolveLogColor(ColorMode::Never));
}

TEST_CASE("MakeLogSink: unwritable log file", "[cli][log]") {
    LogSettings settings;
    settings.file = "/nonexistent/dir/bridge.log";
    auto sink = MakeLogSink(settings);
    CHECK(sink.IsErr());
}
