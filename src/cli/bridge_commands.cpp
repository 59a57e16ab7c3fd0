#include <tool_bridge/cli/bridge_commands.hpp>

#include <tool_bridge/core/terminal.hpp>

#include <iostream>

#include <nlohmann/json.hpp>

namespace tool_bridge {

// ---------------------------------------------------------------------------
// Logging setup
// ---------------------------------------------------------------------------
Result<LogLevel, Error> EffectiveLogLevel(const LogSettings& settings) {
    if (settings.quiet) {
        return Result<LogLevel, Error>::Ok(LogLevel::Error);
    }
    if (settings.verbose) {
        return Result<LogLevel, Error>::Ok(LogLevel::Debug);
    }
    return ParseLogLevel(settings.level);
}

bool ResolveLogColor(ColorMode mode) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never:  return false;
        case ColorMode::Auto:   break;
    }
    return !NoColorEnvSet() && IsStderrTty();
}

Result<std::unique_ptr<ILogSink>, Error> MakeLogSink(const LogSettings& settings) {
    using R = Result<std::unique_ptr<ILogSink>, Error>;

    std::unique_ptr<ILogSink> console;
    if (settings.json) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ColorConsoleSink>(ResolveLogColor(settings.color));
    }

    if (!settings.file.has_value()) {
        return R::Ok(std::move(console));
    }
    auto file = FileSink::Open(*settings.file, std::move(console));
    if (file.IsErr()) {
        return R::Err(std::move(file).Error());
    }
    return R::Ok(std::move(file).Value());
}

Result<void, Error> ConfigureLogging(const LogSettings& settings) {
    auto level = EffectiveLogLevel(settings);
    if (level.IsErr()) {
        return Result<void, Error>::Err(std::move(level).Error());
    }
    auto sink = MakeLogSink(settings);
    if (sink.IsErr()) {
        return Result<void, Error>::Err(std::move(sink).Error());
    }
    InitGlobalLogger(std::move(sink).Value(), level.Value());
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// list
// ---------------------------------------------------------------------------
int RunList(const ToolRegistry& registry, std::ostream& out, bool json) {
    if (json) {
        auto listing = nlohmann::json::array();
        for (const auto& tool : registry.Tools()) {
            listing.push_back({
                {"name", tool->Name()},
                {"description", tool->Description()},
                {"inputSchema", tool->ParametersSchema()}
            });
        }
        out << listing.dump(2) << "\n";
        return kExitSuccess;
    }

    if (registry.Tools().empty()) {
        out << "No tools available.\n";
        return kExitSuccess;
    }
    for (const auto& tool : registry.Tools()) {
        out << tool->Name() << ": " << tool->Description() << "\n";
    }
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// call
// ---------------------------------------------------------------------------
int RunCall(const ToolRegistry& registry,
            const std::string& tool_name,
            const std::string& args_json,
            std::ostream& out,
            bool json) {
    auto arguments = nlohmann::json::parse(args_json, nullptr, false);
    if (arguments.is_discarded() || !arguments.is_object()) {
        PrintError(Error{"call", "", "Tool arguments must be a JSON object",
                         ErrorCategory::Config, std::nullopt},
                   json, std::cerr);
        return kExitConfig;
    }

    if (!registry.HasTool(tool_name)) {
        PrintError(Error{"call", "", "Unknown tool: " + tool_name,
                         ErrorCategory::Discovery, std::nullopt},
                   json, std::cerr);
        return kExitToolFailed;
    }

    const auto result = registry.Execute(tool_name, arguments);

    if (json) {
        nlohmann::json doc = {{"ok", result.ok}, {"content", result.content}};
        if (result.error_message.has_value()) {
            doc["error"] = *result.error_message;
        }
        out << doc.dump(2) << "\n";
    } else {
        if (!result.content.empty()) {
            out << result.content << "\n";
        }
        if (!result.ok) {
            std::cerr << "Error: " << result.error_message.value_or("Tool call failed")
                      << "\n";
        }
    }
    return result.ok ? kExitSuccess : kExitToolFailed;
}

void PrintError(const Error& error, bool json, std::ostream& err) {
    if (json) {
        err << error.ToJson() << "\n";
    } else {
        err << "Error: " << error.ToString() << "\n";
    }
}

} // namespace tool_bridge
