#include <tool_bridge/config/dotenv.hpp>

#include <tool_bridge/core/log.hpp>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace tool_bridge {

namespace {

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

bool IsValidKey(std::string_view key) {
    if (key.empty()) return false;
    for (char c : key) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '.';
        if (!ok) return false;
    }
    return !(key[0] >= '0' && key[0] <= '9');
}

std::string ParseValue(std::string_view raw) {
    raw = Trim(raw);
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'')) {
        const char quote = raw.front();
        const auto close = raw.find(quote, 1);
        if (close != std::string_view::npos) {
            std::string value(raw.substr(1, close - 1));
            if (quote == '"') {
                std::string unescaped;
                for (size_t i = 0; i < value.size(); ++i) {
                    if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] == 'n') {
                        unescaped += '\n';
                        ++i;
                    } else {
                        unescaped += value[i];
                    }
                }
                return unescaped;
            }
            return value;
        }
    }
    // Unquoted: " #" starts a comment.
    const auto comment = raw.find(" #");
    if (comment != std::string_view::npos) {
        raw = Trim(raw.substr(0, comment));
    }
    return std::string(raw);
}

} // anonymous namespace

std::map<std::string, std::string> ParseDotEnv(std::string_view text) {
    std::map<std::string, std::string> vars;
    std::istringstream in{std::string(text)};
    std::string line;
    while (std::getline(in, line)) {
        auto view = Trim(line);
        if (view.empty() || view.front() == '#') continue;
        if (view.substr(0, 7) == "export ") {
            view = Trim(view.substr(7));
        }
        const auto eq = view.find('=');
        if (eq == std::string_view::npos) continue;
        const auto key = Trim(view.substr(0, eq));
        if (!IsValidKey(key)) continue;
        vars[std::string(key)] = ParseValue(view.substr(eq + 1));
    }
    return vars;
}

Result<int, Error> LoadDotEnv(const std::string& path, bool override_existing) {
    std::ifstream file(path);
    if (!file) {
        return Result<int, Error>::Err(Error{
            "LoadDotEnv", "", "Cannot read env file '" + path + "'",
            ErrorCategory::Config, std::nullopt});
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    int applied = 0;
    for (const auto& [key, value] : ParseDotEnv(contents.str())) {
        if (setenv(key.c_str(), value.c_str(), override_existing ? 1 : 0) != 0) {
            return Result<int, Error>::Err(Error::FromErrno(
                "LoadDotEnv", "", "setenv(" + key + ") failed", errno,
                ErrorCategory::Config));
        }
        ++applied;
    }
    LogDebug("config", "Loaded " + std::to_string(applied) +
                           " variables from " + path);
    return Result<int, Error>::Ok(applied);
}

std::vector<std::string> DefaultDotEnvPaths() {
    std::vector<std::string> paths;
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    paths.push_back((cwd / "config" / ".env").string());
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        paths.push_back((std::filesystem::path(home) / ".tool-bridge" / ".env").string());
    }
    paths.push_back((cwd / ".env").string());
    return paths;
}

std::optional<std::string> LoadDefaultDotEnv() {
    for (const auto& path : DefaultDotEnvPaths()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) continue;
        auto result = LoadDotEnv(path);
        if (result.IsErr()) {
            LogWarn("config", result.Error().ToString());
            continue;
        }
        return path;
    }
    return std::nullopt;
}

} // namespace tool_bridge
