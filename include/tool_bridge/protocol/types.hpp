#pragma once

#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace tool_bridge {

struct ClientInfo {
    std::string name;
    std::string version;
};

struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// ToolDescriptor — one capability as advertised by tools/list. Read-only
// after discovery.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// ---------------------------------------------------------------------------
// ContentFragment — one item of a tools/call result. Text is kept as text;
// every other kind (image, resource, ...) is kept as its compact JSON form.
// ---------------------------------------------------------------------------
struct TextContent {
    std::string text;
};

struct OtherContent {
    std::string type;
    std::string rendering;
};

using ContentFragment = std::variant<TextContent, OtherContent>;

struct CallToolResult {
    std::vector<ContentFragment> content;
    bool is_error = false;
};

/// Classify one raw content item.
ContentFragment ParseContentFragment(const nlohmann::json& item);

/// The text of a TextContent, the rendering of anything else.
std::string RenderFragment(const ContentFragment& fragment);

} // namespace tool_bridge
