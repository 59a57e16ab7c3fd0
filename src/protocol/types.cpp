#include <tool_bridge/protocol/types.hpp>

namespace tool_bridge {

ContentFragment ParseContentFragment(const nlohmann::json& item) {
    if (item.is_object()) {
        auto type = item.find("type");
        auto text = item.find("text");
        if (type != item.end() && type->is_string() && *type == "text" &&
            text != item.end() && text->is_string()) {
            return TextContent{text->get<std::string>()};
        }
        if (type != item.end() && type->is_string()) {
            return OtherContent{type->get<std::string>(), item.dump()};
        }
    }
    return OtherContent{"unknown", item.dump()};
}

std::string RenderFragment(const ContentFragment& fragment) {
    if (const auto* text = std::get_if<TextContent>(&fragment)) {
        return text->text;
    }
    return std::get<OtherContent>(fragment).rendering;
}

} // namespace tool_bridge
