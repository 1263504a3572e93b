#pragma once

// Internal helpers shared by the built-in tools. Not installed.

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace stdio_mcp {
namespace tool_helpers {

inline nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

inline nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

inline nlohmann::json MakeSchema(const nlohmann::json& properties,
                                 const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// A string argument, or nullopt when absent or not a string.
inline std::optional<std::string> OptString(const nlohmann::json& args,
                                            const std::string& key) {
    if (args.is_object() && args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace tool_helpers
} // namespace stdio_mcp
