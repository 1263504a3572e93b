#include <stdio_mcp/tools/builtin_tools.hpp>

#include <stdio_mcp/core/log.hpp>

#include "tool_helpers.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace stdio_mcp {

using namespace tool_helpers;
namespace fs = std::filesystem;

namespace {

// Structural UTF-8 check (lead/continuation bytes, no overlongs or surrogates).
bool IsValidUtf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            if (c < 0xC2) return false;
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            if (c > 0xF4) return false;
            len = 4;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        const auto c1 = static_cast<unsigned char>(s[i + 1]);
        if (len == 3 && c == 0xE0 && c1 < 0xA0) return false;
        if (len == 3 && c == 0xED && c1 > 0x9F) return false;
        if (len == 4 && c == 0xF0 && c1 < 0x90) return false;
        if (len == 4 && c == 0xF4 && c1 > 0x8F) return false;
        i += len;
    }
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// list_files
// ---------------------------------------------------------------------------
std::string ListFilesTool::Description() const {
    return "List files in a directory";
}

nlohmann::json ListFilesTool::InputSchema() const {
    auto path = StringProp("Directory path to list");
    path["default"] = ".";
    return {{"type", "object"}, {"properties", {{"path", path}}}};
}

CallResult ListFilesTool::Invoke(const nlohmann::json& arguments) {
    const auto path = OptString(arguments, "path").value_or(".");

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        LogDebug("tool:list_files", path + ": " + ec.message());
        return CallResult::Failure("Error listing directory: " + ec.message());
    }

    std::vector<std::pair<std::string, bool>> entries;
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        const bool is_dir = it->is_directory(type_ec);
        entries.emplace_back(it->path().filename().string(), is_dir && !type_ec);
    }
    if (ec) {
        return CallResult::Failure("Error listing directory: " + ec.message());
    }

    if (entries.empty()) {
        return CallResult::Text("Directory is empty");
    }

    std::sort(entries.begin(), entries.end());
    std::ostringstream out;
    out << "Files in " << path << ":";
    for (const auto& [name, is_dir] : entries) {
        out << '\n' << name << (is_dir ? " (directory)" : " (file)");
    }
    return CallResult::Text(out.str());
}

// ---------------------------------------------------------------------------
// read_file
// ---------------------------------------------------------------------------
ReadFileTool::ReadFileTool(std::uint64_t default_max_bytes)
    : default_max_bytes_(default_max_bytes) {}

std::string ReadFileTool::Description() const {
    return "Read the contents of a file";
}

nlohmann::json ReadFileTool::InputSchema() const {
    auto max_size = IntProp("Maximum file size to read in bytes");
    max_size["default"] = default_max_bytes_;
    return MakeSchema({{"path", StringProp("Path to the file to read")},
                       {"max_size", max_size}},
                      nlohmann::json::array({"path"}));
}

CallResult ReadFileTool::Invoke(const nlohmann::json& arguments) {
    auto path = OptString(arguments, "path");
    if (!path || path->empty()) {
        return CallResult::Failure("Missing required parameter: path");
    }

    std::uint64_t max_size = default_max_bytes_;
    if (arguments.contains("max_size") && !arguments["max_size"].is_null()) {
        const auto& value = arguments["max_size"];
        if (!value.is_number_integer() ||
            (!value.is_number_unsigned() && value.get<std::int64_t>() <= 0)) {
            return CallResult::Failure(
                "Invalid parameter: max_size must be a positive integer");
        }
        max_size = value.get<std::uint64_t>();
    }

    std::error_code ec;
    const auto size = fs::file_size(*path, ec);
    if (ec) {
        return CallResult::Failure("Error accessing file: " + ec.message());
    }
    if (size > max_size) {
        return CallResult::Failure("File is too large (" + std::to_string(size) +
                                   " bytes, max: " + std::to_string(max_size) +
                                   " bytes)");
    }

    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        return CallResult::Failure(std::string("Error reading file: ") + std::strerror(errno));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return CallResult::Failure("Error reading file: read failed");
    }

    auto content = buffer.str();
    if (!IsValidUtf8(content)) {
        return CallResult::Failure("Error reading file: file is not valid UTF-8 text");
    }
    LogDebug("tool:read_file", "Read " + std::to_string(content.size()) +
                               " bytes from " + *path);
    return CallResult::Text("Contents of " + *path + ":\n" + content);
}

} // namespace stdio_mcp
