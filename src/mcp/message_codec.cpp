#include <stdio_mcp/mcp/message_codec.hpp>

#include <cctype>
#include <charconv>
#include <limits>

namespace stdio_mcp {

namespace {

using DecodeResult = Result<Message, DecodeError>;

DecodeResult Fail(DecodeErrorKind kind, std::string message,
                  std::optional<RequestId> id = std::nullopt) {
    return DecodeResult::Err(DecodeError{kind, std::move(message), std::move(id)});
}

std::string_view StripFrameTerminator(std::string_view frame) {
    if (!frame.empty() && frame.back() == '\n') frame.remove_suffix(1);
    if (!frame.empty() && frame.back() == '\r') frame.remove_suffix(1);
    return frame;
}

// Outcome of reading the "id" member of a decoded object.
struct IdField {
    bool present = false;
    bool valid = false;  // string or integer
    bool is_null = false;
    std::optional<RequestId> id;
};

IdField ReadIdField(const nlohmann::json& obj) {
    IdField field;
    auto it = obj.find("id");
    if (it == obj.end()) return field;
    field.present = true;
    if (it->is_null()) {
        field.is_null = true;
        return field;
    }
    if (it->is_string()) {
        field.valid = true;
        field.id = it->get<std::string>();
    } else if (it->is_number_integer() && !it->is_number_unsigned()) {
        field.valid = true;
        field.id = it->get<std::int64_t>();
    } else if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        field.valid = true;
        if (value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            field.id = static_cast<std::int64_t>(value);
        } else {
            field.id = value;
        }
    }
    return field;
}

bool IsStructured(const nlohmann::json& value) {
    return value.is_object() || value.is_array();
}

DecodeResult DecodeCall(const nlohmann::json& obj, const IdField& id) {
    const auto& method = obj["method"];
    if (!method.is_string() || method.get_ref<const std::string&>().empty()) {
        return Fail(DecodeErrorKind::InvalidShape,
                    "'method' must be a non-empty string", id.id);
    }

    std::optional<nlohmann::json> params;
    if (auto it = obj.find("params"); it != obj.end()) {
        if (!IsStructured(*it)) {
            return Fail(DecodeErrorKind::InvalidShape,
                        "'params' must be an object or an array", id.id);
        }
        params = *it;
    }

    if (!id.present) {
        return DecodeResult::Ok(Notification{method.get<std::string>(), std::move(params)});
    }
    if (!id.valid) {
        return Fail(DecodeErrorKind::InvalidShape,
                    "'id' must be a string or an integer");
    }
    return DecodeResult::Ok(Request{*id.id, method.get<std::string>(), std::move(params)});
}

DecodeResult DecodeResponse(const nlohmann::json& obj, const IdField& id) {
    if (!id.present) {
        return Fail(DecodeErrorKind::InvalidShape, "Response is missing 'id'");
    }
    if (!id.valid && !id.is_null) {
        return Fail(DecodeErrorKind::InvalidShape,
                    "'id' must be a string, an integer or null");
    }

    if (auto it = obj.find("result"); it != obj.end()) {
        Response r;
        r.id = id.id;
        r.outcome.emplace<0>(*it);
        return DecodeResult::Ok(std::move(r));
    }

    const auto& error = obj["error"];
    if (!error.is_object() || !error.contains("code") ||
        !error["code"].is_number_integer() || !error.contains("message") ||
        !error["message"].is_string()) {
        return Fail(DecodeErrorKind::InvalidShape,
                    "'error' must be an object with integer 'code' and string 'message'",
                    id.id);
    }
    ProtocolError pe{error["code"].get<int>(), error["message"].get<std::string>(),
                     std::nullopt};
    if (error.contains("data")) {
        pe.data = error["data"];
    }
    return DecodeResult::Ok(Response::Failure(id.id, std::move(pe)));
}

DecodeResult DecodeObject(const nlohmann::json& obj) {
    if (!obj.is_object()) {
        return Fail(DecodeErrorKind::Malformed, "Frame is not a JSON object");
    }

    const auto id = ReadIdField(obj);
    const bool has_method = obj.contains("method");
    const bool has_result = obj.contains("result");
    const bool has_error = obj.contains("error");

    if (!has_method && has_result == has_error) {
        // A request-side object that lost its method is an ill-shaped request;
        // anything else is not recognizable as a message at all.
        if (obj.contains("params")) {
            return Fail(DecodeErrorKind::InvalidShape, "Request is missing 'method'", id.id);
        }
        return Fail(DecodeErrorKind::Malformed,
                    has_result ? "Response carries both 'result' and 'error'"
                               : "Object is neither a request nor a response",
                    id.id);
    }

    auto version = obj.find("jsonrpc");
    if (version == obj.end() || !version->is_string() || *version != kJsonRpcVersion) {
        return Fail(DecodeErrorKind::InvalidShape,
                    "'jsonrpc' must be \"2.0\"", id.id);
    }

    if (has_method) {
        return DecodeCall(obj, id);
    }
    return DecodeResponse(obj, id);
}

std::optional<RequestId> ParseIdToken(std::string_view text) {
    if (text.empty()) return std::nullopt;

    if (text.front() == '"') {
        bool escaped = false;
        for (size_t i = 1; i < text.size(); ++i) {
            if (escaped) {
                escaped = false;
            } else if (text[i] == '\\') {
                escaped = true;
            } else if (text[i] == '"') {
                try {
                    return nlohmann::json::parse(text.substr(0, i + 1)).get<std::string>();
                } catch (const nlohmann::json::exception&) {
                    return std::nullopt;
                }
            }
        }
        return std::nullopt;
    }

    size_t end = 0;
    if (text[end] == '-') ++end;
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
    if (end == 0 || (end == 1 && text[0] == '-')) return std::nullopt;
    if (end < text.size() && (text[end] == '.' || text[end] == 'e' || text[end] == 'E')) {
        return std::nullopt;
    }

    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + end, value);
    if (ec == std::errc() && ptr == text.data() + end) return value;
    if (ec != std::errc::result_out_of_range || text[0] == '-') return std::nullopt;

    std::uint64_t wide = 0;
    auto [wide_ptr, wide_ec] = std::from_chars(text.data(), text.data() + end, wide);
    if (wide_ec != std::errc() || wide_ptr != text.data() + end) return std::nullopt;
    return wide;
}

size_t SkipSpace(std::string_view text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    return pos;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
nlohmann::json MessageToJson(const Message& message) {
    nlohmann::json j = {{"jsonrpc", kJsonRpcVersion}};

    if (const auto* request = std::get_if<Request>(&message)) {
        j["id"] = RequestIdToJson(request->id);
        j["method"] = request->method;
        if (request->params) j["params"] = *request->params;
    } else if (const auto* notification = std::get_if<Notification>(&message)) {
        j["method"] = notification->method;
        if (notification->params) j["params"] = *notification->params;
    } else {
        const auto& response = std::get<Response>(message);
        j["id"] = response.id ? RequestIdToJson(*response.id) : nlohmann::json(nullptr);
        if (response.IsError()) {
            j["error"] = response.Error().ToJson();
        } else {
            j["result"] = response.Result();
        }
    }
    return j;
}

std::string EncodeMessage(const Message& message) {
    auto frame = MessageToJson(message).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    frame.push_back('\n');
    return frame;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
Result<Message, DecodeError> DecodeMessage(std::string_view frame) {
    frame = StripFrameTerminator(frame);

    nlohmann::json obj;
    try {
        obj = nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error& e) {
        return Fail(DecodeErrorKind::Malformed,
                    std::string("Invalid JSON: ") + e.what(),
                    RecoverRequestId(frame));
    }

    auto decoded = DecodeObject(obj);
    if (decoded.IsErr()) {
        auto error = std::move(decoded).Error();
        error.parsed = true;
        return DecodeResult::Err(std::move(error));
    }
    return decoded;
}

std::optional<RequestId> RecoverRequestId(std::string_view frame) {
    int depth = 0;
    size_t i = 0;
    while (i < frame.size()) {
        const char c = frame[i];
        if (c == '"') {
            const size_t start = i++;
            bool escaped = false;
            while (i < frame.size()) {
                if (escaped) {
                    escaped = false;
                } else if (frame[i] == '\\') {
                    escaped = true;
                } else if (frame[i] == '"') {
                    break;
                }
                ++i;
            }
            if (i >= frame.size()) return std::nullopt;
            const auto token = frame.substr(start, i - start + 1);
            ++i;
            if (depth == 1 && token == "\"id\"") {
                size_t pos = SkipSpace(frame, i);
                if (pos < frame.size() && frame[pos] == ':') {
                    return ParseIdToken(frame.substr(SkipSpace(frame, pos + 1)));
                }
            }
            continue;
        }
        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        }
        ++i;
    }
    return std::nullopt;
}

} // namespace stdio_mcp
