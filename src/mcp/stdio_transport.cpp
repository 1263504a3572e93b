#include <stdio_mcp/mcp/stdio_transport.hpp>

#include <stdio_mcp/core/log.hpp>
#include <stdio_mcp/mcp/message_codec.hpp>

namespace stdio_mcp {

namespace {

constexpr const char* kComponent = "transport";

Error MakeStreamError(const std::string& operation, const std::string& message) {
    return Error{operation, "stdio", message, ErrorCategory::Io, std::nullopt};
}

} // anonymous namespace

StdioTransport::StdioTransport(ProtocolEngine& engine,
                               std::istream& in,
                               std::ostream& out)
    : engine_(engine), in_(in), out_(out) {}

Result<void, Error> StdioTransport::Run() {
    LogInfo(kComponent, "Listening on stdin");

    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        ++frames_read_;
        auto written = ProcessFrame(line);
        if (written.IsErr()) {
            LogError(kComponent, written.Error().ToString());
            return written;
        }
    }

    if (in_.bad()) {
        auto error = MakeStreamError("StdioTransport::Run", "Read from stdin failed");
        LogError(kComponent, error.ToString());
        return Result<void, Error>::Err(std::move(error));
    }

    LogInfo(kComponent, "End of input after " + std::to_string(frames_read_) +
                        " frames, shutting down");
    return Result<void, Error>::Ok();
}

Result<void, Error> StdioTransport::ProcessFrame(const std::string& frame) {
    if (GlobalLogger().Enabled(LogLevel::Debug)) {
        LogDebug(kComponent, "<- " + frame);
    }

    auto decoded = DecodeMessage(frame);
    std::optional<Response> response;
    if (decoded.IsErr()) {
        response = engine_.HandleDecodeError(decoded.Error());
    } else {
        response = engine_.Handle(decoded.Value());
    }

    if (!response) {
        return Result<void, Error>::Ok();
    }
    return WriteFrame(EncodeMessage(*response));
}

Result<void, Error> StdioTransport::WriteFrame(const std::string& frame) {
    if (GlobalLogger().Enabled(LogLevel::Debug)) {
        LogDebug(kComponent, "-> " + frame.substr(0, frame.size() - 1));
    }

    out_ << frame;
    out_.flush();
    if (!out_) {
        return Result<void, Error>::Err(
            MakeStreamError("StdioTransport::WriteFrame", "Write to stdout failed"));
    }
    ++responses_written_;
    return Result<void, Error>::Ok();
}

} // namespace stdio_mcp
