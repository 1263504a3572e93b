#pragma once

#include <stdio_mcp/core/result.hpp>
#include <stdio_mcp/mcp/protocol_engine.hpp>

#include <cstddef>
#include <iostream>
#include <string>

namespace stdio_mcp {

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON-RPC over a pair of streams.
//
// Reads one frame, lets the engine handle it, writes the response (if any)
// and only then reads the next frame, so responses leave in request order.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    explicit StdioTransport(ProtocolEngine& engine,
                            std::istream& in = std::cin,
                            std::ostream& out = std::cout);

    // Run until end of input. Returns Ok on a clean EOF and an Io error when
    // reading or writing the streams fails.
    Result<void, Error> Run();

    // Handle one frame (without its newline) and write the response, if
    // any. Fails only when the response cannot be written.
    Result<void, Error> ProcessFrame(const std::string& frame);

    [[nodiscard]] std::size_t FramesRead() const noexcept { return frames_read_; }
    [[nodiscard]] std::size_t ResponsesWritten() const noexcept {
        return responses_written_;
    }

private:
    Result<void, Error> WriteFrame(const std::string& frame);

    ProtocolEngine& engine_;
    std::istream& in_;
    std::ostream& out_;
    std::size_t frames_read_ = 0;
    std::size_t responses_written_ = 0;
};

} // namespace stdio_mcp
