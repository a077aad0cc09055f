#pragma once
#include "record_framer.hpp"
#include "record.hpp"
#include "frame_splicer.hpp"
#include <string>
#include <functional>
#include <cstddef>

namespace nimproxy {

struct RewriteOptions {
    bool show_reasoning = true;
    std::string model; // client-facing model id, stamped on synthesized records
    ReasoningMarkers markers;
};

// Receives rewritten event-stream bytes. Return false once the client is gone.
using EmitCallback = std::function<bool(const std::string& bytes)>;

// Rewrites one upstream event stream into the client-facing stream.
// One instance per response; holds the reasoning-span state for that
// response only. Does no I/O: the caller pushes chunks in and receives
// output through the emit callback.
class StreamRewriter {
public:
    explicit StreamRewriter(RewriteOptions options);

    // Process one upstream chunk. Returns false once emit has refused output;
    // the rewriter is stopped from then on.
    bool feed(const char* data, size_t len, const EmitCallback& emit);
    bool feed(const std::string& chunk, const EmitCallback& emit);

    // Upstream ended cleanly. Drops a torn final line and, if reasoning is
    // still open and no terminator was seen, closes the span.
    bool finish(const EmitCallback& emit);

    // Upstream error or client disconnect: stop without emitting anything.
    void abort();

    bool span_open() const { return span_open_; }
    bool stopped() const { return stopped_; }

private:
    bool process_line(const std::string& line, const EmitCallback& emit);
    bool process_data(const std::string& line, const std::string& payload,
                      const EmitCallback& emit);
    bool close_span(const EmitCallback& emit);
    bool emit_bytes(const std::string& bytes, const EmitCallback& emit);

    RewriteOptions options_;
    RecordFramer framer_;
    bool span_open_ = false;
    bool terminated_ = false;
    bool stopped_ = false;
};

// Minimal chat.completion.chunk carrying one content delta, used for
// records the proxy injects into the stream.
Frame make_content_chunk(const std::string& model, const std::string& content);

} // namespace nimproxy
