#include "stream_rewriter.hpp"
#include "../util.hpp"

#include <utility>

namespace nimproxy {

Frame make_content_chunk(const std::string& model, const std::string& content) {
    Frame choice;
    choice["index"] = 0;
    choice["delta"] = {{"content", content}};
    choice["finish_reason"] = nullptr;

    Frame chunk;
    chunk["id"] = "chatcmpl-inject-" + std::to_string(epoch_millis());
    chunk["object"] = "chat.completion.chunk";
    chunk["created"] = epoch_seconds();
    chunk["model"] = model;
    chunk["choices"] = Frame::array({choice});
    return chunk;
}

StreamRewriter::StreamRewriter(RewriteOptions options)
    : options_(std::move(options)) {}

bool StreamRewriter::feed(const char* data, size_t len, const EmitCallback& emit) {
    if (stopped_) return false;
    bool ok = framer_.feed(data, len, [&](const std::string& line) {
        return process_line(line, emit);
    });
    if (!ok) abort();
    return ok;
}

bool StreamRewriter::feed(const std::string& chunk, const EmitCallback& emit) {
    return feed(chunk.data(), chunk.size(), emit);
}

bool StreamRewriter::finish(const EmitCallback& emit) {
    if (stopped_) return false;
    framer_.finish();
    bool ok = true;
    if (span_open_ && !terminated_) ok = close_span(emit);
    stopped_ = true;
    return ok;
}

void StreamRewriter::abort() {
    framer_.finish();
    span_open_ = false;
    stopped_ = true;
}

bool StreamRewriter::emit_bytes(const std::string& bytes, const EmitCallback& emit) {
    if (!emit(bytes)) {
        stopped_ = true;
        return false;
    }
    return true;
}

bool StreamRewriter::close_span(const EmitCallback& emit) {
    span_open_ = false;
    return emit_bytes(encode_data_record(
        make_content_chunk(options_.model, options_.markers.close)), emit);
}

bool StreamRewriter::process_line(const std::string& line, const EmitCallback& emit) {
    Record record = classify_record(line);
    switch (record.kind) {
        case RecordKind::Blank:
            return true;
        case RecordKind::Terminator:
            if (span_open_ && options_.show_reasoning && !close_span(emit))
                return false;
            terminated_ = true;
            return emit_bytes(encode_terminator(), emit);
        case RecordKind::Data:
            return process_data(line, record.payload, emit);
        case RecordKind::Opaque:
            return emit_bytes(encode_opaque_record(record.payload), emit);
    }
    return true;
}

bool StreamRewriter::process_data(const std::string& line, const std::string& payload,
                                  const EmitCallback& emit) {
    Frame frame;
    try {
        frame = Frame::parse(payload);
    } catch (const Frame::parse_error&) {
        // Undecodable record goes out exactly as it came in
        return emit_bytes(encode_opaque_record(line), emit);
    }

    if (!options_.show_reasoning)
        return emit_bytes(encode_data_record(strip_reasoning(frame)), emit);

    SpliceResult spliced = splice_frame(frame, span_open_, options_.markers);
    span_open_ = spliced.span_open;
    return emit_bytes(encode_data_record(spliced.frame), emit);
}

} // namespace nimproxy
