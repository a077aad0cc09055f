#include <catch2/catch_test_macros.hpp>
#include "stream/frame_splicer.hpp"
#include "stream/record.hpp"

using namespace nimproxy;

static Frame delta_frame(const std::string& delta_json) {
    return Frame::parse(R"({"id":"c1","choices":[{"index":0,"delta":)" + delta_json +
                        R"(,"finish_reason":null}]})");
}

static const Frame& delta_of(const Frame& frame) {
    return frame["choices"][0]["delta"];
}

// ── classify_record ──────────────────────────────────────────────

TEST_CASE("classify_record: blank and whitespace-only lines", "[record]") {
    REQUIRE(classify_record("").kind == RecordKind::Blank);
    REQUIRE(classify_record("\r").kind == RecordKind::Blank);
    REQUIRE(classify_record("   ").kind == RecordKind::Blank);
}

TEST_CASE("classify_record: terminator", "[record]") {
    REQUIRE(classify_record("data: [DONE]").kind == RecordKind::Terminator);
    REQUIRE(classify_record("data: [DONE]\r").kind == RecordKind::Terminator);
}

TEST_CASE("classify_record: data record strips prefix", "[record]") {
    auto rec = classify_record("data: {\"a\":1}\r");
    REQUIRE(rec.kind == RecordKind::Data);
    REQUIRE(rec.payload == "{\"a\":1}");
}

TEST_CASE("classify_record: anything else is opaque and kept verbatim", "[record]") {
    auto comment = classify_record(": keep-alive");
    REQUIRE(comment.kind == RecordKind::Opaque);
    REQUIRE(comment.payload == ": keep-alive");

    auto event = classify_record("  event: ping");
    REQUIRE(event.kind == RecordKind::Opaque);
    REQUIRE(event.payload == "  event: ping");

    // No space after the colon is not a data record
    REQUIRE(classify_record("data:{}").kind == RecordKind::Opaque);
}

// ── encoders ─────────────────────────────────────────────────────

TEST_CASE("encode_data_record: compact JSON with key order preserved", "[record]") {
    auto frame = Frame::parse(R"({"z":1,"a":{"y":2,"b":3}})");
    REQUIRE(encode_data_record(frame) == "data: {\"z\":1,\"a\":{\"y\":2,\"b\":3}}\n\n");
}

TEST_CASE("encode_terminator and encode_opaque_record", "[record]") {
    REQUIRE(encode_terminator() == "data: [DONE]\n\n");
    REQUIRE(encode_opaque_record(": ping") == ": ping\n");
}

// ── splice_frame ─────────────────────────────────────────────────

TEST_CASE("splice_frame: first reasoning opens the span", "[splicer]") {
    ReasoningMarkers markers;
    auto result = splice_frame(delta_frame(R"({"reasoning_content":"hmm"})"), false, markers);
    REQUIRE(result.span_open);
    const auto& delta = delta_of(result.frame);
    REQUIRE(delta["content"] == "<think>\nhmm");
    REQUIRE_FALSE(delta.contains("reasoning_content"));
}

TEST_CASE("splice_frame: reasoning inside an open span adds no marker", "[splicer]") {
    ReasoningMarkers markers;
    auto result = splice_frame(delta_frame(R"({"reasoning_content":" more"})"), true, markers);
    REQUIRE(result.span_open);
    REQUIRE(delta_of(result.frame)["content"] == " more");
}

TEST_CASE("splice_frame: content closes an open span", "[splicer]") {
    ReasoningMarkers markers;
    auto result = splice_frame(delta_frame(R"({"content":"4"})"), true, markers);
    REQUIRE_FALSE(result.span_open);
    REQUIRE(delta_of(result.frame)["content"] == "\n</think>\n\n4");
}

TEST_CASE("splice_frame: reasoning and content in one frame, reasoning first", "[splicer]") {
    ReasoningMarkers markers;
    auto result = splice_frame(
        delta_frame(R"({"content":"answer","reasoning_content":"think"})"), false, markers);
    REQUIRE_FALSE(result.span_open);
    REQUIRE(delta_of(result.frame)["content"] == "<think>\nthink\n</think>\n\nanswer");
}

TEST_CASE("splice_frame: alternate reasoning field name", "[splicer]") {
    ReasoningMarkers markers;
    auto result = splice_frame(delta_frame(R"({"reasoning":"r"})"), false, markers);
    REQUIRE(result.span_open);
    REQUIRE(delta_of(result.frame)["content"] == "<think>\nr");
    REQUIRE_FALSE(delta_of(result.frame).contains("reasoning"));
}

TEST_CASE("splice_frame: empty reasoning_content falls back to reasoning", "[splicer]") {
    ReasoningMarkers markers;
    auto result = splice_frame(delta_frame(R"({"reasoning_content":"","reasoning":"x"})"),
                               false, markers);
    REQUIRE(result.span_open);
    const auto& delta = delta_of(result.frame);
    REQUIRE(delta["content"] == "<think>\nx");
    REQUIRE_FALSE(delta.contains("reasoning_content"));
    REQUIRE_FALSE(delta.contains("reasoning"));
}

TEST_CASE("splice_frame: explicit empty content survives", "[splicer]") {
    ReasoningMarkers markers;
    auto result = splice_frame(delta_frame(R"({"role":"assistant","content":""})"), false, markers);
    REQUIRE_FALSE(result.span_open);
    const auto& delta = delta_of(result.frame);
    REQUIRE(delta["role"] == "assistant");
    REQUIRE(delta["content"] == "");
}

TEST_CASE("splice_frame: empty content does not close the span", "[splicer]") {
    ReasoningMarkers markers;
    auto result = splice_frame(delta_frame(R"({"content":""})"), true, markers);
    REQUIRE(result.span_open);
    REQUIRE(delta_of(result.frame)["content"] == "");
}

TEST_CASE("splice_frame: null or absent content is omitted", "[splicer]") {
    ReasoningMarkers markers;
    auto with_null = splice_frame(delta_frame(R"({"content":null,"reasoning_content":null})"),
                                  false, markers);
    REQUIRE(delta_of(with_null.frame).empty());

    auto absent = splice_frame(delta_frame(R"({"role":"assistant"})"), false, markers);
    REQUIRE_FALSE(delta_of(absent.frame).contains("content"));
    REQUIRE(delta_of(absent.frame)["role"] == "assistant");
}

TEST_CASE("splice_frame: frame-level fields pass through unchanged", "[splicer]") {
    ReasoningMarkers markers;
    auto input = Frame::parse(
        R"({"id":"x","object":"chat.completion.chunk","created":5,"model":"m",)"
        R"("choices":[{"index":0,"delta":{"content":"hi","tool_calls":[]},"finish_reason":"stop"}],)"
        R"("usage":{"total_tokens":3}})");
    auto result = splice_frame(input, false, markers);
    REQUIRE(result.frame == input);
    REQUIRE(result.frame.dump() == input.dump());
}

TEST_CASE("splice_frame: frames without a delta are untouched", "[splicer]") {
    ReasoningMarkers markers;
    auto usage_only = Frame::parse(R"({"choices":[],"usage":{"total_tokens":9}})");
    auto result = splice_frame(usage_only, true, markers);
    REQUIRE(result.span_open);
    REQUIRE(result.frame == usage_only);

    auto no_delta = Frame::parse(R"({"choices":[{"index":0,"finish_reason":"stop"}]})");
    REQUIRE(splice_frame(no_delta, false, markers).frame == no_delta);
}

TEST_CASE("splice_frame: input frame is not modified", "[splicer]") {
    ReasoningMarkers markers;
    auto input = delta_frame(R"({"reasoning_content":"r"})");
    auto copy = input;
    splice_frame(input, false, markers);
    REQUIRE(input == copy);
}

TEST_CASE("splice_frame: custom markers", "[splicer]") {
    ReasoningMarkers markers{"[[", "]]"};
    auto open = splice_frame(delta_frame(R"({"reasoning_content":"a"})"), false, markers);
    auto close = splice_frame(delta_frame(R"({"content":"b"})"), open.span_open, markers);
    REQUIRE(delta_of(open.frame)["content"] == "[[a");
    REQUIRE(delta_of(close.frame)["content"] == "]]b");
}

// ── strip_reasoning ──────────────────────────────────────────────

TEST_CASE("strip_reasoning: drops reasoning, substitutes empty content", "[splicer]") {
    auto out = strip_reasoning(delta_frame(R"({"reasoning_content":"secret"})"));
    REQUIRE_FALSE(delta_of(out).contains("reasoning_content"));
    REQUIRE(delta_of(out)["content"] == "");

    auto null_content = strip_reasoning(delta_frame(R"({"content":null})"));
    REQUIRE(delta_of(null_content)["content"] == "");
}

TEST_CASE("strip_reasoning: content passes through without markers", "[splicer]") {
    auto out = strip_reasoning(delta_frame(R"({"content":"The answer","reasoning":"x"})"));
    REQUIRE(delta_of(out)["content"] == "The answer");
    REQUIRE_FALSE(delta_of(out).contains("reasoning"));
}

// ── reasoning_text / join_reasoning ──────────────────────────────

TEST_CASE("reasoning_text: prefers reasoning_content", "[splicer]") {
    REQUIRE(reasoning_text(Frame::parse(R"({"reasoning_content":"a","reasoning":"b"})")) == "a");
    REQUIRE(reasoning_text(Frame::parse(R"({"reasoning_content":null,"reasoning":"b"})")) == "b");
    REQUIRE(reasoning_text(Frame::parse(R"({"reasoning_content":"","reasoning":"b"})")) == "b");
    REQUIRE(reasoning_text(Frame::parse(R"({"content":"c"})")).empty());
    REQUIRE(reasoning_text(Frame::parse("[]")).empty());
}

TEST_CASE("join_reasoning: wraps reasoning ahead of content", "[splicer]") {
    ReasoningMarkers markers;
    REQUIRE(join_reasoning("why", "because", markers) == "<think>\nwhy\n</think>\n\nbecause");
    REQUIRE(join_reasoning("", "because", markers) == "because");
}
