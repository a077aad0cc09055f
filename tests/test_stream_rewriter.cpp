#include <catch2/catch_test_macros.hpp>
#include "stream/stream_rewriter.hpp"
#include "stream_test_util.hpp"
#include <vector>

using namespace nimproxy;

static RewriteOptions options(bool show_reasoning = true) {
    RewriteOptions opts;
    opts.show_reasoning = show_reasoning;
    opts.model = "gpt-4";
    return opts;
}

// Helper: run chunks through a fresh rewriter and return everything emitted
static std::string rewrite(const std::vector<std::string>& chunks, bool show_reasoning = true) {
    StreamRewriter rewriter(options(show_reasoning));
    std::string out;
    EmitCallback emit = [&](const std::string& bytes) {
        out += bytes;
        return true;
    };
    for (const auto& chunk : chunks) rewriter.feed(chunk, emit);
    rewriter.finish(emit);
    return out;
}

static std::string concat(const std::vector<std::string>& parts) {
    std::string all;
    for (const auto& p : parts) {
        if (p != "[DONE]" && p != "<absent>") all += p;
    }
    return all;
}

static const std::string kDone = "data: [DONE]\n\n";

// ── Scenarios ────────────────────────────────────────────────────

TEST_CASE("StreamRewriter: content only passes through without markers", "[rewriter]") {
    auto out = rewrite({delta_record(R"({"content":"Hi"})"),
                        delta_record(R"({"content":" there"})"),
                        kDone});
    auto contents = stream_contents(out);
    REQUIRE(contents == std::vector<std::string>{"Hi", " there", "[DONE]"});
    REQUIRE(out.find("<think>") == std::string::npos);
    REQUIRE(out.find("</think>") == std::string::npos);
}

TEST_CASE("StreamRewriter: reasoning then content", "[rewriter]") {
    auto out = rewrite({delta_record(R"({"reasoning_content":"Let me think"})"),
                        delta_record(R"({"content":"The answer is 4"})"),
                        kDone});
    auto contents = stream_contents(out);
    REQUIRE(contents == std::vector<std::string>{
        "<think>\nLet me think", "\n</think>\n\nThe answer is 4", "[DONE]"});
    REQUIRE(out.find("reasoning_content") == std::string::npos);
}

TEST_CASE("StreamRewriter: unclosed reasoning is closed before the terminator", "[rewriter]") {
    auto out = rewrite({delta_record(R"({"reasoning_content":"partial thought"})"), kDone});
    auto contents = stream_contents(out);
    REQUIRE(contents == std::vector<std::string>{
        "<think>\npartial thought", "\n</think>\n\n", "[DONE]"});

    // The injected record is a well-formed chunk for the client model
    size_t second = out.find("data: ", 1);
    size_t end = out.find('\n', second);
    auto injected = Frame::parse(out.substr(second + 6, end - second - 6));
    REQUIRE(injected["object"] == "chat.completion.chunk");
    REQUIRE(injected["model"] == "gpt-4");
    REQUIRE(injected["choices"][0]["index"] == 0);
    REQUIRE(injected["choices"][0]["finish_reason"].is_null());
    REQUIRE(injected["id"].get<std::string>().rfind("chatcmpl-inject-", 0) == 0);
}

TEST_CASE("StreamRewriter: reasoning display disabled", "[rewriter]") {
    auto out = rewrite({delta_record(R"({"reasoning_content":"Let me think"})"),
                        delta_record(R"({"content":"The answer is 4"})"),
                        kDone},
                       false);
    auto contents = stream_contents(out);
    REQUIRE(contents == std::vector<std::string>{"", "The answer is 4", "[DONE]"});
    REQUIRE(out.find("think") == std::string::npos);
}

TEST_CASE("StreamRewriter: record split mid-JSON across chunks", "[rewriter]") {
    std::string record = delta_record(R"({"content":"split me"})");
    size_t mid = record.find("split");

    auto whole = rewrite({record});
    auto split = rewrite({record.substr(0, mid), record.substr(mid)});
    REQUIRE(split == whole);
    REQUIRE(stream_contents(split) == std::vector<std::string>{"split me"});
}

// ── Properties ───────────────────────────────────────────────────

TEST_CASE("StreamRewriter: output independent of chunk boundaries", "[rewriter]") {
    std::string input =
        delta_record(R"({"role":"assistant","content":""})") +
        delta_record(R"({"reasoning_content":"step 1, "})") +
        delta_record(R"({"reasoning_content":"step 2"})") +
        ": keep-alive\n" +
        delta_record(R"({"content":"done"})") +
        data_record(R"({"choices":[{"index":0,"delta":{},"finish_reason":"stop"}],"usage":{"total_tokens":7}})") +
        kDone;

    auto all_at_once = rewrite({input});

    std::vector<std::string> bytes;
    for (char c : input) bytes.emplace_back(1, c);
    auto byte_by_byte = rewrite(bytes);

    std::vector<std::string> sevens;
    for (size_t i = 0; i < input.size(); i += 7) sevens.push_back(input.substr(i, 7));
    auto seven_at_a_time = rewrite(sevens);

    REQUIRE(byte_by_byte == all_at_once);
    REQUIRE(seven_at_a_time == all_at_once);
}

TEST_CASE("StreamRewriter: content concatenation preserved without reasoning", "[rewriter]") {
    std::vector<std::string> pieces = {"The", " quick", "", " brown", " fox"};
    std::vector<std::string> chunks;
    std::string expected;
    for (const auto& p : pieces) {
        chunks.push_back(delta_record(R"({"content":")" + p + R"("})"));
        expected += p;
    }
    chunks.push_back(kDone);

    auto out = rewrite(chunks);
    REQUIRE(concat(stream_contents(out)) == expected);
    REQUIRE(count_occurrences(out, "<think>") == 0);
}

TEST_CASE("StreamRewriter: one marker pair per contiguous reasoning span", "[rewriter]") {
    auto out = rewrite({delta_record(R"({"reasoning_content":"a"})"),
                        delta_record(R"({"reasoning_content":"b"})"),
                        delta_record(R"({"content":"x"})"),
                        delta_record(R"({"reasoning_content":"c"})"),
                        delta_record(R"({"content":"y"})"),
                        delta_record(R"({"reasoning_content":"d"})"),
                        kDone});
    std::string text = concat(stream_contents(out));
    REQUIRE(text == "<think>\nab\n</think>\n\nx<think>\nc\n</think>\n\ny<think>\nd\n</think>\n\n");
    REQUIRE(count_occurrences(text, "<think>") == 3);
    REQUIRE(count_occurrences(text, "</think>") == 3);

    // Last close comes before the terminator
    REQUIRE(out.rfind("</think>") < out.find("[DONE]"));
}

TEST_CASE("StreamRewriter: malformed record is passed through byte-identical", "[rewriter]") {
    std::string bad = "data: {\"choices\":[{\"delta\":";
    auto out = rewrite({bad + "\n",
                        delta_record(R"({"content":"after"})"),
                        kDone});
    REQUIRE(out.rfind(bad + "\n", 0) == 0);
    REQUIRE(out.find(delta_record(R"({"content":"after"})")) != std::string::npos);
    REQUIRE(out.substr(out.size() - kDone.size()) == kDone);
}

TEST_CASE("StreamRewriter: opaque lines keep their bytes", "[rewriter]") {
    auto out = rewrite({": keep-alive\r\n", "event: ping\n", kDone});
    REQUIRE(out == ": keep-alive\r\n" "event: ping\n" + kDone);
}

TEST_CASE("StreamRewriter: passthrough fields and key order survive", "[rewriter]") {
    std::string json =
        R"({"id":"chatcmpl-1","object":"chat.completion.chunk","created":1,"model":"qwen/qwen3-235b-a22b",)"
        R"("choices":[{"index":0,"delta":{"role":"assistant","content":"Hi"},"logprobs":null,"finish_reason":null}]})";
    auto out = rewrite({data_record(json)});
    REQUIRE(out == data_record(json));
}

TEST_CASE("StreamRewriter: blank lines and CRLF framing", "[rewriter]") {
    auto out = rewrite({"\n\r\ndata: {\"choices\":[{\"delta\":{\"content\":\"a\"}}]}\r\n\r\n",
                        "data: [DONE]\r\n\r\n"});
    REQUIRE(stream_contents(out) == std::vector<std::string>{"a", "[DONE]"});
}

// ── End of stream ────────────────────────────────────────────────

TEST_CASE("StreamRewriter: terminator without an open span adds nothing", "[rewriter]") {
    auto out = rewrite({delta_record(R"({"reasoning_content":"r"})"),
                        delta_record(R"({"content":"c"})"),
                        kDone});
    REQUIRE(stream_contents(out).size() == 3);
}

TEST_CASE("StreamRewriter: upstream closing mid-span still balances markers", "[rewriter]") {
    auto out = rewrite({delta_record(R"({"reasoning_content":"cut off"})")});
    REQUIRE(stream_contents(out) == std::vector<std::string>{"<think>\ncut off", "\n</think>\n\n"});
    REQUIRE(out.find("[DONE]") == std::string::npos);
}

TEST_CASE("StreamRewriter: torn final record is dropped", "[rewriter]") {
    auto out = rewrite({delta_record(R"({"content":"kept"})") + "data: {\"choi"});
    REQUIRE(stream_contents(out) == std::vector<std::string>{"kept"});
    REQUIRE(out.find("choi\n") == std::string::npos);
}

TEST_CASE("StreamRewriter: state is per instance", "[rewriter]") {
    StreamRewriter a(options());
    StreamRewriter b(options());
    std::string out_a, out_b;
    EmitCallback emit_a = [&](const std::string& s) { out_a += s; return true; };
    EmitCallback emit_b = [&](const std::string& s) { out_b += s; return true; };

    a.feed(delta_record(R"({"reasoning_content":"x"})"), emit_a);
    b.feed(delta_record(R"({"content":"y"})"), emit_b);

    REQUIRE(a.span_open());
    REQUIRE_FALSE(b.span_open());
    REQUIRE(stream_contents(out_b) == std::vector<std::string>{"y"});
}

// ── Cancellation ─────────────────────────────────────────────────

TEST_CASE("StreamRewriter: refused emit stops processing", "[rewriter]") {
    StreamRewriter rewriter(options());
    int emitted = 0;
    EmitCallback emit = [&](const std::string&) {
        ++emitted;
        return false;
    };

    bool ok = rewriter.feed(delta_record(R"({"content":"a"})") +
                            delta_record(R"({"content":"b"})"), emit);
    REQUIRE_FALSE(ok);
    REQUIRE(emitted == 1);
    REQUIRE(rewriter.stopped());

    REQUIRE_FALSE(rewriter.feed(delta_record(R"({"content":"c"})"), emit));
    REQUIRE_FALSE(rewriter.finish(emit));
    REQUIRE(emitted == 1);
}

TEST_CASE("StreamRewriter: abort emits nothing, even mid-span", "[rewriter]") {
    StreamRewriter rewriter(options());
    std::string out;
    EmitCallback emit = [&](const std::string& s) { out += s; return true; };

    rewriter.feed(delta_record(R"({"reasoning_content":"r"})") + "data: {\"part", emit);
    size_t before = out.size();
    rewriter.abort();
    REQUIRE(rewriter.stopped());
    REQUIRE_FALSE(rewriter.span_open());
    REQUIRE_FALSE(rewriter.finish(emit));
    REQUIRE(out.size() == before);
}
