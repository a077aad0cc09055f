#pragma once
#include "record.hpp"
#include <string>

namespace nimproxy {

// Marker tokens embedded in the content stream around reasoning text.
struct ReasoningMarkers {
    std::string open = "<think>\n";
    std::string close = "\n</think>\n\n";
};

struct SpliceResult {
    Frame frame;
    bool span_open = false;
};

// Move choices[0].delta reasoning into content, opening or closing the
// reasoning span as needed. Reasoning is handled before content when both
// arrive in one frame. Frames without a delta come back unchanged.
// The input frame is never modified.
SpliceResult splice_frame(const Frame& frame, bool span_open,
                          const ReasoningMarkers& markers);

// Reasoning display off: drop reasoning, pass content through with ""
// standing in for null or absent content. No markers.
Frame strip_reasoning(const Frame& frame);

// Reasoning text of a delta or message: the first non-empty string of
// reasoning_content, then reasoning. Empty when neither has one.
std::string reasoning_text(const Frame& obj);

// Whole-message form: open + reasoning + close + content, or content alone
// when reasoning is empty.
std::string join_reasoning(const std::string& reasoning, const std::string& content,
                           const ReasoningMarkers& markers);

} // namespace nimproxy
