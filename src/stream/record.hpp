#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace nimproxy {

// Decoded data-record payload. Ordered so passthrough fields keep their
// upstream key order when re-serialized.
using Frame = nlohmann::ordered_json;

enum class RecordKind {
    Blank,      // record separator, dropped
    Terminator, // "data: [DONE]"
    Data,       // "data: " + JSON payload
    Opaque      // anything else, forwarded untouched
};

struct Record {
    RecordKind kind = RecordKind::Blank;
    std::string payload; // JSON text for Data, the original line for Opaque
};

constexpr const char* kDataPrefix = "data: ";
constexpr const char* kTerminatorLine = "data: [DONE]";

// Categorize one framed line.
Record classify_record(const std::string& line);

// "data: <json>\n\n"
std::string encode_data_record(const Frame& frame);

// "data: [DONE]\n\n"
std::string encode_terminator();

// Original line with its '\n' restored
std::string encode_opaque_record(const std::string& line);

} // namespace nimproxy
