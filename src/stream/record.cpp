#include "record.hpp"
#include "../util.hpp"

namespace nimproxy {

Record classify_record(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) return {RecordKind::Blank, {}};
    if (trimmed == kTerminatorLine) return {RecordKind::Terminator, {}};
    if (trimmed.rfind(kDataPrefix, 0) == 0)
        return {RecordKind::Data, trimmed.substr(6)};
    return {RecordKind::Opaque, line};
}

std::string encode_data_record(const Frame& frame) {
    // Invalid UTF-8 is replaced, never thrown
    return std::string(kDataPrefix) +
           frame.dump(-1, ' ', false, Frame::error_handler_t::replace) + "\n\n";
}

std::string encode_terminator() {
    return std::string(kTerminatorLine) + "\n\n";
}

std::string encode_opaque_record(const std::string& line) {
    return line + "\n";
}

} // namespace nimproxy
