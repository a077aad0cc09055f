#include "record_framer.hpp"

namespace nimproxy {

bool RecordFramer::feed(const char* data, size_t len, const LineCallback& callback) {
    buffer_.append(data, len);

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;

        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;

        if (!callback(line)) {
            buffer_.erase(0, pos);
            return false;
        }
    }

    // Keep the incomplete tail only
    buffer_.erase(0, pos);
    return true;
}

bool RecordFramer::feed(const std::string& chunk, const LineCallback& callback) {
    return feed(chunk.data(), chunk.size(), callback);
}

void RecordFramer::finish() {
    buffer_.clear();
}

} // namespace nimproxy
