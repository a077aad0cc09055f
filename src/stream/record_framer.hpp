#pragma once
#include <string>
#include <functional>
#include <cstddef>

namespace nimproxy {

// Callback receives each complete line (terminator stripped). Return false to stop.
using LineCallback = std::function<bool(const std::string& line)>;

// Turns an arbitrarily chunked byte stream into complete '\n'-terminated lines.
// Only the trailing partial line is buffered between feeds.
class RecordFramer {
public:
    // Append a chunk and emit every line it completes. Returns false if the
    // callback stopped; lines after the stopping one stay buffered.
    bool feed(const char* data, size_t len, const LineCallback& callback);
    bool feed(const std::string& chunk, const LineCallback& callback);

    // End of stream: an unterminated remainder is an incomplete record and is dropped.
    void finish();

    // Bytes held for the next feed
    size_t buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
};

} // namespace nimproxy
