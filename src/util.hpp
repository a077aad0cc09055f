#pragma once
#include <string>
#include <cstdint>

namespace nimproxy {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write file via temp file + rename so readers never see a partial file.
// Creates parent directories as needed.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace nimproxy
