#pragma once
#include <string>
#include <cstdint>

namespace replywatch {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// First max_len bytes of s, without splitting a UTF-8 sequence
std::string utf8_prefix(const std::string& s, size_t max_len);

// First max_chars code points of s (continuation bytes are not counted)
std::string utf8_prefix_chars(const std::string& s, size_t max_chars);

// Shorten text for log lines: prefix plus "..." when truncated
std::string truncate_for_log(const std::string& s, size_t max_len = 80);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to a temp file beside path, fsync, then rename over path.
// Creates missing parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace replywatch
