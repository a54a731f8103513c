#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace toolcage {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch seconds with sub-second precision
double epoch_seconds_precise();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of whitespace, dropping empty segments
std::vector<std::string> split_whitespace(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via a sibling temp file + rename. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Lower-case hex SHA-256 digest
std::string sha256_hex(const std::string& data);

// Strict UTF-8 validation (rejects overlongs, surrogates, > U+10FFFF)
bool is_valid_utf8(const std::string& s);

// Copy with every malformed byte replaced by U+FFFD
std::string sanitize_utf8(const std::string& s);

// Number of lines; a trailing newline does not start a new line
uint32_t count_lines(const std::string& s);

} // namespace toolcage
