#ifndef UTILITY_H
#define UTILITY_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "SubmissionTypes.h"

// Standard base64 (RFC 4648) with '=' padding
std::string base64_encode(const std::string& input);

// Replaces CR/LF/TAB with spaces, trims, and truncates to max_chars
// (the last three characters become "..." when truncated)
std::string sanitize_metadata_value(const std::string& value, size_t max_chars);

// Keys in Upload-Metadata may not contain spaces or commas
std::string sanitize_metadata_key(const std::string& key);

// "sub-<epoch ms>-<9 random base36 chars>"
std::string generate_submission_id(int64_t now_ms);

std::string trim_copy(const std::string& s);
std::string to_lower_copy(const std::string& s);

// "0, 5000,10000" -> {0, 5000, 10000}. Returns false on any non-numeric
// or negative entry and leaves out untouched.
bool parse_int_list(const std::string& csv, std::vector<int64_t>& out);

// "X-Api-Key: abc; X-Site: 7" -> {{"X-Api-Key","abc"},{"X-Site","7"}}
FieldList parse_header_list(const std::string& text);

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out);

std::string base_name(const std::string& path);

// Mime type from the file extension, audio/webm when unknown
std::string guess_mime_type(const std::string& file_name);

#endif // UTILITY_H
