#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace meshlink {
namespace util {

// --- Hex encoding ---
std::string to_hex(const uint8_t* data, size_t len);

// Lays 16 random bytes out as a version 4 UUID string
std::string format_uuid4(const uint8_t (&bytes)[16]);

// Case-insensitive ASCII helpers for header names
std::string to_lower(const std::string& s);
bool iequals(const std::string& a, const std::string& b);
bool istarts_with(const std::string& s, const std::string& prefix);

} // namespace util
} // namespace meshlink
