#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace trashy::util {

std::optional<unsigned int> parseUInt(const std::string& sv);

// "512", "10K", "3M", "1G", "2T" (binary units)
uintmax_t parseSize(const std::string& s);

// "90s", "15m", "12h", "30d", "2w"; bare numbers are days
std::chrono::seconds parseDuration(const std::string& s);

std::string humanSize(uintmax_t bytes);

// Percent-encoding of paths as used by trash info records ('/' stays literal)
std::string percentEncodePath(const std::string& path);
std::string percentDecode(const std::string& value);

}
