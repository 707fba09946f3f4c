#include "util/parse.hpp"

#include <array>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <fmt/format.h>

namespace trashy::util {

static constexpr uintmax_t KILOBYTE = 1024;
static constexpr uintmax_t MEGABYTE = KILOBYTE * KILOBYTE;
static constexpr uintmax_t GIGABYTE = KILOBYTE * MEGABYTE;
static constexpr uintmax_t TERABYTE = KILOBYTE * GIGABYTE;

std::optional<unsigned int> parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

static uintmax_t parseCount(const std::string& digits, const std::string& original) {
    if (digits.empty()) throw std::invalid_argument("Missing number in '" + original + "'");
    for (const char c : digits)
        if (c < '0' || c > '9') throw std::invalid_argument("Invalid number in '" + original + "'");
    return std::stoull(digits);
}

uintmax_t parseSize(const std::string& s) {
    if (s.empty()) throw std::invalid_argument("Empty size");
    const auto body = s.substr(0, s.size() - 1);
    switch (std::toupper(static_cast<unsigned char>(s.back()))) {
    case 'T': return parseCount(body, s) * TERABYTE;
    case 'G': return parseCount(body, s) * GIGABYTE;
    case 'M': return parseCount(body, s) * MEGABYTE;
    case 'K': return parseCount(body, s) * KILOBYTE;
    case 'B': return parseCount(body, s);
    default: return parseCount(s, s); // Assume bytes if no suffix
    }
}

std::chrono::seconds parseDuration(const std::string& s) {
    using namespace std::chrono;
    if (s.empty()) throw std::invalid_argument("Empty duration");
    const auto body = s.substr(0, s.size() - 1);
    const auto n = [&](const std::string& digits) { return static_cast<long long>(parseCount(digits, s)); };
    switch (std::tolower(static_cast<unsigned char>(s.back()))) {
    case 's': return seconds(n(body));
    case 'm': return minutes(n(body));
    case 'h': return hours(n(body));
    case 'd': return days(n(body));
    case 'w': return weeks(n(body));
    default: return days(n(s));
    }
}

std::string humanSize(const uintmax_t bytes) {
    static constexpr std::array units = {"B", "KiB", "MiB", "GiB", "TiB"};
    auto value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) return fmt::format("{} {}", bytes, units[unit]);
    return fmt::format("{:.1f} {}", value, units[unit]);
}

static bool keepLiteral(const unsigned char c) {
    return std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string percentEncodePath(const std::string& path) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (const char ch : path) {
        const auto c = static_cast<unsigned char>(ch);
        if (keepLiteral(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

static int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] != '%') {
            result.push_back(value[i]);
            continue;
        }
        if (i + 2 >= value.length())
            throw std::runtime_error("Truncated percent-encoding in '" + value + "'");
        const int hi = hexValue(value[i + 1]);
        const int lo = hexValue(value[i + 2]);
        if (hi < 0 || lo < 0) throw std::runtime_error("Invalid percent-encoding in '" + value + "'");
        result.push_back(static_cast<char>(hi << 4 | lo));
        i += 2;
    }
    return result;
}

}
