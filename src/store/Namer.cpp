#include "store/Namer.hpp"
#include "store/Store.hpp"
#include "store/TrashInfo.hpp"

#include <cstring>

using namespace trashy::store;

Namer::Namer(const unsigned int maxAttempts) : maxAttempts_(maxAttempts == 0 ? 1 : maxAttempts) {}

std::string Namer::truncateUtf8(const std::string& s, const size_t maxBytes) {
    if (s.size() <= maxBytes) return s;
    size_t cut = maxBytes;
    // step back over continuation bytes (10xxxxxx) so the cut lands on a character boundary
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

std::string Namer::candidate(const std::string& base, const unsigned int attempt) const {
    const std::string suffix = attempt == 0 ? "" : "." + std::to_string(attempt);
    const size_t room = MAX_NAME_BYTES - std::strlen(TRASH_INFO_EXT) - suffix.size();
    return truncateUtf8(base, room) + suffix;
}

std::optional<unsigned int> Namer::nextFree(const Store& store, const std::string& base, const unsigned int from) const {
    for (unsigned int attempt = from; attempt < maxAttempts_; ++attempt)
        if (!store.isOccupied(candidate(base, attempt))) return attempt;
    return std::nullopt;
}
