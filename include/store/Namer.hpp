#pragma once

#include "config/Config.hpp"

#include <optional>
#include <string>

namespace trashy::store {

class Store;

/**
 * Suggests collision-free entry names: `name`, `name.1`, `name.2`, ...
 *
 * Suggestions are advisory. Ownership of a name is only established by
 * Store::reserve(), which another process may win first; callers then ask
 * for the next free candidate after the one they lost.
 */
class Namer {
public:
    // Leaves room for ".trashinfo" and a numeric suffix within NAME_MAX
    static constexpr size_t MAX_NAME_BYTES = 255;

    explicit Namer(unsigned int maxAttempts = config::DEFAULT_MAX_NAME_ATTEMPTS);

    [[nodiscard]] std::string candidate(const std::string& base, unsigned int attempt) const;

    // First attempt index >= `from` whose candidate is unused in `store`, or nullopt once attempts run out
    [[nodiscard]] std::optional<unsigned int> nextFree(const Store& store, const std::string& base,
                                                       unsigned int from = 0) const;

    [[nodiscard]] unsigned int maxAttempts() const { return maxAttempts_; }

    // Truncates to `maxBytes` without splitting a UTF-8 sequence
    static std::string truncateUtf8(const std::string& s, size_t maxBytes);

private:
    unsigned int maxAttempts_;
};

}
