#include "store/TrashInfo.hpp"
#include "types/Error.hpp"
#include "util/parse.hpp"
#include "util/timestamp.hpp"

#include <optional>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

using namespace trashy::store;
using namespace trashy::types;

std::string TrashInfo::serialize() const {
    return fmt::format("{}\nPath={}\nDeletionDate={}\n",
                       TRASH_INFO_HEADER,
                       util::percentEncodePath(original_path.string()),
                       util::localTimestamp(deleted_at));
}

TrashInfo TrashInfo::parse(const std::string& text, const std::filesystem::path& topdir) {
    std::istringstream in(text);
    std::string line;
    bool inGroup = false, sawHeader = false;
    std::optional<std::string> path, date;

    while (std::getline(in, line)) {
        boost::algorithm::trim(line);
        if (line.empty() || line.front() == '#') continue;

        if (line.front() == '[') {
            inGroup = line == TRASH_INFO_HEADER;
            if (!sawHeader && !inGroup) throw Error(ErrorCode::Corrupt, "Unexpected first group: " + line);
            sawHeader = true;
            continue;
        }
        if (!sawHeader) throw Error(ErrorCode::Corrupt, "Missing [Trash Info] header");
        if (!inGroup) continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) throw Error(ErrorCode::Corrupt, "Malformed line: " + line);

        auto key = line.substr(0, eq);
        auto value = line.substr(eq + 1);
        boost::algorithm::trim(key);
        boost::algorithm::trim_left(value);

        // First occurrence wins
        if (key == "Path" && !path) path = value;
        else if (key == "DeletionDate" && !date) date = value;
    }

    if (!sawHeader) throw Error(ErrorCode::Corrupt, "Empty trash info record");
    if (!path || path->empty()) throw Error(ErrorCode::Corrupt, "Missing Path key");
    if (!date) throw Error(ErrorCode::Corrupt, "Missing DeletionDate key");

    TrashInfo info;
    try {
        info.original_path = util::percentDecode(*path);
    } catch (const std::runtime_error& e) {
        throw Error(ErrorCode::Corrupt, e.what());
    }
    if (info.original_path.is_relative()) {
        if (topdir.empty()) throw Error(ErrorCode::Corrupt, "Relative Path in home trash: " + *path);
        info.original_path = (topdir / info.original_path).lexically_normal();
    }

    const auto ts = util::parseLocalTimestamp(*date);
    if (!ts) throw Error(ErrorCode::Corrupt, "Invalid DeletionDate: " + *date);
    info.deleted_at = *ts;

    return info;
}
