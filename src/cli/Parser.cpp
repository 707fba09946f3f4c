#include "cli/Parser.hpp"

#include <algorithm>
#include <cctype>

namespace trashy::cli {

const std::unordered_set<std::string>& valueFlags() {
    static const std::unordered_set<std::string> flags{
        "config", "older-than", "newer-than", "min-size", "max-size",
        "under", "n", "limit", "dest", "index"
    };
    return flags;
}

// Heuristic: if tail has obvious "value" chars, treat "-Xtail" as glued value
static bool looks_glued_value(const std::string_view tail) {
    if (tail.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(tail.front()))) return true;
    return std::ranges::any_of(tail, [](const char c) {
        return c == '/' || c == '.' || c == ':' || c == '=';
    });
}

std::vector<std::string> normalizeArgs(const int argc, char** argv, const int start) {
    std::vector<std::string> out;
    if (argc <= start) return out;
    out.reserve(static_cast<size_t>(argc - start) + 4);

    bool literal = false;
    for (int i = start; i < argc; ++i) {
        std::string a = argv[i];

        if (literal) { out.emplace_back(std::move(a)); continue; }
        if (a == "--") { literal = true; out.emplace_back("--"); continue; }

        if (a.rfind("--", 0) == 0) {
            const auto eq = a.find('=');
            if (eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));          // --key
                out.emplace_back(a.substr(eq + 1));         // value
            } else {
                out.emplace_back(std::move(a));
            }
            continue;
        }

        if (a.size() > 2 && a[0] == '-' && a[1] != '-') {
            std::string tail = a.substr(2);
            if (looks_glued_value(tail)) {
                out.emplace_back(std::string("-") + a[1]);  // -X
                if (tail[0] == '=') tail.erase(tail.begin());
                out.emplace_back(std::move(tail));          // value
            } else {
                // -abc bundle of single-letter switches
                for (size_t c = 1; c < a.size(); ++c) out.emplace_back(std::string("-") + a[c]);
            }
            continue;
        }

        out.emplace_back(std::move(a));
    }
    return out;
}

static bool isFlag(const std::string& t) {
    return t.size() > 1 && t[0] == '-' && t != "--";
}

static std::string stripDashes(const std::string& t) {
    const auto pos = t.find_first_not_of('-');
    return pos == std::string::npos ? std::string{} : t.substr(pos);
}

// Upsert a flag (last wins)
static void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

CommandCall parseArgs(const std::vector<std::string>& tokens) {
    CommandCall call;
    bool stop_flags = false;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& t = tokens[i];

        if (stop_flags) { call.positionals.push_back(t); continue; }
        if (t == "--") {
            stop_flags = true;
            call.literal = call.positionals.empty();
            continue;
        }

        if (isFlag(t)) {
            const auto key = stripDashes(t);
            if (valueFlags().contains(key) && i + 1 < tokens.size()) {
                setOpt(call, key, tokens[i + 1]);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t);
    }
    return call;
}

}
