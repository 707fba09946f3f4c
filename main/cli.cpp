#include "cli/argsHelpers.hpp"
#include "cli/commands.hpp"
#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "config/ConfigRegistry.hpp"
#include "engine/Context.hpp"
#include "engine/Engine.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <unistd.h>

using namespace trashy;

static std::string ensureNewLine(const std::string& s) {
    if (s.empty() || s.back() != '\n') return s + '\n';
    return s;
}

static bool is_interactive_allowed(const cli::CommandCall& call) {
    // Hard opt-out via env or flags
    if (const char* env = std::getenv("TRASHY_NONINTERACTIVE")) {
        if (std::string_view(env) == "1" || std::string_view(env) == "true") return false;
    }
    if (cli::hasFlag(call, {"yes", "y", "non-interactive"})) return false;
    // Avoid interactivity if stdin isn't a TTY
    return ::isatty(STDIN_FILENO) == 1;
}

static std::string read_line_from_stdin() {
    std::string line;
    std::getline(std::cin, line);
    return line;
}

static bool confirm_on_tty(const std::string& question) {
    fmt::print("{} [y/N] ", question);
    std::fflush(stdout);
    const auto answer = read_line_from_stdin();
    return answer == "y" || answer == "Y" || answer == "yes";
}

static void print_result(const cli::CommandResult& res) {
    if (res.has_data) fmt::print("{}\n", res.data.dump(2));
    else if (!res.stdout_text.empty()) fmt::print("{}", ensureNewLine(res.stdout_text));
    if (!res.stderr_text.empty()) fmt::print(stderr, "{}", ensureNewLine(res.stderr_text));
}

int main(const int argc, char** argv) {
    auto call = cli::parseArgs(cli::normalizeArgs(argc, argv));

    try {
        if (const auto cfg = cli::optVal(call, "config")) {
            if (cfg->empty()) {
                fmt::print(stderr, "trashy: --config requires a path\n");
                return 2;
            }
            config::ConfigRegistry::init(*cfg);
        } else {
            config::ConfigRegistry::init();
        }
        log::Registry::init();
        if (cli::hasFlag(call, std::vector<std::string>{"v", "verbose"})) log::Registry::setConsoleLevel(spdlog::level::debug);
    } catch (const std::exception& e) {
        fmt::print(stderr, "trashy: configuration error: {}\n", e.what());
        return 2;
    }

    if (is_interactive_allowed(call)) call.confirm = confirm_on_tty;

    cli::CommandResult res;
    try {
        engine::Engine engine(std::make_shared<engine::Context>(config::ConfigRegistry::get()));

        cli::Router router;
        cli::registerCommands(router, engine);
        res = router.execute(std::move(call));
    } catch (const std::invalid_argument& e) {
        res = cli::invalid(fmt::format("trashy: {}", e.what()));
    } catch (const types::Error& e) {
        log::Registry::cli()->debug("Operation failed with {}", types::to_string(e.code()));
        res = cli::failed("", fmt::format("trashy: {}", e.what()));
    } catch (const std::exception& e) {
        log::Registry::cli()->error("Unexpected failure: {}", e.what());
        res = cli::failed("", fmt::format("trashy: {}", e.what()));
    }

    print_result(res);
    spdlog::shutdown();
    return res.exit_code;
}
