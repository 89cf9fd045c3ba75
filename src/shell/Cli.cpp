#include "shell/Cli.hpp"
#include "shell/Parser.hpp"

#include <fmt/format.h>

using namespace tmr::shell;

namespace {

const std::unordered_set<std::string> SWITCHES = {
    "n", "dry-run", "json", "no-color", "h", "help"
};

const std::unordered_set<std::string> VALUED = {
    "e", "exclude", "v", "verbosity", "config"
};

std::string requireValue(const CommandCall& call, std::initializer_list<std::string_view> keys, const std::string& name) {
    const auto v = optVal(call, keys);
    if (!v) throw UsageError("option --" + name + " requires a value");
    return *v;
}

}

spdlog::level::level_enum tmr::shell::parseVerbosity(const std::string& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    throw UsageError("invalid verbosity '" + level + "' (expected debug, info, warn or error)");
}

CliOptions tmr::shell::parseCli(const std::vector<std::string>& args) {
    const auto call = parseTokens(tokenize(args), SWITCHES);

    for (const auto& [key, value] : call.options) {
        if (SWITCHES.contains(key)) continue;
        if (!VALUED.contains(key)) throw UsageError("unknown option: " + std::string(key.size() == 1 ? "-" : "--") + key);
        if (!value) throw UsageError("option " + std::string(key.size() == 1 ? "-" : "--") + key + " requires a value");
    }

    CliOptions opts;
    opts.help = hasFlag(call, {"h", "help"});
    if (opts.help) return opts;

    opts.dryRun = hasFlag(call, {"n", "dry-run"});
    opts.json = hasFlag(call, {"json"});
    opts.noColor = hasFlag(call, {"no-color"});
    opts.excludes = optVals(call, {"e", "exclude"});

    if (hasFlag(call, {"v", "verbosity"}))
        opts.verbosity = parseVerbosity(requireValue(call, {"v", "verbosity"}, "verbosity"));

    if (hasFlag(call, {"config"}))
        opts.configPath = std::filesystem::path(requireValue(call, {"config"}, "config"));

    if (call.positionals.size() != 2)
        throw UsageError(fmt::format("expected <source> and <target>, got {} path argument{}",
                                     call.positionals.size(), call.positionals.size() == 1 ? "" : "s"));

    opts.source = call.positionals[0];
    opts.target = call.positionals[1];
    if (opts.source.empty() || opts.target.empty()) throw UsageError("source and target must not be empty");

    return opts;
}

std::string tmr::shell::usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options] <source> <target>\n"
        "\n"
        "Make <target> an exact mirror of <source>: copy what is missing, overwrite\n"
        "what differs, remove what is extra.\n"
        "\n"
        "Options:\n"
        "  -e, --exclude <pattern>    Ignore paths matching a gitignore-style pattern (repeatable)\n"
        "  -n, --dry-run              Print the plan, change nothing\n"
        "  -v, --verbosity <level>    Console log level: debug, info, warn, error\n"
        "      --config <file>        Configuration file (default $TREEMIRROR_CONFIG, then\n"
        "                             /etc/treemirror/config.yaml)\n"
        "      --json                 Print the plan and result as JSON\n"
        "      --no-color             Disable colored output\n"
        "  -h, --help                 Show this help\n"
        "\n"
        "Patterns are also read from .sync-ignore at the source root.\n",
        program);
}
