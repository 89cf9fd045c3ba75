#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tmr::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;        // in command-line order, repeats kept
    std::vector<std::string> positionals;
};

// Bad command line; the caller prints usage
struct UsageError : std::runtime_error {
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// ANSI color theme. Set enabled=false to disable.
struct ColorTheme {
    bool enabled = true;

    std::string add = "\033[32m";        // green
    std::string update = "\033[33m";     // yellow
    std::string remove = "\033[31m";     // red
    std::string header = "\033[1;36m";   // bold cyan
    std::string dim = "\033[2m";
    std::string reset = "\033[0m";

    [[nodiscard]] std::string maybe(const std::string& code) const {
        return enabled ? code : "";
    }
    [[nodiscard]] std::string A() const { return maybe(add); }
    [[nodiscard]] std::string U() const { return maybe(update); }
    [[nodiscard]] std::string X() const { return maybe(remove); }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string D() const { return maybe(dim); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

}
