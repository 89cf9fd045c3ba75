#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tmr::shell {

// Append a flag; repeats are kept so repeatable options see every value
inline void addOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    c.options.push_back(FlagKV{key, val});
}

// Switches never consume the following word as their value
inline CommandCall parseTokens(const std::vector<Token>& toks,
                               const std::unordered_set<std::string>& switches = {}) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(4);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto& key = t.text;
            if (!switches.contains(key) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word
                && !(toks[i + 1].text == "--")) {
                addOpt(call, key, toks[i + 1].text);
                ++i; // consumed value
            } else {
                addOpt(call, key, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

inline bool hasFlag(const CommandCall& c, std::initializer_list<std::string_view> keys) {
    for (const auto& [k, v] : c.options)
        for (const auto key : keys) if (k == key) return true;
    return false;
}

// Last occurrence wins
inline std::optional<std::string> optVal(const CommandCall& c, std::initializer_list<std::string_view> keys) {
    std::optional<std::string> out;
    for (const auto& [k, v] : c.options)
        for (const auto key : keys) if (k == key) out = v;
    return out;
}

inline std::vector<std::string> optVals(const CommandCall& c, std::initializer_list<std::string_view> keys) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options)
        for (const auto key : keys) if (k == key && v) out.push_back(*v);
    return out;
}

}
