#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace tmr::ignore {

struct Rule {
    std::string patternStr;   // as written, after trimming
    std::regex pattern;
    bool negated = false;
    bool anchored = false;
};

// Gitignore-style exclusion rules evaluated against '/'-separated relative paths
class Matcher {
public:
    Matcher() = default;

    // CLI patterns first, then the lines of <sourceRoot>/<ignoreFileName> when present
    static Matcher load(const std::filesystem::path& sourceRoot,
                        const std::vector<std::string>& cliPatterns,
                        const std::string& ignoreFileName);

    static Matcher fromPatterns(const std::vector<std::string>& lines, std::string ignoreFileName = {});

    [[nodiscard]] bool matches(const std::string& relativePath) const;

    // Copyable predicate sharing this matcher's rules
    [[nodiscard]] std::function<bool(const std::string&)> predicate() const;

    [[nodiscard]] size_t size() const { return rules_ ? rules_->size() : 0; }
    [[nodiscard]] bool empty() const { return size() == 0; }

    static std::string globToRegex(const std::string& glob);

private:
    std::shared_ptr<const std::vector<Rule>> rules_;
    std::string ignoreFileName_;

    static std::vector<std::string> readIgnoreFile(const std::filesystem::path& path);
    static bool parseLine(std::string line, Rule& out);
    static bool ruleHits(const Rule& rule, const std::string& relativePath);
};

}
