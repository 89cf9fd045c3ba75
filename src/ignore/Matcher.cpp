#include "ignore/Matcher.hpp"
#include "sync/errors.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <system_error>

using namespace tmr::ignore;
using tmr::sync::FatalSetupError;

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool isRegexSpecial(const char c) {
    switch (c) {
    case '.': case '^': case '$': case '+': case '(': case ')':
    case '{': case '}': case '|': case '\\': case '[': case ']':
    case '*': case '?':
        return true;
    default:
        return false;
    }
}

}

std::string Matcher::globToRegex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2);

    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];

        if (c == '*') {
            const bool dbl = i + 1 < glob.size() && glob[i + 1] == '*';
            if (!dbl) { out += "[^/]*"; continue; }

            const bool atStart = i == 0 || glob[i - 1] == '/';
            const bool slashAfter = i + 2 < glob.size() && glob[i + 2] == '/';

            if (atStart && slashAfter) {
                // "**/" spans zero or more leading directories
                out += "(?:.*/)?";
                i += 2;
            } else {
                out += ".*";
                i += 1;
            }
            continue;
        }

        if (c == '?') { out += "[^/]"; continue; }

        if (c == '[') {
            const auto close = glob.find(']', i + 1);
            if (close == std::string::npos) { out += "\\["; continue; }

            std::string body = glob.substr(i + 1, close - i - 1);
            out += '[';
            size_t k = 0;
            if (!body.empty() && (body[0] == '!' || body[0] == '^')) { out += '^'; k = 1; }
            for (; k < body.size(); ++k) {
                if (body[k] == '\\' || body[k] == '[') out += '\\';
                out += body[k];
            }
            out += ']';
            i = close;
            continue;
        }

        if (c == '\\' && i + 1 < glob.size()) {
            const char next = glob[++i];
            if (isRegexSpecial(next)) out += '\\';
            out += next;
            continue;
        }

        if (isRegexSpecial(c)) out += '\\';
        out += c;
    }

    return out;
}

bool Matcher::parseLine(std::string line, Rule& out) {
    line = trim(line);
    if (line.empty() || line[0] == '#') return false;

    out.patternStr = line;

    if (line[0] == '!') {
        out.negated = true;
        line.erase(0, 1);
    }

    while (line.size() > 1 && line.back() == '/') line.pop_back();
    if (line == "/") return false;

    if (line[0] == '/') {
        out.anchored = true;
        line.erase(0, 1);
    } else if (line.find('/') != std::string::npos) {
        out.anchored = true;
    }

    if (line.empty()) return false;

    std::string re = globToRegex(line);
    if (!out.anchored) re = "(?:.*/)?" + re;

    try {
        out.pattern = std::regex(re, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw FatalSetupError("Invalid ignore pattern '" + out.patternStr + "': " + e.what());
    }

    return true;
}

std::vector<std::string> Matcher::readIgnoreFile(const fs::path& path) {
    std::vector<std::string> lines;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) throw FatalSetupError("Cannot access ignore file " + path.string() + ": " + ec.message());
        return lines;
    }

    std::ifstream in(path);
    if (!in) throw FatalSetupError("Failed to open ignore file: " + path.string());

    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    if (in.bad()) throw FatalSetupError("Failed to read ignore file: " + path.string());

    return lines;
}

Matcher Matcher::fromPatterns(const std::vector<std::string>& lines, std::string ignoreFileName) {
    auto rules = std::make_shared<std::vector<Rule>>();
    rules->reserve(lines.size());

    for (const auto& line : lines) {
        Rule r;
        if (parseLine(line, r)) rules->push_back(std::move(r));
    }

    Matcher m;
    m.rules_ = std::move(rules);
    m.ignoreFileName_ = std::move(ignoreFileName);
    return m;
}

Matcher Matcher::load(const fs::path& sourceRoot,
                      const std::vector<std::string>& cliPatterns,
                      const std::string& ignoreFileName) {
    std::vector<std::string> lines(cliPatterns.begin(), cliPatterns.end());

    if (!ignoreFileName.empty()) {
        const auto fileLines = readIgnoreFile(sourceRoot / ignoreFileName);
        lines.insert(lines.end(), fileLines.begin(), fileLines.end());
        if (!fileLines.empty())
            log::Registry::scan()->debug("[ignore::Matcher] Read {} lines from {}",
                                         fileLines.size(), (sourceRoot / ignoreFileName).string());
    }

    auto m = fromPatterns(lines, ignoreFileName);
    log::Registry::scan()->debug("[ignore::Matcher] {} active patterns", m.size());
    return m;
}

bool Matcher::ruleHits(const Rule& rule, const std::string& relativePath) {
    if (std::regex_match(relativePath, rule.pattern)) return true;

    // A match on any ancestor covers everything below it
    for (size_t pos = relativePath.find('/'); pos != std::string::npos; pos = relativePath.find('/', pos + 1))
        if (std::regex_match(relativePath.begin(), relativePath.begin() + static_cast<std::ptrdiff_t>(pos), rule.pattern))
            return true;

    return false;
}

bool Matcher::matches(const std::string& relativePath) const {
    if (!ignoreFileName_.empty() && relativePath == ignoreFileName_) return true;
    if (!rules_) return false;

    bool ignored = false;
    for (const auto& rule : *rules_)
        if (ruleHits(rule, relativePath)) ignored = !rule.negated;

    return ignored;
}

std::function<bool(const std::string&)> Matcher::predicate() const {
    return [self = *this](const std::string& relativePath) { return self.matches(relativePath); };
}
