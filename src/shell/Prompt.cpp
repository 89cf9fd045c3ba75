#include "shell/Prompt.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>

using namespace tmr::shell;

std::optional<bool> Prompt::parseAnswer(const std::string& answer) {
    std::string a;
    a.reserve(answer.size());
    for (const char c : answer)
        if (!std::isspace(static_cast<unsigned char>(c))) a.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (a == "y" || a == "yes") return true;
    if (a == "n" || a == "no") return false;
    return std::nullopt;
}

bool Prompt::confirm(const std::string& question) const {
    while (true) {
        out_ << question << " " << suffix() << ": " << std::flush;

        std::string line;
        if (!std::getline(in_, line)) {
            out_ << std::endl;
            log::Registry::shell()->debug("[Prompt] End of input, declining");
            return false;
        }

        const bool blank = std::ranges::all_of(line, [](const char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        });
        if (blank) return defaultYes_;

        if (const auto answer = parseAnswer(line)) return *answer;

        out_ << "Please answer y or n." << std::endl;
    }
}
