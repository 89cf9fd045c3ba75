#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace tmr::shell {

// Yes/no question. Empty input takes the default, EOF declines.
class Prompt {
public:
    Prompt(std::istream& in, std::ostream& out, bool defaultYes)
        : in_(in), out_(out), defaultYes_(defaultYes) {}

    bool confirm(const std::string& question) const;

    [[nodiscard]] std::string suffix() const { return defaultYes_ ? "[Y/n]" : "[y/N]"; }

    // nullopt for anything that is neither yes nor no
    static std::optional<bool> parseAnswer(const std::string& answer);

private:
    std::istream& in_;
    std::ostream& out_;
    bool defaultYes_;
};

}
