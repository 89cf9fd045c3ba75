#pragma once

#include "shell/types.hpp"
#include "sync/model/Plan.hpp"
#include "sync/model/Result.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace tmr::shell {

class Presenter {
public:
    Presenter(std::ostream& out, bool color, size_t sampleSize);

    // Counts, then a sample of actions in plan order
    void plan(const sync::model::Plan& plan) const;

    void warnings(const std::vector<sync::model::Warning>& warnings) const;

    void result(const sync::model::AggregateResult& result) const;

    [[nodiscard]] std::string actionLine(const sync::model::Action& action) const;

    static std::string label(sync::model::ActionType type);

private:
    std::ostream& out_;
    ColorTheme theme_;
    size_t sampleSize_;

    [[nodiscard]] std::string colorFor(sync::model::ActionType type) const;
};

}
