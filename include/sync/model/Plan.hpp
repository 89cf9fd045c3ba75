#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/Warning.hpp"

#include <vector>

namespace tmr::sync::model {

struct Plan {
    std::vector<Action> actions;
    size_t adds = 0;
    size_t updates = 0;
    size_t deletes = 0;
    std::vector<Warning> warnings;  // comparison warnings raised while planning

    [[nodiscard]] bool empty() const { return actions.empty(); }
    [[nodiscard]] size_t size() const { return actions.size(); }

    // Bytes an apply would copy, summed over file Add/Update actions
    [[nodiscard]] uintmax_t bytesToCopy() const;
};

}
