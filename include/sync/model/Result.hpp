#pragma once

#include "sync/model/Warning.hpp"

#include <cstdint>
#include <vector>

namespace tmr::sync::model {

struct AggregateResult {
    size_t appliedCount = 0;
    size_t added = 0;
    size_t updated = 0;
    size_t deleted = 0;
    uintmax_t bytesCopied = 0;
    int64_t durationMs = 0;
    std::vector<ActionError> errors;
    std::vector<Warning> warnings;   // metadata and contract warnings

    [[nodiscard]] bool ok() const { return errors.empty(); }
};

}
