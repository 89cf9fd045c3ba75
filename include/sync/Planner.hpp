#pragma once

#include "sync/Digest.hpp"
#include "sync/model/Plan.hpp"

#include <vector>

namespace tmr::sync {

struct Planner {
    // Single-threaded and deterministic for a deterministic digest function
    static model::Plan build(const model::Mapping& source,
                             const model::Mapping& target,
                             const DigestFn& digest);

    // Deletes first, deepest first, then everything else by ascending path
    static void order(std::vector<model::Action>& actions);

private:
    static bool filesDiffer(const model::Entry& src,
                            const model::Entry& dst,
                            const DigestFn& digest,
                            std::vector<model::Warning>& warnings);
};

}
