#include "sync/Planner.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace tmr::sync;
using namespace tmr::sync::model;

Plan Planner::build(const Mapping& source, const Mapping& target, const DigestFn& digest) {
    Plan plan;

    std::set<std::string> keys;
    for (const auto& [rel, _] : source) keys.insert(rel);
    for (const auto& [rel, _] : target) keys.insert(rel);

    plan.actions.reserve(keys.size());

    for (const auto& k : keys) {
        std::shared_ptr<const Entry> S;
        std::shared_ptr<const Entry> T;

        if (const auto it = source.find(k); it != source.end()) S = it->second;
        if (const auto it = target.find(k); it != target.end()) T = it->second;

        if (S && !T) {
            plan.actions.push_back({ActionType::Add, k, S, nullptr});
            continue;
        }

        if (!S && T) {
            plan.actions.push_back({ActionType::Delete, k, nullptr, T});
            continue;
        }

        if (T->isSymlink || S->isDirectory != T->isDirectory) {
            // Kind change is always realised as a delete of the old kind plus an add of the new
            plan.actions.push_back({ActionType::Delete, k, nullptr, T});
            plan.actions.push_back({ActionType::Add, k, S, nullptr});
            continue;
        }

        if (S->isDirectory) continue;

        if (filesDiffer(*S, *T, digest, plan.warnings))
            plan.actions.push_back({ActionType::Update, k, S, T});
    }

    order(plan.actions);

    for (const auto& a : plan.actions) {
        switch (a.type) {
        case ActionType::Add: ++plan.adds; break;
        case ActionType::Update: ++plan.updates; break;
        case ActionType::Delete: ++plan.deletes; break;
        }
    }

    log::Registry::plan()->info("[Planner] {} actions ({} adds, {} updates, {} deletes) over {} paths",
                                plan.size(), plan.adds, plan.updates, plan.deletes, keys.size());
    return plan;
}

bool Planner::filesDiffer(const Entry& src, const Entry& dst, const DigestFn& digest, std::vector<Warning>& warnings) {
    if (src.size != dst.size) return true;
    if (truncatedSeconds(src.modifiedTime) == truncatedSeconds(dst.modifiedTime)) return false;

    // Same size, different time: only the content can decide
    try {
        if (!digest) throw std::runtime_error("no digest function available");
        const auto a = digest(src.absolutePath);
        const auto b = digest(dst.absolutePath);
        return a != b;
    } catch (const std::exception& e) {
        log::Registry::plan()->warn("[Planner] Digest failed for {}, scheduling update: {}", src.relativePath, e.what());
        warnings.push_back({Warning::Kind::Comparison, src.relativePath, e.what()});
        return true;
    }
}

void Planner::order(std::vector<Action>& actions) {
    std::ranges::stable_sort(actions, [](const Action& a, const Action& b) {
        const bool aDel = a.type == ActionType::Delete;
        const bool bDel = b.type == ActionType::Delete;
        if (aDel != bDel) return aDel;

        if (aDel) {
            const auto da = pathDepth(a.key);
            const auto db = pathDepth(b.key);
            if (da != db) return da > db;
        }
        return a.key < b.key;
    });
}
