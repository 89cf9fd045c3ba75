#include "sync/model/Entry.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/Plan.hpp"
#include "sync/model/Warning.hpp"

#include <chrono>

namespace tmr::sync::model {

int64_t truncatedSeconds(const std::filesystem::file_time_type t) {
    return std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count();
}

std::string to_string(const ActionType type) {
    switch (type) {
    case ActionType::Add: return "add";
    case ActionType::Update: return "update";
    case ActionType::Delete: return "delete";
    }
    return "unknown";
}

std::string to_string(const Warning::Kind kind) {
    switch (kind) {
    case Warning::Kind::Scan: return "scan";
    case Warning::Kind::Comparison: return "comparison";
    case Warning::Kind::Metadata: return "metadata";
    case Warning::Kind::Contract: return "contract";
    }
    return "unknown";
}

uintmax_t Plan::bytesToCopy() const {
    uintmax_t total = 0;
    for (const auto& a : actions)
        if (a.type != ActionType::Delete && a.source && !a.source->isDirectory) total += a.source->size;
    return total;
}

}
