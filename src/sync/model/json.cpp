#include "sync/model/json.hpp"

#include <chrono>
#include <fmt/format.h>

using namespace tmr::sync::model;
using nlohmann::json;

namespace {

int64_t toUnixSeconds(const std::filesystem::file_time_type t) {
    const auto sys = std::chrono::file_clock::to_sys(t);
    return std::chrono::floor<std::chrono::seconds>(sys.time_since_epoch()).count();
}

}

namespace tmr::sync::model {

void to_json(json& j, const Entry& e) {
    j = {
        {"path", e.relativePath},
        {"absolute_path", e.absolutePath.string()},
        {"type", e.kindString()},
        {"size", e.size},
        {"mtime", toUnixSeconds(e.modifiedTime)},
        {"mode", fmt::format("{:04o}", static_cast<unsigned int>(e.permissionMode))}
    };
}

void to_json(json& j, const Action& a) {
    j = {
        {"type", to_string(a.type)},
        {"path", a.key},
        {"directory", a.isDirectory()}
    };
    if (a.source) j["source"] = *a.source;
    if (a.target) j["target"] = *a.target;
}

void to_json(json& j, const Warning& w) {
    j = {
        {"kind", to_string(w.kind)},
        {"path", w.path},
        {"message", w.message}
    };
}

void to_json(json& j, const ActionError& e) {
    j = {
        {"type", to_string(e.action.type)},
        {"path", e.action.key},
        {"message", e.message}
    };
}

void to_json(json& j, const Plan& p) {
    j = {
        {"adds", p.adds},
        {"updates", p.updates},
        {"deletes", p.deletes},
        {"bytes", p.bytesToCopy()},
        {"actions", p.actions},
        {"warnings", p.warnings}
    };
}

void to_json(json& j, const AggregateResult& r) {
    j = {
        {"applied", r.appliedCount},
        {"added", r.added},
        {"updated", r.updated},
        {"deleted", r.deleted},
        {"bytes_copied", r.bytesCopied},
        {"duration_ms", r.durationMs},
        {"errors", r.errors},
        {"warnings", r.warnings}
    };
}

}
