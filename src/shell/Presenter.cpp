#include "shell/Presenter.hpp"
#include "util/cmdLineHelpers.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace tmr::shell;
using namespace tmr::sync::model;

Presenter::Presenter(std::ostream& out, const bool color, const size_t sampleSize)
    : out_(out), sampleSize_(sampleSize) {
    theme_.enabled = color;
}

std::string Presenter::label(const ActionType type) {
    switch (type) {
    case ActionType::Add: return "[ADD   ]";
    case ActionType::Update: return "[UPDATE]";
    case ActionType::Delete: return "[DELETE]";
    }
    return "[?     ]";
}

std::string Presenter::colorFor(const ActionType type) const {
    switch (type) {
    case ActionType::Add: return theme_.A();
    case ActionType::Update: return theme_.U();
    case ActionType::Delete: return theme_.X();
    }
    return {};
}

std::string Presenter::actionLine(const Action& action) const {
    return fmt::format("{}{}{} {}{}", colorFor(action.type), label(action.type), theme_.R(),
                       action.key, action.isDirectory() ? "/" : "");
}

void Presenter::plan(const Plan& plan) const {
    if (plan.empty()) {
        out_ << "Target is already in sync with source." << std::endl;
        return;
    }

    out_ << fmt::format("{}Sync plan:{} {}{} to add{}, {}{} to update{}, {}{} to delete{} ({} to copy)\n",
                        theme_.H(), theme_.R(),
                        theme_.A(), plan.adds, theme_.R(),
                        theme_.U(), plan.updates, theme_.R(),
                        theme_.X(), plan.deletes, theme_.R(),
                        human_bytes(plan.bytesToCopy()));

    const auto shown = std::min(sampleSize_, plan.size());
    for (size_t i = 0; i < shown; ++i) out_ << "  " << actionLine(plan.actions[i]) << '\n';

    if (plan.size() > shown)
        out_ << fmt::format("  {}... and {} more actions{}\n", theme_.D(), plan.size() - shown, theme_.R());

    out_.flush();
}

void Presenter::warnings(const std::vector<Warning>& warnings) const {
    if (warnings.empty()) return;

    out_ << fmt::format("{}{} warnings:{}\n", theme_.U(), warnings.size(), theme_.R());
    for (const auto& w : warnings)
        out_ << fmt::format("  [{}] {}: {}\n", to_string(w.kind), w.path.empty() ? "." : w.path, w.message);
    out_.flush();
}

void Presenter::result(const AggregateResult& result) const {
    const auto seconds = result.durationMs / 1000;

    if (result.ok()) {
        out_ << fmt::format("{}Synchronization complete:{} {} actions applied ({} added, {} updated, {} deleted), {} copied in {}\n",
                            theme_.A(), theme_.R(), result.appliedCount, result.added, result.updated,
                            result.deleted, human_bytes(result.bytesCopied), human_duration(seconds));
        out_.flush();
        return;
    }

    out_ << fmt::format("{}Synchronization finished with {} errors{} ({} actions applied):\n",
                        theme_.X(), result.errors.size(), theme_.R(), result.appliedCount);
    for (const auto& e : result.errors)
        out_ << fmt::format("  {}: {}\n", actionLine(e.action), e.message);
    out_.flush();
}
