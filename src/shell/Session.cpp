#include "shell/Session.hpp"
#include "shell/Presenter.hpp"
#include "shell/Prompt.hpp"

#include <memory>

using namespace tmr::shell;
using namespace tmr::sync;

RunHooks tmr::shell::makeRunHooks(const CliOptions& opts,
                                  const config::SyncConfig& cfg,
                                  const bool color,
                                  const Streams& streams,
                                  model::ProgressObserver* observer) {
    auto& listing = opts.json ? streams.err : streams.out;

    const auto presenter = std::make_shared<const Presenter>(listing, color && !opts.json, cfg.plan_sample_size);
    const auto prompt = std::make_shared<const Prompt>(streams.in, listing, cfg.confirm_default);

    RunHooks hooks;
    hooks.present = [presenter](const model::Plan& plan) { presenter->plan(plan); };
    hooks.confirm = [prompt](const model::Plan&) { return prompt->confirm("Proceed with synchronization?"); };
    hooks.observer = observer;
    return hooks;
}
