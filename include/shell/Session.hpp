#pragma once

#include "config/Config.hpp"
#include "shell/Cli.hpp"
#include "sync/Controller.hpp"

#include <istream>
#include <ostream>

namespace tmr::shell {

// Terminal streams a run talks to
struct Streams {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

// Presentation and confirmation for Controller::run. With --json the listing and the
// question go to err so out carries only the JSON document, but the plan is always
// shown before anything is asked.
sync::RunHooks makeRunHooks(const CliOptions& opts,
                            const config::SyncConfig& cfg,
                            bool color,
                            const Streams& streams,
                            sync::model::ProgressObserver* observer = nullptr);

}
