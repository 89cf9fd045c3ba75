#pragma once

#include "sync/tasks/ActionTask.hpp"

namespace tmr::sync::tasks {

// Recursive for directories. A path that is already gone counts as converged.
struct Delete final : ActionTask {
    using ActionTask::ActionTask;

protected:
    Outcome run() override;
};

}
