#pragma once

#include "sync/tasks/ActionTask.hpp"

namespace tmr::sync::tasks {

struct Mkdir final : ActionTask {
    using ActionTask::ActionTask;

protected:
    Outcome run() override;
};

}
