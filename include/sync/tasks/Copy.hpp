#pragma once

#include "sync/tasks/ActionTask.hpp"

namespace tmr::sync::tasks {

// Add or Update of a regular file: truncate-and-rewrite, fsync, then carry the source mtime over
struct Copy final : ActionTask {
    size_t bufferSize;

    Copy(model::Action a,
         std::filesystem::path src,
         std::filesystem::path dst,
         model::ProgressObserver* obs,
         size_t bufferSize);

protected:
    Outcome run() override;
};

}
