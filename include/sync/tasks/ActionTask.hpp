#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/Progress.hpp"
#include "sync/model/Warning.hpp"

#include <filesystem>
#include <vector>

namespace tmr::sync::tasks {

struct Outcome {
    uintmax_t bytesCopied = 0;
    std::vector<model::Warning> warnings;  // non-fatal, the action still counts as applied
};

// One plan action against the target tree. Failure surfaces as an exception on the future.
struct ActionTask : concurrency::PromisedTask<Outcome> {
    model::Action action;
    std::filesystem::path sourcePath;
    std::filesystem::path targetPath;
    model::ProgressObserver* observer = nullptr;

    ActionTask(model::Action a, std::filesystem::path src, std::filesystem::path dst, model::ProgressObserver* obs)
        : action(std::move(a)), sourcePath(std::move(src)), targetPath(std::move(dst)), observer(obs) {}

    void operator()() override {
        bool ok = true;
        try {
            promise.set_value(run());
        } catch (const std::exception&) {
            ok = false;
            promise.set_exception(std::current_exception());
        }
        if (observer) observer->onActionFinished(action.key, ok);
    }
};

// create_directories on the parent, "already there" is success
void ensureParentDirectory(const std::filesystem::path& path);

}
