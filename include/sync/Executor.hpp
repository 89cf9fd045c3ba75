#pragma once

#include "config/Config.hpp"
#include "sync/model/Plan.hpp"
#include "sync/model/Progress.hpp"
#include "sync/model/Result.hpp"

#include <filesystem>
#include <memory>

namespace tmr::sync {

namespace tasks {
struct ActionTask;
}

class Executor {
public:
    // Every action is attempted. A failure never cancels the rest, it lands in the result.
    static model::AggregateResult apply(const model::Plan& plan,
                                        const std::filesystem::path& sourceRoot,
                                        const std::filesystem::path& targetRoot,
                                        unsigned int maxConcurrency,
                                        model::ProgressObserver* observer = nullptr,
                                        size_t copyBufferSize = config::DEFAULT_COPY_BUFFER_SIZE);

private:
    static std::shared_ptr<tasks::ActionTask> dispatch(const model::Action& action,
                                                       const std::filesystem::path& sourceRoot,
                                                       const std::filesystem::path& targetRoot,
                                                       model::ProgressObserver* observer,
                                                       size_t copyBufferSize);
};

}
