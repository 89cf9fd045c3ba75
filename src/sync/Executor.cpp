#include "sync/Executor.hpp"
#include "sync/tasks/Copy.hpp"
#include "sync/tasks/Delete.hpp"
#include "sync/tasks/Mkdir.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <future>
#include <system_error>

using namespace tmr::sync;
using namespace tmr::sync::model;
using namespace tmr::sync::tasks;
using namespace tmr::concurrency;

namespace fs = std::filesystem;

std::shared_ptr<ActionTask> Executor::dispatch(const Action& action,
                                               const fs::path& sourceRoot,
                                               const fs::path& targetRoot,
                                               ProgressObserver* observer,
                                               const size_t copyBufferSize) {
    const auto src = sourceRoot / action.key;
    const auto dst = targetRoot / action.key;

    switch (action.type) {
    case ActionType::Delete:
        return std::make_shared<Delete>(action, src, dst, observer);
    case ActionType::Add:
        if (action.isDirectory()) return std::make_shared<Mkdir>(action, src, dst, observer);
        return std::make_shared<Copy>(action, src, dst, observer, copyBufferSize);
    case ActionType::Update:
        return std::make_shared<Copy>(action, src, dst, observer, copyBufferSize);
    }
    return nullptr;
}

AggregateResult Executor::apply(const Plan& plan,
                                const fs::path& sourceRoot,
                                const fs::path& targetRoot,
                                const unsigned int maxConcurrency,
                                ProgressObserver* observer,
                                const size_t copyBufferSize) {
    const auto started = std::chrono::steady_clock::now();
    AggregateResult result;

    // Links above the root are the caller's choice, below it nothing is followed
    std::error_code ec;
    const auto resolved = fs::canonical(targetRoot, ec);
    const auto& target = ec ? targetRoot : resolved;

    const auto workers = maxConcurrency == 0 ? 1u : maxConcurrency;
    log::Registry::exec()->info("[Executor] Applying {} actions with concurrency {}", plan.size(), workers);

    if (observer) observer->onPlanStarted(plan.bytesToCopy(), plan.size());

    {
        // Fixed worker count is the permit pool: at most `workers` actions in flight
        ThreadPool pool(workers, "exec");

        // Deletes drain before anything is created, so a kind change never races its own add
        for (const bool deletes : {true, false}) {
            std::vector<std::pair<const Action*, std::future<Outcome>>> pending;

            for (const auto& action : plan.actions) {
                if ((action.type == ActionType::Delete) != deletes) continue;

                if (action.type == ActionType::Update && (action.isDirectory() || (action.target && action.target->isDirectory))) {
                    const auto msg = "directory update is never planned, skipped";
                    log::Registry::exec()->error("[Executor] {}: {}", action.key, msg);
                    result.warnings.push_back({Warning::Kind::Contract, action.key, msg});
                    continue;
                }

                const auto task = dispatch(action, sourceRoot, target, observer, copyBufferSize);
                auto future = task->getFuture();
                try {
                    pool.submit(task);
                    pending.emplace_back(&action, std::move(future));
                } catch (const std::exception& e) {
                    result.errors.push_back({action, e.what()});
                }
            }

            // Single writer: only this thread touches the aggregate
            for (auto& [action, future] : pending) {
                try {
                    auto outcome = future.get();
                    ++result.appliedCount;
                    result.bytesCopied += outcome.bytesCopied;
                    switch (action->type) {
                    case ActionType::Add: ++result.added; break;
                    case ActionType::Update: ++result.updated; break;
                    case ActionType::Delete: ++result.deleted; break;
                    }
                    for (auto& w : outcome.warnings) result.warnings.push_back(std::move(w));
                    log::Registry::exec()->debug("[Executor] {} {}", to_string(action->type), action->key);
                } catch (const std::exception& e) {
                    log::Registry::exec()->error("[Executor] {} {} failed: {}", to_string(action->type), action->key, e.what());
                    result.errors.push_back({*action, e.what()});
                }
            }
        }
    }

    if (observer) observer->onPlanFinished();

    result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    log::Registry::exec()->info("[Executor] Applied {}/{} actions ({} added, {} updated, {} deleted), {} bytes in {} ms, {} errors",
                                result.appliedCount, plan.size(), result.added, result.updated, result.deleted,
                                result.bytesCopied, result.durationMs, result.errors.size());
    return result;
}
