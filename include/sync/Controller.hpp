#pragma once

#include "config/Config.hpp"
#include "sync/Digest.hpp"
#include "sync/Scanner.hpp"
#include "sync/model/Plan.hpp"
#include "sync/model/Progress.hpp"
#include "sync/model/Result.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tmr::concurrency {
class ThreadPool;
}

namespace tmr::sync {

struct RunOptions {
    std::filesystem::path source;
    std::filesystem::path target;
    std::vector<std::string> excludes;
    bool dryRun = false;
};

// Outer collaborators; every hook is optional
struct RunHooks {
    std::function<void(const model::Plan&)> present;
    std::function<bool(const model::Plan&)> confirm;   // unset means proceed
    model::ProgressObserver* observer = nullptr;
};

struct RunReport {
    model::Plan plan;
    std::vector<model::Warning> scanWarnings;
    std::optional<model::AggregateResult> applied;
    bool declined = false;
    bool dryRun = false;

    [[nodiscard]] bool ok() const { return !applied || applied->ok(); }
};

// Owns the scan pool and the digest service for the duration of a run
class Controller {
public:
    explicit Controller(config::SyncConfig cfg);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    void start();
    void shutdown();

    RunReport run(const RunOptions& opts, const RunHooks& hooks = {});

    // Throws FatalSetupError when the pair of roots cannot be mirrored
    static void validateSetup(const std::filesystem::path& source, const std::filesystem::path& target);

    [[nodiscard]] const config::SyncConfig& syncConfig() const { return cfg_; }

private:
    config::SyncConfig cfg_;
    std::unique_ptr<concurrency::ThreadPool> scanPool_;
    ContentDigest digest_;

    std::pair<ScanResult, ScanResult> scanBoth(const std::filesystem::path& source,
                                               const std::filesystem::path& target,
                                               const IgnorePredicate& ignore);
};

}
