#include "sync/Controller.hpp"
#include "sync/Executor.hpp"
#include "sync/Planner.hpp"
#include "sync/errors.hpp"
#include "ignore/Matcher.hpp"
#include "concurrency/ThreadPool.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <future>
#include <system_error>

using namespace tmr::sync;
using namespace tmr::sync::model;
using namespace tmr::concurrency;

namespace fs = std::filesystem;

Controller::Controller(config::SyncConfig cfg)
    : cfg_(std::move(cfg)), digest_(cfg_.digest_workers) {}

Controller::~Controller() {
    shutdown();
}

void Controller::start() {
    if (!scanPool_) scanPool_ = std::make_unique<ThreadPool>(cfg_.effectiveScanWorkers(), "scan");
    digest_.start();
}

void Controller::shutdown() {
    if (scanPool_) {
        scanPool_->stop();
        scanPool_.reset();
    }
    digest_.shutdown();
}

void Controller::validateSetup(const fs::path& source, const fs::path& target) {
    std::error_code ec;

    const auto srcStatus = fs::status(source, ec);
    if (!fs::exists(srcStatus))
        throw FatalSetupError("Source directory does not exist: " + source.string());
    if (!fs::is_directory(srcStatus))
        throw FatalSetupError("Source is not a directory: " + source.string());

    ec.clear();
    const auto tgtStatus = fs::status(target, ec);
    if (fs::exists(tgtStatus) && !fs::is_directory(tgtStatus))
        throw FatalSetupError("Target exists but is not a directory: " + target.string());

    fs::path src, tgt;
    try {
        src = util::normalizeRoot(source);
        tgt = util::normalizeRoot(target);
    } catch (const fs::filesystem_error& e) {
        throw FatalSetupError(std::string("Cannot resolve paths: ") + e.what());
    }

    if (src == tgt)
        throw FatalSetupError("Source and target are the same directory: " + src.string());
    if (util::isSubpath(src, tgt))
        throw FatalSetupError("Target " + tgt.string() + " is inside source " + src.string());
    if (util::isSubpath(tgt, src))
        throw FatalSetupError("Source " + src.string() + " is inside target " + tgt.string());
}

std::pair<ScanResult, ScanResult> Controller::scanBoth(const fs::path& source,
                                                       const fs::path& target,
                                                       const IgnorePredicate& ignore) {
    const Scanner scanner(*scanPool_);

    // Independent trees, no shared mutable state between the two walks
    auto sourceScan = std::async(std::launch::async, [&] {
        return scanner.scan(source, ignore, Scanner::Role::Source);
    });
    auto targetResult = scanner.scan(target, {}, Scanner::Role::Target);
    auto sourceResult = sourceScan.get();

    return {std::move(sourceResult), std::move(targetResult)};
}

RunReport Controller::run(const RunOptions& opts, const RunHooks& hooks) {
    validateSetup(opts.source, opts.target);

    const auto matcher = ignore::Matcher::load(opts.source, opts.excludes, cfg_.ignore_file);
    start();

    log::Registry::treemirror()->info("[Controller] Mirroring {} -> {}{}", opts.source.string(),
                                      opts.target.string(), opts.dryRun ? " (dry run)" : "");

    auto [sourceScan, targetScan] = scanBoth(opts.source, opts.target, matcher.predicate());

    RunReport report;
    report.dryRun = opts.dryRun;
    report.scanWarnings = std::move(sourceScan.warnings);
    report.scanWarnings.insert(report.scanWarnings.end(),
                               std::make_move_iterator(targetScan.warnings.begin()),
                               std::make_move_iterator(targetScan.warnings.end()));

    report.plan = Planner::build(sourceScan.entries, targetScan.entries, digest_.fn());

    if (hooks.present) hooks.present(report.plan);

    if (report.plan.empty()) {
        log::Registry::treemirror()->info("[Controller] Target already in sync");
        return report;
    }

    if (opts.dryRun) {
        log::Registry::treemirror()->info("[Controller] Dry run, nothing applied");
        return report;
    }

    if (hooks.confirm && !hooks.confirm(report.plan)) {
        log::Registry::treemirror()->info("[Controller] Synchronization declined");
        report.declined = true;
        return report;
    }

    std::error_code ec;
    if (!fs::exists(opts.target, ec)) {
        fs::create_directories(opts.target, ec);
        if (ec) throw FatalSetupError("Cannot create target " + opts.target.string() + ": " + ec.message());
        log::Registry::treemirror()->info("[Controller] Created target {}", opts.target.string());
    }

    report.applied = Executor::apply(report.plan, opts.source, opts.target,
                                     cfg_.max_concurrency, hooks.observer,
                                     static_cast<size_t>(cfg_.copy_buffer_size));
    return report;
}
