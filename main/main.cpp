// Sync
#include "sync/Controller.hpp"
#include "sync/errors.hpp"
#include "sync/model/json.hpp"

// Shell
#include "shell/Cli.hpp"
#include "shell/Presenter.hpp"
#include "shell/ProgressBar.hpp"
#include "shell/Session.hpp"
#include "shell/types.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace tmr::config;
using namespace tmr::shell;
using namespace tmr::sync;

namespace {

constexpr int EXIT_USAGE = 2;

bool useColor(const CliOptions& opts, const ColorMode mode) {
    if (opts.noColor || opts.json) return false;
    if (mode == ColorMode::Always) return true;
    if (mode == ColorMode::Never) return false;
    return isatty(STDOUT_FILENO);
}

void printJson(const RunReport& report) {
    nlohmann::json j = {
        {"dry_run", report.dryRun},
        {"declined", report.declined},
        {"plan", report.plan},
        {"scan_warnings", report.scanWarnings}
    };
    if (report.applied) j["result"] = *report.applied;
    std::cout << j.dump(2) << std::endl;
}

}

int main(int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parseCli(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << "treemirror: " << e.what() << "\n\n" << usage();
        return EXIT_USAGE;
    }

    if (opts.help) {
        std::cout << usage();
        return EXIT_SUCCESS;
    }

    try {
        ConfigRegistry::init(opts.configPath);
        tmr::log::Registry::init(ConfigRegistry::get().logging);
        if (opts.verbosity) tmr::log::Registry::setConsoleLevel(*opts.verbosity);

        const auto& sync = ConfigRegistry::get().sync;
        tmr::log::Registry::config()->debug("[ConfigRegistry] max_concurrency={} digest_workers={} scan_workers={} copy_buffer_size={} ignore_file={}",
                                            sync.max_concurrency, sync.digest_workers, sync.effectiveScanWorkers(),
                                            sync.copy_buffer_size, sync.ignore_file);
    } catch (const std::exception& e) {
        std::cerr << "treemirror: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;

    try {
        const auto& cfg = ConfigRegistry::get().sync;

        const bool color = useColor(opts, cfg.color);
        const Presenter presenter(std::cout, color, cfg.plan_sample_size);
        ProgressBar progress(std::cerr, ProgressBar::shouldRender(STDERR_FILENO, opts.json));

        const auto hooks = makeRunHooks(opts, cfg, color, {std::cin, std::cout, std::cerr},
                                        progress.enabled() ? &progress : nullptr);

        Controller controller(cfg);
        const auto report = controller.run({opts.source, opts.target, opts.excludes, opts.dryRun}, hooks);
        controller.shutdown();

        if (opts.json) printJson(report);
        else {
            auto warnings = report.scanWarnings;
            warnings.insert(warnings.end(), report.plan.warnings.begin(), report.plan.warnings.end());
            if (report.applied) {
                warnings.insert(warnings.end(), report.applied->warnings.begin(), report.applied->warnings.end());
                presenter.result(*report.applied);
            } else if (report.declined) {
                std::cout << "Synchronization cancelled." << std::endl;
            } else if (report.dryRun && !report.plan.empty()) {
                std::cout << "Dry run: no changes were made." << std::endl;
            }
            presenter.warnings(warnings);
        }

        if (!report.ok()) rc = EXIT_FAILURE;
    } catch (const FatalSetupError& e) {
        tmr::log::Registry::treemirror()->error("[-] {}", e.what());
        rc = EXIT_FAILURE;
    } catch (const std::exception& e) {
        tmr::log::Registry::treemirror()->error("[-] Synchronization failed: {}", e.what());
        rc = EXIT_FAILURE;
    }

    tmr::log::Registry::shutdown();
    return rc;
}
