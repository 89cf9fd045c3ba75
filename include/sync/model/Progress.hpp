#pragma once

#include <cstdint>
#include <string>

namespace tmr::sync::model {

// Passive consumer of apply progress. Called from worker threads.
struct ProgressObserver {
    virtual ~ProgressObserver() = default;

    virtual void onPlanStarted(uintmax_t totalBytes, size_t totalActions) { (void)totalBytes; (void)totalActions; }
    virtual void onFileStarted(const std::string& relativePath, uintmax_t size) = 0;
    virtual void onBytesCopied(uintmax_t n) = 0;
    virtual void onActionFinished(const std::string& relativePath, bool ok) { (void)relativePath; (void)ok; }
    virtual void onPlanFinished() {}
};

}
