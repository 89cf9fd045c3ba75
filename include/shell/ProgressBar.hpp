#pragma once

#include "sync/model/Progress.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>

namespace tmr::shell {

// Single-line transfer progress redrawn in place. Thread-safe, never blocks the copy path for long.
class ProgressBar final : public sync::model::ProgressObserver {
public:
    using clock = std::chrono::steady_clock;

    explicit ProgressBar(std::ostream& out,
                         bool enabled = true,
                         std::chrono::milliseconds redrawInterval = std::chrono::milliseconds(100),
                         int width = 0);

    void onPlanStarted(uintmax_t totalBytes, size_t totalActions) override;
    void onFileStarted(const std::string& relativePath, uintmax_t size) override;
    void onBytesCopied(uintmax_t n) override;
    void onActionFinished(const std::string& relativePath, bool ok) override;
    void onPlanFinished() override;

    [[nodiscard]] bool enabled() const { return enabled_; }
    [[nodiscard]] uintmax_t bytesDone() const;
    [[nodiscard]] size_t actionsDone() const;

    // Bytes per second over the sliding window
    [[nodiscard]] double rate() const;

    // Enabled only when the stream is a terminal and output is meant for humans
    static bool shouldRender(int fd, bool jsonOutput);

private:
    struct Sample {
        clock::time_point at;
        uintmax_t bytes;
    };

    static constexpr std::chrono::seconds RATE_WINDOW{5};

    std::ostream& out_;
    bool enabled_;
    std::chrono::milliseconds interval_;
    int width_;

    mutable std::mutex mutex_;
    uintmax_t totalBytes_ = 0;
    uintmax_t doneBytes_ = 0;
    size_t totalActions_ = 0;
    size_t doneActions_ = 0;
    size_t failedActions_ = 0;
    std::string current_;
    clock::time_point started_{};
    clock::time_point lastDraw_{};
    std::deque<Sample> samples_;

    void maybeDraw(bool force);                   // mutex held
    [[nodiscard]] double rateLocked() const;      // mutex held
    [[nodiscard]] std::string render() const;     // mutex held
};

}
