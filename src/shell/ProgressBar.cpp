#include "shell/ProgressBar.hpp"
#include "util/cmdLineHelpers.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <unistd.h>

using namespace tmr::shell;

ProgressBar::ProgressBar(std::ostream& out, const bool enabled,
                         const std::chrono::milliseconds redrawInterval, const int width)
    : out_(out), enabled_(enabled), interval_(redrawInterval),
      width_(width > 0 ? width : term_width(STDERR_FILENO)) {}

bool ProgressBar::shouldRender(const int fd, const bool jsonOutput) {
    return !jsonOutput && isatty(fd);
}

void ProgressBar::onPlanStarted(const uintmax_t totalBytes, const size_t totalActions) {
    std::scoped_lock lock(mutex_);
    totalBytes_ = totalBytes;
    totalActions_ = totalActions;
    doneBytes_ = 0;
    doneActions_ = 0;
    failedActions_ = 0;
    started_ = clock::now();
    samples_.clear();
    samples_.push_back({started_, 0});
}

void ProgressBar::onFileStarted(const std::string& relativePath, uintmax_t) {
    std::scoped_lock lock(mutex_);
    current_ = relativePath;
    maybeDraw(false);
}

void ProgressBar::onBytesCopied(const uintmax_t n) {
    std::scoped_lock lock(mutex_);
    doneBytes_ += n;

    const auto now = clock::now();
    samples_.push_back({now, doneBytes_});
    while (samples_.size() > 2 && now - samples_.front().at > RATE_WINDOW) samples_.pop_front();

    maybeDraw(false);
}

void ProgressBar::onActionFinished(const std::string&, const bool ok) {
    std::scoped_lock lock(mutex_);
    ++doneActions_;
    if (!ok) ++failedActions_;
    maybeDraw(false);
}

void ProgressBar::onPlanFinished() {
    std::scoped_lock lock(mutex_);
    current_.clear();
    maybeDraw(true);
    if (enabled_) out_ << std::endl;
}

uintmax_t ProgressBar::bytesDone() const {
    std::scoped_lock lock(mutex_);
    return doneBytes_;
}

size_t ProgressBar::actionsDone() const {
    std::scoped_lock lock(mutex_);
    return doneActions_;
}

double ProgressBar::rate() const {
    std::scoped_lock lock(mutex_);
    return rateLocked();
}

double ProgressBar::rateLocked() const {
    if (samples_.size() < 2) return 0.0;
    const auto& first = samples_.front();
    const auto& last = samples_.back();
    const auto secs = std::chrono::duration<double>(last.at - first.at).count();
    if (secs <= 0.0) return 0.0;
    return static_cast<double>(last.bytes - first.bytes) / secs;
}

void ProgressBar::maybeDraw(const bool force) {
    if (!enabled_) return;

    const auto now = clock::now();
    if (!force && now - lastDraw_ < interval_) return;
    lastDraw_ = now;

    out_ << '\r' << render() << "\033[K" << std::flush;
}

std::string ProgressBar::render() const {
    const double fraction = totalBytes_ > 0
        ? static_cast<double>(std::min(doneBytes_, totalBytes_)) / static_cast<double>(totalBytes_)
        : (totalActions_ > 0 ? static_cast<double>(doneActions_) / static_cast<double>(totalActions_) : 1.0);

    constexpr int barWidth = 24;
    const auto filled = static_cast<int>(fraction * barWidth);
    std::string bar(static_cast<size_t>(filled), '#');
    bar.append(static_cast<size_t>(barWidth - filled), '.');

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(clock::now() - started_).count();
    const auto bps = rateLocked();

    std::string eta = "--";
    if (bps > 0.0 && totalBytes_ > doneBytes_)
        eta = human_duration(static_cast<int64_t>(static_cast<double>(totalBytes_ - doneBytes_) / bps));

    auto line = fmt::format("[{}] {:5.1f}%  {}/{}  {}/s  {} elapsed  ETA {}  {}/{}",
                            bar, fraction * 100.0, human_bytes(doneBytes_), human_bytes(totalBytes_),
                            human_bytes(static_cast<uint64_t>(bps)), human_duration(elapsed), eta,
                            doneActions_, totalActions_);
    if (failedActions_ > 0) line += fmt::format(" ({} failed)", failedActions_);

    if (!current_.empty()) {
        const auto room = static_cast<int>(width_) - static_cast<int>(line.size()) - 3;
        if (room >= 5) line += "  " + ellipsize_middle(current_, static_cast<size_t>(room));
    }

    return line;
}
