// =============================================================================
// FILE: gvmi/core/progress.cpp
// BRIEF: Progress tracker and built-in sinks
// =============================================================================

#include "gvmi/core/progress.hpp"

#include <algorithm>

namespace gvmi::progress {

namespace {

// Sink is contacted at most ~this many times per run
constexpr Size MAX_PUBLISH_EVENTS = 1000;

void format_hms(std::FILE* out, long long seconds) noexcept {
    const long long h = seconds / 3600;
    const long long m = (seconds / 60) % 60;
    const long long s = seconds % 60;
    std::fprintf(out, "%02lld:%02lld:%02lld", h, m, s);
}

} // anonymous namespace

// =============================================================================
// TerminalProgressBar
// =============================================================================

TerminalProgressBar::TerminalProgressBar(std::FILE* out, int width)
    : out_(out != nullptr ? out : stderr),
      width_(width > 0 ? width : 40),
      start_time_(std::chrono::steady_clock::now()) {}

void TerminalProgressBar::on_start(Size total, const std::string& message) {
    message_ = message;
    start_time_ = std::chrono::steady_clock::now();
    render(0, total);
}

void TerminalProgressBar::on_advance(Size position, Size total) noexcept {
    render(position, total);
}

void TerminalProgressBar::on_finish(const std::string& message) {
    message_ = message;
    std::fprintf(out_, "\r\033[K");
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_).count();
    std::fputc('[', out_);
    format_hms(out_, static_cast<long long>(elapsed));
    std::fprintf(out_, "] %s\n", message_.c_str());
    std::fflush(out_);
}

void TerminalProgressBar::render(Size position, Size total) noexcept {
    const double frac = (total > 0)
        ? static_cast<double>(std::min(position, total)) / static_cast<double>(total)
        : 1.0;
    const int filled = static_cast<int>(frac * width_);

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_).count();

    std::fputs("\r[", out_);
    format_hms(out_, static_cast<long long>(elapsed));
    std::fputs("] [", out_);
    for (int i = 0; i < width_; ++i) {
        std::fputs(i < filled ? "\xe2\x96\x88" : "\xe2\x96\x91", out_);  // full / light shade
    }
    std::fprintf(out_, "] %zu/%zu (%3d%%)", position, total, static_cast<int>(frac * 100));

    if (position > 0 && position < total) {
        const auto eta = static_cast<long long>(
            static_cast<double>(elapsed) * static_cast<double>(total - position) /
            static_cast<double>(position));
        std::fputs(" eta ", out_);
        format_hms(out_, eta);
    }

    if (!message_.empty()) {
        std::fprintf(out_, " %s", message_.c_str());
    }
    std::fflush(out_);
}

// =============================================================================
// CallbackProgressSink
// =============================================================================

void CallbackProgressSink::on_start(Size total, const std::string& /*message*/) {
    if (callback_ != nullptr) {
        callback_(0, total, user_data_);
    }
}

void CallbackProgressSink::on_advance(Size position, Size total) noexcept {
    if (callback_ != nullptr) {
        callback_(position, total, user_data_);
    }
}

void CallbackProgressSink::on_finish(const std::string& /*message*/) {
    // Final position was already delivered through on_advance
}

// =============================================================================
// ProgressTracker
// =============================================================================

ProgressTracker::ProgressTracker(ProgressSink* sink, Size total) noexcept
    : sink_(sink),
      total_(total),
      stride_(std::max<Size>(1, total / MAX_PUBLISH_EVENTS)) {}

void ProgressTracker::start(const std::string& message) {
    counter_.store(0, std::memory_order_release);
    published_.store(0, std::memory_order_release);
    if (sink_ != nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_->on_start(total_, message);
    }
}

void ProgressTracker::advance(Size n) noexcept {
    const Size pos = counter_.fetch_add(n, std::memory_order_acq_rel) + n;
    if (sink_ == nullptr) return;
    if (pos != total_ && (pos % stride_) != 0) return;

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return;
    publish_locked(pos);
}

void ProgressTracker::finish(const std::string& message) {
    if (sink_ == nullptr) return;
    std::lock_guard<std::mutex> lock(mutex_);
    publish_locked(counter_.load(std::memory_order_acquire));
    sink_->on_finish(message);
}

void ProgressTracker::publish_locked(Size pos) noexcept {
    if (pos <= published_.load(std::memory_order_relaxed)) return;
    published_.store(pos, std::memory_order_release);
    sink_->on_advance(pos, total_);
}

} // namespace gvmi::progress
