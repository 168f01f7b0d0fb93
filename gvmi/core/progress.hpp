#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/macros.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>

// =============================================================================
/// @file progress.hpp
/// @brief Progress reporting for long-running kernels
///
/// Workers never talk to the output directly. They bump an atomic counter
/// on a ProgressTracker, and the tracker forwards a snapshot to a single
/// ProgressSink under a mutex. A worker that finds the mutex held skips
/// publishing, so the hot path never waits on terminal I/O.
///
/// @code{.cpp}
/// progress::TerminalProgressBar bar;
/// progress::ProgressTracker tracker(&bar, n_items);
/// tracker.start("Working...");
/// parallel_for(0, n_items, [&](size_t i) {
///     // Computation...
///     tracker.advance();
/// });
/// tracker.finish("Done");
/// @endcode
// =============================================================================

namespace gvmi::progress {

/// @brief Receiver of progress events.
///
/// on_start and on_finish are called from the thread that owns the
/// tracker. on_advance may be called from any worker, but never by two
/// threads at once, and positions only increase between calls.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void on_start(Size total, const std::string& message) = 0;
    virtual void on_advance(Size position, Size total) noexcept = 0;
    virtual void on_finish(const std::string& message) = 0;
};

/// @brief Text progress bar rendered in place with carriage returns.
class GVMI_EXPORT TerminalProgressBar : public ProgressSink {
public:
    explicit TerminalProgressBar(std::FILE* out = stderr, int width = 40);

    void on_start(Size total, const std::string& message) override;
    void on_advance(Size position, Size total) noexcept override;
    void on_finish(const std::string& message) override;

private:
    void render(Size position, Size total) noexcept;

    std::FILE* out_;
    int width_;
    std::string message_;
    std::chrono::steady_clock::time_point start_time_;
};

/// @brief C-style callback: (position, total, user_data).
using ProgressCallback = void (*)(Size position, Size total, void* user_data);

/// @brief Sink forwarding every event to a ProgressCallback.
class GVMI_EXPORT CallbackProgressSink : public ProgressSink {
public:
    CallbackProgressSink(ProgressCallback callback, void* user_data) noexcept
        : callback_(callback), user_data_(user_data) {}

    void on_start(Size total, const std::string& message) override;
    void on_advance(Size position, Size total) noexcept override;
    void on_finish(const std::string& message) override;

private:
    ProgressCallback callback_;
    void* user_data_;
};

/// @brief Shared completion counter with single-writer publication.
class GVMI_EXPORT ProgressTracker {
public:
    /// @param sink  Receiver, may be null (counting only)
    /// @param total Number of work items
    ProgressTracker(ProgressSink* sink, Size total) noexcept;

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void start(const std::string& message);

    /// @brief Record n completed items. Safe to call concurrently.
    void advance(Size n = 1) noexcept;

    /// @brief Publish the final position and the completion message.
    void finish(const std::string& message);

    [[nodiscard]] Size position() const noexcept {
        return counter_.load(std::memory_order_acquire);
    }

    [[nodiscard]] Size total() const noexcept { return total_; }

    /// @brief Highest position handed to the sink so far.
    [[nodiscard]] Size published() const noexcept {
        return published_.load(std::memory_order_acquire);
    }

private:
    void publish_locked(Size pos) noexcept;

    ProgressSink* sink_;
    Size total_;
    Size stride_;
    std::atomic<Size> counter_{0};
    std::atomic<Size> published_{0};
    std::mutex mutex_;
};

} // namespace gvmi::progress
