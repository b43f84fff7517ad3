#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace plotcore
{

struct Frame
{
    uint64_t number      = 0;
    float    dt          = 0.0f;   // seconds since the previous frame
    float    elapsed_sec = 0.0f;   // seconds since the first frame
};

// Defer-and-notify trigger for repaints.
//
// Model mutations call request_redraw() from any thread; nothing renders
// inside that call. The owning loop polls begin_frame() and runs one
// clear-rebuild-render pass when it returns true. Any number of requests
// between two frames coalesce into a single pass.
class RedrawScheduler
{
   public:
    RedrawScheduler() = default;

    RedrawScheduler(const RedrawScheduler&)            = delete;
    RedrawScheduler& operator=(const RedrawScheduler&) = delete;

    void request_redraw();
    bool redraw_pending() const { return pending_.load(std::memory_order_acquire); }

    // Consumes the pending request. Returns false (and leaves the frame
    // counter untouched) when nothing was requested.
    bool begin_frame();

    Frame current_frame() const;

    uint64_t requests() const { return requests_.load(std::memory_order_relaxed); }
    uint64_t coalesced() const { return coalesced_.load(std::memory_order_relaxed); }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    std::atomic<bool>     pending_{false};
    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> coalesced_{0};

    mutable std::mutex mutex_;
    Frame              frame_;
    TimePoint          start_time_;
    TimePoint          last_frame_start_;
    bool               first_frame_ = true;
};

}   // namespace plotcore
