#include <plotcore/logger.hpp>
#include <plotcore/scheduler.hpp>

namespace plotcore
{

void RedrawScheduler::request_redraw()
{
    requests_.fetch_add(1, std::memory_order_relaxed);
    if (pending_.exchange(true, std::memory_order_acq_rel))
    {
        coalesced_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    PLOTCORE_LOG_TRACE("scheduler", "Redraw requested");
}

bool RedrawScheduler::begin_frame()
{
    if (!pending_.exchange(false, std::memory_order_acq_rel))
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint                   now = Clock::now();

    if (first_frame_)
    {
        first_frame_      = false;
        start_time_       = now;
        last_frame_start_ = now;
        frame_            = Frame{};
    }
    else
    {
        std::chrono::duration<double> dt      = now - last_frame_start_;
        std::chrono::duration<double> elapsed = now - start_time_;
        last_frame_start_                     = now;

        frame_.dt          = static_cast<float>(dt.count());
        frame_.elapsed_sec = static_cast<float>(elapsed.count());
        frame_.number++;
    }

    PLOTCORE_LOG_TRACE("scheduler", "begin_frame {}", frame_.number);
    return true;
}

Frame RedrawScheduler::current_frame() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return frame_;
}

}   // namespace plotcore
