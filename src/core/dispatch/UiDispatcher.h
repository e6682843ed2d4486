#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace wndtap {
namespace core {
namespace dispatch {

// Priority tiers, lowest first. Work at a higher tier always runs
// before work at a lower one; within a tier, FIFO.
enum class DispatcherPriority : uint8_t {
    Inactive        = 0,   // queued but never run
    SystemIdle      = 1,
    ApplicationIdle = 2,
    ContextIdle     = 3,
    Background      = 4,
    Input           = 5,
    Loaded          = 6,
    Render          = 7,
    DataBind        = 8,
    Normal          = 9,
    Send            = 10
};

const char* DispatcherPriorityName(DispatcherPriority priority);

// ------------------------------------------------------------------
// UiDispatcher -- prioritized work queue of one UI thread.
//
// BeginInvoke never runs work inline; the owning thread drains the
// queue from its message loop with ProcessPending(). Posting is safe
// from any thread. Running is done by the owner thread only.
//
// A native message pump can install a wakeup callback so that posting
// from elsewhere wakes a blocked GetMessage loop.
// ------------------------------------------------------------------

class UiDispatcher {
public:
    using Work = std::function<void()>;

    UiDispatcher();
    ~UiDispatcher() = default;

    // Non-copyable
    UiDispatcher(const UiDispatcher&) = delete;
    UiDispatcher& operator=(const UiDispatcher&) = delete;

    // --- Posting ---

    // Throws std::invalid_argument on empty work.
    void BeginInvoke(Work work, DispatcherPriority priority = DispatcherPriority::Normal);

    // --- Running ---

    // Runs the oldest item of the highest runnable tier. Returns false
    // when nothing ran. Exceptions from the item propagate.
    bool RunOne();

    // Runs items until none is runnable. Returns how many ran.
    size_t ProcessPending();

    // --- Queries ---
    size_t GetPendingCount() const;
    bool   HasPending() const;

    // True on the thread that created this dispatcher.
    bool CheckAccess() const;

    void SetWakeupCallback(Work wakeup);

private:
    static constexpr size_t kTierCount = static_cast<size_t>(DispatcherPriority::Send) + 1;

    std::array<std::deque<Work>, kTierCount> m_queues;
    Work            m_wakeup;
    std::thread::id m_ownerThread;
    mutable std::mutex m_mutex;
};

} // namespace dispatch
} // namespace core
} // namespace wndtap
