#include "UiDispatcher.h"
#include "utils/Logger.h"

#include <stdexcept>

namespace wndtap {
namespace core {
namespace dispatch {

const char* DispatcherPriorityName(DispatcherPriority priority) {
    switch (priority) {
    case DispatcherPriority::Inactive:        return "Inactive";
    case DispatcherPriority::SystemIdle:      return "SystemIdle";
    case DispatcherPriority::ApplicationIdle: return "ApplicationIdle";
    case DispatcherPriority::ContextIdle:     return "ContextIdle";
    case DispatcherPriority::Background:      return "Background";
    case DispatcherPriority::Input:           return "Input";
    case DispatcherPriority::Loaded:          return "Loaded";
    case DispatcherPriority::Render:          return "Render";
    case DispatcherPriority::DataBind:        return "DataBind";
    case DispatcherPriority::Normal:          return "Normal";
    case DispatcherPriority::Send:            return "Send";
    }
    return "Unknown";
}

// ===================================================================
// Construction
// ===================================================================

UiDispatcher::UiDispatcher()
    : m_ownerThread(std::this_thread::get_id()) {
}

// ===================================================================
// Posting
// ===================================================================

void UiDispatcher::BeginInvoke(Work work, DispatcherPriority priority) {
    if (!work) {
        WNDTAP_LOG_ERROR("BeginInvoke called with empty work item");
        throw std::invalid_argument("work must not be empty");
    }

    const auto tier = static_cast<size_t>(priority);
    if (tier >= kTierCount) {
        WNDTAP_LOG_ERROR("BeginInvoke called with invalid priority {}", tier);
        throw std::invalid_argument("unknown dispatcher priority");
    }

    Work wakeup;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queues[tier].push_back(std::move(work));
        wakeup = m_wakeup;
    }

    WNDTAP_LOG_TRACE("Work queued at {} priority", DispatcherPriorityName(priority));

    if (wakeup) {
        wakeup();
    }
}

// ===================================================================
// Running
// ===================================================================

bool UiDispatcher::RunOne() {
    Work work;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Tier 0 (Inactive) is never run
        for (size_t tier = kTierCount - 1; tier > 0; --tier) {
            auto& queue = m_queues[tier];
            if (!queue.empty()) {
                work = std::move(queue.front());
                queue.pop_front();
                break;
            }
        }
    }

    if (!work) {
        return false;
    }

    work();
    return true;
}

size_t UiDispatcher::ProcessPending() {
    size_t ran = 0;
    while (RunOne()) {
        ++ran;
    }
    return ran;
}

// ===================================================================
// Queries
// ===================================================================

size_t UiDispatcher::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& queue : m_queues) {
        count += queue.size();
    }
    return count;
}

bool UiDispatcher::HasPending() const {
    return GetPendingCount() > 0;
}

bool UiDispatcher::CheckAccess() const {
    return std::this_thread::get_id() == m_ownerThread;
}

void UiDispatcher::SetWakeupCallback(Work wakeup) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_wakeup = std::move(wakeup);
}

} // namespace dispatch
} // namespace core
} // namespace wndtap
