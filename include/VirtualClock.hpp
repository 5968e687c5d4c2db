#pragma once
#include <atomic>
#include <ctime>
#include "Types.hpp"

// "Now" for departure ETAs, alert classification and alert timestamps.
// Pinning it answers every query as of a fixed instant (`--at` on the
// command line); unpinned it follows the system clock.
class VirtualClock
{
public:
    static void pin(EpochSeconds t)
    {
        pinnedAt.store(t, std::memory_order_relaxed);
        isPinned.store(true, std::memory_order_relaxed);
    }

    static void unpin()
    {
        isPinned.store(false, std::memory_order_relaxed);
    }

    static bool pinned()
    {
        return isPinned.load(std::memory_order_relaxed);
    }

    static EpochSeconds now()
    {
        if (pinned())
            return pinnedAt.load(std::memory_order_relaxed);
        return static_cast<EpochSeconds>(std::time(nullptr));
    }

private:
    static inline std::atomic<bool> isPinned{false};
    static inline std::atomic<EpochSeconds> pinnedAt{0};
};
