#pragma once
#include <atomic>
#include <ctime>

// Process-wide wall clock in epoch seconds. Tests pin it with set() to get
// reproducible envelope timestamps and to step over cache TTLs.
class VirtualClock
{
public:
    static void set(std::time_t t)
    {
        value.store(t, std::memory_order_relaxed);
        enabled.store(true, std::memory_order_relaxed);
    }

    static void advance(std::time_t seconds)
    {
        value.fetch_add(seconds, std::memory_order_relaxed);
    }

    static void disable()
    {
        enabled.store(false, std::memory_order_relaxed);
    }

    static std::time_t now()
    {
        if (enabled.load(std::memory_order_relaxed))
            return value.load(std::memory_order_relaxed);
        return std::time(nullptr);
    }

private:
    static inline std::atomic<bool> enabled{false};
    static inline std::atomic<std::time_t> value{0};
};
