#pragma once

#include <array>
#include <atomic>

namespace redub {

/// Wait-free single-producer/single-consumer ring. One slot is kept empty to
/// tell "full" from "empty", so the backing array holds Capacity + 1 items.
template<typename T, int Capacity>
class SPSCQueue {
    static_assert(Capacity > 0, "Capacity must be positive");

public:
    static constexpr int capacity() { return Capacity; }

    // --- Producer ---
    bool tryPush(const T& item)
    {
        const int write = writePos_.load(std::memory_order_relaxed);
        const int nextWrite = advance(write);
        if (nextWrite == readPos_.load(std::memory_order_acquire))
            return false;
        slots_[write] = item;
        writePos_.store(nextWrite, std::memory_order_release);
        return true;
    }

    // --- Consumer ---
    bool tryPop(T& item)
    {
        const int read = readPos_.load(std::memory_order_relaxed);
        if (read == writePos_.load(std::memory_order_acquire))
            return false;
        item = slots_[read];
        readPos_.store(advance(read), std::memory_order_release);
        return true;
    }

    template<typename Handler>
    int drain(Handler&& handler)
    {
        int count = 0;
        T item;
        while (tryPop(item))
        {
            handler(item);
            ++count;
        }
        return count;
    }

    // --- Either side (approximate while the other side is active) ---
    int size() const
    {
        const int diff = writePos_.load(std::memory_order_acquire)
                       - readPos_.load(std::memory_order_acquire);
        return diff >= 0 ? diff : diff + (Capacity + 1);
    }

    bool empty() const { return size() == 0; }

private:
    static int advance(int pos) { return (pos + 1) % (Capacity + 1); }

    std::array<T, Capacity + 1> slots_;
    std::atomic<int> readPos_{0};
    std::atomic<int> writePos_{0};
};

} // namespace redub
