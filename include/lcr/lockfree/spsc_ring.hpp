// -----------------------------------------------------------------------------
// Bounded SPSC ring with compile-time capacity.
// One producer thread (push), one consumer thread (pop / drain).
//
// Example:
//     spsc_ring<std::string, 1024> frames;
//     frames.push(std::move(text));    // IO thread
//     std::string s;
//     while (frames.pop(s)) { ... }    // owner thread
//
// Notes:
//   - Capacity must be a power of two; usable slots = Capacity - 1
//   - Slots are moved out on pop, so move-only payloads are fine
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>


namespace lcr::lockfree {

template <typename T, std::size_t Capacity>
class spsc_ring {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    spsc_ring() = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Producer side
    template <typename U>
    [[nodiscard]] inline bool push(U&& item) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.load(std::memory_order_acquire)) {
            return false; // full
        }
        slots_[head] = std::forward<U>(item);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side
    [[nodiscard]] inline bool pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // empty
        }
        out = std::move(slots_[tail]);
        tail_.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    // Consumer side: pops every pending item into fn, returns how many
    template <typename Fn>
    inline std::size_t drain(Fn&& fn) {
        std::size_t n = 0;
        T item;
        while (pop(item)) {
            fn(std::move(item));
            ++n;
        }
        return n;
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline std::size_t size() const noexcept {
        return (head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire)) & MASK;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return Capacity - 1; }

private:
    static constexpr std::size_t MASK = Capacity - 1;

    std::array<T, Capacity> slots_{};
    alignas(64) std::atomic<std::size_t> head_{0};
    alignas(64) std::atomic<std::size_t> tail_{0};
};

} // namespace lcr::lockfree
