#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

namespace sqlaudit {

/**
 * @brief Bounded lock-free queue, many producers and one consumer
 *
 * Every slot carries a sequence number. A slot at position p is free for
 * the producer when its sequence equals p, and holds a value for the
 * consumer when it equals p + 1. A producer only claims a position whose
 * slot is free, so a full queue rejects the push instead of leaving a
 * hole the consumer would wait on.
 *
 * Capacity is rounded up to a power of two.
 */
template <typename T>
class RecordQueue {
    static_assert(std::is_move_constructible_v<T>, "T must be move-constructible");

public:
    explicit RecordQueue(size_t capacity)
        : capacity_(round_up_pow2(capacity)),
          mask_(capacity_ - 1),
          slots_(std::make_unique<Slot[]>(capacity_)) {
        for (size_t i = 0; i < capacity_; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    RecordQueue(const RecordQueue&) = delete;
    RecordQueue& operator=(const RecordQueue&) = delete;
    RecordQueue(RecordQueue&&) = delete;
    RecordQueue& operator=(RecordQueue&&) = delete;

    /**
     * @brief Enqueue from any thread
     * @return false when the queue is full; the item is dropped and counted
     */
    [[nodiscard]] bool try_push(T item) {
        size_t pos = write_pos_.load(std::memory_order_relaxed);
        Slot* slot = nullptr;
        while (true) {
            slot = &slots_[pos & mask_];
            const size_t seq = slot->sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos);
            if (diff == 0) {
                if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                overflow_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            } else {
                pos = write_pos_.load(std::memory_order_relaxed);
            }
        }

        slot->data.emplace(std::move(item));
        slot->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    /**
     * @brief Move up to max_count items into batch, in claim order (consumer thread only)
     * @return Number of items moved
     */
    size_t drain(std::vector<T>& batch, size_t max_count) {
        size_t count = 0;
        size_t pos = read_pos_.load(std::memory_order_relaxed);

        while (count < max_count) {
            Slot& slot = slots_[pos & mask_];
            if (slot.sequence.load(std::memory_order_acquire) != pos + 1) {
                break;  // empty, or a producer is still writing
            }

            batch.emplace_back(std::move(*slot.data));
            slot.data.reset();
            slot.sequence.store(pos + capacity_, std::memory_order_release);
            ++pos;
            ++count;
        }

        read_pos_.store(pos, std::memory_order_relaxed);
        return count;
    }

    /// Items claimed but not yet drained; approximate while producers are active
    [[nodiscard]] size_t depth() const noexcept {
        const size_t w = write_pos_.load(std::memory_order_relaxed);
        const size_t r = read_pos_.load(std::memory_order_relaxed);
        return w > r ? w - r : 0;
    }

    [[nodiscard]] uint64_t overflow_count() const noexcept {
        return overflow_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    static size_t round_up_pow2(size_t n) {
        size_t cap = 1;
        while (cap < n) cap <<= 1;
        return cap;
    }

    struct alignas(64) Slot {
        std::atomic<size_t> sequence{0};
        std::optional<T> data;
    };

    const size_t capacity_;
    const size_t mask_;
    std::unique_ptr<Slot[]> slots_;

    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    alignas(64) std::atomic<uint64_t> overflow_count_{0};
};

} // namespace sqlaudit
