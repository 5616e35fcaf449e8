#pragma once

#include "util/util.hpp"

#include <atomic>
#include <bit>
#include <type_traits>
#include <utility>

#include <stddef.h>
#include <stdint.h>

namespace sm {
    /// @brief A fixed size, multi-producer, single-consumer atomic ringbuffer.
    ///
    /// Storage is inline so the queue can be constinit. Each slot carries a sequence
    /// number, a slot that a producer has claimed but not yet written is not visible
    /// to the consumer. Pushing never waits so it is safe from interrupt handlers.
    ///
    /// @tparam T The element type.
    /// @tparam N The capacity, must be a power of two.
    template<typename T, uint32_t N>
    class AtomicRingQueue {
        static_assert(std::has_single_bit(N), "Capacity must be a power of two");
        static_assert(std::is_nothrow_move_assignable_v<T>);

        struct Cell {
            /// @brief Sequence number minus the cell index, so a zeroed cell is ready for its first write.
            std::atomic<uint32_t> sequence{0};
            T value{};
        };

        Cell mCells[N];
        std::atomic<uint32_t> mProducerHead{0};
        std::atomic<uint32_t> mConsumerHead{0};

        static constexpr uint32_t slot(uint32_t position) noexcept {
            return position % N;
        }

        uint32_t sequence(uint32_t position) const noexcept {
            return mCells[slot(position)].sequence.load(std::memory_order_acquire) + slot(position);
        }

    public:
        constexpr AtomicRingQueue() noexcept = default;
        UTIL_NOCOPY(AtomicRingQueue);
        UTIL_NOMOVE(AtomicRingQueue);

        /// @brief Try to push a value onto the queue.
        ///
        /// If the value is pushed then @p value is moved from, otherwise it is left unchanged.
        ///
        /// @return true if the value was pushed, false if the queue was full.
        bool tryPush(T& value) noexcept {
            uint32_t position = mProducerHead.load(std::memory_order_relaxed);

            while (true) {
                int32_t diff = int32_t(sequence(position) - position);
                if (diff == 0) {
                    if (mProducerHead.compare_exchange_weak(position, position + 1, std::memory_order_relaxed)) {
                        break;
                    }
                } else if (diff < 0) {
                    return false; // Queue is full
                } else {
                    position = mProducerHead.load(std::memory_order_relaxed);
                }
            }

            Cell& cell = mCells[slot(position)];
            cell.value = std::move(value);
            cell.sequence.store(position + 1 - slot(position), std::memory_order_release);
            return true;
        }

        /// @brief Try to pop a value from the queue.
        ///
        /// Only one thread may pop at a time.
        ///
        /// @return true if a value was popped, false if no published value was waiting.
        bool tryPop(T& value) noexcept {
            uint32_t position = mConsumerHead.load(std::memory_order_relaxed);
            if (int32_t(sequence(position) - (position + 1)) < 0) {
                return false; // Queue is empty
            }

            Cell& cell = mCells[slot(position)];
            value = std::move(cell.value);
            cell.sequence.store(position + N - slot(position), std::memory_order_release);
            mConsumerHead.store(position + 1, std::memory_order_relaxed);
            return true;
        }

        /// @brief Is a published value waiting to be popped.
        bool hasPending() const noexcept {
            uint32_t position = mConsumerHead.load(std::memory_order_relaxed);
            return int32_t(sequence(position) - (position + 1)) >= 0;
        }

        /// @brief Get an estimate of the number of claimed slots.
        ///
        /// @warning As this is a lock-free structure the count will be immediately out of date.
        uint32_t count() const noexcept {
            return mProducerHead.load(std::memory_order_relaxed) - mConsumerHead.load(std::memory_order_relaxed);
        }

        static constexpr uint32_t capacity() noexcept {
            return N;
        }
    };
}
