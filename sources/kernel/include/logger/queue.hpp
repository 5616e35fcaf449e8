#pragma once

#include "logger/appender.hpp"

#include "std/ringbuffer.hpp"
#include "std/spinlock.hpp"

#include <kestrel/status.h>

#include <atomic>

namespace kr {
    /// @brief Fans log messages out to the installed appenders.
    ///
    /// Submission never blocks. If the appenders are busy, for example because an
    /// interrupt arrived while the interrupted code was logging, the message is
    /// queued and written by whoever holds the lock. Messages are only dropped
    /// when the queue is full.
    class LogQueue {
    public:
        static constexpr size_t kMaxAppenders = 4;
        static constexpr uint32_t kMessageQueueCapacity = 32;

    private:
        using MessageQueue = sm::AtomicRingQueue<detail::LogMessage, kMessageQueueCapacity>;

        static LogQueue sLogQueue;

        stdx::SpinLock mLock;
        ILogAppender *mAppenders[kMaxAppenders]{};
        size_t mAppenderCount{0};
        MessageQueue mQueue;

        /// @brief Number of messages that were dropped due to the queue being full.
        std::atomic<uint32_t> mDroppedCount{0};

        /// @brief Number of messages that were written out to the appenders.
        std::atomic<uint32_t> mCommittedCount{0};

        void write(const LogMessageView& message);
        size_t writeAllMessages();

        /// @brief Write out queued messages until none are left, then release the lock.
        void drainAndUnlock();

        OsStatus recordMessage(const LogMessageView& message) noexcept;

    public:
        constexpr LogQueue() noexcept = default;

        OsStatus addAppender(ILogAppender *appender) noexcept;
        void removeAppender(ILogAppender *appender) noexcept;

        OsStatus submit(const LogMessageView& message) noexcept;

        /// @brief Write out every queued message.
        ///
        /// @return The number of messages written.
        size_t flush() noexcept;

        uint32_t getDroppedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mDroppedCount.load(order);
        }

        uint32_t getCommittedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mCommittedCount.load(order);
        }

        static constexpr LogQueue &getGlobalQueue() noexcept {
            return sLogQueue;
        }

        static OsStatus addGlobalAppender(ILogAppender *appender) noexcept {
            return getGlobalQueue().addAppender(appender);
        }

        static void removeGlobalAppender(ILogAppender *appender) noexcept {
            getGlobalQueue().removeAppender(appender);
        }
    };

    constinit inline LogQueue LogQueue::sLogQueue{};
}
