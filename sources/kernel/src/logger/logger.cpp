#include "logger/logger.hpp"

void kr::LogQueue::write(const LogMessageView& message) {
    for (size_t i = 0; i < mAppenderCount; i++) {
        mAppenders[i]->write(message);
    }

    mCommittedCount.fetch_add(1, std::memory_order_relaxed);
}

size_t kr::LogQueue::writeAllMessages() {
    size_t count = 0;
    detail::LogMessage message;
    while (mQueue.tryPop(message)) {
        write({ message.location, message.message, message.logger, message.level });
        count++;
    }

    return count;
}

void kr::LogQueue::drainAndUnlock() {
    do {
        writeAllMessages();
        mLock.unlock();

        // pairs with the fence in recordMessage, a message queued while the lock
        // was held is either seen here or its producer takes the lock
        std::atomic_thread_fence(std::memory_order_seq_cst);
    } while (mQueue.hasPending() && mLock.try_lock());
}

OsStatus kr::LogQueue::addAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);

    if (mAppenderCount >= kMaxAppenders) {
        return OsStatusOutOfMemory;
    }

    mAppenders[mAppenderCount++] = appender;
    return OsStatusSuccess;
}

void kr::LogQueue::removeAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);

    size_t kept = 0;
    for (size_t i = 0; i < mAppenderCount; i++) {
        if (mAppenders[i] != appender) {
            mAppenders[kept++] = mAppenders[i];
        }
    }

    mAppenderCount = kept;
}

OsStatus kr::LogQueue::recordMessage(const LogMessageView& message) noexcept {
    detail::LogMessage record {
        .level = message.level,
        .location = message.location,
        .logger = message.logger,
        .message = message.message,
    };

    if (!mQueue.tryPush(record)) {
        mDroppedCount.fetch_add(1, std::memory_order_relaxed);
        return OsStatusOutOfMemory;
    }

    std::atomic_thread_fence(std::memory_order_seq_cst);

    // the holder may have finished draining before the message was published
    if (mLock.try_lock()) {
        drainAndUnlock();
    }

    return OsStatusSuccess;
}

OsStatus kr::LogQueue::submit(const LogMessageView& message) noexcept {
    if (!mLock.try_lock()) {
        return recordMessage(message);
    }

    // queued messages were submitted first
    writeAllMessages();
    write(message);
    drainAndUnlock();
    return OsStatusSuccess;
}

size_t kr::LogQueue::flush() noexcept {
    stdx::LockGuard guard(mLock);
    return writeAllMessages();
}

stdx::StringView kr::Logger::getName() const noexcept {
    return mName;
}

void kr::Logger::submit(LogLevel level, stdx::StringView message, std::source_location location) const noexcept {
    LogMessageView view {
        .location = location,
        .message = message,
        .logger = this,
        .level = level,
    };

    mQueue->submit(view);
}

void kr::Logger::dbg(stdx::StringView message, std::source_location location) const noexcept {
    submit(LogLevel::eDebug, message, location);
}

void kr::Logger::info(stdx::StringView message, std::source_location location) const noexcept {
    submit(LogLevel::eInfo, message, location);
}

void kr::Logger::warn(stdx::StringView message, std::source_location location) const noexcept {
    submit(LogLevel::eWarning, message, location);
}

void kr::Logger::error(stdx::StringView message, std::source_location location) const noexcept {
    submit(LogLevel::eError, message, location);
}

void kr::Logger::fatal(stdx::StringView message, std::source_location location) const noexcept {
    submit(LogLevel::eFatal, message, location);
}
