#include "memory/frames.hpp"

#include "panic.hpp"

#include <bit>

kr::FreeFrameSequence::FreeFrameSequence(std::span<const MemoryRegion> regions, size_t frameSize, uintptr_t threshold)
    : mRegions(regions)
    , mFrameSize(frameSize)
    , mThreshold(threshold)
    , mRegion(0)
    , mCursor(0)
{
    KR_CHECK(std::has_single_bit(frameSize), "Frame size must be a power of two.");

    //
    // Frame zero is never handed out, its identity mapping is the null pointer.
    //
    mThreshold = std::max(mThreshold, mFrameSize);
}

std::optional<uintptr_t> kr::FreeFrameSequence::firstFrame(uintptr_t front, uintptr_t back) const {
    // round up to the next frame, stopping if that overflows
    uintptr_t frame;
    uintptr_t end;
    if (__builtin_add_overflow(front, mFrameSize - 1, &frame)) {
        return std::nullopt;
    }

    frame &= ~(mFrameSize - 1);

    if (__builtin_add_overflow(frame, mFrameSize, &end) || end > back) {
        return std::nullopt;
    }

    return frame;
}

std::optional<uintptr_t> kr::FreeFrameSequence::yieldedUntil(uintptr_t frame) const {
    for (size_t i = 0; i < mRegion; i++) {
        const MemoryRegion& region = mRegions[i];
        if (!region.isFree()) {
            continue;
        }

        uintptr_t back = region.back();
        if (region.front.toInteger() <= frame && frame + mFrameSize <= back) {
            // every frame from here to the last whole frame of the region was handed out
            return back & ~(mFrameSize - 1);
        }
    }

    return std::nullopt;
}

std::optional<kr::PhysicalAddress> kr::FreeFrameSequence::next() {
    while (mRegion < mRegions.size()) {
        const MemoryRegion& region = mRegions[mRegion];
        if (region.isFree()) {
            uintptr_t front = std::max({ mCursor, region.front.toInteger(), mThreshold });

            if (std::optional<uintptr_t> frame = firstFrame(front, region.back())) {
                if (std::optional<uintptr_t> end = yieldedUntil(*frame)) {
                    mCursor = *end;
                    continue;
                }

                if (std::optional<PhysicalAddress> paddr = PhysicalAddress::fromInteger(*frame)) {
                    mCursor = *frame + mFrameSize;
                    return paddr;
                }
            }
        }

        mRegion += 1;
        mCursor = 0;
    }

    return std::nullopt;
}
