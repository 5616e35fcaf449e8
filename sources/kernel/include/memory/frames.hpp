#pragma once

#include "boot.hpp"

#include <optional>
#include <span>

namespace kr {
    /// @brief A source of unused physical frames.
    ///
    /// Every frame returned is owned by the caller and is never returned again.
    class IFrameSource {
    public:
        virtual ~IFrameSource() = default;

        /// @brief Take the next free frame.
        ///
        /// @return The frame, or nothing if the source is exhausted.
        virtual std::optional<PhysicalAddress> next() = 0;
    };

    /// @brief Hands out the frames of the free regions in a memory map.
    ///
    /// Only frames that are fully contained in a free region are returned, in region
    /// order and ascending within each region. Frame zero and frames below the threshold
    /// are never returned. A frame covered by more than one free region is only returned
    /// for the first of them. The sequence cannot be restarted.
    class FreeFrameSequence final : public IFrameSource {
        std::span<const MemoryRegion> mRegions;
        size_t mFrameSize;
        uintptr_t mThreshold;

        size_t mRegion;
        uintptr_t mCursor;

        std::optional<uintptr_t> firstFrame(uintptr_t front, uintptr_t back) const;

        /// @brief If an earlier free region already returned @p frame, the end of the
        /// frames that region returned.
        std::optional<uintptr_t> yieldedUntil(uintptr_t frame) const;

    public:
        UTIL_NOCOPY(FreeFrameSequence);

        /// @brief Create a frame sequence.
        ///
        /// @pre @p frameSize is a power of two.
        ///
        /// @param regions The memory map, must outlive the sequence.
        /// @param frameSize The size and alignment of each frame.
        /// @param threshold Frames below this address are skipped.
        FreeFrameSequence(std::span<const MemoryRegion> regions, size_t frameSize = x64::kPageSize, uintptr_t threshold = 0);

        std::optional<PhysicalAddress> next() override;

        size_t frameSize() const { return mFrameSize; }
    };
}
