#pragma once

#include "arch/generic/intrin.hpp"

namespace arch {
    /// @brief Replaceable implementation of the privileged instructions.
    ///
    /// Hosted builds cannot execute privileged instructions, tests install
    /// their own implementation into @ref HostedIntrin::gImpl to observe and
    /// script them.
    class IHostedIntrin {
    public:
        virtual ~IHostedIntrin() = default;

        virtual void pause() noexcept { }
        virtual void halt() noexcept { }
        virtual void cli() noexcept { }
        virtual void sti() noexcept { }
        virtual void invlpg(uintptr_t) noexcept { }
        virtual void lidt(const IDTR&) noexcept { }
        virtual uint64_t readCr3() noexcept { return 0; }
        virtual uint64_t readCr2() noexcept { return 0; }
        virtual uint16_t readCs() noexcept { return 0x08; }
        virtual void outbyte(uint16_t, uint8_t) noexcept { }
        virtual uint8_t inbyte(uint16_t) noexcept { return 0; }

        static IHostedIntrin *GetDefault() noexcept {
            static IHostedIntrin sInstance;
            return &sInstance;
        }
    };

    struct HostedIntrin : GenericIntrin {
        static IHostedIntrin *gImpl;

        static void pause() noexcept {
            gImpl->pause();
        }

        static void halt() noexcept {
            gImpl->halt();
        }

        static void cli() noexcept {
            gImpl->cli();
        }

        static void sti() noexcept {
            gImpl->sti();
        }

        static void invlpg(uintptr_t address) noexcept {
            gImpl->invlpg(address);
        }

        static void lidt(const IDTR& idtr) noexcept {
            gImpl->lidt(idtr);
        }

        static uint64_t readCr3() noexcept {
            return gImpl->readCr3();
        }

        static uint64_t readCr2() noexcept {
            return gImpl->readCr2();
        }

        static uint16_t readCs() noexcept {
            return gImpl->readCs();
        }

        static void outbyte(uint16_t port, uint8_t data) noexcept {
            gImpl->outbyte(port, data);
        }

        static uint8_t inbyte(uint16_t port) noexcept {
            return gImpl->inbyte(port);
        }
    };

    using Intrin = HostedIntrin;
}
