#include <gtest/gtest.h>

#include "kernel_test.hpp"

#include "memory/pager.hpp"
#include "arch/cr3.hpp"

using kr::PhysicalAddress;
using kr::VirtualAddress;

using namespace x64::paging;

template<typename T>
static T *HostTable(const x64::Entry& entry) {
    return reinterpret_cast<T*>(entry.address());
}

class PagerTest : public testing::Test {
public:
    static constexpr uint16_t kMapSlot = 256;

    void SetUp() override {
        root = pages.allocate<x64::PageMapLevel4>();
        intrin.cr3 = uintptr_t(root);
    }

    kr::Pager pager() {
        return kr::Pager::current();
    }

    kr::MaybeIdentityMapped tables() const {
        return kr::MaybeIdentityMapped { map, krtest::kHostIdentityMappedSize };
    }

    VirtualAddress MapAddress(uintptr_t offset) const {
        return *map.base().offset(offset);
    }

    x64::PageMapLevel2 *MapDirectory(uint16_t pdpte) const {
        const x64::pml4e& t4 = root->entries[kMapSlot];
        if (!t4.present()) return nullptr;

        const x64::pdpte& t3 = HostTable<x64::PageMapLevel3>(t4)->entries[pdpte];
        if (!t3.present()) return nullptr;

        return HostTable<x64::PageMapLevel2>(t3);
    }

    krtest::TestIntrin intrin;
    krtest::IntrinScope scope { &intrin };

    krtest::HostPages pages;
    x64::PageMapLevel4 *root = nullptr;

    kr::PhysicalMemoryMap map { *VirtualAddress::fromInteger(kr::kPhysicalMemoryMapBase), kr::kPhysicalMemoryMapMaxSize };
};

TEST_F(PagerTest, Current) {
    EXPECT_EQ(pager().root(), krtest::HostAddress(root));
}

TEST_F(PagerTest, CurrentMasksFlags) {
    intrin.cr3 = uintptr_t(root) | x64::Cr3::PWT | x64::Cr3::PCD | 0x5;
    EXPECT_EQ(pager().root(), krtest::HostAddress(root));
}

TEST_F(PagerTest, MapLargePages) {
    krtest::TestFrameSource frames;
    size_t mapped = 0;

    OsStatus status = pager().mapPhysicalMemory(map, 8 * 0x100000, krtest::kHostIdentityMappedSize, frames, &mapped);
    ASSERT_EQ(status, OsStatusSuccess);

    EXPECT_EQ(mapped, 8 * 0x100000);
    EXPECT_EQ(map.size(), 8 * 0x100000);

    // one pdpt and one page directory
    EXPECT_EQ(frames.count(), 2);

    const x64::pml4e& t4 = root->entries[kMapSlot];
    EXPECT_TRUE(t4.present());
    EXPECT_TRUE(t4.writeable());

    x64::PageMapLevel2 *l2 = MapDirectory(0);
    ASSERT_NE(l2, nullptr);

    for (size_t i = 0; i < 4; i++) {
        const x64::pdte& entry = l2->entries[i];
        EXPECT_TRUE(entry.present()) << i;
        EXPECT_TRUE(entry.writeable()) << i;
        EXPECT_TRUE(entry.global()) << i;
        EXPECT_TRUE(entry.is2m()) << i;
        EXPECT_FALSE(entry.user()) << i;
        EXPECT_EQ(entry.address(), i * x64::kLargePageSize) << i;
    }

    for (size_t i = 4; i < x64::paging::kEntryCount; i++) {
        ASSERT_EQ(l2->entries[i].underlying, 0) << i;
    }

    std::vector<uintptr_t> expected;
    for (size_t i = 0; i < 4; i++) {
        expected.push_back(kr::kPhysicalMemoryMapBase + (i * x64::kLargePageSize));
    }
    EXPECT_EQ(intrin.invalidated(), expected);
}

TEST_F(PagerTest, TranslateMappedMemory) {
    krtest::TestFrameSource frames;
    size_t mapped = 0;

    ASSERT_EQ(pager().mapPhysicalMemory(map, 8 * 0x100000, krtest::kHostIdentityMappedSize, frames, &mapped), OsStatusSuccess);

    std::optional<PhysicalAddress> paddr = pager().translate(tables(), MapAddress(0x234567));
    ASSERT_TRUE(paddr.has_value());
    EXPECT_EQ(paddr->toInteger(), 0x234567);

    EXPECT_FALSE(pager().translate(tables(), MapAddress(8 * 0x100000)).has_value());
    EXPECT_FALSE(pager().translate(tables(), *VirtualAddress::fromInteger(0x1000)).has_value());
}

TEST_F(PagerTest, PartialPage) {
    krtest::TestFrameSource frames;
    size_t mapped = 0;

    ASSERT_EQ(pager().mapPhysicalMemory(map, 3 * 0x100000, krtest::kHostIdentityMappedSize, frames, &mapped), OsStatusSuccess);

    EXPECT_EQ(mapped, 2 * x64::kLargePageSize);
    EXPECT_EQ(map.size(), 2 * x64::kLargePageSize);
    EXPECT_EQ(intrin.invalidated().size(), 2);
}

TEST_F(PagerTest, MapNothing) {
    krtest::TestFrameSource frames;
    size_t mapped = 1234;

    ASSERT_EQ(pager().mapPhysicalMemory(map, 0, krtest::kHostIdentityMappedSize, frames, &mapped), OsStatusSuccess);

    EXPECT_EQ(mapped, 0);
    EXPECT_EQ(map.size(), 0);
    EXPECT_EQ(frames.count(), 0);
}

TEST_F(PagerTest, TooLarge) {
    krtest::TestFrameSource frames;
    size_t mapped = 0;

    OsStatus status = pager().mapPhysicalMemory(map, map.maxSize() + x64::kLargePageSize, krtest::kHostIdentityMappedSize, frames, &mapped);
    EXPECT_EQ(status, OsStatusInvalidInput);
    EXPECT_EQ(mapped, 0);
    EXPECT_EQ(frames.count(), 0);
}

TEST_F(PagerTest, OutOfFrames) {
    krtest::TestFrameSource frames { 1 };
    size_t mapped = 0;

    OsStatus status = pager().mapPhysicalMemory(map, 4 * 0x100000, krtest::kHostIdentityMappedSize, frames, &mapped);
    EXPECT_EQ(status, OsStatusOutOfMemory);
    EXPECT_EQ(mapped, 0);
    EXPECT_EQ(map.size(), 0);
    EXPECT_TRUE(intrin.invalidated().empty());
}

TEST_F(PagerTest, FailureKeepsMappedMemory) {
    // enough for the first page directory, the second gigabyte needs another
    krtest::TestFrameSource frames { 2 };
    size_t mapped = 0;

    OsStatus status = pager().mapPhysicalMemory(map, kr::kGigabyte + x64::kLargePageSize, krtest::kHostIdentityMappedSize, frames, &mapped);
    EXPECT_EQ(status, OsStatusOutOfMemory);

    EXPECT_EQ(mapped, kr::kGigabyte);
    EXPECT_EQ(map.size(), kr::kGigabyte);
    EXPECT_EQ(intrin.invalidated().size(), kr::kGigabyte / x64::kLargePageSize);

    std::optional<PhysicalAddress> paddr = pager().translate(tables(), MapAddress(kr::kGigabyte - 1));
    ASSERT_TRUE(paddr.has_value());
    EXPECT_EQ(paddr->toInteger(), kr::kGigabyte - 1);
}

TEST_F(PagerTest, ReusesExistingTables) {
    x64::PageMapLevel3 *l3 = pages.allocate<x64::PageMapLevel3>();
    root->entries[kMapSlot].underlying = kPresentBit | kWriteableBit | uintptr_t(l3);

    krtest::TestFrameSource frames;
    size_t mapped = 0;

    ASSERT_EQ(pager().mapPhysicalMemory(map, 4 * 0x100000, krtest::kHostIdentityMappedSize, frames, &mapped), OsStatusSuccess);

    EXPECT_EQ(frames.count(), 1);
    EXPECT_TRUE(l3->entries[0].present());
    EXPECT_EQ(MapDirectory(0), HostTable<x64::PageMapLevel2>(l3->entries[0]));
}

TEST_F(PagerTest, AlreadyMapped) {
    krtest::TestFrameSource frames;
    size_t mapped = 0;

    ASSERT_EQ(pager().mapPhysicalMemory(map, 4 * 0x100000, krtest::kHostIdentityMappedSize, frames, &mapped), OsStatusSuccess);

    kr::PhysicalMemoryMap other { map.base(), map.maxSize() };
    OsStatus status = pager().mapPhysicalMemory(other, 4 * 0x100000, krtest::kHostIdentityMappedSize, frames, &mapped);
    EXPECT_EQ(status, OsStatusAlreadyExists);
    EXPECT_EQ(mapped, 0);
    EXPECT_EQ(other.size(), 0);
}

TEST_F(PagerTest, HugePageConflict) {
    x64::PageMapLevel3 *l3 = pages.allocate<x64::PageMapLevel3>();
    root->entries[kMapSlot].underlying = kPresentBit | kWriteableBit | uintptr_t(l3);
    l3->entries[0].underlying = kPresentBit | kWriteableBit | kPageSizeBit;

    krtest::TestFrameSource frames;
    size_t mapped = 0;

    OsStatus status = pager().mapPhysicalMemory(map, 4 * 0x100000, krtest::kHostIdentityMappedSize, frames, &mapped);
    EXPECT_EQ(status, OsStatusInvalidData);
    EXPECT_EQ(mapped, 0);
    EXPECT_EQ(frames.count(), 0);

    std::optional<PhysicalAddress> paddr = pager().translate(tables(), MapAddress(0x12345678));
    ASSERT_TRUE(paddr.has_value());
    EXPECT_EQ(paddr->toInteger(), 0x12345678);
}

TEST_F(PagerTest, RootNotAccessible) {
    krtest::TestFrameSource frames;
    size_t mapped = 0;

    OsStatus status = pager().mapPhysicalMemory(map, 4 * 0x100000, 0x1000, frames, &mapped);
    EXPECT_EQ(status, OsStatusInvalidAddress);
    EXPECT_EQ(mapped, 0);
    EXPECT_EQ(frames.count(), 0);

    kr::MaybeIdentityMapped unmapped { map, 0x1000 };
    EXPECT_FALSE(pager().translate(unmapped, MapAddress(0)).has_value());
}

TEST_F(PagerTest, FrameNotAccessible) {
    class UnreachableFrames final : public kr::IFrameSource {
    public:
        std::optional<PhysicalAddress> next() override {
            return PhysicalAddress::fromInteger(1ull << 51);
        }
    };

    UnreachableFrames frames;
    size_t mapped = 0;

    OsStatus status = pager().mapPhysicalMemory(map, 4 * 0x100000, uintptr_t(root) + x64::kPageSize, frames, &mapped);
    EXPECT_EQ(status, OsStatusInvalidAddress);
    EXPECT_EQ(mapped, 0);
    EXPECT_FALSE(root->entries[kMapSlot].present());
}

TEST_F(PagerTest, TranslateSmallPage) {
    x64::PageMapLevel3 *l3 = pages.allocate<x64::PageMapLevel3>();
    x64::PageMapLevel2 *l2 = pages.allocate<x64::PageMapLevel2>();
    x64::PageTable *l1 = pages.allocate<x64::PageTable>();

    uintptr_t vaddr = 0x0000'0040'0020'3000;
    auto [pml4e, pdpte, pdte, pte] = x64::GetAddressParts(vaddr);

    root->entries[pml4e].underlying = kPresentBit | uintptr_t(l3);
    l3->entries[pdpte].underlying = kPresentBit | uintptr_t(l2);
    l2->entries[pdte].underlying = kPresentBit | uintptr_t(l1);
    l1->entries[pte].underlying = kPresentBit | 0xABCD000;

    std::optional<PhysicalAddress> paddr = pager().translate(tables(), *VirtualAddress::fromInteger(vaddr + 0x123));
    ASSERT_TRUE(paddr.has_value());
    EXPECT_EQ(paddr->toInteger(), 0xABCD123);

    EXPECT_FALSE(pager().translate(tables(), *VirtualAddress::fromInteger(vaddr + x64::kPageSize)).has_value());
}
