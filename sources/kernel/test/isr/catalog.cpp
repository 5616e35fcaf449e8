#include <gtest/gtest.h>

#include "isr/catalog.hpp"
#include "isr/error_code.hpp"

using kr::Vector;
using kr::VectorInfo;

template<typename... Args>
static std::string Concat(Args&&... args) {
    auto result = kr::concat<256>(std::forward<Args>(args)...);
    return std::string(std::string_view(result));
}

TEST(VectorTest, ClassifyEveryVector) {
    for (unsigned i = 0; i < kr::isr::kIsrCount; i++) {
        Vector vector = uint8_t(i);
        EXPECT_NE(vector.isException(), vector.isUserInterrupt()) << i;
        EXPECT_EQ(vector.isException(), i < 32) << i;
        EXPECT_EQ(vector.isUserInterrupt(), i >= 32) << i;
    }
}

TEST(VectorTest, Boundary) {
    EXPECT_TRUE(Vector(31).isException());
    EXPECT_TRUE(Vector(32).isUserInterrupt());
    EXPECT_TRUE(Vector(255).isUserInterrupt());
}

TEST(VectorTest, Format) {
    EXPECT_EQ(Concat(Vector(kr::isr::GP)), "0x0D (#GP)");
    EXPECT_EQ(Concat(Vector(0x40)), "0x40");
}

TEST(ExceptionCatalogTest, EntriesMatchVectors) {
    for (size_t i = 0; i < kr::isr::kExceptionCount; i++) {
        EXPECT_EQ(kr::GetExceptionInfo(uint8_t(i)).vector, i);
    }
}

TEST(ExceptionCatalogTest, Reserved) {
    size_t count = 0;
    for (size_t i = 0; i < kr::isr::kExceptionCount; i++) {
        const kr::ExceptionInfo& info = kr::GetExceptionInfo(uint8_t(i));
        if (info.isReserved()) {
            count += 1;
            EXPECT_FALSE(info.hasErrorCode()) << i;
        }
    }

    EXPECT_EQ(count, 9);
    EXPECT_TRUE(kr::GetExceptionInfo(0x09).isReserved());
    EXPECT_TRUE(kr::GetExceptionInfo(0x0F).isReserved());
    EXPECT_TRUE(kr::GetExceptionInfo(0x1F).isReserved());
}

TEST(ExceptionCatalogTest, Names) {
    EXPECT_EQ(std::string_view(kr::GetExceptionInfo(kr::isr::PF).mnemonic), "#PF");
    EXPECT_EQ(std::string_view(kr::GetExceptionInfo(kr::isr::PF).name), "Page Fault");
    EXPECT_EQ(std::string_view(kr::GetExceptionInfo(kr::isr::NMI).mnemonic), "NMI");
}

TEST(ExceptionCatalogTest, ValidateVectorTable) {
    EXPECT_EQ(kr::ValidateVectorTable(), OsStatusSuccess);
    EXPECT_FALSE(kr::FindVectorTableMismatch().has_value());
}

TEST(ExceptionCatalogTest, VectorTableMatchesCatalog) {
    for (size_t i = 0; i < kr::isr::kExceptionCount; i++) {
        const kr::ExceptionInfo& info = kr::GetExceptionInfo(uint8_t(i));
        EXPECT_EQ(kr::GetVectorInfo(uint8_t(i)), kr::GetCatalogVectorInfo(info)) << i;
    }
}

TEST(ExceptionCatalogTest, VectorInfo) {
    EXPECT_EQ(kr::GetVectorInfo(kr::isr::DF), (VectorInfo { 8, true }));
    EXPECT_EQ(kr::GetVectorInfo(kr::isr::MC), (VectorInfo { 0, true }));
    EXPECT_EQ(kr::GetVectorInfo(kr::isr::GP), (VectorInfo { 8, false }));
    EXPECT_EQ(kr::GetVectorInfo(kr::isr::PF), (VectorInfo { 8, false }));
    EXPECT_EQ(kr::GetVectorInfo(kr::isr::UD), (VectorInfo { 0, false }));

    for (unsigned i = kr::isr::kExceptionCount; i < kr::isr::kIsrCount; i++) {
        EXPECT_EQ(kr::GetVectorInfo(uint8_t(i)), (VectorInfo { 0, false })) << i;
    }
}

TEST(ExceptionCatalogTest, DoubleFaultEscalation) {
    using namespace kr::isr;

    // contributory then contributory
    EXPECT_TRUE(kr::IsDoubleFaultEscalation(GP, NP));
    EXPECT_TRUE(kr::IsDoubleFaultEscalation(DE, GP));

    // page fault then page fault or contributory
    EXPECT_TRUE(kr::IsDoubleFaultEscalation(PF, PF));
    EXPECT_TRUE(kr::IsDoubleFaultEscalation(PF, GP));

    // contributory then page fault is delivered serially
    EXPECT_FALSE(kr::IsDoubleFaultEscalation(GP, PF));

    // benign never escalates
    EXPECT_FALSE(kr::IsDoubleFaultEscalation(UD, GP));
    EXPECT_FALSE(kr::IsDoubleFaultEscalation(GP, UD));
    EXPECT_FALSE(kr::IsDoubleFaultEscalation(PF, BP));

    // a fault while delivering a double fault is a triple fault
    EXPECT_FALSE(kr::IsDoubleFaultEscalation(DF, GP));

    EXPECT_FALSE(kr::IsDoubleFaultEscalation(0x40, GP));
    EXPECT_FALSE(kr::IsDoubleFaultEscalation(GP, 0x40));
}

TEST(ErrorCodeTest, Selector) {
    EXPECT_FALSE(kr::SelectorErrorCode::of(0).has_value());

    // index 5 in the idt
    std::optional<kr::SelectorErrorCode> idt = kr::SelectorErrorCode::of((5 << 3) | 0b010);
    ASSERT_TRUE(idt.has_value());
    EXPECT_EQ(idt->table(), kr::DescriptorTable::eIdt);
    EXPECT_EQ(idt->index(), 5);
    EXPECT_FALSE(idt->external());

    // idt bit takes priority over the ti bit
    std::optional<kr::SelectorErrorCode> both = kr::SelectorErrorCode::of((7 << 3) | 0b110);
    ASSERT_TRUE(both.has_value());
    EXPECT_EQ(both->table(), kr::DescriptorTable::eIdt);

    std::optional<kr::SelectorErrorCode> ldt = kr::SelectorErrorCode::of((2 << 3) | 0b101);
    ASSERT_TRUE(ldt.has_value());
    EXPECT_EQ(ldt->table(), kr::DescriptorTable::eLdt);
    EXPECT_EQ(ldt->index(), 2);
    EXPECT_TRUE(ldt->external());

    std::optional<kr::SelectorErrorCode> gdt = kr::SelectorErrorCode::of(0x28);
    ASSERT_TRUE(gdt.has_value());
    EXPECT_EQ(gdt->table(), kr::DescriptorTable::eGdt);
    EXPECT_EQ(gdt->index(), 5);
}

TEST(ErrorCodeTest, FormatSelector) {
    EXPECT_EQ(Concat(*kr::SelectorErrorCode::of((5 << 3) | 0b010)), "IDT[5]");
    EXPECT_EQ(Concat(*kr::SelectorErrorCode::of((2 << 3) | 0b101)), "LDT[2] (External)");
}

TEST(ErrorCodeTest, PageFault) {
    using Bit = kr::PageFaultErrorCode::Bit;

    kr::PageFaultErrorCode error = 0b00111;
    EXPECT_TRUE(error.test(Bit::ePresent));
    EXPECT_TRUE(error.test(Bit::eWrite));
    EXPECT_TRUE(error.test(Bit::eUser));
    EXPECT_FALSE(error.test(Bit::eFetch));

    EXPECT_EQ(Concat(error), "Protection violation, Write, User");
    EXPECT_EQ(Concat(kr::PageFaultErrorCode(0b10000)), "Not present, Read, Supervisor, Instruction fetch");
}

TEST(ErrorCodeTest, ControlProtection) {
    EXPECT_EQ(Concat(kr::ControlProtectionErrorCode(1)), "NEAR-RET");
    EXPECT_EQ(Concat(kr::ControlProtectionErrorCode(3 | (1 << 15))), "ENDBRANCH (Enclave)");
}

TEST(ErrorCodeTest, VmExit) {
    const kr::ExceptionInfo& info = kr::GetExceptionInfo(kr::isr::VC);
    EXPECT_EQ(info.vector, 29);
    EXPECT_EQ(std::string_view(info.mnemonic), "#VC");
    EXPECT_EQ(info.errorCode, kr::ErrorCodeShape::eVmExit);
    EXPECT_TRUE(info.hasErrorCode());

    EXPECT_EQ(kr::VmExitCode(0x72).exit(), kr::VmExitCode::eCpuid);
    EXPECT_EQ(Concat(kr::VmExitCode(0x72)), "CPUID");
    EXPECT_EQ(Concat(kr::VmExitCode(0x7B)), "IOIO");
    EXPECT_EQ(Concat(kr::VmExitCode(0x400)), "Nested page fault");
    EXPECT_EQ(Concat(kr::VmExitCode(0x1234)), "Exit code 0x1234");
}

TEST(ErrorCodeTest, Security) {
    EXPECT_TRUE(kr::SecurityErrorCode(1).isInitRedirection());
    EXPECT_FALSE(kr::SecurityErrorCode(2).isInitRedirection());
    EXPECT_EQ(Concat(kr::SecurityErrorCode(1)), "INIT redirection");
}
