#include <gtest/gtest.h>

#include "kernel_test.hpp"

#include "isr/exceptions.hpp"
#include "isr/isr.hpp"

using kr::InterruptFrame;
using kr::IsrTable;
using kr::Vector;
using kr::VectorInfo;

namespace {
    struct HandlerCall {
        InterruptFrame *frame = nullptr;
        uint8_t vector = 0;
        uint64_t error = 0;
        size_t count = 0;
    };

    HandlerCall gLastCall;

    void RecordingHandler(InterruptFrame *frame, Vector vector, uint64_t error) {
        gLastCall.frame = frame;
        gLastCall.vector = vector.value();
        gLastCall.error = error;
        gLastCall.count += 1;
    }

    void OtherHandler(InterruptFrame *, Vector, uint64_t) { }
}

class IsrTest : public testing::Test {
public:
    void SetUp() override {
        gLastCall = HandlerCall { };
    }

    void ExpectBugCheck(Vector vector, uint64_t error, std::string_view expected) {
        try {
            kr::DispatchInterrupt(*table, &frame, vector, error);
            FAIL() << "Expected a bug check for " << unsigned(vector.value());
        } catch (const krtest::BugCheckError& e) {
            EXPECT_EQ(std::string_view(e.what()), expected);
        }
    }

    krtest::TestIntrin intrin;
    krtest::IntrinScope scope { &intrin };

    std::unique_ptr<IsrTable> table = std::make_unique<IsrTable>();
    InterruptFrame frame {
        .rip = 0xffff'ffff'8010'2030,
        .cs = 0x08,
        .rflags = 0x202,
        .rsp = 0xffff'ffff'8020'0000,
        .ss = 0x10,
    };
};

TEST_F(IsrTest, EmptyTable) {
    for (unsigned i = 0; i < kr::isr::kIsrCount; i++) {
        ASSERT_EQ(table->get(uint8_t(i)), nullptr) << i;
    }
}

TEST_F(IsrTest, Install) {
    kr::IsrHandler previous = OtherHandler;
    ASSERT_EQ(table->install(0x40, VectorInfo { 0, false }, RecordingHandler, &previous), OsStatusSuccess);
    EXPECT_EQ(previous, nullptr);
    EXPECT_EQ(table->get(0x40), &RecordingHandler);

    ASSERT_EQ(table->install(0x40, VectorInfo { 0, false }, OtherHandler, &previous), OsStatusSuccess);
    EXPECT_EQ(previous, &RecordingHandler);
    EXPECT_EQ(table->get(0x40), &OtherHandler);
}

TEST_F(IsrTest, InstallNull) {
    EXPECT_EQ(table->install(0x40, VectorInfo { 0, false }, nullptr), OsStatusInvalidInput);
    EXPECT_EQ(table->get(0x40), nullptr);
}

TEST_F(IsrTest, InstallMismatch) {
    // #GP pushes an error code
    EXPECT_EQ(table->install(kr::isr::GP, VectorInfo { 0, false }, &RecordingHandler), OsStatusInvalidInput);
    EXPECT_EQ(table->get(kr::isr::GP), nullptr);

    // #DF must not return
    EXPECT_EQ(table->install(kr::isr::DF, VectorInfo { 8, false }, &RecordingHandler), OsStatusInvalidInput);

    EXPECT_EQ(table->install(0x40, VectorInfo { 8, false }, &RecordingHandler), OsStatusInvalidInput);

    EXPECT_EQ(table->install(kr::isr::GP, VectorInfo { 8, false }, &RecordingHandler), OsStatusSuccess);
}

TEST_F(IsrTest, Remove) {
    ASSERT_EQ(table->install(0x40, VectorInfo { 0, false }, &RecordingHandler), OsStatusSuccess);
    EXPECT_EQ(table->remove(0x40), &RecordingHandler);
    EXPECT_EQ(table->get(0x40), nullptr);
    EXPECT_EQ(table->remove(0x40), nullptr);
}

TEST_F(IsrTest, DispatchToHandler) {
    ASSERT_EQ(table->install(kr::isr::PF, kr::GetVectorInfo(kr::isr::PF), &RecordingHandler), OsStatusSuccess);

    kr::DispatchInterrupt(*table, &frame, kr::isr::PF, 0b110);

    EXPECT_EQ(gLastCall.count, 1);
    EXPECT_EQ(gLastCall.frame, &frame);
    EXPECT_EQ(gLastCall.vector, kr::isr::PF);
    EXPECT_EQ(gLastCall.error, 0b110);
}

TEST_F(IsrTest, DispatchUserInterrupt) {
    ASSERT_EQ(table->install(0x80, kr::GetVectorInfo(0x80), &RecordingHandler), OsStatusSuccess);

    kr::DispatchInterrupt(*table, &frame, 0x80, 0);
    EXPECT_EQ(gLastCall.count, 1);
    EXPECT_EQ(gLastCall.vector, 0x80);
}

TEST_F(IsrTest, UnhandledUserInterrupt) {
    EXPECT_NO_THROW(kr::DispatchInterrupt(*table, &frame, 0x41, 0));
    EXPECT_NO_THROW(kr::DispatchInterrupt(*table, &frame, 0xFF, 0));
    EXPECT_EQ(gLastCall.count, 0);

    // the interrupted context is left alone
    EXPECT_EQ(frame.rip, 0xffff'ffff'8010'2030);
}

TEST_F(IsrTest, UnhandledException) {
    ExpectBugCheck(kr::isr::GP, 0, "No handler for #GP General Protection");
    ExpectBugCheck(kr::isr::UD, 0, "No handler for #UD Invalid Opcode");
}

TEST_F(IsrTest, UnhandledPageFault) {
    intrin.cr2 = 0xdead'b000;
    ExpectBugCheck(kr::isr::PF, 0b111, "No handler for #PF Page Fault");
}

TEST_F(IsrTest, SegmentNotPresent) {
    ExpectBugCheck(kr::isr::NP, (5 << 3) | 0b010, "Segment not present, IDT index 5");
    ExpectBugCheck(kr::isr::NP, (3 << 3) | 0b100, "Segment not present, LDT index 3");
}

TEST_F(IsrTest, SegmentNotPresentWithoutSelector) {
    ExpectBugCheck(kr::isr::NP, 0, "No handler for #NP Segment Not Present");
}

TEST_F(IsrTest, AbortHandlerReturns) {
    ASSERT_EQ(table->install(kr::isr::MC, kr::GetVectorInfo(kr::isr::MC), &RecordingHandler), OsStatusSuccess);

    ExpectBugCheck(kr::isr::MC, 0, "Handler for 0x12 (#MC) returned");
    EXPECT_EQ(gLastCall.count, 1);
}

TEST_F(IsrTest, ExceptionTable) {
    kr::ExceptionTable exceptions;

    EXPECT_EQ(exceptions.set(kr::isr::GP, &RecordingHandler), OsStatusSuccess);
    EXPECT_EQ(exceptions.get(kr::isr::GP), &RecordingHandler);

    EXPECT_EQ(exceptions.set(0x0F, &RecordingHandler), OsStatusInvalidInput);
    EXPECT_EQ(exceptions.set(0x40, &RecordingHandler), OsStatusInvalidInput);
    EXPECT_EQ(exceptions.get(0x0F), nullptr);
    EXPECT_EQ(exceptions.get(0x40), nullptr);

    ASSERT_EQ(exceptions.install(*table), OsStatusSuccess);
    EXPECT_EQ(table->get(kr::isr::GP), &RecordingHandler);
    EXPECT_EQ(table->get(kr::isr::PF), nullptr);
}

TEST_F(IsrTest, DefaultExceptionTable) {
    kr::ExceptionTable exceptions = kr::GetDefaultExceptionTable();
    EXPECT_EQ(exceptions.get(kr::isr::DF), &kr::DoubleFaultHandler);

    ASSERT_EQ(exceptions.install(*table), OsStatusSuccess);
    EXPECT_EQ(table->get(kr::isr::DF), &kr::DoubleFaultHandler);

    ExpectBugCheck(kr::isr::DF, 0, "Double fault");
}

TEST_F(IsrTest, FormatFrame) {
    auto text = kr::concat<256>(frame);
    EXPECT_EQ(std::string_view(text), "RIP: 0xFFFFFFFF80102030 CS: 0x0008 RFLAGS: 0x0000000000000202 RSP: 0xFFFFFFFF80200000 SS: 0x0010");
}

TEST(IsrStubTest, Stride) {
    EXPECT_EQ(kr::GetIsrStub(0), uintptr_t(KrIsrTable));
    EXPECT_EQ(kr::GetIsrStub(0x20) - kr::GetIsrStub(0x1F), kIsrStubStride);
    EXPECT_EQ(kr::GetIsrStub(0xFF), uintptr_t(KrIsrTable) + (0xFF * kIsrStubStride));
}

TEST(InstallIsrTest, UserInterrupt) {
    krtest::TestIntrin intrin;
    krtest::IntrinScope scope { &intrin };
    intrin.cs = 0x08;

    ASSERT_EQ(kr::InstallIsr(0x50, &RecordingHandler), OsStatusSuccess);
    EXPECT_EQ(kr::GetIsrTable().get(0x50), &RecordingHandler);

    std::optional<x64::GateDescriptor> gate = kr::GetInterruptDescriptorTable().entry(0x50);
    ASSERT_TRUE(gate.has_value());
    EXPECT_EQ(gate->address(), kr::GetIsrStub(0x50));
    EXPECT_EQ(gate->selector, 0x08);

    kr::GetIsrTable().remove(0x50);
    kr::GetInterruptDescriptorTable().remove(0x50);
}

TEST(InstallIsrTest, RejectsExceptions) {
    EXPECT_EQ(kr::InstallIsr(kr::isr::GP, &RecordingHandler), OsStatusInvalidInput);
    EXPECT_EQ(kr::GetIsrTable().get(kr::isr::GP), nullptr);
    EXPECT_FALSE(kr::GetInterruptDescriptorTable().entry(kr::isr::GP).has_value());
}

TEST(InstallIsrTest, RejectsNull) {
    EXPECT_EQ(kr::InstallIsr(0x51, nullptr), OsStatusInvalidInput);
    EXPECT_FALSE(kr::GetInterruptDescriptorTable().entry(0x51).has_value());
}

TEST(DispatchRoutineTest, UsesGlobalTable) {
    kr::InterruptFrame frame { };
    gLastCall = HandlerCall { };

    ASSERT_EQ(kr::GetIsrTable().install(0x52, kr::GetVectorInfo(0x52), &RecordingHandler), OsStatusSuccess);
    KrIsrDispatchRoutine(&frame, 0x52, 0);
    EXPECT_EQ(gLastCall.count, 1);
    EXPECT_EQ(gLastCall.frame, &frame);

    kr::GetIsrTable().remove(0x52);
}
