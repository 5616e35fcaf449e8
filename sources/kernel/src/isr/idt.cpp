#include "isr/idt.hpp"

static constinit kr::InterruptDescriptorTable gIdt{};

void kr::InterruptDescriptorTable::install(Vector vector, uintptr_t handler) {
    install(vector, handler, __get_cs(), 0);
}

void kr::InterruptDescriptorTable::install(Vector vector, uintptr_t handler, uint16_t selector, uint8_t ist) {
    mEntries[vector.value()].store(x64::GateDescriptor::create(handler, selector, ist));
}

void kr::InterruptDescriptorTable::remove(Vector vector) {
    mEntries[vector.value()].store(x64::GateDescriptor { });
}

std::optional<x64::GateDescriptor> kr::InterruptDescriptorTable::entry(Vector vector) const {
    x64::GateDescriptor descriptor = mEntries[vector.value()].load();
    if (!descriptor.isPresent()) {
        return std::nullopt;
    }

    return descriptor;
}

IDTR kr::InterruptDescriptorTable::idtr() const {
    return IDTR {
        .limit = sizeof(InterruptDescriptorTable) - 1,
        .base = (uintptr_t)this,
    };
}

void kr::InterruptDescriptorTable::activate() const {
    __lidt(idtr());
}

kr::InterruptDescriptorTable& kr::GetInterruptDescriptorTable() {
    return gIdt;
}
