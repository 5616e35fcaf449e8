#ifndef KESTREL_X86_64_ARCH_ASM
#define KESTREL_X86_64_ARCH_ASM

#define PROC_BASE(name) \
    .global name; \
    .type name,@function; \
    .balign 16; \
    name:

#define ENDP_BASE(name) \
    .size name,.-name;

#define PUSHQ_REGS(r0, r1, r2, r3, r4, r5, r6, r7, r8) \
    pushq r0; pushq r1; pushq r2; pushq r3; pushq r4; pushq r5; pushq r6; pushq r7; pushq r8;

#define POPQ_REGS(r0, r1, r2, r3, r4, r5, r6, r7, r8) \
    popq r8; popq r7; popq r6; popq r5; popq r4; popq r3; popq r2; popq r1; popq r0;

#endif /* KESTREL_X86_64_ARCH_ASM */
