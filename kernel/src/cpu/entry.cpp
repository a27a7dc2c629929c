#include <cpu/cpu.hpp>
#include <cpu/gdt/gdt.hpp>
#include <cpu/interrupts/frame.hpp>
#include <cpu/interrupts/vectors.hpp>
#include <cpu/interrupts/idt.hpp>
#include <cpu/syscall/syscall.hpp>

/*
 * Trap and syscall entry points.
 *
 * Every vector stub leaves [vector][error code] on the stack, vector on top,
 * and jumps to __isr_common. __syscall_entry builds the same two words on top
 * of a synthesised hardware frame. From there both run TRAP_SAVE_GPRS, call
 * their collaborator with the frame base in rdi, and run TRAP_RESTORE_GPRS.
 *
 * The stub words arrive directly below the hardware frame but the TrapFrame
 * layout wants the register block in between, so TRAP_SAVE_GPRS opens the
 * register block below the stub words and moves them down to the frame base.
 * They end up occupying the rbx and rax slots, which are therefore saved last.
 */

#define IDT_VECTOR_COUNT 256
#define SYSENTER_ESP_MSR 0x175
#define SYSRET_RFLAGS 0x200

static_assert(IDT_VECTOR_COUNT == cpu::interrupts::vector_count);
static_assert(SYSENTER_ESP_MSR == cpu::MSR::IA32_SYSENTER_ESP);
static_assert(SYSRET_RFLAGS == cpu::syscall::sysret_rflags);
static_assert(TRAP_FRAME_VECTOR + TRAP_FRAME_GPR_SIZE == TRAP_FRAME_RBX);
static_assert(TRAP_FRAME_ERR + TRAP_FRAME_GPR_SIZE == TRAP_FRAME_RAX);

#define SLOT(field) STRINGIFY2(CONCAT(TRAP_FRAME_, field)) "(%rsp)"

#define TRAP_SAVE_GPRS                                          \
    "sub $" STRINGIFY2(TRAP_FRAME_GPR_SIZE) ", %rsp\n"           \
    "mov %r15, " SLOT(R15) "\n"                                 \
    "mov %r14, " SLOT(R14) "\n"                                 \
    "mov %r13, " SLOT(R13) "\n"                                 \
    "mov %r12, " SLOT(R12) "\n"                                 \
    "mov %r11, " SLOT(R11) "\n"                                 \
    "mov %r10, " SLOT(R10) "\n"                                 \
    "mov %r9, " SLOT(R9) "\n"                                   \
    "mov %r8, " SLOT(R8) "\n"                                   \
    "mov %rbp, " SLOT(RBP) "\n"                                 \
    "mov %rdi, " SLOT(RDI) "\n"                                 \
    "mov %rsi, " SLOT(RSI) "\n"                                 \
    "mov %rdx, " SLOT(RDX) "\n"                                 \
    "mov %rcx, " SLOT(RCX) "\n"                                 \
    "mov " SLOT(RBX) ", %r15\n"                                 \
    "mov %r15, " SLOT(VECTOR) "\n"                              \
    "mov " SLOT(RAX) ", %r15\n"                                 \
    "mov %r15, " SLOT(ERR) "\n"                                 \
    "mov %rbx, " SLOT(RBX) "\n"                                 \
    "mov %rax, " SLOT(RAX) "\n"

#define TRAP_RESTORE_GPRS                                       \
    "mov " SLOT(RAX) ", %rax\n"                                 \
    "mov " SLOT(RBX) ", %rbx\n"                                 \
    "mov " SLOT(RCX) ", %rcx\n"                                 \
    "mov " SLOT(RDX) ", %rdx\n"                                 \
    "mov " SLOT(RSI) ", %rsi\n"                                 \
    "mov " SLOT(RDI) ", %rdi\n"                                 \
    "mov " SLOT(RBP) ", %rbp\n"                                 \
    "mov " SLOT(R8) ", %r8\n"                                   \
    "mov " SLOT(R9) ", %r9\n"                                   \
    "mov " SLOT(R10) ", %r10\n"                                 \
    "mov " SLOT(R11) ", %r11\n"                                 \
    "mov " SLOT(R12) ", %r12\n"                                 \
    "mov " SLOT(R13) ", %r13\n"                                 \
    "mov " SLOT(R14) ", %r14\n"                                 \
    "mov " SLOT(R15) ", %r15\n"

// true (non-zero) for vectors whose error code is pushed by the cpu
#define IDT_ERROR_CODE_TEST(vec) " || (idt_vec == " #vec ")"
#define IDT_HAS_ERROR_CODE "(0" IDT_ERROR_CODE_VECTORS(IDT_ERROR_CODE_TEST) ")"

asm(
    ".pushsection .data.rel.ro.idt_wrappers, \"aw\"\n"
    ".balign 8\n"
    ".global __idt_wrappers\n"
    ".type __idt_wrappers, @object\n"
    "__idt_wrappers:\n"
    ".popsection\n"

    ".pushsection .text\n"
    ".set idt_vec, 0\n"
    ".rept " STRINGIFY2(IDT_VECTOR_COUNT) "\n"
    "    .pushsection .data.rel.ro.idt_wrappers\n"
    "    .quad 1f\n"
    "    .popsection\n"
    "    .balign 16\n"
    "1:\n"
    "    .ifeq " IDT_HAS_ERROR_CODE "\n"
    "    pushq $0\n"
    "    .endif\n"
    "    pushq $idt_vec\n"
    "    jmp __isr_common\n"
    "    .set idt_vec, idt_vec + 1\n"
    ".endr\n"

    ".pushsection .data.rel.ro.idt_wrappers\n"
    ".size __idt_wrappers, . - __idt_wrappers\n"
    ".popsection\n"

    ".balign 16\n"
    ".type __isr_common, @function\n"
    "__isr_common:\n"
    TRAP_SAVE_GPRS
    "cld\n"
    "mov %rsp, %rdi\n"
    "call interrupt_handler\n"
    TRAP_RESTORE_GPRS
    "add $" STRINGIFY2(TRAP_FRAME_RIP) ", %rsp\n" // drop registers, vector and error code
    "iretq\n"
    ".size __isr_common, . - __isr_common\n"

    /*
     * syscall leaves the user rip in rcx and the user rflags in r11 and does
     * not touch rsp. The kernel stack comes from IA32_SYSENTER_ESP; rdmsr needs
     * ecx and clobbers edx:eax, so the syscall number is carried through it in
     * the upper half of rcx and rdx is parked in rsp. r9 is clobbered.
     */
    ".balign 16\n"
    ".global __syscall_entry\n"
    ".type __syscall_entry, @function\n"
    "__syscall_entry:\n"
    "mov %rsp, %r11\n"
    "mov %rcx, %r9\n"
    "mov %rdx, %rsp\n"
    "shl $32, %rax\n"
    "lea " STRINGIFY2(SYSENTER_ESP_MSR) "(%rax), %rcx\n"
    "rdmsr\n"
    "shl $32, %rdx\n"
    "or %rdx, %rax\n"
    "mov %rsp, %rdx\n"
    "mov %rax, %rsp\n"
    "shr $32, %rcx\n"
    "mov %rcx, %rax\n"
    "mov %r9, %rcx\n"
    "and $-16, %rsp\n"
    "pushq $" STRINGIFY2(GDT_USER_DATA_RPL3) "\n"
    "push %r11\n"
    "pushq $" STRINGIFY2(SYSRET_RFLAGS) "\n"
    "pushq $" STRINGIFY2(GDT_USER_CODE_RPL3) "\n"
    "push %rcx\n"
    "pushq $0\n" // error code
    "pushq $0\n" // vector
    TRAP_SAVE_GPRS
    "cld\n"
    "mov %rsp, %rdi\n"
    "call syscall_handler\n"
    TRAP_RESTORE_GPRS
    "mov " SLOT(RIP) ", %rcx\n"
    "mov $" STRINGIFY2(SYSRET_RFLAGS) ", %r11\n"
    "mov " SLOT(RSP) ", %rsp\n"
    "sysretq\n"
    ".size __syscall_entry, . - __syscall_entry\n"
    ".popsection\n"
);
