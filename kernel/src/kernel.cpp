#include <klib/common.hpp>
#include <klib/cstdio.hpp>
#include <limine.h>
#include <cpu/cpu.hpp>
#include <cpu/interrupts/idt.hpp>
#include <cpu/syscall/syscall.hpp>
#include <panic.hpp>

[[gnu::used, gnu::section(".limine_requests")]]
static volatile LIMINE_BASE_REVISION(3);

[[gnu::used, gnu::section(".limine_requests")]]
static volatile limine_mp_request smp_req = {
    .id = LIMINE_MP_REQUEST,
    .revision = 0,
    .response = nullptr,
    .flags = 0
};

[[gnu::used, gnu::section(".limine_requests_start")]]
static volatile LIMINE_REQUESTS_START_MARKER;

[[gnu::used, gnu::section(".limine_requests_end")]]
static volatile LIMINE_REQUESTS_END_MARKER;

namespace {
    enum : usize {
        SYS_DEBUG_LOG = 0,
        SYS_CPU_COUNT = 1
    };

    constexpr u64 breakpoint_marker = 0x7472617067617465; // "trapgate"

    isize syscall_debug_log(usize buffer, usize length, usize, usize, usize) {
        log_syscall("debug_log(%#lX, %lu)\n", buffer, length);
        klib::printf("%.*s", (int)length, (const char*)buffer);
        return length;
    }

    isize syscall_cpu_count(usize, usize, usize, usize, usize) {
        log_syscall("cpu_count()\n");
        return cpu::online_cores();
    }

    void breakpoint_handler(void *priv, cpu::TrapFrame *frame) {
        auto *hits = (usize*)priv;
        (*hits)++;
        klib::printf("IDT: breakpoint at %#lX from %s mode\n", frame->rip, frame->from_user() ? "user" : "kernel");
        frame->rax = breakpoint_marker;
    }

    // round trip through vector 3: the handler's write to rax has to reach the interrupted code
    void breakpoint_self_test() {
        static usize hits = 0;
        cpu::interrupts::set_isr(cpu::interrupts::BREAKPOINT, breakpoint_handler, &hits);

        u64 rax = 0;
        asm volatile("int3" : "+a" (rax) : : "memory");
        if (hits != 1 || rax != breakpoint_marker)
            panic("IDT: breakpoint self test failed (hits %lu, rax %#lX)", hits, rax);
        klib::printf("IDT: breakpoint self test passed\n");
    }
}

extern "C" [[noreturn]] void kmain() {
    if (!LIMINE_BASE_REVISION_SUPPORTED)
        panic("Limine base revision not supported");

    klib::printf("trapgate: booting\n");

    cpu::early_init();
    breakpoint_self_test();

    if (!smp_req.response) panic("Did not receive Limine SMP feature response");
    cpu::smp_init(smp_req.response);

    cpu::syscall::register_syscall(SYS_DEBUG_LOG, "debug_log", syscall_debug_log);
    cpu::syscall::register_syscall(SYS_CPU_COUNT, "cpu_count", syscall_cpu_count);
    klib::printf("Syscall: %lu slots, fast path at %#lX\n", cpu::syscall::syscall_table_size, (u64)&__syscall_entry);

    asm volatile("sti");
    while (true) asm volatile("hlt");
}
