#include <cpu/cpu.hpp>
#include <cpu/gdt/gdt.hpp>
#include <cpu/interrupts/idt.hpp>
#include <cpu/syscall/syscall.hpp>
#include <klib/cstdio.hpp>
#include <limine.h>

namespace cpu {
    const usize stack_size = 0x4000; // 16 KiB

    struct CoreStacks {
        alignas(16) u8 kernel[stack_size]; // TSS.rsp0, traps taken from user mode
        alignas(16) u8 double_fault[stack_size];
        alignas(16) u8 nmi[stack_size];
        alignas(16) u8 syscall[stack_size];
    };

    static_assert(interrupts::double_fault_ist == 1 && interrupts::nmi_ist == 2);

    // slot 0 is the BSP, APs take the following slots in the order limine lists them
    static CPU cpus[max_cpus];
    static CoreStacks core_stacks[max_cpus];
    static u32 cores_online = 0;

    template<usize N>
    static uptr stack_top(u8 (&stack)[N]) {
        return uptr(&stack[N]);
    }

    // everything a core needs before it may take a trap or execute syscall
    static void init_core(usize slot) {
        CPU *cpu = &cpus[slot];
        CoreStacks &stacks = core_stacks[slot];

        cpu->tss.rsp0 = stack_top(stacks.kernel);
        cpu->tss.ist1 = stack_top(stacks.double_fault);
        cpu->tss.ist2 = stack_top(stacks.nmi);
        load_tss(&cpu->tss);

        interrupts::load_idt();

        cpu->syscall_stack = stack_top(stacks.syscall);
        syscall::init(cpu->syscall_stack);

        __atomic_fetch_add(&cores_online, 1, __ATOMIC_SEQ_CST);
    }

    u32 online_cores() {
        return __atomic_load_n(&cores_online, __ATOMIC_SEQ_CST);
    }

    void early_init() {
        load_gdt();

        init_core(0);

        klib::printf("CPU: BSP initialised, syscall stack at %#lX\n", cpus[0].syscall_stack);
    }

    void smp_init(limine_mp_response *smp_res) {
        klib::printf("CPU: SMP | x2APIC: %s\n", (smp_res->flags & 1) ? "yes" : "no");
        if (smp_res->cpu_count > max_cpus)
            panic("CPU: %lu cores reported, at most %lu supported", smp_res->cpu_count, max_cpus);

        usize next_slot = 1;
        for (u64 i = 0; i < smp_res->cpu_count; i++) {
            auto cpu_info = smp_res->cpus[i];
            auto is_bsp = cpu_info->lapic_id == smp_res->bsp_lapic_id;
            klib::printf("  Core %lu%s | Processor ID: %u, LAPIC ID: %u\n", i, is_bsp ? " (BSP)" : "", cpu_info->processor_id, cpu_info->lapic_id);

            CPU *cpu = is_bsp ? &cpus[0] : &cpus[next_slot++];
            cpu_info->extra_argument = u64(cpu);

            if (!is_bsp)
                __atomic_store_n(&cpu_info->goto_address, &init, __ATOMIC_SEQ_CST);
        }

        while (__atomic_load_n(&cores_online, __ATOMIC_SEQ_CST) < smp_res->cpu_count)
            asm volatile("pause");

        klib::printf("CPU: %u cores online\n", cores_online);
    }

    void init(limine_mp_info *info) {
        load_gdt();

        auto cpu = (CPU*)info->extra_argument;
        init_core(cpu - cpus);

        // APs have nothing to run yet
        halt();
    }
}
