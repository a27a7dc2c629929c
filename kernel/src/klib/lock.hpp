#pragma once

#include <klib/common.hpp>
#include <cpu/cpu.hpp>
#include <panic.hpp>

#ifndef TRAPGATE_SPINLOCK_DEBUG
#define TRAPGATE_SPINLOCK_DEBUG 1
#endif

namespace klib {
    struct Spinlock {
        volatile bool locked = false;
#if TRAPGATE_SPINLOCK_DEBUG
        u32 spins = 0;
#endif

        inline void lock() {
#if TRAPGATE_SPINLOCK_DEBUG
            // a trap taken while holding the lock would spin forever on it
            if (cpu::get_interrupt_state() == true)
                panic("Attempted to lock spinlock while interrupts are enabled");
#endif
            while (__atomic_test_and_set(&this->locked, __ATOMIC_ACQUIRE)) {
#if TRAPGATE_SPINLOCK_DEBUG
                if (++spins >= 100000000)
                    panic("Deadlock detected");
#endif
                asm volatile("pause");
            }
        }

        inline void unlock() {
#if TRAPGATE_SPINLOCK_DEBUG
            spins = 0;
#endif
            __atomic_clear(&this->locked, __ATOMIC_RELEASE);
        }
    };

    template<class L>
    concept BasicLockable = requires(L l) {
        l.lock();
        l.unlock();
    };

    class InterruptLock {
        bool old_state;

    public:
        explicit InterruptLock() {
            old_state = cpu::get_interrupt_state();
            cpu::toggle_interrupts(false);
        }

        ~InterruptLock() {
            cpu::toggle_interrupts(old_state);
        }

        InterruptLock(const InterruptLock&) = delete;
        InterruptLock& operator =(const InterruptLock&) = delete;
    };

    template<BasicLockable L>
    class SpinlockGuard {
        L &guarded_lock;

    public:
        explicit SpinlockGuard(L &l) : guarded_lock(l) { guarded_lock.lock(); }
        ~SpinlockGuard() { guarded_lock.unlock(); }

        SpinlockGuard(const SpinlockGuard&) = delete;
        SpinlockGuard& operator =(const SpinlockGuard&) = delete;
    };
}
