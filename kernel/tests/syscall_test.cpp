#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "kernel_doubles.hpp"

#include <cpu/syscall/syscall.hpp>

#include <errno.h>

using ::testing::HasSubstr;
using cpu::TrapFrame;
using namespace cpu::syscall;

namespace {
    // every test registers its own numbers, the table cannot be cleared
    enum : usize {
        SYS_TEST_ADD = 3,
        SYS_TEST_ARGS = 4,
        SYS_TEST_FAIL = 5,
        SYS_TEST_DUPLICATE = 6,
        SYS_TEST_NAMED = 7,
        SYS_TEST_UNREGISTERED = 9
    };

    isize sys_add(usize a, usize b, usize, usize, usize) {
        return a + b;
    }

    // each argument lands in its own decimal digit
    isize sys_args(usize a, usize b, usize c, usize d, usize e) {
        return a + b * 10 + c * 100 + d * 1000 + e * 10000;
    }

    isize sys_fail(usize, usize, usize, usize, usize) {
        return -EBADF;
    }

    TrapFrame syscall_frame(u64 number) {
        TrapFrame frame = {};
        frame.rax = number;
        frame.cs = 0x23;
        frame.ss = 0x1B;
        frame.rflags = sysret_rflags;
        frame.rip = 0x401000;
        frame.rsp = 0x7FFFFFFFE000;
        return frame;
    }

    class SyscallDispatchTest : public ::testing::Test {
    protected:
        void SetUp() override { test::clear_log(); }
    };
}

TEST_F(SyscallDispatchTest, RegisteredSyscallResultLandsInRax) {
    register_syscall(SYS_TEST_ADD, "test_add", sys_add);

    TrapFrame frame = syscall_frame(SYS_TEST_ADD);
    frame.rdi = 40;
    frame.rsi = 2;
    syscall_handler(&frame);

    EXPECT_EQ(u64(frame.rax), 42u);
    EXPECT_EQ(u64(frame.rdi), 40u);
}

TEST_F(SyscallDispatchTest, ArgumentsComeFromRdiRsiRdxR10R8) {
    register_syscall(SYS_TEST_ARGS, "test_args", sys_args);

    TrapFrame frame = syscall_frame(SYS_TEST_ARGS);
    frame.rdi = 1;
    frame.rsi = 2;
    frame.rdx = 3;
    frame.rcx = 9; // user rip after syscall, never an argument
    frame.r10 = 4;
    frame.r8 = 5;
    frame.r9 = 9;
    syscall_handler(&frame);

    EXPECT_EQ(u64(frame.rax), 54321u);
}

TEST_F(SyscallDispatchTest, NegativeErrnoIsPassedThrough) {
    register_syscall(SYS_TEST_FAIL, "test_fail", sys_fail);

    TrapFrame frame = syscall_frame(SYS_TEST_FAIL);
    syscall_handler(&frame);

    EXPECT_EQ((isize)frame.rax, -EBADF);
}

TEST_F(SyscallDispatchTest, EmptySlotReturnsENOSYS) {
    TrapFrame frame = syscall_frame(SYS_TEST_UNREGISTERED);
    syscall_handler(&frame);

    EXPECT_EQ((isize)frame.rax, -ENOSYS);
#if TRAPGATE_UNIMPLEMENTED_SYSCALL_TRACE
    EXPECT_THAT(test::kernel_log(), HasSubstr("unimplemented syscall: 9"));
#endif
}

TEST_F(SyscallDispatchTest, OutOfRangeNumberReturnsENOSYS) {
    TrapFrame frame = syscall_frame(syscall_table_size);
    syscall_handler(&frame);
    EXPECT_EQ((isize)frame.rax, -ENOSYS);

    frame = syscall_frame(0xFFFFFFFF);
    syscall_handler(&frame);
    EXPECT_EQ((isize)frame.rax, -ENOSYS);
}

TEST_F(SyscallDispatchTest, RegisteringANumberTwiceIsFatal) {
    register_syscall(SYS_TEST_DUPLICATE, "test_duplicate", sys_add);
    EXPECT_THROW(register_syscall(SYS_TEST_DUPLICATE, "test_duplicate_again", sys_fail), test::KernelPanic);

    // the first registration stays in place
    TrapFrame frame = syscall_frame(SYS_TEST_DUPLICATE);
    frame.rdi = 1;
    frame.rsi = 1;
    syscall_handler(&frame);
    EXPECT_EQ(u64(frame.rax), 2u);
}

TEST_F(SyscallDispatchTest, RegisteringOutsideTheTableIsFatal) {
    EXPECT_THROW(register_syscall(syscall_table_size, "test_too_big", sys_add), test::KernelPanic);
}

TEST_F(SyscallDispatchTest, NamesAreKeptForTracing) {
    register_syscall(SYS_TEST_NAMED, "test_named", sys_add);
    EXPECT_STREQ(syscall_name(SYS_TEST_NAMED), "test_named");
    EXPECT_EQ(syscall_name(SYS_TEST_UNREGISTERED), nullptr);
    EXPECT_EQ(syscall_name(syscall_table_size + 1), nullptr);
}

TEST_F(SyscallDispatchTest, ContinuationIsLeftAlone) {
    register_syscall(SYS_TEST_ADD + syscall_table_size / 2, "test_add_high", sys_add);

    TrapFrame frame = syscall_frame(SYS_TEST_ADD + syscall_table_size / 2);
    syscall_handler(&frame);

    EXPECT_EQ(u64(frame.rip), 0x401000u);
    EXPECT_EQ(u64(frame.rsp), 0x7FFFFFFFE000u);
    EXPECT_EQ(u64(frame.rflags), sysret_rflags);
    EXPECT_EQ(u64(frame.vector), 0u);
}

TEST(SyscallMsrs, StarSelectsTheFlatGdtSegments) {
    constexpr u64 star = star_value();
    u64 sysret_base = star >> 48;
    u64 syscall_base = (star >> 32) & 0xFFFF;

    // sysretq: cs = base + 16, ss = base + 8, both forced to RPL 3
    EXPECT_EQ((sysret_base + 16) | 3, u64(GDT_USER_CODE_RPL3));
    EXPECT_EQ((sysret_base + 8) | 3, u64(GDT_USER_DATA_RPL3));
    EXPECT_EQ(u64(GDT_USER_CODE_RPL3), 0x23u);
    EXPECT_EQ(u64(GDT_USER_DATA_RPL3), 0x1Bu);

    // syscall: cs = base, ss = base + 8
    EXPECT_EQ(syscall_base, u64(cpu::GDTSegment::KERNEL_CODE_64));
    EXPECT_EQ(syscall_base + 8, u64(cpu::GDTSegment::KERNEL_DATA_64));

    EXPECT_EQ(star & 0xFFFFFFFF, 0u);
}

TEST(SyscallMsrs, EntryMasksInterruptDirectionAndTrapFlags) {
    EXPECT_EQ(entry_rflags_mask, (1ul << 9) | (1ul << 10) | (1ul << 8));
    EXPECT_NE(entry_rflags_mask & cpu::RFLAGS::IF, 0u);
    EXPECT_NE(entry_rflags_mask & cpu::RFLAGS::DF, 0u);
    EXPECT_NE(entry_rflags_mask & cpu::RFLAGS::TF, 0u);
    EXPECT_EQ(sysret_rflags, 0x200u);
}
