#pragma once

#include <stdexcept>
#include <string>

namespace test {
    // thrown by the host panic() in place of halting
    struct KernelPanic : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // everything klib::printf and friends printed since the last clear_log()
    const std::string& kernel_log();
    void clear_log();
}
