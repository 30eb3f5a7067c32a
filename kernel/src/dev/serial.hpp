#pragma once

#include <klib/common.hpp>

// 16550 UART on COM1, the kernel's only diagnostic output
namespace serial {
    constexpr u16 com1 = 0x3F8;

    void init();
    void write_char(char c);
}
