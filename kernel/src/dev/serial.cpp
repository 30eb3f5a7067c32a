#include <dev/serial.hpp>
#include <klib/cstdio.hpp>
#include <cpu/cpu.hpp>

namespace serial {
    static bool initialized = false;

    void init() {
        cpu::out<u8>(com1 + 1, 0x00); // no interrupts
        cpu::out<u8>(com1 + 3, 0x80); // DLAB on
        cpu::out<u8>(com1 + 0, 0x01); // 115200 baud
        cpu::out<u8>(com1 + 1, 0x00);
        cpu::out<u8>(com1 + 3, 0x03); // 8N1
        cpu::out<u8>(com1 + 2, 0xC7); // fifo on, cleared, 14 byte threshold
        cpu::out<u8>(com1 + 4, 0x03); // DTR + RTS
        initialized = true;
    }

    void write_char(char c) {
        if (!initialized)
            return;
        while ((cpu::in<u8>(com1 + 5) & 0x20) == 0)
            asm volatile("pause");
        cpu::out<u8>(com1, c);
    }
}

namespace klib {
    int putchar(char c) {
        if (c == '\n')
            serial::write_char('\r');
        serial::write_char(c);
        return c;
    }
}
