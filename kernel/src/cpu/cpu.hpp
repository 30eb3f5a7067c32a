#pragma once

#include <klib/common.hpp>
#include <panic.hpp>

namespace cpu {
    template<klib::Integral T> static inline void out(const u16 port, const T val) {
        panic("cpu::out must be used with u8, u16, or u32");
    }

    template<>
    inline void out<u8>(const u16 port, const u8 val) {
        asm volatile("outb %0, %1" : : "a" (val), "Nd" (port));
    }

    template<>
    inline void out<u16>(const u16 port, const u16 val) {
        asm volatile("outw %0, %1" : : "a" (val), "Nd" (port));
    }

    template<>
    inline void out<u32>(const u16 port, const u32 val) {
        asm volatile("outl %0, %1" : : "a" (val), "Nd" (port));
    }

    template<klib::Integral T> static inline T in(const u16 port) {
        panic("cpu::in must be used with u8, u16, or u32");
    }

    template<>
    inline u8 in<u8>(const u16 port) {
        volatile u8 ret;
        asm volatile("inb %1, %0" : "=a" (ret) : "Nd" (port));
        return ret;
    }

    template<>
    inline u16 in<u16>(const u16 port) {
        volatile u16 ret;
        asm volatile("inw %1, %0" : "=a" (ret) : "Nd" (port));
        return ret;
    }

    template<>
    inline u32 in<u32>(const u16 port) {
        volatile u32 ret;
        asm volatile("inl %1, %0" : "=a" (ret) : "Nd" (port));
        return ret;
    }

    [[noreturn]] static inline void halt_forever() {
        asm volatile("cli");
        while (true)
            asm volatile("hlt");
    }
}
