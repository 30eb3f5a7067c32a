#pragma once

#include <stdint.h>
#include <stddef.h>

#if __STDC_HOSTED__
#include <new>
#endif

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

using usize = size_t;
using isize = i64;
using uptr = uintptr_t;
using uint = unsigned int;

static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__, "on-disk structures are read in place as little-endian");

namespace klib {
    template<typename T, T v>
    struct IntegralConstant {
        static constexpr T value = v;
    };

    template<bool v>
    using BooleanConstant = IntegralConstant<bool, v>;

    using True = BooleanConstant<true>;
    using False = BooleanConstant<false>;

    template<typename> struct IsIntegral : public False {};
    template<> struct IsIntegral<bool> : public True {};
    template<> struct IsIntegral<char> : public True {};
    template<> struct IsIntegral<u8> : public True {};
    template<> struct IsIntegral<u16> : public True {};
    template<> struct IsIntegral<u32> : public True {};
    template<> struct IsIntegral<u64> : public True {};
    template<> struct IsIntegral<i8> : public True {};
    template<> struct IsIntegral<i16> : public True {};
    template<> struct IsIntegral<i32> : public True {};
    template<> struct IsIntegral<i64> : public True {};

    template<typename T> concept Integral = IsIntegral<T>::value;

    template<typename T, typename U> struct IsSame : False {};
    template<typename T> struct IsSame<T, T> : True {};
    template<typename T, typename U> constexpr bool is_same = IsSame<T, U>::value;

    template<typename T> struct NumericLimits {};
    template<> struct NumericLimits<u8>  { static constexpr u8  max = 0xff; };
    template<> struct NumericLimits<u16> { static constexpr u16 max = 0xffff; };
    template<> struct NumericLimits<u32> { static constexpr u32 max = 0xffffffff; };
    template<> struct NumericLimits<u64> { static constexpr u64 max = 0xffffffffffffffff; };
    template<> struct NumericLimits<i16> { static constexpr i16 max = 0x7fff; };
    template<> struct NumericLimits<i32> { static constexpr i32 max = 0x7fffffff; };

    template<typename T> struct RemoveReference { using type = T; };
    template<typename T> struct RemoveReference<T&> { using type = T; };
    template<typename T> struct RemoveReference<T&&> { using type = T; };

    template<typename T> struct IsLValueReference : public False {};
    template<typename T> struct IsLValueReference<T&> : public True {};

    template<typename T>
    constexpr inline T&& forward(typename RemoveReference<T>::type &t) {
        return static_cast<T&&>(t);
    }

    template<typename T>
    constexpr inline T&& forward(typename RemoveReference<T>::type &&t) {
        static_assert(!IsLValueReference<T>::value, "Cannot forward an rvalue as an lvalue.");
        return static_cast<T&&>(t);
    }

    template<typename T>
    constexpr typename RemoveReference<T>::type&& move(T &&t) {
        return static_cast<typename RemoveReference<T>::type&&>(t);
    }

    template<typename T>
    constexpr inline void swap(T &a, T &b) {
        T tmp = move(a);
        a = move(b);
        b = move(tmp);
    }

    [[noreturn]] inline void unreachable() { __builtin_unreachable(); }

    inline u32 hash(const char *str) { // djb2a
        u32 hash = 5381;
        for (const char *c = str; *c; c++)
            hash = ((hash << 5) + hash) ^ *c; // hash * 33 ^ str[i]
        return hash;
    }

    inline u64 hash(u64 h) { // murmur64
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccd;
        h ^= h >> 33;
        h *= 0xc4ceb9fe1a85ec53;
        h ^= h >> 33;
        return h;
    }

    struct ScopeExitTag {};

    template<typename Function>
    class ScopeExit final {
        Function function;
    public:
        explicit ScopeExit(Function &&fn) : function(klib::move(fn)) {}
        ~ScopeExit() {
            function();
        }
    };

    template<typename Function>
    auto operator->*(ScopeExitTag, Function &&function) {
        return ScopeExit<Function>{forward<Function>(function)};
    }
}

#if !__STDC_HOSTED__
inline void* operator new(usize, void *p)      { return p; }
inline void* operator new[](usize, void *p)    { return p; }
inline void  operator delete  (void *, void *) { }
inline void  operator delete[](void *, void *) { }
#endif

#define CONCAT(a, b) a ## b
#define CONCAT2(a, b) CONCAT(a, b)

#define defer auto CONCAT2(_defer, __LINE__) = ::klib::ScopeExitTag{}->*[&]()
