#pragma once

#include <klib/cstdlib.hpp>
#include <panic.hpp>

namespace klib {
    // elements are moved around with realloc, so T has to be trivially relocatable
    template<typename T>
    class Vector {
        T *m_buffer;
        usize m_size;
        usize m_capacity;

        bool increase_capacity(usize new_capacity) {
            if (new_capacity <= m_capacity)
                return true;
            usize capacity = m_capacity ? m_capacity : 1;
            while (new_capacity > capacity)
                capacity *= 2;
            T *buffer = (T*)klib::realloc(m_buffer, capacity * sizeof(T));
            if (buffer == nullptr)
                return false;
            m_buffer = buffer;
            m_capacity = capacity;
            return true;
        }

    public:
        Vector(usize reserve = 0) : m_buffer(nullptr), m_size(0), m_capacity(0) {
            increase_capacity(reserve);
        }

        ~Vector() {
            clear();
            klib::free(m_buffer);
        }

        Vector(const Vector &) = delete;
        Vector& operator=(const Vector &) = delete;

        Vector(Vector &&other) : m_buffer(other.m_buffer), m_size(other.m_size), m_capacity(other.m_capacity) {
            other.m_buffer = nullptr;
            other.m_size = 0;
            other.m_capacity = 0;
        }

        Vector& operator=(Vector &&other) {
            swap(m_buffer, other.m_buffer);
            swap(m_size, other.m_size);
            swap(m_capacity, other.m_capacity);
            return *this;
        }

        T& operator [](usize index) const {
            ASSERT(index < m_size);
            return m_buffer[index];
        }

        template<typename... Args>
        T& emplace_back(Args&&... args) {
            if (!increase_capacity(m_size + 1))
                panic("Vector: out of memory");
            return *new (m_buffer + m_size++) T(klib::forward<Args>(args)...);
        }

        T& push_back(const T &t) { return emplace_back(t); }
        T& push_back(T &&t) { return emplace_back(klib::move(t)); }

        void pop_back() {
            ASSERT(m_size > 0);
            m_buffer[--m_size].~T();
        }

        // returns false if the heap could not satisfy the new size
        bool resize(usize new_size) {
            if (!increase_capacity(new_size))
                return false;
            for (usize i = m_size; i < new_size; i++)
                new (m_buffer + i) T();
            for (usize i = new_size; i < m_size; i++)
                m_buffer[i].~T();
            m_size = new_size;
            return true;
        }

        bool reserve(usize capacity) { return increase_capacity(capacity); }

        inline constexpr T* data() const { return m_buffer; }
        inline constexpr usize size() const { return m_size; }
        inline constexpr usize capacity() const { return m_capacity; }
        inline constexpr bool empty() const { return m_size == 0; }
        T& back() const { return (*this)[m_size - 1]; }

        void clear() {
            resize(0);
        }

        T* begin() const { return m_buffer; }
        T* end() const { return m_buffer + m_size; }
    };
}
