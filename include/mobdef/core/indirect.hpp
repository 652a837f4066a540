#pragma once

/// @file indirect.hpp
/// @brief Heap-allocated value with deep-copy semantics

#include <memory>
#include <utility>

namespace mobdef_core {

/// Owns a single T on the heap and copies it deeply.
/// Lets recursive aggregates hold a child by value while T is still incomplete.
template<typename T>
class Indirect {
public:
    Indirect(T value) : m_ptr(std::make_unique<T>(std::move(value))) {}

    Indirect(const Indirect& other)
        : m_ptr(other.m_ptr ? std::make_unique<T>(*other.m_ptr) : nullptr) {}

    Indirect(Indirect&& other) noexcept = default;

    Indirect& operator=(const Indirect& other) {
        if (this != &other) {
            m_ptr = other.m_ptr ? std::make_unique<T>(*other.m_ptr) : nullptr;
        }
        return *this;
    }

    Indirect& operator=(Indirect&& other) noexcept = default;

    ~Indirect() = default;

    [[nodiscard]] T& operator*() { return *m_ptr; }
    [[nodiscard]] const T& operator*() const { return *m_ptr; }
    [[nodiscard]] T* operator->() { return m_ptr.get(); }
    [[nodiscard]] const T* operator->() const { return m_ptr.get(); }
    [[nodiscard]] T* get() { return m_ptr.get(); }
    [[nodiscard]] const T* get() const { return m_ptr.get(); }

    bool operator==(const Indirect& other) const {
        if (!m_ptr || !other.m_ptr) {
            return m_ptr == other.m_ptr;
        }
        return *m_ptr == *other.m_ptr;
    }

private:
    std::unique_ptr<T> m_ptr;
};

} // namespace mobdef_core
