#pragma once

/// @file history.hpp
/// @brief Bounded whole-document undo/redo history

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

namespace mobdef_editor {

/// Two bounded stacks of snapshots.
/// Each stack holds at most max_size() entries; the oldest entry is dropped
/// on overflow. push() clears the redo stack.
/// @tparam T Any copyable document type
template<typename T>
class UndoHistory {
public:
    static constexpr std::size_t k_default_max_size = 50;

    /// Construct with max entries per stack (0 is treated as 1)
    explicit UndoHistory(std::size_t max_size = k_default_max_size)
        : m_max_size(max_size == 0 ? 1 : max_size) {}

    /// Record the state before an edit
    void push(T snapshot) {
        push_bounded(m_past, std::move(snapshot));
        m_future.clear();
    }

    /// Step back. `current` moves onto the redo stack.
    /// @return The previous state, nullopt if there is none
    [[nodiscard]] std::optional<T> undo(T current) {
        if (m_past.empty()) {
            return std::nullopt;
        }
        T previous = std::move(m_past.back());
        m_past.pop_back();
        push_bounded(m_future, std::move(current));
        return previous;
    }

    /// Step forward. `current` moves onto the undo stack.
    /// @return The next state, nullopt if there is none
    [[nodiscard]] std::optional<T> redo(T current) {
        if (m_future.empty()) {
            return std::nullopt;
        }
        T next = std::move(m_future.back());
        m_future.pop_back();
        push_bounded(m_past, std::move(current));
        return next;
    }

    [[nodiscard]] bool can_undo() const noexcept { return !m_past.empty(); }
    [[nodiscard]] bool can_redo() const noexcept { return !m_future.empty(); }

    void clear() {
        m_past.clear();
        m_future.clear();
    }

    [[nodiscard]] std::size_t undo_count() const noexcept { return m_past.size(); }
    [[nodiscard]] std::size_t redo_count() const noexcept { return m_future.size(); }
    [[nodiscard]] std::size_t max_size() const noexcept { return m_max_size; }

    /// Change the bound, dropping the oldest entries that no longer fit
    void set_max_size(std::size_t max_size) {
        m_max_size = max_size == 0 ? 1 : max_size;
        trim(m_past);
        trim(m_future);
    }

private:
    void push_bounded(std::deque<T>& stack, T value) {
        stack.push_back(std::move(value));
        trim(stack);
    }

    void trim(std::deque<T>& stack) {
        while (stack.size() > m_max_size) {
            stack.pop_front();
        }
    }

    std::size_t m_max_size;
    std::deque<T> m_past;
    std::deque<T> m_future;
};

} // namespace mobdef_editor
