#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace handoff {

/// fixed capacity FIFO shared between threads
///
/// a classic monitor: one mutex guards the buffer, `not_empty_` wakes
/// readers and `not_full_` wakes writers, so each side only ever wakes the
/// other side. every wait re-checks its predicate after waking.
///
/// `size`, `empty` and `full` are snapshots, by the time the caller looks at
/// the value another thread may already have changed it
template<typename T>
class bounded_queue {
public:
    using size_type = std::size_t;
    using value_type = T;

    explicit bounded_queue(std::ptrdiff_t capacity)
        : capacity_{checked_capacity(capacity)}
    {
    }
    bounded_queue(bounded_queue&&) = delete;
    bounded_queue(const bounded_queue&) = delete;

    /// block until there is room, then append `item` at the tail
    void put(T item)
    {
        std::unique_lock l{m_};
        not_full_.wait(l, [this] { return items_.size() < capacity_; });
        push_locked(std::move(item));
    }

    /// block until there is an item, then remove and return the head
    auto get() -> T
    {
        std::unique_lock l{m_};
        not_empty_.wait(l, [this] { return !items_.empty(); });
        return pop_locked();
    }

    auto try_put(T item) -> bool
    {
        std::unique_lock l{m_};
        if (items_.size() >= capacity_) {
            return false;
        }
        push_locked(std::move(item));
        return true;
    }

    auto try_get() -> std::optional<T>
    {
        std::unique_lock l{m_};
        if (items_.empty()) {
            return std::nullopt;
        }
        return pop_locked();
    }

    /// like `put` but gives up after `timeout`, in which case `item` is dropped
    template<typename Rep, typename Period>
    auto try_put_for(T item, std::chrono::duration<Rep, Period> timeout)
        -> bool
    {
        std::unique_lock l{m_};
        if (!not_full_.wait_for(
                l, timeout, [this] { return items_.size() < capacity_; })) {
            return false;
        }
        push_locked(std::move(item));
        return true;
    }

    template<typename Rep, typename Period>
    auto try_get_for(std::chrono::duration<Rep, Period> timeout)
        -> std::optional<T>
    {
        std::unique_lock l{m_};
        if (!not_empty_.wait_for(
                l, timeout, [this] { return !items_.empty(); })) {
            return std::nullopt;
        }
        return pop_locked();
    }

    auto size() const -> size_type
    {
        std::lock_guard l{m_};
        return items_.size();
    }
    auto empty() const -> bool
    {
        std::lock_guard l{m_};
        return items_.empty();
    }
    auto full() const -> bool
    {
        std::lock_guard l{m_};
        return items_.size() >= capacity_;
    }
    constexpr auto max_size() const -> size_type { return capacity_; }

private:
    static auto checked_capacity(std::ptrdiff_t capacity) -> size_type
    {
        if (capacity <= 0) {
            throw std::invalid_argument{"bounded_queue capacity must be "
                                        "positive, got " +
                                        std::to_string(capacity)};
        }
        return static_cast<size_type>(capacity);
    }

    // both expect `m_` to be held by the caller
    void push_locked(T&& item)
    {
        items_.push_back(std::move(item));
        not_empty_.notify_one();
    }
    auto pop_locked() -> T
    {
        T item(std::move(items_.front()));
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    std::deque<T> items_;
    const size_type capacity_;
    mutable std::mutex m_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

static_assert(!std::is_copy_constructible_v<bounded_queue<int>>);
static_assert(!std::is_move_constructible_v<bounded_queue<int>>);

} // namespace handoff
