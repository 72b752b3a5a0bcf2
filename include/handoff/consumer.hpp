#pragma once

#include <concepts>
#include <cstddef>
#include <utility>
#include <variant>

#include <handoff/bounded_queue.hpp>
#include <handoff/message.hpp>

namespace handoff {

/// an ordered container we can default construct and append to
template<typename C, typename T>
concept appendable = std::default_initializable<C> &&
                     requires(C& c, T&& v) { c.push_back(std::move(v)); };

/// moves items out of `queue` into `destination` until the end marker
///
/// only the consumer's thread may touch `destination` while `run` is going
template<typename T, typename Container>
    requires(appendable<Container, T>)
struct consumer {
    bounded_queue<message<T>>& queue;
    Container& destination;
    std::size_t taken{0};

    void run()
    {
        while (true) {
            auto m = queue.get();
            if (is_end(m)) {
                return;
            }
            destination.push_back(std::get<0>(std::move(m)));
            ++taken;
        }
    }

    /// throw away everything up to and including the end marker
    void drain()
    {
        while (!is_end(queue.get())) {
        }
    }
};

} // namespace handoff
