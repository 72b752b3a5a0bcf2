#pragma once

#include <concepts>
#include <cstddef>
#include <ranges>
#include <stop_token>

#include <handoff/bounded_queue.hpp>
#include <handoff/message.hpp>

namespace handoff {

/// pushes every element of a source into `queue`, then the end marker
///
/// if the source throws, `run` lets the exception out without sending the
/// marker. whoever runs the producer decides whether to call `finish` then.
/// a stop request ends iteration early, that still counts as finishing
template<typename T>
struct producer {
    bounded_queue<message<T>>& queue;
    std::stop_token stop{};
    /// items sent so far, not counting the marker
    std::size_t sent{0};

    template<std::ranges::input_range Source>
        requires(std::constructible_from<T,
                                         std::ranges::range_reference_t<Source>>)
    void run(Source&& source)
    {
        // the stop token is checked before every `*it` and `++it`, once a
        // stop is requested the source is not touched again
        auto it = std::ranges::begin(source);
        const auto last = std::ranges::end(source);
        while (!stop.stop_requested() && it != last) {
            queue.put(make_item<T>(*it));
            ++sent;
            if (stop.stop_requested()) {
                break;
            }
            ++it;
        }
        finish();
    }

    void finish() { queue.put(make_end<T>()); }
};

} // namespace handoff
