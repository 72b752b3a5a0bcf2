#pragma once

#include <cstddef>
#include <exception>
#include <ranges>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <handoff/__detail/util.hpp>
#include <handoff/bounded_queue.hpp>
#include <handoff/consumer.hpp>
#include <handoff/error.hpp>
#include <handoff/log.hpp>
#include <handoff/message.hpp>
#include <handoff/producer.hpp>

namespace handoff {

/// queue slots used when the caller doesn't pick a capacity
constexpr std::ptrdiff_t default_capacity = 10;

/// move every element of `source` through a queue of `capacity` slots,
/// with the producer and the consumer each on their own thread, and return
/// what the consumer collected once both threads are done
///
/// throws `std::invalid_argument` for a capacity below 1 before any thread is
/// started. if iterating `source` throws the result is discarded and
/// `producer_failure` is thrown, if appending to the container throws
/// `consumer_failure` is thrown. either way the original exception is nested.
/// if both fail, the one that failed first is thrown and both are logged
template<typename Container, std::ranges::input_range Source>
    requires(appendable<Container, std::ranges::range_value_t<Source>>)
auto run_into(Source&& source, std::ptrdiff_t capacity = default_capacity)
    -> Container
{
    using value_type = std::ranges::range_value_t<Source>;

    bounded_queue<message<value_type>> queue{capacity};
    Container destination{};
    std::stop_source stop;

    std::exception_ptr produce_error;
    std::exception_ptr consume_error;
    std::size_t sent = 0;
    std::size_t taken = 0;
    // whichever worker fails first is the one to request the stop, so
    // `request_stop` returning true marks the earlier failure
    bool producer_failed_first = false;

    log(log_level::debug,
        "pipeline: starting with capacity " + std::to_string(capacity));
    {
        std::jthread consumer_thread{[&] {
            consumer<value_type, Container> c{queue, destination};
            consume_error = __detail::util::capture([&] { c.run(); });
            taken = c.taken;
            if (consume_error != nullptr) {
                // the producer may be parked on a full queue, ask it to wrap
                // up and keep taking items until it has sent the marker
                stop.request_stop();
                c.drain();
            }
        }};

        std::jthread producer_thread;
        try {
            producer_thread = std::jthread{[&] {
                producer<value_type> p{queue, stop.get_token()};
                produce_error =
                    __detail::util::capture([&] { p.run(source); });
                sent = p.sent;
                if (produce_error != nullptr) {
                    producer_failed_first = stop.request_stop();
                    // the source never reached its end, release the consumer
                    p.finish();
                }
            }};
        }
        catch (...) {
            queue.put(make_end<value_type>());
            throw;
        }
    }

    const auto log_producer = [&] {
        log(log_level::warn, "pipeline: producer failed after " +
                                 std::to_string(sent) + " items: " +
                                 __detail::util::describe(produce_error));
    };
    const auto log_consumer = [&] {
        log(log_level::warn, "pipeline: consumer failed after " +
                                 std::to_string(taken) + " items: " +
                                 __detail::util::describe(consume_error));
    };

    // both failures are logged, the earlier one is thrown
    if (produce_error != nullptr &&
        (producer_failed_first || consume_error == nullptr)) {
        log_producer();
        if (consume_error != nullptr) {
            log_consumer();
        }
        __detail::util::rethrow_nested<producer_failure>(produce_error);
    }
    if (consume_error != nullptr) {
        log_consumer();
        if (produce_error != nullptr) {
            log_producer();
        }
        __detail::util::rethrow_nested<consumer_failure>(consume_error);
    }

    log(log_level::debug,
        "pipeline: done, moved " + std::to_string(taken) + " items");
    return destination;
}

/// `run_into` collecting into a `std::vector`
template<std::ranges::input_range Source>
auto run(Source&& source, std::ptrdiff_t capacity = default_capacity)
    -> std::vector<std::ranges::range_value_t<Source>>
{
    return run_into<std::vector<std::ranges::range_value_t<Source>>>(
        std::forward<Source>(source), capacity);
}

} // namespace handoff
