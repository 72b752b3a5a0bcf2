#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace handoff {

/// marks the end of a stream, nothing is sent after it
struct end_of_stream {};

/// what actually travels through a pipeline queue: either a payload or the
/// end marker. the marker is told apart by which alternative is active, so a
/// payload that compares equal to anything can never be mistaken for it
template<typename T>
using message = std::variant<T, end_of_stream>;

template<typename T>
constexpr auto is_end(const message<T>& m) noexcept -> bool
{
    return m.index() == 1;
}

template<typename T, typename... Args>
auto make_item(Args&&... args) -> message<T>
{
    static_assert(!std::is_same_v<T, end_of_stream>,
                  "end_of_stream can't be used as a payload");
    return message<T>{std::in_place_index<0>, std::forward<Args>(args)...};
}

template<typename T>
auto make_end() -> message<T>
{
    return message<T>{std::in_place_index<1>};
}

} // namespace handoff
