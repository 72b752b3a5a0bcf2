#pragma once

#include <concepts>
#include <exception>
#include <string>
#include <utility>

namespace handoff::__detail::util {

/// run `f` and hand back whatever it threw, or nullptr if it returned normally
template<typename F>
    requires(std::invocable<F&>)
auto capture(F&& f) noexcept -> std::exception_ptr
{
    try {
        f();
    }
    catch (...) {
        return std::current_exception();
    }
    return nullptr;
}

/// best effort human readable text for a captured exception
inline auto describe(const std::exception_ptr& e) -> std::string
{
    if (e == nullptr) {
        return "no error";
    }
    try {
        std::rethrow_exception(e);
    }
    catch (const std::exception& ex) {
        return ex.what();
    }
    catch (...) {
        return "unknown exception";
    }
}

/// throw `Failure` with `cause` nested inside it
template<typename Failure>
[[noreturn]] void rethrow_nested(const std::exception_ptr& cause)
{
    try {
        std::rethrow_exception(cause);
    }
    catch (...) {
        std::throw_with_nested(Failure{describe(cause)});
    }
}

} // namespace handoff::__detail::util
