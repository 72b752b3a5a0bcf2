#pragma once

#include <stdexcept>
#include <string>

namespace handoff {

/// a worker thread of a pipeline failed, the cause is attached as a nested
/// exception (see `std::rethrow_if_nested`)
class pipeline_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// iterating the source threw
class producer_failure : public pipeline_error {
public:
    explicit producer_failure(const std::string& cause)
        : pipeline_error{"producer failed: " + cause}
    {
    }
};

/// appending to the destination threw
class consumer_failure : public pipeline_error {
public:
    explicit consumer_failure(const std::string& cause)
        : pipeline_error{"consumer failed: " + cause}
    {
    }
};

} // namespace handoff
