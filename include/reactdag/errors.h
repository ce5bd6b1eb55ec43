#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace reactdag {

// Base class for failures raised by the engine itself. Exceptions thrown by
// user derivations and effect bodies propagate unchanged.
class ReactiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A single drain ran more nodes than RuntimeOptions::max_drain_steps allows
class DrainLimitExceeded : public ReactiveError {
public:
    explicit DrainLimitExceeded(std::size_t limit)
        : ReactiveError("Scheduler drain exceeded " + std::to_string(limit) + " steps"),
          limit_(limit) {}

    std::size_t limit() const { return limit_; }

private:
    std::size_t limit_;
};

// A computed value was read while its own derivation was running
class CycleError : public ReactiveError {
public:
    explicit CycleError(const std::string& node_name)
        : ReactiveError("Cyclic read of '" + node_name + "' during its own evaluation") {}
};

} // namespace reactdag
