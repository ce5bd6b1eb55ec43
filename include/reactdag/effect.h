#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "reactdag/dependency_node.h"

namespace reactdag {

// Returned by an effect body; an empty function means nothing to clean up
using Cleanup = std::function<void()>;

// Side-effecting consumer, re-run whenever something it read changes.
class Effect : public DependencyNode {
public:
    using Body = std::function<Cleanup()>;

    // Runs the body immediately unless manual
    explicit Effect(Body body, bool manual = false, std::string name = {});

    // Re-subscribes from scratch and keeps the body's cleanup. The previous
    // cleanup is replaced without being called.
    void run() override;

    // Calls the cleanup, drops all edges and any scheduled run. Does nothing
    // when the effect is not running.
    void stop();

    bool is_running() const { return running_; }
    bool is_manual() const { return manual_; }
    bool has_cleanup() const { return static_cast<bool>(cleanup_); }
    std::uint64_t runs() const { return runs_; }

private:
    Body body_;
    Cleanup cleanup_;
    bool running_ = false;
    bool manual_;
    std::uint64_t runs_ = 0;
};

} // namespace reactdag
