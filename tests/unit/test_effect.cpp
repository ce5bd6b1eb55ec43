#include <gtest/gtest.h>
#include <stdexcept>
#include <utility>
#include <vector>
#include "reactdag/reactive.h"

using namespace reactdag;

class EffectTest : public ::testing::Test {
protected:
    Runtime runtime;
    RuntimeScope scope{runtime};
};

// Test that an automatic effect runs on creation
TEST_F(EffectTest, RunsImmediately) {
    auto s = create_signal(1);
    std::vector<int> seen;
    auto effect = create_effect([&]() { seen.push_back(s->read()); });

    EXPECT_EQ(seen, std::vector<int>{1});
    EXPECT_TRUE(effect->is_running());
    EXPECT_FALSE(effect->is_manual());
    EXPECT_EQ(effect->runs(), 1u);
    EXPECT_EQ(effect->kind(), NodeKind::EFFECT);
}

// Test that a manual effect waits for an explicit run
TEST_F(EffectTest, ManualEffectWaitsForRun) {
    auto s = create_signal(1);
    int runs = 0;
    auto effect = create_effect([&]() {
        s->read();
        ++runs;
    }, true);

    EXPECT_EQ(runs, 0);
    EXPECT_FALSE(effect->is_running());
    EXPECT_TRUE(s->downstream().empty());

    s->write(2);
    EXPECT_EQ(runs, 0);

    effect->run();
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(effect->is_running());

    s->write(3);
    EXPECT_EQ(runs, 2);
}

// Test re-running on every dependency change
TEST_F(EffectTest, RerunsOnDependencyChange) {
    auto s = create_signal(0);
    std::vector<int> seen;
    auto effect = create_effect([&]() { seen.push_back(s->read()); });

    s->write(1);
    s->write(2);
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2}));
    EXPECT_FALSE(effect->is_dirty());
}

// Test stop: cleanup once, edges gone, no further runs
TEST_F(EffectTest, StopRunsCleanupAndDetaches) {
    auto s = create_signal(1);
    int runs = 0;
    int cleanups = 0;
    auto effect = create_effect([&]() -> Cleanup {
        s->read();
        ++runs;
        return [&cleanups]() { ++cleanups; };
    });
    ASSERT_TRUE(effect->has_cleanup());

    effect->stop();
    EXPECT_EQ(cleanups, 1);
    EXPECT_FALSE(effect->is_running());
    EXPECT_FALSE(effect->has_cleanup());
    EXPECT_TRUE(effect->upstream().empty());
    EXPECT_TRUE(s->downstream().empty());

    s->write(2);
    EXPECT_EQ(runs, 1);

    // Already stopped
    effect->stop();
    EXPECT_EQ(cleanups, 1);
}

// Test that an explicit run restarts a stopped effect
TEST_F(EffectTest, RunAfterStopResubscribes) {
    auto s = create_signal(1);
    int runs = 0;
    auto effect = create_effect([&]() {
        s->read();
        ++runs;
    });

    effect->stop();
    effect->run();
    EXPECT_EQ(runs, 2);
    EXPECT_TRUE(effect->is_running());

    s->write(5);
    EXPECT_EQ(runs, 3);
}

// Test that a re-run replaces the cleanup without calling it
TEST_F(EffectTest, RerunReplacesCleanup) {
    auto s = create_signal(1);
    std::vector<int> cleaned;
    auto effect = create_effect([&]() -> Cleanup {
        int value = s->read();
        return [&cleaned, value]() { cleaned.push_back(value); };
    });

    s->write(2);
    s->write(3);
    EXPECT_TRUE(cleaned.empty());

    effect->stop();
    EXPECT_EQ(cleaned, std::vector<int>{3});
}

// Test that a body returning no cleanup is fine to stop
TEST_F(EffectTest, StopWithoutCleanup) {
    auto s = create_signal(1);
    auto effect = create_effect([&]() -> Cleanup {
        s->read();
        return nullptr;
    });

    EXPECT_FALSE(effect->has_cleanup());
    effect->stop();
    EXPECT_FALSE(effect->is_running());
}

// Test that a cleanup writing a former dependency does not restart the effect
TEST_F(EffectTest, CleanupWritingDependencyDoesNotRestart) {
    auto s = create_signal(1);
    int runs = 0;
    auto effect = create_effect([&]() -> Cleanup {
        s->read();
        ++runs;
        return [&s]() { s->write(0); };
    });

    effect->stop();
    EXPECT_EQ(s->peek(), 0);
    EXPECT_EQ(runs, 1);
    EXPECT_FALSE(effect->is_running());
}

// Test that stopping an effect also drops a scheduled run
TEST_F(EffectTest, StopCancelsScheduledRun) {
    auto s = create_signal(1);
    auto t = create_signal(1);
    int victim_runs = 0;
    std::shared_ptr<Effect> victim;

    // Reads one signal, so it runs before the victim which reads two
    auto stopper = create_effect([&]() {
        if (s->read() > 1 && victim) {
            victim->stop();
        }
    });
    victim = create_effect([&]() {
        s->read();
        t->read();
        ++victim_runs;
    });
    ASSERT_LT(stopper->priority(), victim->priority());
    ASSERT_EQ(victim_runs, 1);

    s->write(2);
    EXPECT_EQ(victim_runs, 1);
    EXPECT_FALSE(victim->is_running());
    EXPECT_EQ(runtime.scheduler().pending_count(), 0u);
}

// Test that a body stopping its own effect stays stopped and cleans up
TEST_F(EffectTest, BodyStoppingItselfCleansUpImmediately) {
    auto s = create_signal(1);
    auto t = create_signal(1);
    int cleanups = 0;
    std::shared_ptr<Effect> effect;
    effect = create_effect([&]() -> Cleanup {
        s->read();
        effect->stop();
        t->read();
        return [&cleanups]() { ++cleanups; };
    }, true);

    effect->run();
    EXPECT_EQ(cleanups, 1);
    EXPECT_FALSE(effect->is_running());
    EXPECT_FALSE(effect->has_cleanup());
    EXPECT_TRUE(effect->upstream().empty());
    EXPECT_TRUE(s->downstream().empty());
    EXPECT_TRUE(t->downstream().empty());
    EXPECT_TRUE(runtime.evaluation_stack().empty());

    s->write(2);
    t->write(2);
    EXPECT_EQ(effect->runs(), 1u);

    effect->stop();
    EXPECT_EQ(cleanups, 1);
}

// Test that a failing body propagates and leaves the stack clean
TEST_F(EffectTest, BodyFailurePropagates) {
    auto s = create_signal(0);
    auto effect = create_effect([&]() {
        if (s->read() > 0) {
            throw std::runtime_error("effect failed");
        }
    });

    EXPECT_THROW(s->write(1), std::runtime_error);
    EXPECT_TRUE(runtime.evaluation_stack().empty());
    EXPECT_FALSE(runtime.scheduler().is_draining());
    EXPECT_EQ(s->downstream().count(effect->id()), 1u);

    // Still subscribed, recovers on the next good value
    s->write(0);
    EXPECT_EQ(effect->runs(), 2u);
}

// Test an effect observing a computed
TEST_F(EffectTest, ObservesComputed) {
    auto s = create_signal(2);
    auto squared = create_computed([&]() { return s->read() * s->read(); });
    std::vector<int> seen;
    auto effect = create_effect([&]() { seen.push_back(squared->read()); });

    s->write(3);
    EXPECT_EQ(seen, (std::vector<int>{4, 9}));
    EXPECT_EQ(squared->evaluations(), 2u);
}
