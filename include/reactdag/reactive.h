#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include "reactdag/batch.h"
#include "reactdag/computed.h"
#include "reactdag/effect.h"
#include "reactdag/errors.h"
#include "reactdag/runtime.h"
#include "reactdag/signal.h"

namespace reactdag {

template <typename T>
std::shared_ptr<Signal<T>> create_signal(T initial, std::string name = {}) {
    return std::make_shared<Signal<T>>(std::move(initial), std::move(name));
}

template <typename Fn>
auto create_computed(Fn&& derive, std::string name = {}) {
    using T = std::decay_t<std::invoke_result_t<Fn&>>;
    return std::make_shared<Computed<T>>(
        typename Computed<T>::DeriveFn(std::forward<Fn>(derive)), std::move(name));
}

// The body may return a Cleanup or nothing
template <typename Fn>
std::shared_ptr<Effect> create_effect(Fn&& body, bool manual = false, std::string name = {}) {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
        Effect::Body wrapped = [fn = std::forward<Fn>(body)]() mutable -> Cleanup {
            fn();
            return Cleanup{};
        };
        return std::make_shared<Effect>(std::move(wrapped), manual, std::move(name));
    } else {
        return std::make_shared<Effect>(Effect::Body(std::forward<Fn>(body)), manual,
                                        std::move(name));
    }
}

// Runs fn with signal propagation deferred, then drains once
void batch(const std::function<void()>& fn);

} // namespace reactdag
