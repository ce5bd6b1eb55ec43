#include "reactdag/reactive.h"

namespace reactdag {

void batch(const std::function<void()>& fn) {
    Runtime::current().batch().run(fn);
}

} // namespace reactdag
