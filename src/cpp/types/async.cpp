#include <relay/types/async.h>

namespace relay {
    namespace {
        struct WhenAllState {
            Promise<void> promise;
            std::size_t remaining{0};
            std::vector<std::exception_ptr> errors;
        };
    } // namespace

    Async<void> when_all(std::vector<Async<void> > pending) {
        if (pending.empty()) { return {}; }
        auto state = std::make_shared<WhenAllState>();
        state->remaining = pending.size();
        state->errors.resize(pending.size());
        auto result = state->promise.future();
        for (std::size_t i = 0; i < pending.size(); ++i) {
            pending[i].on_complete([state, i](const Async<void> &completed) {
                state->errors[i] = completed.error();
                if (--state->remaining > 0) { return; }
                for (const auto &error: state->errors) {
                    if (error) {
                        state->promise.set_error(error);
                        return;
                    }
                }
                state->promise.set_value();
            });
        }
        return result;
    }
} // namespace relay
