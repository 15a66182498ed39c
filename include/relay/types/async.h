#ifndef RELAY_TYPES_ASYNC_H
#define RELAY_TYPES_ASYNC_H

#include <relay/relay_base.h>
#include <relay/util/errors.h>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace relay {
    template<typename T>
    struct is_async : std::false_type {
    };

    template<typename T>
    struct is_async<Async<T> > : std::true_type {
    };

    template<typename T>
    inline constexpr bool is_async_v = is_async<std::remove_cvref_t<T> >::value;

    template<typename T>
    struct async_value {
        using type = T;
    };

    template<typename T>
    struct async_value<Async<T> > {
        using type = T;
    };

    template<typename T>
    using async_value_t = typename async_value<std::remove_cvref_t<T> >::type;

    /**
     * A value that is available now or will be available later.
     *
     * This is the single type the observer machinery accepts from callbacks: a synchronous callback returns a ready
     * Async (implicitly converted from its result), an asynchronous one returns an Async that a Promise completes on a
     * later turn of the event loop. Completion runs the registered continuations on the thread that completes it.
     *
     * Async is a cheap handle to shared state, copies observe the same result.
     */
    template<typename T>
    class Async {
    public:
        using value_type = T;
        using stored_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

        struct State {
            std::optional<stored_type> value;
            std::exception_ptr error;
            std::vector<std::function<void(const Async &)> > continuations;

            [[nodiscard]] bool done() const { return value.has_value() || error != nullptr; }
        };

        /**
         * A completed Async<void>, or an Async<T> holding a default constructed T.
         */
        Async() : _state{std::make_shared<State>()} { _state->value.emplace(); }

        template<typename U>
            requires (!is_async_v<U> && std::constructible_from<stored_type, U &&>)
        Async(U &&value) : _state{std::make_shared<State>()} { _state->value.emplace(std::forward<U>(value)); }

        [[nodiscard]] static Async failed(std::exception_ptr error) {
            auto state = std::make_shared<State>();
            state->error = std::move(error);
            return Async{std::move(state)};
        }

        [[nodiscard]] bool is_ready() const { return _state->done(); }

        [[nodiscard]] bool has_error() const { return _state->error != nullptr; }

        [[nodiscard]] std::exception_ptr error() const { return _state->error; }

        /**
         * The result, re-throws the error when the Async failed. Must only be called once ready.
         */
        decltype(auto) get() const {
            if (!_state->done()) { throw_error<std::logic_error>("Async value requested before it was completed"); }
            if (_state->error) { std::rethrow_exception(_state->error); }
            if constexpr (std::is_void_v<T>) {
                return;
            } else {
                return static_cast<const T &>(*_state->value);
            }
        }

        /**
         * Call fn(const Async &) once complete, immediately if already complete.
         * Exceptions thrown by fn are NOT captured, they propagate to whoever completed this Async.
         */
        template<typename F>
        void on_complete(F &&fn) const {
            if (_state->done()) {
                fn(*this);
                return;
            }
            _state->continuations.emplace_back(std::forward<F>(fn));
        }

        /**
         * Chain fn(const Async &) on completion. The result of fn (or the Async it returns) completes the returned
         * Async, anything fn throws becomes its error.
         */
        template<typename F>
        auto then(F &&fn) const -> Async<async_value_t<std::invoke_result_t<F &, const Async &> > > {
            using R = std::invoke_result_t<F &, const Async &>;
            using Next = async_value_t<R>;
            Promise<Next> promise;
            auto next = promise.future();
            on_complete([promise, fn = std::forward<F>(fn)](const Async &completed) mutable {
                if constexpr (is_async_v<R>) {
                    std::optional<R> inner;
                    try {
                        inner.emplace(fn(completed));
                    } catch (...) {
                        promise.set_error(std::current_exception());
                        return;
                    }
                    inner->on_complete([promise](const R &result) mutable { promise.set_from(result); });
                } else if constexpr (std::is_void_v<R>) {
                    try {
                        fn(completed);
                    } catch (...) {
                        promise.set_error(std::current_exception());
                        return;
                    }
                    promise.set_value();
                } else {
                    std::optional<R> result;
                    try {
                        result.emplace(fn(completed));
                    } catch (...) {
                        promise.set_error(std::current_exception());
                        return;
                    }
                    promise.set_value(std::move(*result));
                }
            });
            return next;
        }

    private:
        explicit Async(std::shared_ptr<State> state) : _state{std::move(state)} {}

        std::shared_ptr<State> _state;

        friend class Promise<T>;
    };

    /**
     * The producer side of an Async. Completing a promise runs the continuations of its Async in registration order.
     */
    template<typename T>
    class Promise {
    public:
        using state_type = typename Async<T>::State;
        using stored_type = typename Async<T>::stored_type;

        Promise() : _state{std::make_shared<state_type>()} {}

        [[nodiscard]] Async<T> future() const { return Async<T>{_state}; }

        [[nodiscard]] bool is_complete() const { return _state->done(); }

        template<typename... Args>
            requires std::constructible_from<stored_type, Args &&...>
        void set_value(Args &&... args) {
            ensure_pending();
            _state->value.emplace(std::forward<Args>(args)...);
            run_continuations();
        }

        void set_error(std::exception_ptr error) {
            ensure_pending();
            _state->error = std::move(error);
            run_continuations();
        }

        /**
         * Complete with the outcome (value or error) of another, completed, Async.
         */
        void set_from(const Async<T> &other) {
            if (other.has_error()) {
                set_error(other.error());
            } else if constexpr (std::is_void_v<T>) {
                set_value();
            } else {
                set_value(other.get());
            }
        }

    private:
        void ensure_pending() const {
            if (_state->done()) { throw_error<std::logic_error>("Promise has already been completed"); }
        }

        void run_continuations() {
            auto continuations = std::move(_state->continuations);
            _state->continuations.clear();
            const Async<T> completed{_state};
            for (auto &continuation: continuations) { continuation(completed); }
        }

        std::shared_ptr<state_type> _state;
    };

    /**
     * Completes once every input has completed. Fails with the first error encountered (in input order) after all
     * inputs have completed.
     */
    RELAY_EXPORT Async<void> when_all(std::vector<Async<void> > pending);
} // namespace relay

#endif // RELAY_TYPES_ASYNC_H
