#ifndef RELAY_RUNTIME_EVENT_LOOP_H
#define RELAY_RUNTIME_EVENT_LOOP_H

#include <relay/types/async.h>

#include <deque>
#include <limits>
#include <mutex>
#include <optional>

namespace relay {
    /**
     * Single threaded, cooperative, run queue.
     *
     * Tasks are executed in the order they were posted, on the thread calling run_once / run_until_idle. Posting is
     * guarded so that other threads (an input reader for example) may enqueue work. An exception escaping a task stops
     * the run and propagates to the caller of run_once / run_until_idle.
     */
    class RELAY_EXPORT EventLoop {
    public:
        using LockType = std::recursive_mutex;
        using LockGuard = std::lock_guard<LockType>;
        using task_type = std::function<void()>;

        EventLoop() = default;

        EventLoop(const EventLoop &) = delete;

        EventLoop &operator=(const EventLoop &) = delete;

        void post(task_type task);

        void post_front(task_type task);

        /**
         * Run fn on a later turn of the loop, the returned Async completes with its result (or error).
         */
        template<typename F>
        auto defer(F &&fn) -> Async<std::invoke_result_t<F &> > {
            using R = std::invoke_result_t<F &>;
            Promise<R> promise;
            auto result = promise.future();
            post([promise, fn = std::forward<F>(fn)]() mutable {
                if constexpr (std::is_void_v<R>) {
                    try {
                        fn();
                    } catch (...) {
                        promise.set_error(std::current_exception());
                        return;
                    }
                    promise.set_value();
                } else {
                    std::optional<R> value;
                    try {
                        value.emplace(fn());
                    } catch (...) {
                        promise.set_error(std::current_exception());
                        return;
                    }
                    promise.set_value(std::move(*value));
                }
            });
            return result;
        }

        /**
         * Run the next task, returns false when there was nothing to run.
         * Throws std::logic_error when called from a task of this loop.
         */
        bool run_once();

        /**
         * Run tasks, including those posted while running, until the queue is empty or max_tasks have run.
         * Returns the number of tasks run.
         */
        std::size_t run_until_idle(std::size_t max_tasks = std::numeric_limits<std::size_t>::max());

        [[nodiscard]] std::size_t pending() const;

        explicit operator bool() const;

        /**
         * True while a task is executing.
         */
        [[nodiscard]] bool running() const;

        [[nodiscard]] bool stopped() const;

        /**
         * Refuse further posts, tasks already queued can still be run.
         */
        void mark_stopped();

    private:
        std::optional<task_type> dequeue();

        mutable LockType _lock;
        std::deque<task_type> _queue;
        bool _stopped{false};
        bool _running{false};
    };
} // namespace relay

#endif // RELAY_RUNTIME_EVENT_LOOP_H
