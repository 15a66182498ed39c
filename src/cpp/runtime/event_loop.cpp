#include <relay/runtime/event_loop.h>
#include <relay/util/scope.h>

namespace relay {
    void EventLoop::post(task_type task) {
        LockGuard guard(_lock);
        if (_stopped) { throw_error<std::runtime_error>("Cannot post into a stopped event loop"); }
        _queue.push_back(std::move(task));
    }

    void EventLoop::post_front(task_type task) {
        LockGuard guard(_lock);
        if (_stopped) { throw_error<std::runtime_error>("Cannot post into a stopped event loop"); }
        _queue.push_front(std::move(task));
    }

    std::optional<EventLoop::task_type> EventLoop::dequeue() {
        LockGuard guard(_lock);
        if (!_queue.empty()) {
            auto task = std::move(_queue.front());
            _queue.pop_front();
            return task;
        }
        return std::nullopt;
    }

    bool EventLoop::run_once() {
        if (_running) { throw_error<std::logic_error>("The event loop cannot be run from one of its own tasks"); }
        auto task = dequeue();
        if (!task) { return false; }
        _running = true;
        auto reset = make_scope_exit([this] { _running = false; });
        (*task)();
        return true;
    }

    std::size_t EventLoop::run_until_idle(std::size_t max_tasks) {
        std::size_t count{0};
        while (count < max_tasks && run_once()) { ++count; }
        return count;
    }

    std::size_t EventLoop::pending() const {
        LockGuard guard(_lock);
        return _queue.size();
    }

    EventLoop::operator bool() const {
        LockGuard guard(_lock);
        return !_queue.empty();
    }

    bool EventLoop::running() const { return _running; }

    bool EventLoop::stopped() const { return _stopped; }

    void EventLoop::mark_stopped() {
        LockGuard guard(_lock);
        _stopped = true;
    }
} // namespace relay
