#pragma once

#include "result.hpp"
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace ydispatch {

class Loop;

// Completion state shared by a running task and everyone waiting on it.
// Outlives the coroutine frame, which destroys itself on completion.
class TaskState {
public:
    bool done() const;
    Result<void> result() const;

    // Queue fn to run on completion. Returns false (and drops fn) when
    // the task has already completed.
    bool on_done(std::function<void()> fn);

    // Resume the coroutine if it is still suspended
    void resume();

    // Keep owner alive until the task completes. May be called repeatedly.
    void anchor(std::shared_ptr<void> owner);

private:
    friend class Loop;
    friend class Task;

    void _attach(std::coroutine_handle<> handle);
    void _detach_handle();
    void _complete(Result<void> result);
    // Destroy a never-finished frame and complete with an error
    void _cancel(const std::string& reason);

    mutable std::mutex _mutex;
    std::coroutine_handle<> _handle;
    bool _done = false;
    Result<void> _result = Ok();
    std::vector<std::function<void()>> _continuations;
    std::vector<std::shared_ptr<void>> _anchors;
};

// Coroutine type for asynchronous subscribers. Bodies finish with
// `co_return Ok();` or `co_return Err<void>(...)`.
// A Task does nothing until spawned on a Loop.
class Task {
public:
    struct promise_type {
        std::shared_ptr<TaskState> state = std::make_shared<TaskState>();
        Loop* loop = nullptr;
        Result<void> result = Ok();

        Task get_return_object() {
            return Task(std::coroutine_handle<promise_type>::from_promise(*this));
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        struct FinalAwaiter {
            bool await_ready() const noexcept { return false; }
            void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                auto state = h.promise().state;
                auto result = std::move(h.promise().result);
                state->_detach_handle();
                h.destroy();
                state->_complete(std::move(result));
            }
            void await_resume() const noexcept {}
        };

        FinalAwaiter final_suspend() noexcept { return {}; }

        void return_value(Result<void> value) { result = std::move(value); }

        void unhandled_exception();
    };

    using Handle = std::coroutine_handle<promise_type>;

    class Awaiter;

    Task() = default;
    Task(Task&& other) noexcept : _handle(std::exchange(other._handle, {})) {}
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            _destroy();
            _handle = std::exchange(other._handle, {});
        }
        return *this;
    }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;
    ~Task() { _destroy(); }

    bool valid() const { return static_cast<bool>(_handle); }

    // Keep owner alive until the task completes
    void anchor(std::shared_ptr<void> owner) {
        if (_handle) _handle.promise().state->anchor(std::move(owner));
    }

    // Awaiting a Task runs it as a child task on the awaiting task's loop
    Awaiter operator co_await() &&;

private:
    friend class Loop;

    explicit Task(Handle h) : _handle(h) {}

    Handle _release() { return std::exchange(_handle, {}); }

    void _destroy() {
        if (_handle) {
            _handle.destroy();
            _handle = {};
        }
    }

    Handle _handle;
};

// Shared view on a spawned task
class TaskHandle {
public:
    class Awaiter {
    public:
        explicit Awaiter(std::shared_ptr<TaskState> state) : _state(std::move(state)) {}
        bool await_ready() const { return !_state || _state->done(); }
        bool await_suspend(Task::Handle caller);
        Result<void> await_resume() const;

    private:
        std::shared_ptr<TaskState> _state;
    };

    TaskHandle() = default;
    explicit TaskHandle(std::shared_ptr<TaskState> state) : _state(std::move(state)) {}

    bool valid() const { return static_cast<bool>(_state); }
    bool done() const { return _state && _state->done(); }
    Result<void> result() const;
    const std::shared_ptr<TaskState>& state() const { return _state; }

    Awaiter operator co_await() const { return Awaiter(_state); }

private:
    std::shared_ptr<TaskState> _state;
};

class Task::Awaiter {
public:
    explicit Awaiter(Task task) : _task(std::move(task)) {}
    bool await_ready() const { return false; }
    bool await_suspend(Task::Handle caller);
    Result<void> await_resume() const;

private:
    Task _task;
    TaskHandle _child;
};

inline Task::Awaiter Task::operator co_await() && {
    return Awaiter(std::move(*this));
}

} // namespace ydispatch
