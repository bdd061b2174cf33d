#include "loop.hpp"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <exception>

namespace ydispatch {

namespace {
thread_local std::weak_ptr<Loop> t_current_loop;
}

// ---------------------------------------------------------------------------
// TaskState
// ---------------------------------------------------------------------------

bool TaskState::done() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _done;
}

Result<void> TaskState::result() const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_done) {
        return Err<void>(ErrorCode::TaskFailed, "TaskState::result: task has not finished");
    }
    return _result;
}

bool TaskState::on_done(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_done) {
        return false;
    }
    _continuations.push_back(std::move(fn));
    return true;
}

void TaskState::resume() {
    std::coroutine_handle<> handle;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_done || !_handle) {
            return;
        }
        handle = _handle;
    }
    handle.resume();
}

void TaskState::anchor(std::shared_ptr<void> owner) {
    std::lock_guard<std::mutex> lock(_mutex);
    _anchors.push_back(std::move(owner));
}

void TaskState::_attach(std::coroutine_handle<> handle) {
    std::lock_guard<std::mutex> lock(_mutex);
    _handle = handle;
}

void TaskState::_detach_handle() {
    std::lock_guard<std::mutex> lock(_mutex);
    _handle = {};
}

void TaskState::_complete(Result<void> result) {
    std::vector<std::function<void()>> continuations;
    std::vector<std::shared_ptr<void>> anchors;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_done) {
            return;
        }
        _done = true;
        _result = std::move(result);
        _handle = {};
        continuations.swap(_continuations);
        anchors.swap(_anchors);
    }
    for (auto& fn : continuations) {
        fn();
    }
}

void TaskState::_cancel(const std::string& reason) {
    std::coroutine_handle<> handle;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_done) {
            return;
        }
        handle = std::exchange(_handle, {});
    }
    if (handle) {
        handle.destroy();
    }
    _complete(Err<void>(ErrorCode::TaskFailed, reason));
}

// ---------------------------------------------------------------------------
// Task / TaskHandle awaiting
// ---------------------------------------------------------------------------

void Task::promise_type::unhandled_exception() {
    try {
        throw;
    } catch (const std::exception& e) {
        result = Err<void>(ErrorCode::TaskFailed, std::string("unhandled exception: ") + e.what());
    } catch (...) {
        result = Err<void>(ErrorCode::TaskFailed, "unhandled exception of unknown type");
    }
}

Result<void> TaskHandle::result() const {
    if (!_state) {
        return Err<void>(ErrorCode::TaskFailed, "TaskHandle::result: empty handle");
    }
    return _state->result();
}

bool TaskHandle::Awaiter::await_suspend(Task::Handle caller) {
    auto& promise = caller.promise();
    if (!promise.loop) {
        return false;
    }
    std::weak_ptr<Loop> loop = promise.loop->weak_from_this();
    std::weak_ptr<TaskState> waiter = promise.state;
    return _state->on_done([loop, waiter] { Loop::wake(loop, waiter); });
}

Result<void> TaskHandle::Awaiter::await_resume() const {
    if (!_state) {
        return Err<void>(ErrorCode::TaskFailed, "awaited an empty task handle");
    }
    return _state->result();
}

bool Task::Awaiter::await_suspend(Task::Handle caller) {
    auto& promise = caller.promise();
    if (!promise.loop) {
        return false;
    }
    _child = promise.loop->spawn(std::move(_task));
    if (!_child.valid()) {
        return false;
    }
    TaskHandle::Awaiter inner(_child.state());
    return inner.await_suspend(caller);
}

Result<void> Task::Awaiter::await_resume() const {
    if (!_child.valid()) {
        return Err<void>(ErrorCode::TaskFailed, "awaited task could not be started");
    }
    return _child.result();
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------

Result<std::shared_ptr<Loop>> Loop::create(std::string name) {
    auto loop = std::shared_ptr<Loop>(new Loop(std::move(name)));
    if (auto res = loop->init(); !res) {
        return Err<std::shared_ptr<Loop>>("Loop::create: init failed", res);
    }
    ydebug("Loop::create: {} ({})", loop->_name, loop->uid());
    return loop;
}

Loop::~Loop() {
    std::vector<std::shared_ptr<TaskState>> tasks;
    std::deque<std::function<void()>> jobs;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        tasks.swap(_tasks);
        jobs.swap(_jobs);
    }
    jobs.clear();
    std::size_t cancelled = 0;
    for (auto& state : tasks) {
        if (!state->done()) {
            state->_cancel("task cancelled: loop '" + _name + "' destroyed");
            ++cancelled;
        }
    }
    ydebug("Loop::~Loop: {} destroyed, {} unfinished task(s) cancelled", _name, cancelled);
}

void Loop::post(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _jobs.push_back(std::move(job));
    }
    _cv.notify_all();
}

TaskHandle Loop::spawn(Task task) {
    auto handle = task._release();
    if (!handle) {
        ywarn("Loop::spawn: {} given an empty task", _name);
        return TaskHandle();
    }
    auto& promise = handle.promise();
    promise.loop = this;
    auto state = promise.state;
    state->_attach(handle);
    state->on_done([loop = weak_from_this(), weak_state = std::weak_ptr<TaskState>(state)] {
        auto self = loop.lock();
        auto finished = weak_state.lock();
        if (self && finished) {
            self->_record_failure(finished);
        }
    });
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _tasks.push_back(state);
    }
    wake(weak_from_this(), state);
    return TaskHandle(state);
}

std::size_t Loop::run_once() {
    std::deque<std::function<void()>> jobs;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        jobs.swap(_jobs);
    }
    Scope scope(*this);
    bool was_running = _running.exchange(true);
    for (auto& job : jobs) {
        job();
    }
    _running.store(was_running);
    _reap();
    return jobs.size();
}

std::size_t Loop::run_until_idle() {
    std::size_t total = 0;
    while (auto n = run_once()) {
        total += n;
    }
    return total;
}

Result<void> Loop::run_until_complete(const TaskHandle& handle) {
    if (!handle.valid()) {
        return Err<void>(ErrorCode::TaskFailed, "Loop::run_until_complete: empty task handle");
    }
    // A task finishing on another loop must still wake this one up
    handle.state()->on_done([weak = weak_from_this()] {
        if (auto self = weak.lock()) {
            self->post([] {});
        }
    });
    while (!handle.done()) {
        if (run_once() > 0) {
            continue;
        }
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this] { return !_jobs.empty() || _stopping; });
        if (_stopping) {
            _stopping = false;
            return Err<void>(ErrorCode::TaskFailed,
                             "Loop::run_until_complete: loop '" + _name + "' stopped before the task finished");
        }
    }
    return handle.result();
}

Result<void> Loop::run_until_complete(Task task) {
    auto handle = spawn(std::move(task));
    return run_until_complete(handle);
}

void Loop::run_forever() {
    ydebug("Loop::run_forever: {} starting", _name);
    while (true) {
        run_once();
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this] { return !_jobs.empty() || _stopping; });
        if (_stopping) {
            _stopping = false;
            break;
        }
    }
    ydebug("Loop::run_forever: {} stopped", _name);
}

void Loop::stop() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
    }
    _cv.notify_all();
}

std::size_t Loop::pending_jobs() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _jobs.size();
}

std::size_t Loop::live_tasks() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<std::size_t>(std::count_if(_tasks.begin(), _tasks.end(),
        [](const auto& state) { return !state->done(); }));
}

std::shared_ptr<Loop> Loop::current() {
    return t_current_loop.lock();
}

Loop::Scope::Scope(Loop& loop) : _previous(t_current_loop) {
    t_current_loop = loop.weak_from_this();
}

Loop::Scope::~Scope() {
    t_current_loop = _previous;
}

void Loop::wake(const std::weak_ptr<Loop>& loop, std::weak_ptr<TaskState> task) {
    auto target = loop.lock();
    if (!target) {
        return;
    }
    target->post([task = std::move(task)] {
        if (auto state = task.lock()) {
            state->resume();
        }
    });
}

void Loop::_reap() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::erase_if(_tasks, [](const auto& state) { return state->done(); });
}

void Loop::_record_failure(const std::shared_ptr<TaskState>& state) {
    auto res = state->result();
    if (!res) {
        _errors.add(Error("task failed on loop '" + _name + "'", res.error()), spdlog::level::warn);
    }
}

} // namespace ydispatch
