#pragma once

#include "result.hpp"
#include "object.hpp"
#include "task.hpp"
#include "error_buffer.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ydispatch {

// Loop - cooperative execution context for coroutine subscribers.
// Jobs may be posted from any thread; tasks only run on the thread
// that drives the loop.
class Loop : public Object, public std::enable_shared_from_this<Loop> {
public:
    static Result<std::shared_ptr<Loop>> create(std::string name = "loop");

    ~Loop() override;

    const char* type_name() const override { return "Loop"; }
    const std::string& name() const { return _name; }

    // Thread-safe
    void post(std::function<void()> job);

    // Schedule a task; its first step runs on the next loop iteration
    TaskHandle spawn(Task task);

    // Run the jobs queued so far, returns how many ran
    std::size_t run_once();

    // Run until the queue is empty
    std::size_t run_until_idle();

    // Drive the loop until handle completes (blocks while idle)
    Result<void> run_until_complete(const TaskHandle& handle);
    Result<void> run_until_complete(Task task);

    // Drive the loop until stop() is called
    void run_forever();

    // Thread-safe
    void stop();

    bool is_running() const { return _running.load(); }
    std::size_t pending_jobs() const;
    std::size_t live_tasks() const;

    // Failures of spawned tasks. Only touch from the loop thread.
    ErrorBuffer& errors() { return _errors; }

    // Ambient loop of the calling thread, if any
    static std::shared_ptr<Loop> current();

    // Makes a loop the ambient one for the current thread
    class Scope {
    public:
        explicit Scope(Loop& loop);
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        std::weak_ptr<Loop> _previous;
    };

    // Post a resume of task onto loop, when both are still around
    static void wake(const std::weak_ptr<Loop>& loop, std::weak_ptr<TaskState> task);

private:
    explicit Loop(std::string name) : _name(std::move(name)) {}

    void _reap();
    void _record_failure(const std::shared_ptr<TaskState>& state);

    std::string _name;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<std::function<void()>> _jobs;
    std::vector<std::shared_ptr<TaskState>> _tasks;
    bool _stopping = false;
    std::atomic<bool> _running{false};
    ErrorBuffer _errors;
};

using LoopPtr = std::shared_ptr<Loop>;

} // namespace ydispatch
