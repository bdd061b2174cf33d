#pragma once

#include "types.hpp"
#include "listener.hpp"
#include "task.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ydispatch {

class Loop;

// What an awaited emission delivers
struct EventPayload {
    Args args;
    Kwargs kwargs;
};

struct EmitOutcome {
    Propagation propagation = Propagation::Continue;
    // Tasks scheduled for coroutine listeners, in bind order
    std::vector<TaskHandle> scheduled;
};

// Event - listeners of one named event of one dispatcher instance
class Event {
public:
    explicit Event(std::string name) : _name(std::move(name)) {}

    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    const std::string& name() const { return _name; }

    // Returns false when the same listener is already bound
    bool add_listener(Listener listener);
    bool add_async_listener(Listener listener, const std::shared_ptr<Loop>& loop);

    // Number of entries removed, from both lists
    std::size_t remove_listener(const Listener& listener);
    std::size_t remove_owner(const void* owner);

    bool has_listener(const Listener& listener) const;

    // Schedule coroutine listeners, call synchronous listeners in bind order
    // until one returns Stop, then wake awaiting tasks
    EmitOutcome emit(const Args& args, const Kwargs& kwargs);

    // Live entries
    std::size_t listener_count() const;
    std::size_t async_listener_count() const;
    std::size_t waiter_count() const { return _waiters.size(); }

    // `co_await event` inside a Task suspends until the next emission
    class Awaiter {
    public:
        explicit Awaiter(Event& event) : _event(&event) {}
        bool await_ready() const { return false; }
        bool await_suspend(Task::Handle caller);
        EventPayload await_resume();

    private:
        Event* _event;
        std::shared_ptr<std::optional<EventPayload>> _slot;
    };

    Awaiter operator co_await() { return Awaiter(*this); }

private:
    struct Entry {
        Listener listener;
        std::weak_ptr<Loop> loop;
        bool removed = false;
    };

    struct Waiter {
        std::weak_ptr<Loop> loop;
        std::weak_ptr<TaskState> task;
        std::shared_ptr<std::optional<EventPayload>> slot;
    };

    static std::size_t _remove_if(std::vector<std::shared_ptr<Entry>>& entries,
                                  const std::function<bool(const Entry&)>& pred);
    void _prune();
    void _wake_waiters(const Args& args, const Kwargs& kwargs);

    std::string _name;
    std::vector<std::shared_ptr<Entry>> _listeners;
    std::vector<std::shared_ptr<Entry>> _async_listeners;
    std::vector<Waiter> _waiters;
};

} // namespace ydispatch
