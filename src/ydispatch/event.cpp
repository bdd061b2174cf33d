#include "event.hpp"
#include "loop.hpp"
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace ydispatch {

bool Event::add_listener(Listener listener) {
    _prune();
    if (has_listener(listener)) {
        return false;
    }
    _listeners.push_back(std::make_shared<Entry>(Entry{std::move(listener), {}, false}));
    return true;
}

bool Event::add_async_listener(Listener listener, const std::shared_ptr<Loop>& loop) {
    _prune();
    if (has_listener(listener)) {
        return false;
    }
    _async_listeners.push_back(std::make_shared<Entry>(Entry{std::move(listener), loop, false}));
    return true;
}

std::size_t Event::_remove_if(std::vector<std::shared_ptr<Entry>>& entries,
                              const std::function<bool(const Entry&)>& pred) {
    std::size_t removed = 0;
    std::erase_if(entries, [&](const std::shared_ptr<Entry>& entry) {
        if (!pred(*entry)) {
            return false;
        }
        // an emission holding a snapshot must skip it too
        entry->removed = true;
        ++removed;
        return true;
    });
    return removed;
}

std::size_t Event::remove_listener(const Listener& listener) {
    auto match = [&](const Entry& entry) { return entry.listener.same_as(listener); };
    return _remove_if(_listeners, match) + _remove_if(_async_listeners, match);
}

std::size_t Event::remove_owner(const void* owner) {
    auto match = [&](const Entry& entry) { return entry.listener.owner_is(owner); };
    return _remove_if(_listeners, match) + _remove_if(_async_listeners, match);
}

bool Event::has_listener(const Listener& listener) const {
    auto match = [&](const std::shared_ptr<Entry>& entry) { return entry->listener.same_as(listener); };
    return std::any_of(_listeners.begin(), _listeners.end(), match) ||
           std::any_of(_async_listeners.begin(), _async_listeners.end(), match);
}

EmitOutcome Event::emit(const Args& args, const Kwargs& kwargs) {
    EmitOutcome outcome;

    auto async_snapshot = _async_listeners;
    for (auto& entry : async_snapshot) {
        if (entry->removed) {
            continue;
        }
        auto loop = entry->loop.lock();
        if (!loop || !entry->listener.is_alive()) {
            entry->removed = true;
            continue;
        }
        Task task = entry->listener.start(args, kwargs);
        if (!task.valid()) {
            entry->removed = true;
            continue;
        }
        outcome.scheduled.push_back(loop->spawn(std::move(task)));
    }

    auto snapshot = _listeners;
    for (auto& entry : snapshot) {
        if (entry->removed) {
            continue;
        }
        if (!entry->listener.is_alive()) {
            entry->removed = true;
            continue;
        }
        if (entry->listener.invoke(args, kwargs) == Propagation::Stop) {
            ydebug("Event::emit: {} stopped by {}", _name, entry->listener.label());
            outcome.propagation = Propagation::Stop;
            break;
        }
    }

    _prune();
    _wake_waiters(args, kwargs);
    return outcome;
}

std::size_t Event::listener_count() const {
    return static_cast<std::size_t>(std::count_if(_listeners.begin(), _listeners.end(),
        [](const auto& entry) { return !entry->removed && entry->listener.is_alive(); }));
}

std::size_t Event::async_listener_count() const {
    return static_cast<std::size_t>(std::count_if(_async_listeners.begin(), _async_listeners.end(),
        [](const auto& entry) {
            return !entry->removed && entry->listener.is_alive() && !entry->loop.expired();
        }));
}

void Event::_prune() {
    auto dead = [](const std::shared_ptr<Entry>& entry) {
        return entry->removed || !entry->listener.is_alive();
    };
    std::erase_if(_listeners, dead);
    std::erase_if(_async_listeners, [&](const std::shared_ptr<Entry>& entry) {
        return dead(entry) || entry->loop.expired();
    });
}

void Event::_wake_waiters(const Args& args, const Kwargs& kwargs) {
    if (_waiters.empty()) {
        return;
    }
    // Waiters registered while waking belong to the next emission
    std::vector<Waiter> waiters;
    waiters.swap(_waiters);
    for (auto& waiter : waiters) {
        *waiter.slot = EventPayload{args, kwargs};
        Loop::wake(waiter.loop, waiter.task);
    }
}

bool Event::Awaiter::await_suspend(Task::Handle caller) {
    auto& promise = caller.promise();
    if (!promise.loop) {
        return false;
    }
    _slot = std::make_shared<std::optional<EventPayload>>();
    _event->_waiters.push_back(Waiter{promise.loop->weak_from_this(), promise.state, _slot});
    return true;
}

EventPayload Event::Awaiter::await_resume() {
    if (_slot && *_slot) {
        return std::move(**_slot);
    }
    return EventPayload{};
}

} // namespace ydispatch
