#include "dispatcher.hpp"
#include "completion_tracker.hpp"
#include "loop.hpp"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <utility>

namespace ydispatch {

// ---------------------------------------------------------------------------
// EmissionHold
// ---------------------------------------------------------------------------

EmissionHold::EmissionHold(EmissionHold&& other) noexcept
    : _state(std::move(other._state)), _name(std::move(other._name)),
      _exclusive(std::exchange(other._exclusive, false)) {
    other._state.reset();
}

EmissionHold& EmissionHold::operator=(EmissionHold&& other) noexcept {
    if (this != &other) {
        release();
        _state = std::move(other._state);
        _name = std::move(other._name);
        _exclusive = std::exchange(other._exclusive, false);
        other._state.reset();
    }
    return *this;
}

void EmissionHold::release() {
    auto state = _state.lock();
    _state.reset();
    bool exclusive = std::exchange(_exclusive, false);
    if (!state || state->depth == 0) {
        return;
    }
    if (--state->depth == 0 && state->owner) {
        state->owner->_release_hold(_name);
    }
    if (exclusive) {
        state->hand_over();
    }
}

void EmissionHold::State::hand_over() {
    while (!waiters.empty()) {
        Waiter waiter = std::move(waiters.front());
        waiters.pop_front();
        auto task = waiter.task.lock();
        if (waiter.ticket->abandoned || !task || task->done() || waiter.loop.expired()) {
            continue;
        }
        waiter.ticket->granted = true;
        ++depth;
        Loop::wake(waiter.loop, waiter.task);
        return;
    }
    locked = false;
}

// ---------------------------------------------------------------------------
// EmissionLockAwaiter
// ---------------------------------------------------------------------------

EmissionLockAwaiter::~EmissionLockAwaiter() {
    if (!_ticket || _consumed) {
        return;
    }
    if (!_ticket->granted) {
        _ticket->abandoned = true;
        return;
    }
    // Granted to a task that never resumed
    if (auto state = _state.lock()) {
        EmissionHold(state, _name, true).release();
    }
}

bool EmissionLockAwaiter::await_ready() {
    if (_error) {
        return true;
    }
    auto state = _state.lock();
    if (!state) {
        _error = Error(ErrorCode::DoesNotExist, "Dispatcher::emission_lock_async: dispatcher is gone");
        return true;
    }
    if (state->locked) {
        return false;
    }
    state->locked = true;
    ++state->depth;
    _ticket = std::make_shared<EmissionHold::Ticket>();
    _ticket->granted = true;
    return true;
}

bool EmissionLockAwaiter::await_suspend(Task::Handle caller) {
    auto& promise = caller.promise();
    auto state = _state.lock();
    if (!promise.loop || !state) {
        _error = Error(ErrorCode::BindingContext,
                       "Dispatcher::emission_lock_async: '" + _name + "' is held and the awaiting task has no loop");
        return false;
    }
    _ticket = std::make_shared<EmissionHold::Ticket>();
    state->waiters.push_back(EmissionHold::Waiter{promise.loop->weak_from_this(), promise.state, _ticket});
    ydebug("Dispatcher::emission_lock_async: waiting for '{}' ({} queued)", _name, state->waiters.size());
    return true;
}

Result<EmissionHold> EmissionLockAwaiter::await_resume() {
    if (_error) {
        return std::unexpected(*_error);
    }
    auto state = _state.lock();
    if (!state || !_ticket || _ticket->owner_gone) {
        return Err<EmissionHold>(ErrorCode::DoesNotExist,
                                 "Dispatcher::emission_lock_async: dispatcher destroyed while waiting for '" + _name + "'");
    }
    _consumed = true;
    return EmissionHold(state, _name, true);
}

// ---------------------------------------------------------------------------
// Dispatcher
// ---------------------------------------------------------------------------

Dispatcher::Dispatcher(ManifestPtr manifest)
    : _manifest(manifest ? std::move(manifest) : Manifest::empty()) {
    for (const auto& descriptor : _manifest->properties()) {
        Value initial = descriptor->default_value();
        if (descriptor->is_container()) {
            initial = _wrap(*descriptor, initial);
        }
        _values[descriptor->name()] = std::move(initial);
    }
}

Result<std::shared_ptr<Dispatcher>> Dispatcher::create(ManifestPtr manifest) {
    auto dispatcher = std::shared_ptr<Dispatcher>(new Dispatcher(std::move(manifest)));
    if (auto res = dispatcher->init(); !res) {
        return Err<std::shared_ptr<Dispatcher>>("Dispatcher::create: init failed", res);
    }
    ydebug("Dispatcher::create: {} ({})", dispatcher->_manifest->class_name(), dispatcher->uid());
    return dispatcher;
}

Dispatcher::~Dispatcher() {
    // Containers may outlive us; they must stop reporting here
    for (auto& [name, value] : _values) {
        Observable::_release(value);
    }
    for (auto* tracker : _trackers) {
        tracker->_dispatcher_gone();
    }
    _trackers.clear();
    for (auto& [name, state] : _holds) {
        state->owner = nullptr;
        for (auto& waiter : state->waiters) {
            waiter.ticket->owner_gone = true;
            Loop::wake(waiter.loop, waiter.task);
        }
        state->waiters.clear();
    }
    _holds.clear();
}

Result<void> Dispatcher::register_event(const std::string& name) {
    return register_events({name});
}

Result<void> Dispatcher::register_events(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (name.empty()) {
            return Err<void>(ErrorCode::Config, "Dispatcher::register_event: empty event name");
        }
        if (_manifest->has_property(name)) {
            return Err<void>(ErrorCode::PropertyExists,
                             "Dispatcher::register_event: '" + name + "' is a property");
        }
    }
    std::vector<std::string> added;
    for (const auto& name : names) {
        if (_manifest->has_event(name) || _registered_set.count(name)) {
            continue;
        }
        _registered_set.insert(name);
        _registered.push_back(name);
        added.push_back(name);
    }
    if (!added.empty()) {
        ydebug("Dispatcher::register_event: {} registered {} event(s)", uid(), added.size());
        _on_events_registered(added);
    }
    return Ok();
}

bool Dispatcher::has_event(const std::string& name) const {
    return _manifest->has_event(name) || _manifest->has_property(name) || _registered_set.count(name) > 0;
}

std::vector<std::string> Dispatcher::event_names() const {
    std::vector<std::string> names = _manifest->event_names();
    names.insert(names.end(), _registered.begin(), _registered.end());
    for (const auto& descriptor : _manifest->properties()) {
        names.push_back(descriptor->name());
    }
    return names;
}

Event* Dispatcher::_event(const std::string& name) {
    auto it = _events.find(name);
    if (it != _events.end()) {
        return it->second.get();
    }
    if (!has_event(name)) {
        return nullptr;
    }
    auto inserted = _events.emplace(name, std::make_unique<Event>(name));
    return inserted.first->second.get();
}

Result<std::shared_ptr<Loop>> Dispatcher::_resolve_loop(const std::shared_ptr<Loop>& loop) const {
    if (loop) {
        return loop;
    }
    if (auto ambient = Loop::current()) {
        return ambient;
    }
    return Err<std::shared_ptr<Loop>>(ErrorCode::BindingContext, "Coroutine function given without event loop");
}

Result<void> Dispatcher::bind(const std::string& name, Listener listener) {
    return bind(Bindings{{name, std::move(listener)}});
}

Result<void> Dispatcher::bind(const Bindings& bindings) {
    // Resolve everything first so a failure binds nothing
    std::vector<std::pair<Event*, std::shared_ptr<Loop>>> targets;
    targets.reserve(bindings.size());
    for (const auto& [name, listener] : bindings) {
        auto* event = _event(name);
        if (!event) {
            return Err<void>(ErrorCode::DoesNotExist, "Dispatcher::bind: no event named '" + name + "'");
        }
        std::shared_ptr<Loop> loop;
        if (listener.is_async()) {
            auto resolved = _resolve_loop(nullptr);
            if (!resolved) {
                return Err<void>("Dispatcher::bind: '" + name + "'", resolved);
            }
            loop = *resolved;
        }
        targets.emplace_back(event, std::move(loop));
    }
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        const auto& listener = bindings[i].second;
        auto& [event, loop] = targets[i];
        bool added = loop ? event->add_async_listener(listener, loop) : event->add_listener(listener);
        ydebug("Dispatcher::bind: {} '{}' <- {}{}", uid(), event->name(), listener.label(),
               added ? "" : " (already bound)");
    }
    return Ok();
}

Result<void> Dispatcher::bind_async(const std::shared_ptr<Loop>& loop, const std::string& name, Listener listener) {
    return bind_async(loop, Bindings{{name, std::move(listener)}});
}

Result<void> Dispatcher::bind_async(const std::shared_ptr<Loop>& loop, const Bindings& bindings) {
    auto resolved = _resolve_loop(loop);
    if (!resolved) {
        return Err<void>("Dispatcher::bind_async", resolved);
    }
    std::vector<Event*> targets;
    targets.reserve(bindings.size());
    for (const auto& [name, listener] : bindings) {
        if (!listener.is_async()) {
            return Err<void>(ErrorCode::BindingContext,
                             "Dispatcher::bind_async: listener for '" + name + "' is not a coroutine function");
        }
        auto* event = _event(name);
        if (!event) {
            return Err<void>(ErrorCode::DoesNotExist, "Dispatcher::bind_async: no event named '" + name + "'");
        }
        targets.push_back(event);
    }
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        targets[i]->add_async_listener(bindings[i].second, *resolved);
        ydebug("Dispatcher::bind_async: {} '{}' <- {} on {}", uid(), targets[i]->name(),
               bindings[i].second.label(), (*resolved)->name());
    }
    return Ok();
}

void Dispatcher::unbind(const Listener& listener) {
    std::size_t removed = 0;
    for (auto& [name, event] : _events) {
        removed += event->remove_listener(listener);
    }
    ydebug("Dispatcher::unbind: {} removed {} entr(ies) of {}", uid(), removed, listener.label());
}

void Dispatcher::_unbind_owner(const void* owner) {
    if (!owner) {
        return;
    }
    std::size_t removed = 0;
    for (auto& [name, event] : _events) {
        removed += event->remove_owner(owner);
    }
    ydebug("Dispatcher::unbind_owner: {} removed {} entr(ies)", uid(), removed);
}

Result<Propagation> Dispatcher::emit(const std::string& name, Args args, Kwargs kwargs) {
    auto* event = _event(name);
    if (!event) {
        return Err<Propagation>(ErrorCode::DoesNotExist, "Dispatcher::emit: no event named '" + name + "'");
    }
    auto hold = _holds.find(name);
    if (hold != _holds.end() && hold->second->depth > 0) {
        hold->second->pending = EventPayload{std::move(args), std::move(kwargs)};
        return Propagation::Continue;
    }
    return _deliver(name, *event, args, kwargs);
}

Result<Propagation> Dispatcher::_deliver(const std::string& name, Event& event,
                                         const Args& args, const Kwargs& kwargs) {
    auto outcome = event.emit(args, kwargs);
    if (!outcome.scheduled.empty()) {
        // a tracker may close itself from inside a task; iterate a copy
        auto trackers = _trackers;
        for (auto* tracker : trackers) {
            if (tracker->covers(name)) {
                tracker->_retain(name, outcome.scheduled);
            }
        }
    }
    return outcome.propagation;
}

Result<Event*> Dispatcher::get_dispatcher_event(const std::string& name) {
    auto* event = _event(name);
    if (!event) {
        return Err<Event*>(ErrorCode::DoesNotExist,
                           "Dispatcher::get_dispatcher_event: no event named '" + name + "'");
    }
    return event;
}

Result<Value> Dispatcher::get_property(const std::string& name) const {
    auto it = _values.find(name);
    if (it == _values.end()) {
        return Err<Value>(ErrorCode::DoesNotExist, "Dispatcher::get_property: no property '" + name + "'");
    }
    return it->second;
}

Result<void> Dispatcher::set_property(const std::string& name, const Value& value) {
    auto descriptor = _manifest->find_property(name);
    if (!descriptor) {
        return Err<void>(ErrorCode::DoesNotExist, "Dispatcher::set_property: no property '" + name + "'");
    }
    auto& cell = _values[name];
    if (descriptor->equals(cell, value)) {
        return Ok();
    }
    auto checked = descriptor->validate(value);
    if (!checked) {
        return Err<void>("Dispatcher::set_property: '" + name + "' rejected", checked);
    }
    Value stored = descriptor->is_container() ? _wrap(*descriptor, *checked) : std::move(*checked);
    Value old = std::exchange(cell, std::move(stored));
    Observable::_release(old);

    Args args{Value(this), cell};
    Kwargs kwargs{{"old", std::move(old)}, {"property", Value(descriptor.get())}};
    auto res = emit(name, std::move(args), std::move(kwargs));
    if (!res) {
        return Err<void>("Dispatcher::set_property: emit failed", res);
    }
    return Ok();
}

Result<ObservableListPtr> Dispatcher::get_list(const std::string& name) const {
    auto value = get_property(name);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (auto list = std::any_cast<ObservableListPtr>(&*value)) {
        return *list;
    }
    return Err<ObservableListPtr>(ErrorCode::InvalidType,
                                  "Dispatcher::get_list: property '" + name + "' is not a list property");
}

Result<ObservableDictPtr> Dispatcher::get_dict(const std::string& name) const {
    auto value = get_property(name);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (auto dict = std::any_cast<ObservableDictPtr>(&*value)) {
        return *dict;
    }
    return Err<ObservableDictPtr>(ErrorCode::InvalidType,
                                  "Dispatcher::get_dict: property '" + name + "' is not a dict property");
}

Value Dispatcher::_wrap(const PropertyBase& descriptor, const Value& value) {
    std::shared_ptr<Observable> root;
    Value wrapped;
    if (auto list = std::any_cast<List>(&value)) {
        auto created = ObservableList::create(*list);
        root = created;
        wrapped = created;
    } else if (auto dict = std::any_cast<Dict>(&value)) {
        auto created = ObservableDict::create(*dict);
        root = created;
        wrapped = created;
    } else {
        return value;
    }
    root->_bind_root(this, &descriptor);
    return wrapped;
}

void Dispatcher::_container_changed(const PropertyBase& descriptor) {
    auto it = _values.find(descriptor.name());
    if (it == _values.end()) {
        return;
    }
    Args args{Value(this), it->second};
    Kwargs kwargs{{"old", Value()}, {"property", Value(&descriptor)}};
    if (auto res = emit(descriptor.name(), std::move(args), std::move(kwargs)); !res) {
        ywarn("Dispatcher::_container_changed: {}", error_msg(res));
    }
}

Result<EmissionHold> Dispatcher::emission_lock(const std::string& name) {
    if (!has_event(name)) {
        return Err<EmissionHold>(ErrorCode::DoesNotExist, "Dispatcher::emission_lock: no event named '" + name + "'");
    }
    ++_hold_state(name)->depth;
    return EmissionHold(_hold_state(name), name);
}

EmissionLockAwaiter Dispatcher::emission_lock_async(const std::string& name) {
    if (!has_event(name)) {
        return EmissionLockAwaiter(nullptr, name,
            Error(ErrorCode::DoesNotExist, "Dispatcher::emission_lock_async: no event named '" + name + "'"));
    }
    return EmissionLockAwaiter(_hold_state(name), name, std::nullopt);
}

const std::shared_ptr<EmissionHold::State>& Dispatcher::_hold_state(const std::string& name) {
    auto& state = _holds[name];
    if (!state) {
        state = std::make_shared<EmissionHold::State>();
        state->owner = this;
    }
    return state;
}

void Dispatcher::_release_hold(const std::string& name) {
    auto it = _holds.find(name);
    if (it == _holds.end() || !it->second->pending) {
        return;
    }
    EventPayload payload = std::move(*it->second->pending);
    it->second->pending.reset();
    auto* event = _event(name);
    if (!event) {
        return;
    }
    ydebug("Dispatcher::emission_lock: {} releasing held '{}'", uid(), name);
    if (auto res = _deliver(name, *event, payload.args, payload.kwargs); !res) {
        ywarn("Dispatcher::emission_lock: {}", error_msg(res));
    }
}

void Dispatcher::_attach_tracker(CompletionTracker* tracker) {
    _trackers.push_back(tracker);
}

void Dispatcher::_detach_tracker(CompletionTracker* tracker) {
    std::erase(_trackers, tracker);
}

} // namespace ydispatch
