#pragma once

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include "listener.hpp"
#include "event.hpp"
#include "manifest.hpp"
#include "observable.hpp"
#include "task.hpp"
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ydispatch {

class Loop;
class CompletionTracker;
class Dispatcher;

using Binding = std::pair<std::string, Listener>;
using Bindings = std::vector<Binding>;

// EmissionHold - while alive, emissions of one event are recorded instead
// of delivered. Releasing the outermost hold delivers the last one.
// Holds taken with emission_lock() nest freely; holds awaited through
// emission_lock_async() are exclusive between tasks.
class EmissionHold {
public:
    EmissionHold() = default;
    EmissionHold(EmissionHold&& other) noexcept;
    EmissionHold& operator=(EmissionHold&& other) noexcept;
    EmissionHold(const EmissionHold&) = delete;
    EmissionHold& operator=(const EmissionHold&) = delete;
    ~EmissionHold() { release(); }

    bool active() const { return !_state.expired(); }
    // Whether this hold keeps other tasks waiting
    bool exclusive() const { return _exclusive && active(); }
    const std::string& name() const { return _name; }

    void release();

private:
    friend class Dispatcher;
    friend class EmissionLockAwaiter;

    struct Ticket {
        bool granted = false;
        bool abandoned = false;
        bool owner_gone = false;
    };

    struct Waiter {
        std::weak_ptr<Loop> loop;
        std::weak_ptr<TaskState> task;
        std::shared_ptr<Ticket> ticket;
    };

    struct State {
        Dispatcher* owner = nullptr;
        std::size_t depth = 0;
        std::optional<EventPayload> pending;
        // Exclusive holder present; waiters queue behind it
        bool locked = false;
        std::deque<Waiter> waiters;

        // Pass the exclusive hold to the next live waiter, or unlock
        void hand_over();
    };

    EmissionHold(std::shared_ptr<State> state, std::string name, bool exclusive = false)
        : _state(state), _name(std::move(name)), _exclusive(exclusive) {}

    std::weak_ptr<State> _state;
    std::string _name;
    bool _exclusive = false;
};

// `co_await dispatcher.emission_lock_async(name)` inside a Task yields
// Result<EmissionHold>, suspending while another task holds the event.
class EmissionLockAwaiter {
public:
    EmissionLockAwaiter(const EmissionLockAwaiter&) = delete;
    EmissionLockAwaiter& operator=(const EmissionLockAwaiter&) = delete;
    ~EmissionLockAwaiter();

    bool await_ready();
    bool await_suspend(Task::Handle caller);
    Result<EmissionHold> await_resume();

private:
    friend class Dispatcher;

    EmissionLockAwaiter(std::shared_ptr<EmissionHold::State> state, std::string name, std::optional<Error> error)
        : _state(std::move(state)), _name(std::move(name)), _error(std::move(error)) {}

    std::weak_ptr<EmissionHold::State> _state;
    std::string _name;
    std::optional<Error> _error;
    std::shared_ptr<EmissionHold::Ticket> _ticket;
    bool _consumed = false;
};

// {get(), set(v)} access to one property of one dispatcher
template<typename T>
class PropertyRef {
public:
    PropertyRef(Dispatcher& dispatcher, std::string name)
        : _dispatcher(&dispatcher), _name(std::move(name)) {}

    const std::string& name() const { return _name; }
    Result<T> get() const;
    Result<void> set(T value);

private:
    Dispatcher* _dispatcher;
    std::string _name;
};

// Dispatcher - event registry and property storage of one object.
// Subclass it, passing the manifest of the subclass to the constructor.
class Dispatcher : public Object {
public:
    static Result<std::shared_ptr<Dispatcher>> create(ManifestPtr manifest = nullptr);

    ~Dispatcher() override;

    const char* type_name() const override { return "Dispatcher"; }
    const Manifest& manifest() const { return *_manifest; }
    const ManifestPtr& manifest_ptr() const { return _manifest; }

    // Events
    Result<void> register_event(const std::string& name);
    Result<void> register_events(const std::vector<std::string>& names);
    // Declared, registered or property event
    bool has_event(const std::string& name) const;
    std::vector<std::string> event_names() const;

    Result<void> bind(const std::string& name, Listener listener);
    Result<void> bind(const Bindings& bindings);
    // loop == nullptr means the ambient loop
    Result<void> bind_async(const std::shared_ptr<Loop>& loop, const std::string& name, Listener listener);
    Result<void> bind_async(const std::shared_ptr<Loop>& loop, const Bindings& bindings);

    void unbind(const Listener& listener);
    template<typename T>
    void unbind_owner(const T* owner) { _unbind_owner(identity_of(owner)); }
    template<typename T>
    void unbind_owner(const std::shared_ptr<T>& owner) { _unbind_owner(identity_of(owner.get())); }

    Result<Propagation> emit(const std::string& name, Args args = {}, Kwargs kwargs = {});

    // Stays valid for the lifetime of the dispatcher
    Result<Event*> get_dispatcher_event(const std::string& name);

    // Properties
    Result<Value> get_property(const std::string& name) const;
    Result<void> set_property(const std::string& name, const Value& value);

    template<typename T>
    Result<T> get(const std::string& name) const {
        auto value = get_property(name);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (auto typed = get_as<T>(*value)) {
            return *typed;
        }
        return Err<T>(ErrorCode::InvalidType,
                      "Dispatcher::get: property '" + name + "' holds " + value_type_name(*value));
    }

    template<typename T>
    Result<void> set(const std::string& name, T value) {
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return set_property(name, Value());
        } else if constexpr (std::is_convertible_v<T, const char*>) {
            return set_property(name, Value(std::string(value)));
        } else {
            return set_property(name, Value(std::move(value)));
        }
    }

    template<typename T>
    Result<PropertyRef<T>> property(const std::string& name) {
        if (!_manifest->has_property(name)) {
            return Err<PropertyRef<T>>(ErrorCode::DoesNotExist,
                                       "Dispatcher::property: no property '" + name + "'");
        }
        return PropertyRef<T>(*this, name);
    }

    Result<ObservableListPtr> get_list(const std::string& name) const;
    Result<ObservableDictPtr> get_dict(const std::string& name) const;

    Result<EmissionHold> emission_lock(const std::string& name);
    EmissionLockAwaiter emission_lock_async(const std::string& name);

protected:
    explicit Dispatcher(ManifestPtr manifest);

    // Called after register_event added new names
    virtual void _on_events_registered(const std::vector<std::string>& names) { (void)names; }

private:
    friend class Observable;
    friend class EmissionHold;
    friend class EmissionLockAwaiter;
    friend class CompletionTracker;

    Event* _event(const std::string& name);
    Result<std::shared_ptr<Loop>> _resolve_loop(const std::shared_ptr<Loop>& loop) const;
    void _unbind_owner(const void* owner);
    Result<Propagation> _deliver(const std::string& name, Event& event, const Args& args, const Kwargs& kwargs);
    void _release_hold(const std::string& name);
    const std::shared_ptr<EmissionHold::State>& _hold_state(const std::string& name);
    Value _wrap(const PropertyBase& descriptor, const Value& value);
    void _container_changed(const PropertyBase& descriptor);

    void _attach_tracker(CompletionTracker* tracker);
    void _detach_tracker(CompletionTracker* tracker);

    ManifestPtr _manifest;
    std::vector<std::string> _registered;
    std::set<std::string> _registered_set;
    std::map<std::string, std::unique_ptr<Event>> _events;
    std::map<std::string, Value> _values;
    std::map<std::string, std::shared_ptr<EmissionHold::State>> _holds;
    std::vector<CompletionTracker*> _trackers;
};

using DispatcherPtr = std::shared_ptr<Dispatcher>;

template<typename T>
Result<T> PropertyRef<T>::get() const {
    return _dispatcher->template get<T>(_name);
}

template<typename T>
Result<void> PropertyRef<T>::set(T value) {
    return _dispatcher->set(_name, std::move(value));
}

} // namespace ydispatch
