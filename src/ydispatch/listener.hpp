#pragma once

#include "types.hpp"
#include "task.hpp"
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace ydispatch {

// Returned by a synchronous listener to halt the current emission
enum class Propagation { Continue, Stop };

// Identity of a listener, used for idempotent binds and unbind matching
struct ListenerKey {
    const void* owner = nullptr;
    std::string token;

    bool operator==(const ListenerKey& other) const = default;
};

// Address of the complete object, so owners compare equal through any base
template<typename T>
const void* identity_of(const T* p) {
    if (!p) return nullptr;
    if constexpr (std::is_polymorphic_v<T>) {
        return dynamic_cast<const void*>(p);
    } else {
        return static_cast<const void*>(p);
    }
}

namespace detail {

template<typename P>
std::string pointer_token(P p) {
    std::string token = typeid(P).name();
    token.push_back(':');
    token.append(reinterpret_cast<const char*>(&p), sizeof(P));
    return token;
}

template<bool Invocable, typename F, typename... Pre>
struct returns_task : std::false_type {};

template<typename F, typename... Pre>
struct returns_task<true, F, Pre...>
    : std::is_same<std::invoke_result_t<F, Pre..., Args, Kwargs>, Task> {};

template<typename F, typename... A>
Propagation call_sync(F& f, A&&... a) {
    using R = std::invoke_result_t<F&, A...>;
    if constexpr (std::is_same_v<std::decay_t<R>, Propagation>) {
        return std::invoke(f, std::forward<A>(a)...);
    } else {
        // any other return value is ignored
        (void)std::invoke(f, std::forward<A>(a)...);
        return Propagation::Continue;
    }
}

} // namespace detail

// True for coroutine listeners: callables taking (Args, Kwargs) and returning Task
template<typename F, typename... Pre>
inline constexpr bool returns_task_v =
    detail::returns_task<std::is_invocable_v<F, Pre..., Args, Kwargs>, F, Pre...>::value;

// Listener - non-owning reference to a subscriber callback.
//
// Forms:
//   Listener(&free_function)
//   Listener(shared_owner, &Owner::method)        dies with the owner
//   Listener(weak_owner, "tag", callable)         dies with the owner
//   Listener("tag", callable)                     never dies
//
// Synchronous callbacks take (const Args&, const Kwargs&) and return void or
// Propagation. Coroutine callbacks take (Args, Kwargs) by value and return Task.
class Listener {
public:
    template<typename R, typename... P>
    Listener(R (*fn)(P...)) : _label("function") {
        using Fn = R (*)(P...);
        _key = {nullptr, detail::pointer_token(fn)};
        if constexpr (returns_task_v<Fn>) {
            _async = [fn](void*, Args args, Kwargs kwargs) {
                return fn(std::move(args), std::move(kwargs));
            };
        } else {
            static_assert(std::is_invocable_v<Fn, const Args&, const Kwargs&>,
                          "listener must accept (const Args&, const Kwargs&)");
            _sync = [fn](void*, const Args& args, const Kwargs& kwargs) {
                return detail::call_sync(fn, args, kwargs);
            };
        }
    }

    template<typename T, typename M>
    Listener(const std::shared_ptr<T>& owner, M T::* method)
        : _owner(owner), _tracks_owner(true), _label("method") {
        static_assert(std::is_member_function_pointer_v<M T::*>, "expected a member function");
        using Mp = M T::*;
        _key = {identity_of(owner.get()), detail::pointer_token(method)};
        if constexpr (returns_task_v<Mp, T*>) {
            _async = [method](void* self, Args args, Kwargs kwargs) {
                return std::invoke(method, static_cast<T*>(self), std::move(args), std::move(kwargs));
            };
        } else {
            static_assert(std::is_invocable_v<Mp, T*, const Args&, const Kwargs&>,
                          "listener method must accept (const Args&, const Kwargs&)");
            _sync = [method](void* self, const Args& args, const Kwargs& kwargs) {
                return detail::call_sync(method, static_cast<T*>(self), args, kwargs);
            };
        }
    }

    template<typename T, typename F>
    Listener(const std::weak_ptr<T>& owner, std::string tag, F fn)
        : _owner(owner), _tracks_owner(true), _label("tag:" + tag) {
        _key = {identity_of(owner.lock().get()), "tag:" + tag};
        _install(std::move(fn));
    }

    template<typename T, typename F>
    Listener(const std::shared_ptr<T>& owner, std::string tag, F fn)
        : Listener(std::weak_ptr<T>(owner), std::move(tag), std::move(fn)) {}

    template<typename F>
    Listener(std::string tag, F fn) : _label("tag:" + tag) {
        _key = {nullptr, "tag:" + tag};
        _install(std::move(fn));
    }

    const ListenerKey& key() const { return _key; }
    const std::string& label() const { return _label; }

    bool is_alive() const { return !_tracks_owner || !_owner.expired(); }
    bool is_async() const { return static_cast<bool>(_async); }

    bool same_as(const Listener& other) const { return _key == other._key; }
    bool owner_is(const void* identity) const { return identity && _key.owner == identity; }

    // Synchronous call; a dead or coroutine listener does nothing
    Propagation invoke(const Args& args, const Kwargs& kwargs) const {
        if (!_sync) return Propagation::Continue;
        std::shared_ptr<void> owner;
        if (_tracks_owner) {
            owner = _owner.lock();
            if (!owner) return Propagation::Continue;
        }
        return _sync(owner.get(), args, kwargs);
    }

    // Create the coroutine for one emission. The task keeps the owner
    // alive until it finishes. Invalid Task when dead or not a coroutine.
    Task start(Args args, Kwargs kwargs) const {
        if (!_async) return Task();
        std::shared_ptr<void> owner;
        if (_tracks_owner) {
            owner = _owner.lock();
            if (!owner) return Task();
        }
        Task task = _async(owner.get(), std::move(args), std::move(kwargs));
        if (owner) task.anchor(std::move(owner));
        return task;
    }

private:
    template<typename F>
    void _install(F fn) {
        if constexpr (returns_task_v<F&>) {
            // Coroutine lambdas reference their captures from the frame, so
            // each task gets its own copy of the closure
            _async = [fn = std::move(fn)](void*, Args args, Kwargs kwargs) {
                auto closure = std::make_shared<F>(fn);
                Task task = (*closure)(std::move(args), std::move(kwargs));
                task.anchor(closure);
                return task;
            };
        } else {
            static_assert(std::is_invocable_v<F&, const Args&, const Kwargs&>,
                          "listener must accept (const Args&, const Kwargs&)");
            _sync = [fn = std::move(fn)](void*, const Args& args, const Kwargs& kwargs) mutable {
                return detail::call_sync(fn, args, kwargs);
            };
        }
    }

    ListenerKey _key;
    std::weak_ptr<void> _owner;
    bool _tracks_owner = false;
    std::string _label;
    std::function<Propagation(void*, const Args&, const Kwargs&)> _sync;
    std::function<Task(void*, Args, Kwargs)> _async;
};

} // namespace ydispatch
