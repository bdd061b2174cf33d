#include "global.hpp"
#include "error_buffer.hpp"
#include "loop.hpp"
#include <ytrace/ytrace.hpp>
#include <mutex>

namespace ydispatch {

namespace {

std::mutex g_global_mutex;

std::shared_ptr<GlobalDispatcher>& global_instance() {
    static std::shared_ptr<GlobalDispatcher> instance;
    return instance;
}

// GlobalDispatcher keeps the default Object::init, which cannot fail
std::shared_ptr<GlobalDispatcher> make_global() {
    return GlobalDispatcher::create().value();
}

} // namespace

GlobalDispatcher::GlobalDispatcher() : Dispatcher(Manifest::empty("GlobalDispatcher")) {}

Result<std::shared_ptr<GlobalDispatcher>> GlobalDispatcher::create() {
    auto dispatcher = std::shared_ptr<GlobalDispatcher>(new GlobalDispatcher());
    if (auto res = dispatcher->init(); !res) {
        return Err<std::shared_ptr<GlobalDispatcher>>("GlobalDispatcher::create: init failed", res);
    }
    return dispatcher;
}

void GlobalDispatcher::cache_receiver(const std::string& name, Listener listener) {
    ydebug("GlobalDispatcher: caching {} until '{}' is registered", listener.label(), name);
    _cached[name].push_back(std::move(listener));
}

std::size_t GlobalDispatcher::cached_receivers(const std::string& name) const {
    auto it = _cached.find(name);
    return it == _cached.end() ? 0 : it->second.size();
}

void GlobalDispatcher::_on_events_registered(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        auto it = _cached.find(name);
        if (it == _cached.end()) {
            continue;
        }
        auto listeners = std::move(it->second);
        _cached.erase(it);
        for (auto& listener : listeners) {
            if (auto res = bind(name, std::move(listener)); !res) {
                add_error(Error("GlobalDispatcher: cached receiver for '" + name + "' could not be bound",
                                res.error()), spdlog::level::warn);
            }
        }
    }
}

GlobalDispatcher& global_dispatcher() {
    std::lock_guard<std::mutex> lock(g_global_mutex);
    auto& instance = global_instance();
    if (!instance) {
        instance = make_global();
    }
    return *instance;
}

void reset_global_dispatcher() {
    std::lock_guard<std::mutex> lock(g_global_mutex);
    global_instance() = make_global();
}

Result<void> register_event(const std::string& name) {
    return global_dispatcher().register_event(name);
}

Result<void> register_events(const std::vector<std::string>& names) {
    return global_dispatcher().register_events(names);
}

Result<Propagation> emit(const std::string& name, Args args, Kwargs kwargs) {
    return global_dispatcher().emit(name, std::move(args), std::move(kwargs));
}

Result<Event*> get_dispatcher_event(const std::string& name) {
    return global_dispatcher().get_dispatcher_event(name);
}

Result<void> receiver(const std::vector<std::string>& names, Listener listener, ReceiverOptions options) {
    auto& dispatcher = global_dispatcher();

    std::vector<std::string> known;
    std::vector<std::string> missing;
    for (const auto& name : names) {
        (dispatcher.has_event(name) ? known : missing).push_back(name);
    }
    if (!missing.empty() && !options.auto_register && !options.cache) {
        return Err<void>(ErrorCode::DoesNotExist, "receiver: no event named '" + missing.front() + "'");
    }
    bool binds_now = !known.empty() || (!missing.empty() && options.auto_register);
    if (listener.is_async() && binds_now && !Loop::current()) {
        return Err<void>(ErrorCode::BindingContext, "Coroutine function given without event loop");
    }

    if (!missing.empty() && options.auto_register) {
        if (auto res = dispatcher.register_events(missing); !res) {
            return Err<void>("receiver: auto-register failed", res);
        }
        known.insert(known.end(), missing.begin(), missing.end());
        missing.clear();
    }

    Bindings bindings;
    for (const auto& name : known) {
        bindings.emplace_back(name, listener);
    }
    if (!bindings.empty()) {
        if (auto res = dispatcher.bind(bindings); !res) {
            return Err<void>("receiver: bind failed", res);
        }
    }
    for (const auto& name : missing) {
        dispatcher.cache_receiver(name, listener);
    }
    return Ok();
}

Result<void> receiver(const std::string& name, Listener listener, ReceiverOptions options) {
    return receiver(std::vector<std::string>{name}, std::move(listener), options);
}

} // namespace ydispatch
