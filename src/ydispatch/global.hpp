#pragma once

#include "dispatcher.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ydispatch {

// Process-wide dispatcher with no declared events. Callbacks cached by
// receiver() are bound as soon as their event gets registered.
class GlobalDispatcher : public Dispatcher {
public:
    static Result<std::shared_ptr<GlobalDispatcher>> create();

    const char* type_name() const override { return "GlobalDispatcher"; }

    void cache_receiver(const std::string& name, Listener listener);
    std::size_t cached_receivers(const std::string& name) const;

protected:
    void _on_events_registered(const std::vector<std::string>& names) override;

private:
    GlobalDispatcher();

    std::map<std::string, std::vector<Listener>> _cached;
};

struct ReceiverOptions {
    // Hold the callback until the event is registered
    bool cache = false;
    // Register missing events instead of failing
    bool auto_register = false;
};

GlobalDispatcher& global_dispatcher();

// Replace the global dispatcher with a fresh one (tests)
void reset_global_dispatcher();

Result<void> register_event(const std::string& name);
Result<void> register_events(const std::vector<std::string>& names);
Result<Propagation> emit(const std::string& name, Args args = {}, Kwargs kwargs = {});
Result<Event*> get_dispatcher_event(const std::string& name);

// Bind listener to events of the global dispatcher
Result<void> receiver(const std::vector<std::string>& names, Listener listener, ReceiverOptions options = {});
Result<void> receiver(const std::string& name, Listener listener, ReceiverOptions options = {});

} // namespace ydispatch
