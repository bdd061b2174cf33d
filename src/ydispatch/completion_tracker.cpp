#include "completion_tracker.hpp"
#include "dispatcher.hpp"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <optional>

namespace ydispatch {

namespace {

Task await_handles(std::vector<TaskHandle> handles) {
    std::optional<Error> first_error;
    for (const auto& handle : handles) {
        auto res = co_await handle;
        if (!res && !first_error) {
            first_error = res.error();
        }
    }
    if (first_error) {
        co_return std::unexpected(std::move(*first_error));
    }
    co_return Ok();
}

Task fail_with(Error error) {
    co_return std::unexpected(std::move(error));
}

std::size_t count_pending(const std::vector<TaskHandle>& handles) {
    return static_cast<std::size_t>(std::count_if(handles.begin(), handles.end(),
        [](const TaskHandle& handle) { return !handle.done(); }));
}

} // namespace

Result<std::unique_ptr<CompletionTracker>> CompletionTracker::open(Dispatcher& dispatcher,
                                                                   const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (!dispatcher.has_event(name)) {
            return Err<std::unique_ptr<CompletionTracker>>(ErrorCode::DoesNotExist,
                "CompletionTracker::open: no event named '" + name + "'");
        }
    }
    std::unique_ptr<CompletionTracker> tracker(
        new CompletionTracker(dispatcher, std::set<std::string>(names.begin(), names.end())));
    dispatcher._attach_tracker(tracker.get());
    ydebug("CompletionTracker::open: {} tracking {} event(s)", dispatcher.uid(), names.size());
    return tracker;
}

CompletionTracker::~CompletionTracker() {
    close();
}

void CompletionTracker::close() {
    if (_dispatcher) {
        _dispatcher->_detach_tracker(this);
        _dispatcher = nullptr;
    }
}

void CompletionTracker::_retain(const std::string& name, const std::vector<TaskHandle>& tasks) {
    auto& retained = _tasks[name];
    // Failed tasks stay so that waiting still reports them
    std::erase_if(retained, [](const TaskHandle& handle) {
        return handle.done() && handle.result().has_value();
    });
    retained.insert(retained.end(), tasks.begin(), tasks.end());
}

std::size_t CompletionTracker::pending(const std::string& name) const {
    auto it = _tasks.find(name);
    return it == _tasks.end() ? 0 : count_pending(it->second);
}

std::size_t CompletionTracker::pending() const {
    std::size_t total = 0;
    for (const auto& [name, handles] : _tasks) {
        total += count_pending(handles);
    }
    return total;
}

std::vector<TaskHandle> CompletionTracker::tasks(const std::string& name) const {
    auto it = _tasks.find(name);
    return it == _tasks.end() ? std::vector<TaskHandle>{} : it->second;
}

Task CompletionTracker::wait(const std::string& name) const {
    if (!covers(name)) {
        return fail_with(Error(ErrorCode::DoesNotExist,
                               "CompletionTracker::wait: '" + name + "' is not tracked"));
    }
    return await_handles(tasks(name));
}

Task CompletionTracker::wait_all() const {
    std::vector<TaskHandle> handles;
    for (const auto& [name, retained] : _tasks) {
        handles.insert(handles.end(), retained.begin(), retained.end());
    }
    return await_handles(std::move(handles));
}

} // namespace ydispatch
