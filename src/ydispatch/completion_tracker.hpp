#pragma once

#include "result.hpp"
#include "task.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace ydispatch {

class Dispatcher;

// CompletionTracker - while open, keeps the tasks scheduled by emissions
// of the tracked names so they can be awaited together.
// Without an open tracker scheduled tasks are fire-and-forget.
class CompletionTracker {
public:
    static Result<std::unique_ptr<CompletionTracker>> open(Dispatcher& dispatcher,
                                                           const std::vector<std::string>& names);

    ~CompletionTracker();

    CompletionTracker(const CompletionTracker&) = delete;
    CompletionTracker& operator=(const CompletionTracker&) = delete;

    bool is_open() const { return _dispatcher != nullptr; }
    bool covers(const std::string& name) const { return _names.count(name) > 0; }
    const std::set<std::string>& names() const { return _names; }

    // Retained tasks not finished yet
    std::size_t pending(const std::string& name) const;
    std::size_t pending() const;

    // Retained tasks. Successful ones are dropped as new tasks arrive.
    std::vector<TaskHandle> tasks(const std::string& name) const;

    // Completes once every task retained for name so far has finished.
    // Yields the first task error, if any.
    Task wait(const std::string& name) const;
    Task wait_all() const;

    // Stop retaining. Already retained tasks stay awaitable.
    void close();

private:
    friend class Dispatcher;

    CompletionTracker(Dispatcher& dispatcher, std::set<std::string> names)
        : _dispatcher(&dispatcher), _names(std::move(names)) {}

    void _retain(const std::string& name, const std::vector<TaskHandle>& tasks);
    void _dispatcher_gone() { _dispatcher = nullptr; }

    Dispatcher* _dispatcher;
    std::set<std::string> _names;
    std::map<std::string, std::vector<TaskHandle>> _tasks;
};

} // namespace ydispatch
