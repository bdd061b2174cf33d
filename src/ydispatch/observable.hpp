#pragma once

#include "result.hpp"
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ydispatch {

class Dispatcher;
class PropertyBase;

// Observable - container value that reports in-place mutation.
// A nested observable links to its enclosing container, the root links to
// the (dispatcher, property) pair that holds it. Both links are lookup-only.
class Observable : public std::enable_shared_from_this<Observable> {
public:
    virtual ~Observable() = default;

    // Whether mutations currently reach a property
    bool attached() const;

    // Stop propagating: forget the parent or owning property
    void detach();

protected:
    // Walk up to the root and have its property emit
    void _notify();

    // Nested List/Dict (raw or observable) become fresh observables
    // parented to this one; other values pass through
    Value _adopt(const Value& value);

    // Detach a value that left this container
    static void _release(const Value& value);

    static Value _to_raw(const Value& value);

private:
    friend class Dispatcher;

    void _bind_root(Dispatcher* owner, const PropertyBase* property);
    std::shared_ptr<const Observable> _root() const;

    Dispatcher* _owner = nullptr;
    const PropertyBase* _property = nullptr;
    std::weak_ptr<Observable> _parent;
};

class ObservableList : public Observable {
public:
    static ObservableListPtr create(const List& items = {});

    std::size_t size() const { return _items.size(); }
    bool empty() const { return _items.empty(); }
    const List& items() const { return _items; }
    List::const_iterator begin() const { return _items.begin(); }
    List::const_iterator end() const { return _items.end(); }

    // Negative indices count from the end
    Result<Value> at(std::ptrdiff_t index) const;
    ObservableListPtr list_at(std::ptrdiff_t index) const;
    ObservableDictPtr dict_at(std::ptrdiff_t index) const;

    // Deep copy into plain containers
    List to_list() const;

    Result<void> set(std::ptrdiff_t index, const Value& value);
    Result<void> erase(std::ptrdiff_t index);
    // Out of range indices clamp to the ends
    void insert(std::ptrdiff_t index, const Value& value);
    void append(const Value& value);
    void extend(const List& values);
    // Removes the first equal element
    Result<void> remove(const Value& value);
    Result<Value> pop(std::ptrdiff_t index = -1);
    void clear();

private:
    ObservableList() = default;

    std::optional<std::size_t> _normalize(std::ptrdiff_t index) const;

    List _items;
};

class ObservableDict : public Observable {
public:
    static ObservableDictPtr create(const Dict& items = {});

    std::size_t size() const { return _items.size(); }
    bool empty() const { return _items.empty(); }
    const Dict& items() const { return _items; }
    Dict::const_iterator begin() const { return _items.begin(); }
    Dict::const_iterator end() const { return _items.end(); }

    bool contains(const std::string& key) const { return _items.count(key) > 0; }
    Result<Value> get(const std::string& key) const;
    Value get(const std::string& key, const Value& fallback) const;
    ObservableListPtr list_at(const std::string& key) const;
    ObservableDictPtr dict_at(const std::string& key) const;
    std::vector<std::string> keys() const;

    // Deep copy into plain containers
    Dict to_dict() const;

    void set(const std::string& key, const Value& value);
    Result<void> erase(const std::string& key);
    Result<Value> pop(const std::string& key);
    void update(const Dict& values);
    // Inserts value when key is missing, returns the stored value
    Value setdefault(const std::string& key, const Value& value);
    void clear();

private:
    ObservableDict() = default;

    Dict _items;
};

} // namespace ydispatch
