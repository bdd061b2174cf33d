#include "observable.hpp"
#include "dispatcher.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <utility>

namespace ydispatch {

// ---------------------------------------------------------------------------
// Observable
// ---------------------------------------------------------------------------

bool Observable::attached() const {
    auto root = _root();
    return root->_owner != nullptr && root->_property != nullptr;
}

void Observable::detach() {
    _owner = nullptr;
    _property = nullptr;
    _parent.reset();
}

void Observable::_bind_root(Dispatcher* owner, const PropertyBase* property) {
    _owner = owner;
    _property = property;
    _parent.reset();
}

std::shared_ptr<const Observable> Observable::_root() const {
    std::shared_ptr<const Observable> node = shared_from_this();
    while (auto parent = node->_parent.lock()) {
        node = parent;
    }
    return node;
}

void Observable::_notify() {
    auto root = _root();
    if (!root->_owner || !root->_property) {
        return;
    }
    root->_owner->_container_changed(*root->_property);
}

Value Observable::_adopt(const Value& value) {
    std::shared_ptr<Observable> child;
    Value adopted;
    if (auto list = std::any_cast<List>(&value)) {
        auto created = ObservableList::create(*list);
        child = created;
        adopted = created;
    } else if (auto dict = std::any_cast<Dict>(&value)) {
        auto created = ObservableDict::create(*dict);
        child = created;
        adopted = created;
    } else if (auto list_ptr = std::any_cast<ObservableListPtr>(&value); list_ptr && *list_ptr) {
        auto created = ObservableList::create((*list_ptr)->to_list());
        child = created;
        adopted = created;
    } else if (auto dict_ptr = std::any_cast<ObservableDictPtr>(&value); dict_ptr && *dict_ptr) {
        auto created = ObservableDict::create((*dict_ptr)->to_dict());
        child = created;
        adopted = created;
    } else {
        return value;
    }
    child->_parent = weak_from_this();
    return adopted;
}

void Observable::_release(const Value& value) {
    if (auto list = std::any_cast<ObservableListPtr>(&value); list && *list) {
        (*list)->detach();
    } else if (auto dict = std::any_cast<ObservableDictPtr>(&value); dict && *dict) {
        (*dict)->detach();
    }
}

Value Observable::_to_raw(const Value& value) {
    if (auto list = std::any_cast<ObservableListPtr>(&value); list && *list) {
        return (*list)->to_list();
    }
    if (auto dict = std::any_cast<ObservableDictPtr>(&value); dict && *dict) {
        return (*dict)->to_dict();
    }
    return value;
}

// ---------------------------------------------------------------------------
// ObservableList
// ---------------------------------------------------------------------------

ObservableListPtr ObservableList::create(const List& items) {
    auto list = std::shared_ptr<ObservableList>(new ObservableList());
    list->_items.reserve(items.size());
    for (const auto& item : items) {
        list->_items.push_back(list->_adopt(item));
    }
    return list;
}

std::optional<std::size_t> ObservableList::_normalize(std::ptrdiff_t index) const {
    auto size = static_cast<std::ptrdiff_t>(_items.size());
    if (index < 0) {
        index += size;
    }
    if (index < 0 || index >= size) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(index);
}

Result<Value> ObservableList::at(std::ptrdiff_t index) const {
    auto i = _normalize(index);
    if (!i) {
        return Err<Value>(ErrorCode::IndexError, fmt::format("list index {} out of range", index));
    }
    return _items[*i];
}

ObservableListPtr ObservableList::list_at(std::ptrdiff_t index) const {
    auto i = _normalize(index);
    if (!i) return nullptr;
    auto p = std::any_cast<ObservableListPtr>(&_items[*i]);
    return p ? *p : nullptr;
}

ObservableDictPtr ObservableList::dict_at(std::ptrdiff_t index) const {
    auto i = _normalize(index);
    if (!i) return nullptr;
    auto p = std::any_cast<ObservableDictPtr>(&_items[*i]);
    return p ? *p : nullptr;
}

List ObservableList::to_list() const {
    List out;
    out.reserve(_items.size());
    for (const auto& item : _items) {
        out.push_back(_to_raw(item));
    }
    return out;
}

Result<void> ObservableList::set(std::ptrdiff_t index, const Value& value) {
    auto i = _normalize(index);
    if (!i) {
        return Err<void>(ErrorCode::IndexError, fmt::format("list assignment index {} out of range", index));
    }
    // value may alias the slot it replaces
    Value adopted = _adopt(value);
    std::swap(_items[*i], adopted);
    _release(adopted);
    _notify();
    return Ok();
}

Result<void> ObservableList::erase(std::ptrdiff_t index) {
    auto i = _normalize(index);
    if (!i) {
        return Err<void>(ErrorCode::IndexError, fmt::format("list index {} out of range", index));
    }
    _release(_items[*i]);
    _items.erase(_items.begin() + static_cast<std::ptrdiff_t>(*i));
    _notify();
    return Ok();
}

void ObservableList::insert(std::ptrdiff_t index, const Value& value) {
    auto size = static_cast<std::ptrdiff_t>(_items.size());
    if (index < 0) {
        index += size;
    }
    index = std::clamp<std::ptrdiff_t>(index, 0, size);
    _items.insert(_items.begin() + index, _adopt(value));
    _notify();
}

void ObservableList::append(const Value& value) {
    _items.push_back(_adopt(value));
    _notify();
}

void ObservableList::extend(const List& values) {
    List adopted;
    adopted.reserve(values.size());
    for (const auto& value : values) {
        adopted.push_back(_adopt(value));
    }
    for (auto& value : adopted) {
        _items.push_back(std::move(value));
    }
    _notify();
}

Result<void> ObservableList::remove(const Value& value) {
    auto it = std::find_if(_items.begin(), _items.end(),
                           [&](const Value& item) { return value_equals(item, value); });
    if (it == _items.end()) {
        return Err<void>(ErrorCode::ValueNotFound,
                         fmt::format("list.remove(x): {} not in list", value_to_string(value)));
    }
    _release(*it);
    _items.erase(it);
    _notify();
    return Ok();
}

Result<Value> ObservableList::pop(std::ptrdiff_t index) {
    if (_items.empty()) {
        return Err<Value>(ErrorCode::IndexError, "pop from empty list");
    }
    auto i = _normalize(index);
    if (!i) {
        return Err<Value>(ErrorCode::IndexError, fmt::format("pop index {} out of range", index));
    }
    Value out = _to_raw(_items[*i]);
    _release(_items[*i]);
    _items.erase(_items.begin() + static_cast<std::ptrdiff_t>(*i));
    _notify();
    return out;
}

void ObservableList::clear() {
    for (const auto& item : _items) {
        _release(item);
    }
    _items.clear();
    _notify();
}

// ---------------------------------------------------------------------------
// ObservableDict
// ---------------------------------------------------------------------------

ObservableDictPtr ObservableDict::create(const Dict& items) {
    auto dict = std::shared_ptr<ObservableDict>(new ObservableDict());
    for (const auto& [key, item] : items) {
        dict->_items.emplace(key, dict->_adopt(item));
    }
    return dict;
}

Result<Value> ObservableDict::get(const std::string& key) const {
    auto it = _items.find(key);
    if (it == _items.end()) {
        return Err<Value>(ErrorCode::KeyError, fmt::format("key '{}' not found", key));
    }
    return it->second;
}

Value ObservableDict::get(const std::string& key, const Value& fallback) const {
    auto it = _items.find(key);
    return it == _items.end() ? fallback : it->second;
}

ObservableListPtr ObservableDict::list_at(const std::string& key) const {
    auto it = _items.find(key);
    if (it == _items.end()) return nullptr;
    auto p = std::any_cast<ObservableListPtr>(&it->second);
    return p ? *p : nullptr;
}

ObservableDictPtr ObservableDict::dict_at(const std::string& key) const {
    auto it = _items.find(key);
    if (it == _items.end()) return nullptr;
    auto p = std::any_cast<ObservableDictPtr>(&it->second);
    return p ? *p : nullptr;
}

std::vector<std::string> ObservableDict::keys() const {
    std::vector<std::string> out;
    out.reserve(_items.size());
    for (const auto& [key, item] : _items) {
        out.push_back(key);
    }
    return out;
}

Dict ObservableDict::to_dict() const {
    Dict out;
    for (const auto& [key, item] : _items) {
        out.emplace(key, _to_raw(item));
    }
    return out;
}

void ObservableDict::set(const std::string& key, const Value& value) {
    Value adopted = _adopt(value);
    auto it = _items.find(key);
    if (it == _items.end()) {
        _items.emplace(key, std::move(adopted));
    } else {
        std::swap(it->second, adopted);
        _release(adopted);
    }
    _notify();
}

Result<void> ObservableDict::erase(const std::string& key) {
    auto it = _items.find(key);
    if (it == _items.end()) {
        return Err<void>(ErrorCode::KeyError, fmt::format("key '{}' not found", key));
    }
    _release(it->second);
    _items.erase(it);
    _notify();
    return Ok();
}

Result<Value> ObservableDict::pop(const std::string& key) {
    auto it = _items.find(key);
    if (it == _items.end()) {
        return Err<Value>(ErrorCode::KeyError, fmt::format("key '{}' not found", key));
    }
    Value out = _to_raw(it->second);
    _release(it->second);
    _items.erase(it);
    _notify();
    return out;
}

void ObservableDict::update(const Dict& values) {
    Dict adopted;
    for (const auto& [key, value] : values) {
        adopted.emplace(key, _adopt(value));
    }
    for (auto& [key, value] : adopted) {
        auto it = _items.find(key);
        if (it == _items.end()) {
            _items.emplace(key, std::move(value));
        } else {
            std::swap(it->second, value);
            _release(value);
        }
    }
    _notify();
}

Value ObservableDict::setdefault(const std::string& key, const Value& value) {
    auto it = _items.find(key);
    if (it == _items.end()) {
        it = _items.emplace(key, _adopt(value)).first;
    }
    _notify();
    return it->second;
}

void ObservableDict::clear() {
    for (const auto& [key, item] : _items) {
        _release(item);
    }
    _items.clear();
    _notify();
}

} // namespace ydispatch
