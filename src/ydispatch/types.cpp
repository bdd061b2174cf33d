#include "types.hpp"
#include "observable.hpp"
#include <sstream>
#include <algorithm>
#include <limits>
#include <type_traits>

namespace ydispatch {

namespace {

template<typename T>
bool take_integer(const Value& v, std::optional<std::int64_t>& out) {
    if (const T* p = std::any_cast<T>(&v)) {
        if constexpr (std::is_unsigned_v<T>) {
            if (*p > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
                return true;
            }
        }
        out = static_cast<std::int64_t>(*p);
        return true;
    }
    return false;
}

template<typename T>
bool take_floating(const Value& v, std::optional<double>& out) {
    if (const T* p = std::any_cast<T>(&v)) {
        out = static_cast<double>(*p);
        return true;
    }
    return false;
}

template<typename... Ts>
std::optional<std::int64_t> first_integer(const Value& v) {
    std::optional<std::int64_t> out;
    (void)(take_integer<Ts>(v, out) || ...);
    return out;
}

template<typename... Ts>
std::optional<double> first_floating(const Value& v) {
    std::optional<double> out;
    (void)(take_floating<Ts>(v, out) || ...);
    return out;
}

template<typename T>
const void* raw_address(const T& p) {
    if constexpr (requires { p.get(); }) {
        return static_cast<const void*>(p.get());
    } else {
        return static_cast<const void*>(p);
    }
}

template<typename T>
bool take_address(const Value& v, std::optional<const void*>& out) {
    if (const T* p = std::any_cast<T>(&v)) {
        out = raw_address(*p);
        return true;
    }
    return false;
}

// Pointer payloads compare by address; both sides must hold the same type
template<typename... Ts>
std::optional<const void*> pointer_address(const Value& v) {
    std::optional<const void*> out;
    (void)(take_address<Ts>(v, out) || ...);
    return out;
}

std::optional<const void*> address_of(const Value& v) {
    return pointer_address<void*, const void*, Dispatcher*, const Dispatcher*,
                           Observable*, const Observable*, PropertyBase*, const PropertyBase*,
                           std::shared_ptr<Dispatcher>, std::shared_ptr<const Dispatcher>,
                           std::shared_ptr<void>, std::shared_ptr<const void>>(v);
}

const List* list_items(const Value& v) {
    if (auto p = std::any_cast<List>(&v)) return p;
    if (auto p = std::any_cast<ObservableListPtr>(&v)) return *p ? &(*p)->items() : nullptr;
    return nullptr;
}

const Dict* dict_items(const Value& v) {
    if (auto p = std::any_cast<Dict>(&v)) return p;
    if (auto p = std::any_cast<ObservableDictPtr>(&v)) return *p ? &(*p)->items() : nullptr;
    return nullptr;
}

} // namespace

std::optional<std::int64_t> as_integer(const Value& v) {
    return first_integer<int, long, long long, unsigned, unsigned long,
                         unsigned long long, short, unsigned short>(v);
}

std::optional<double> as_number(const Value& v) {
    if (auto i = as_integer(v)) {
        return static_cast<double>(*i);
    }
    return first_floating<double, float, long double, unsigned long long, unsigned long>(v);
}

bool is_integer_overflow(const Value& v) {
    auto too_large = [](auto n) {
        return n > static_cast<decltype(n)>(std::numeric_limits<std::int64_t>::max());
    };
    if (auto p = std::any_cast<unsigned long long>(&v)) return too_large(*p);
    if (auto p = std::any_cast<unsigned long>(&v)) return too_large(*p);
    return false;
}

std::optional<std::string> as_string(const Value& v) {
    if (auto p = std::any_cast<std::string>(&v)) return *p;
    if (auto p = std::any_cast<const char*>(&v)) return *p ? std::string(*p) : std::string();
    if (auto p = std::any_cast<std::string_view>(&v)) return std::string(*p);
    return std::nullopt;
}

bool value_equals(const Value& a, const Value& b) {
    if (!a.has_value() || !b.has_value()) {
        return !a.has_value() && !b.has_value();
    }

    auto ab = std::any_cast<bool>(&a);
    auto bb = std::any_cast<bool>(&b);
    if (ab || bb) {
        return ab && bb && *ab == *bb;
    }

    auto ai = as_integer(a);
    auto bi = as_integer(b);
    if (ai && bi) {
        return *ai == *bi;
    }
    auto an = as_number(a);
    auto bn = as_number(b);
    if (an || bn) {
        return an && bn && *an == *bn;
    }

    auto as = as_string(a);
    auto bs = as_string(b);
    if (as || bs) {
        return as && bs && *as == *bs;
    }

    auto al = list_items(a);
    auto bl = list_items(b);
    if (al || bl) {
        if (!al || !bl || al->size() != bl->size()) return false;
        for (std::size_t i = 0; i < al->size(); ++i) {
            if (!value_equals((*al)[i], (*bl)[i])) return false;
        }
        return true;
    }

    auto ad = dict_items(a);
    auto bd = dict_items(b);
    if (ad || bd) {
        if (!ad || !bd || ad->size() != bd->size()) return false;
        auto it_a = ad->begin();
        auto it_b = bd->begin();
        for (; it_a != ad->end(); ++it_a, ++it_b) {
            if (it_a->first != it_b->first) return false;
            if (!value_equals(it_a->second, it_b->second)) return false;
        }
        return true;
    }

    if (a.type() == b.type()) {
        auto pa = address_of(a);
        auto pb = address_of(b);
        if (pa && pb) {
            return *pa == *pb;
        }
    }

    // Unknown payloads: never equal, so assignment always counts as a change
    return false;
}

std::string value_type_name(const Value& v) {
    if (!v.has_value()) return "None";
    if (v.type() == typeid(bool)) return "bool";
    if (as_integer(v) || is_integer_overflow(v)) return "int";
    if (as_number(v)) return "float";
    if (as_string(v)) return "str";
    if (list_items(v)) return "list";
    if (dict_items(v)) return "dict";
    return v.type().name();
}

std::string value_to_string(const Value& v) {
    if (!v.has_value()) return "None";
    if (auto p = std::any_cast<bool>(&v)) return *p ? "true" : "false";
    if (auto i = as_integer(v)) return std::to_string(*i);
    if (auto d = as_number(v)) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    if (auto s = as_string(v)) return "'" + *s + "'";
    if (auto l = list_items(v)) {
        std::string out = "[";
        for (std::size_t i = 0; i < l->size(); ++i) {
            if (i > 0) out += ", ";
            out += value_to_string((*l)[i]);
        }
        return out + "]";
    }
    if (auto d = dict_items(v)) {
        std::string out = "{";
        bool first = true;
        for (const auto& [key, item] : *d) {
            if (!first) out += ", ";
            first = false;
            out += "'" + key + "': " + value_to_string(item);
        }
        return out + "}";
    }
    return std::string("<") + v.type().name() + ">";
}

DataPath::DataPath(const std::string& path) {
    *this = parse(path);
}

DataPath::DataPath(const std::vector<std::string>& components)
    : path_(components), is_absolute_(true) {}

std::string DataPath::filename() const {
    return path_.empty() ? "" : path_.back();
}

DataPath DataPath::dirname() const {
    if (path_.empty()) return *this;
    DataPath result;
    result.path_ = std::vector<std::string>(path_.begin(), path_.end() - 1);
    result.is_absolute_ = is_absolute_;
    return result;
}

DataPath DataPath::operator/(const std::string& component) const {
    DataPath result = *this;
    if (!component.empty() && component != ".") {
        if (component == "..") {
            if (!result.path_.empty()) {
                result.path_.pop_back();
            }
        } else {
            result.path_.push_back(component);
        }
    }
    return result;
}

bool DataPath::starts_with(const DataPath& other) const {
    if (other.path_.size() > path_.size()) return false;
    return std::equal(other.path_.begin(), other.path_.end(), path_.begin());
}

bool DataPath::operator==(const DataPath& other) const {
    return path_ == other.path_ && is_absolute_ == other.is_absolute_;
}

std::string DataPath::to_string() const {
    std::ostringstream oss;
    if (is_absolute_) oss << "/";
    for (std::size_t i = 0; i < path_.size(); ++i) {
        if (i > 0) oss << "/";
        oss << path_[i];
    }
    return oss.str();
}

DataPath DataPath::parse(const std::string& path_str) {
    DataPath result;

    if (path_str.empty()) {
        return result;
    }

    std::string s = path_str;
    if (s[0] == '/') {
        result.is_absolute_ = true;
        s = s.substr(1);
    }

    std::istringstream iss(s);
    std::string component;
    while (std::getline(iss, component, '/')) {
        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            if (!result.path_.empty()) {
                result.path_.pop_back();
            }
        } else {
            result.path_.push_back(component);
        }
    }

    return result;
}

} // namespace ydispatch
