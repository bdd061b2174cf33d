#pragma once

#include "result.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <any>
#include <optional>
#include <memory>
#include <cstdint>
#include <type_traits>

namespace ydispatch {

class ObservableList;
class ObservableDict;

// Value type for dynamic data; an empty Value stands for "None"
using Value = std::any;
using Dict = std::map<std::string, Value>;
using List = std::vector<Value>;

// Emission payload
using Args = List;
using Kwargs = Dict;

using ObservableListPtr = std::shared_ptr<ObservableList>;
using ObservableDictPtr = std::shared_ptr<ObservableDict>;

// Integral value stored in v (bool excluded)
std::optional<std::int64_t> as_integer(const Value& v);

// Integral or floating value stored in v (bool excluded)
std::optional<double> as_number(const Value& v);

// Unsigned integral value too large for int64_t
bool is_integer_overflow(const Value& v);

// String stored as std::string, const char* or std::string_view
std::optional<std::string> as_string(const Value& v);

// Helper to get value from std::any.
// Arithmetic targets also accept other stored arithmetic types,
// std::string also accepts C strings and string views.
template<typename T>
std::optional<T> get_as(const Value& v) {
    if (const T* p = std::any_cast<T>(&v)) {
        return *p;
    }
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (auto i = as_integer(v)) return static_cast<T>(*i);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (auto d = as_number(v)) return static_cast<T>(*d);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return as_string(v);
    }
    return std::nullopt;
}

inline bool is_none(const Value& v) { return !v.has_value(); }

// Structural equality used as the default property comparator
bool value_equals(const Value& a, const Value& b);

// Short type name for messages: int, float, bool, str, list, dict, None
std::string value_type_name(const Value& v);

// Debug rendering
std::string value_to_string(const Value& v);

// DataPath - hierarchical path for navigating introspection trees
class DataPath {
public:
    DataPath() = default;
    explicit DataPath(const std::string& path);
    explicit DataPath(const std::vector<std::string>& components);

    bool is_root() const { return path_.empty(); }
    bool is_absolute() const { return is_absolute_; }

    const std::vector<std::string>& as_list() const { return path_; }
    std::size_t size() const { return path_.size(); }
    const std::string& operator[](std::size_t i) const { return path_[i]; }
    std::string filename() const;
    DataPath dirname() const;

    DataPath operator/(const std::string& component) const;
    bool starts_with(const DataPath& other) const;

    bool operator==(const DataPath& other) const;
    bool operator!=(const DataPath& other) const { return !(*this == other); }

    std::string to_string() const;

    // Parse from string (handles /, /abs, rel, ../parent)
    static DataPath parse(const std::string& path_str);

    static DataPath root() { return DataPath(); }

private:
    std::vector<std::string> path_;
    bool is_absolute_ = false;
};

// TreeLike - read-only hierarchical view
class TreeLike {
public:
    virtual ~TreeLike() = default;

    virtual Result<std::vector<std::string>> get_children_names(const DataPath& path) = 0;

    virtual Result<Dict> get_metadata(const DataPath& path) = 0;
    virtual Result<std::vector<std::string>> get_metadata_keys(const DataPath& path) = 0;

    // Value access (path's last component is the key)
    virtual Result<Value> get(const DataPath& path) = 0;

    virtual Result<std::string> as_tree(const DataPath& path, int depth = -1) = 0;
};

using TreeLikePtr = std::shared_ptr<TreeLike>;

} // namespace ydispatch
