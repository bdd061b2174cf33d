#include "property.hpp"
#include "observable.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace ydispatch {

namespace {

std::string invalid_type_message(const Value& value) {
    return fmt::format("Type \"{}\" not valid", value_type_name(value));
}

const char* const k_none_not_allowed = "\"None\" not allowed";

// Floats render with a fractional part, e.g. -11.0 or 10.1
std::string float_text(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return fmt::format("{:.1f}", value);
    }
    return fmt::format("{}", value);
}

template<typename T>
std::string range_text(const std::optional<T>& min, const std::optional<T>& max) {
    if (min && max) return fmt::format("{} <= value <= {}", *min, *max);
    if (min) return fmt::format("{} <= value", *min);
    return fmt::format("value <= {}", *max);
}

template<typename T>
bool in_range(T value, const std::optional<T>& min, const std::optional<T>& max) {
    return (!min || value >= *min) && (!max || value <= *max);
}

void add_range_metadata(Dict& meta, const Value& min, const Value& max) {
    if (min.has_value()) meta["min"] = min;
    if (max.has_value()) meta["max"] = max;
}

template<typename T>
Value optional_value(const std::optional<T>& v) {
    return v ? Value(*v) : Value();
}

} // namespace

// ---------------------------------------------------------------------------
// PropertyBase
// ---------------------------------------------------------------------------

bool PropertyBase::equals(const Value& current, const Value& incoming) const {
    if (_comparator) {
        return _comparator(current, incoming);
    }
    return value_equals(current, incoming);
}

Result<Value> PropertyBase::validate(const Value& value) const {
    auto checked = _check(value);
    if (!checked) {
        return checked;
    }
    if (_validator) {
        if (auto res = _validator(*checked); !res) {
            if (is_validation_error(res.error().code())) {
                return std::unexpected(res.error());
            }
            return Err<Value>(ErrorCode::Validation, res.error().message(), res);
        }
    }
    return checked;
}

Dict PropertyBase::metadata() const {
    Dict meta;
    meta["name"] = _name;
    meta["kind"] = std::string(kind());
    meta["default"] = _default;
    meta["doc"] = _doc;
    return meta;
}

Result<void> PropertyBase::_validate_default() {
    // None defaults are accepted even where assigning None is not
    if (is_none(_default)) {
        return Ok();
    }
    auto res = validate(_default);
    if (!res) {
        return Err<void>("default value rejected", res);
    }
    _default = std::move(*res);
    return Ok();
}

// ---------------------------------------------------------------------------
// Property
// ---------------------------------------------------------------------------

Result<PropertyPtr> Property::create(std::string name, PropertyOptions options) {
    auto property = std::shared_ptr<Property>(new Property(std::move(name), std::move(options)));
    if (auto res = property->_validate_default(); !res) {
        return Err<PropertyPtr>("Property::create: invalid default for '" + property->name() + "'", res);
    }
    return PropertyPtr(std::move(property));
}

// ---------------------------------------------------------------------------
// StringProperty
// ---------------------------------------------------------------------------

StringProperty::StringProperty(std::string name, StringPropertyOptions options)
    : PropertyBase(std::move(name), std::move(options.default_value), std::move(options.doc),
                   std::move(options.comparator), std::move(options.validator)),
      _allow_none(options.allow_none) {}

Result<PropertyPtr> StringProperty::create(std::string name, StringPropertyOptions options) {
    auto property = std::shared_ptr<StringProperty>(new StringProperty(std::move(name), std::move(options)));
    if (auto res = property->_validate_default(); !res) {
        return Err<PropertyPtr>("StringProperty::create: invalid default for '" + property->name() + "'", res);
    }
    return PropertyPtr(std::move(property));
}

Result<Value> StringProperty::_check(const Value& value) const {
    if (is_none(value)) {
        if (_allow_none) return Value();
        return Err<Value>(ErrorCode::NoneNotAllowed, k_none_not_allowed);
    }
    if (auto s = as_string(value)) {
        return Value(*s);
    }
    return Err<Value>(ErrorCode::InvalidType, invalid_type_message(value));
}

Dict StringProperty::metadata() const {
    auto meta = PropertyBase::metadata();
    meta["allow-none"] = _allow_none;
    return meta;
}

// ---------------------------------------------------------------------------
// BoolProperty
// ---------------------------------------------------------------------------

BoolProperty::BoolProperty(std::string name, BoolPropertyOptions options)
    : PropertyBase(std::move(name), std::move(options.default_value), std::move(options.doc),
                   std::move(options.comparator), std::move(options.validator)),
      _allow_none(options.allow_none) {}

Result<PropertyPtr> BoolProperty::create(std::string name, BoolPropertyOptions options) {
    auto property = std::shared_ptr<BoolProperty>(new BoolProperty(std::move(name), std::move(options)));
    if (auto res = property->_validate_default(); !res) {
        return Err<PropertyPtr>("BoolProperty::create: invalid default for '" + property->name() + "'", res);
    }
    return PropertyPtr(std::move(property));
}

Result<Value> BoolProperty::_check(const Value& value) const {
    if (is_none(value)) {
        if (_allow_none) return Value();
        return Err<Value>(ErrorCode::NoneNotAllowed, k_none_not_allowed);
    }
    if (auto b = std::any_cast<bool>(&value)) {
        return Value(*b);
    }
    return Err<Value>(ErrorCode::InvalidType, invalid_type_message(value));
}

Dict BoolProperty::metadata() const {
    auto meta = PropertyBase::metadata();
    meta["allow-none"] = _allow_none;
    return meta;
}

// ---------------------------------------------------------------------------
// IntProperty
// ---------------------------------------------------------------------------

IntProperty::IntProperty(std::string name, IntPropertyOptions options)
    : PropertyBase(std::move(name), std::move(options.default_value), std::move(options.doc),
                   std::move(options.comparator), std::move(options.validator)),
      _min(options.min), _max(options.max), _allow_none(options.allow_none) {}

Result<PropertyPtr> IntProperty::create(std::string name, IntPropertyOptions options) {
    if (options.min && options.max && *options.min > *options.max) {
        return Err<PropertyPtr>(ErrorCode::Validation,
            fmt::format("IntProperty::create: '{}' has min {} greater than max {}", name, *options.min, *options.max));
    }
    auto property = std::shared_ptr<IntProperty>(new IntProperty(std::move(name), std::move(options)));
    if (auto res = property->_validate_default(); !res) {
        return Err<PropertyPtr>("IntProperty::create: invalid default for '" + property->name() + "'", res);
    }
    return PropertyPtr(std::move(property));
}

Result<Value> IntProperty::_check(const Value& value) const {
    if (is_none(value)) {
        if (_allow_none) return Value();
        return Err<Value>(ErrorCode::NoneNotAllowed, k_none_not_allowed);
    }
    if (is_integer_overflow(value)) {
        return Err<Value>(ErrorCode::OutOfRange, "Value does not fit in a 64-bit integer");
    }
    auto i = as_integer(value);
    if (!i) {
        // bool and floating values land here too
        return Err<Value>(ErrorCode::InvalidType, invalid_type_message(value));
    }
    if (!in_range(*i, _min, _max)) {
        return Err<Value>(ErrorCode::OutOfRange,
            fmt::format("Value {} must be in range \"{}\"", *i, range_text(_min, _max)));
    }
    return Value(*i);
}

Dict IntProperty::metadata() const {
    auto meta = PropertyBase::metadata();
    meta["allow-none"] = _allow_none;
    add_range_metadata(meta, optional_value(_min), optional_value(_max));
    return meta;
}

// ---------------------------------------------------------------------------
// FloatProperty
// ---------------------------------------------------------------------------

FloatProperty::FloatProperty(std::string name, FloatPropertyOptions options)
    : PropertyBase(std::move(name), std::move(options.default_value), std::move(options.doc),
                   std::move(options.comparator), std::move(options.validator)),
      _min(options.min), _max(options.max), _allow_none(options.allow_none) {}

Result<PropertyPtr> FloatProperty::create(std::string name, FloatPropertyOptions options) {
    if (options.min && options.max && *options.min > *options.max) {
        return Err<PropertyPtr>(ErrorCode::Validation,
            fmt::format("FloatProperty::create: '{}' has min {} greater than max {}", name, *options.min, *options.max));
    }
    auto property = std::shared_ptr<FloatProperty>(new FloatProperty(std::move(name), std::move(options)));
    if (auto res = property->_validate_default(); !res) {
        return Err<PropertyPtr>("FloatProperty::create: invalid default for '" + property->name() + "'", res);
    }
    return PropertyPtr(std::move(property));
}

Result<Value> FloatProperty::_check(const Value& value) const {
    if (is_none(value)) {
        if (_allow_none) return Value();
        return Err<Value>(ErrorCode::NoneNotAllowed, k_none_not_allowed);
    }
    auto d = as_number(value);
    if (!d) {
        return Err<Value>(ErrorCode::InvalidType, invalid_type_message(value));
    }
    if (!in_range(*d, _min, _max)) {
        return Err<Value>(ErrorCode::OutOfRange,
            fmt::format("Value {} must be in range \"{}\"", float_text(*d), range_text(_min, _max)));
    }
    return Value(*d);
}

Dict FloatProperty::metadata() const {
    auto meta = PropertyBase::metadata();
    meta["allow-none"] = _allow_none;
    add_range_metadata(meta, optional_value(_min), optional_value(_max));
    return meta;
}

// ---------------------------------------------------------------------------
// ListProperty / DictProperty
// ---------------------------------------------------------------------------

Result<PropertyPtr> ListProperty::create(std::string name, ListPropertyOptions options) {
    auto property = std::shared_ptr<ListProperty>(new ListProperty(std::move(name), std::move(options)));
    if (auto res = property->_validate_default(); !res) {
        return Err<PropertyPtr>("ListProperty::create: invalid default for '" + property->name() + "'", res);
    }
    return PropertyPtr(std::move(property));
}

Result<Value> ListProperty::_check(const Value& value) const {
    if (is_none(value)) {
        return Err<Value>(ErrorCode::NoneNotAllowed, k_none_not_allowed);
    }
    if (auto list = std::any_cast<List>(&value)) {
        return Value(*list);
    }
    if (auto observable = std::any_cast<ObservableListPtr>(&value); observable && *observable) {
        return Value((*observable)->to_list());
    }
    return Err<Value>(ErrorCode::InvalidType, invalid_type_message(value));
}

Result<PropertyPtr> DictProperty::create(std::string name, DictPropertyOptions options) {
    auto property = std::shared_ptr<DictProperty>(new DictProperty(std::move(name), std::move(options)));
    if (auto res = property->_validate_default(); !res) {
        return Err<PropertyPtr>("DictProperty::create: invalid default for '" + property->name() + "'", res);
    }
    return PropertyPtr(std::move(property));
}

Result<Value> DictProperty::_check(const Value& value) const {
    if (is_none(value)) {
        return Err<Value>(ErrorCode::NoneNotAllowed, k_none_not_allowed);
    }
    if (auto dict = std::any_cast<Dict>(&value)) {
        return Value(*dict);
    }
    if (auto observable = std::any_cast<ObservableDictPtr>(&value); observable && *observable) {
        return Value((*observable)->to_dict());
    }
    return Err<Value>(ErrorCode::InvalidType, invalid_type_message(value));
}

} // namespace ydispatch
