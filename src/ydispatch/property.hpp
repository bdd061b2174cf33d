#pragma once

#include "result.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ydispatch {

class PropertyBase;
using PropertyPtr = std::shared_ptr<const PropertyBase>;

// Returns true when two values count as "no change"
using Comparator = std::function<bool(const Value&, const Value&)>;
// Extra check run after the built-in type checks
using Validator = std::function<Result<void>(const Value&)>;

// PropertyBase - class-scoped description of an observable attribute.
// Values live in the owning Dispatcher; the descriptor is shared by all
// instances and by derived manifests.
class PropertyBase {
public:
    virtual ~PropertyBase() = default;

    const std::string& name() const { return _name; }
    virtual const char* kind() const = 0;
    const Value& default_value() const { return _default; }
    const std::string& doc() const { return _doc; }

    // Comparator if configured, structural equality otherwise
    bool equals(const Value& current, const Value& incoming) const;

    // Built-in checks then the custom validator. Returns the value in the
    // form it is stored in (e.g. int64_t for IntProperty).
    Result<Value> validate(const Value& value) const;

    // List and dict properties store observable containers
    virtual bool is_container() const { return false; }

    // Introspection: name, kind, default, doc plus kind-specific keys
    virtual Dict metadata() const;

protected:
    PropertyBase(std::string name, Value default_value, std::string doc,
                 Comparator comparator, Validator validator)
        : _name(std::move(name)), _default(std::move(default_value)), _doc(std::move(doc)),
          _comparator(std::move(comparator)), _validator(std::move(validator)) {}

    virtual Result<Value> _check(const Value& value) const { return value; }

    // Used by create() so a bad default fails at declaration time
    Result<void> _validate_default();

    std::string _name;
    Value _default;
    std::string _doc;
    Comparator _comparator;
    Validator _validator;
};

// ---------------------------------------------------------------------------
// Property - untyped
// ---------------------------------------------------------------------------

struct PropertyOptions {
    Value default_value;
    std::string doc;
    Comparator comparator;
    Validator validator;
};

class Property : public PropertyBase {
public:
    static Result<PropertyPtr> create(std::string name, PropertyOptions options = {});
    const char* kind() const override { return "Property"; }

private:
    Property(std::string name, PropertyOptions options)
        : PropertyBase(std::move(name), std::move(options.default_value), std::move(options.doc),
                       std::move(options.comparator), std::move(options.validator)) {}
};

// ---------------------------------------------------------------------------
// Typed properties
// ---------------------------------------------------------------------------

struct StringPropertyOptions {
    Value default_value;
    bool allow_none = true;
    std::string doc;
    Comparator comparator;
    Validator validator;
};

class StringProperty : public PropertyBase {
public:
    static Result<PropertyPtr> create(std::string name, StringPropertyOptions options = {});
    const char* kind() const override { return "StringProperty"; }
    bool allow_none() const { return _allow_none; }
    Dict metadata() const override;

protected:
    Result<Value> _check(const Value& value) const override;

private:
    StringProperty(std::string name, StringPropertyOptions options);
    bool _allow_none;
};

struct BoolPropertyOptions {
    Value default_value = false;
    bool allow_none = false;
    std::string doc;
    Comparator comparator;
    Validator validator;
};

class BoolProperty : public PropertyBase {
public:
    static Result<PropertyPtr> create(std::string name, BoolPropertyOptions options = {});
    const char* kind() const override { return "BoolProperty"; }
    bool allow_none() const { return _allow_none; }
    Dict metadata() const override;

protected:
    Result<Value> _check(const Value& value) const override;

private:
    BoolProperty(std::string name, BoolPropertyOptions options);
    bool _allow_none;
};

struct IntPropertyOptions {
    Value default_value = std::int64_t{0};
    std::optional<std::int64_t> min;
    std::optional<std::int64_t> max;
    bool allow_none = false;
    std::string doc;
    Comparator comparator;
    Validator validator;
};

class IntProperty : public PropertyBase {
public:
    static Result<PropertyPtr> create(std::string name, IntPropertyOptions options = {});
    const char* kind() const override { return "IntProperty"; }
    const std::optional<std::int64_t>& min() const { return _min; }
    const std::optional<std::int64_t>& max() const { return _max; }
    bool allow_none() const { return _allow_none; }
    Dict metadata() const override;

protected:
    Result<Value> _check(const Value& value) const override;

private:
    IntProperty(std::string name, IntPropertyOptions options);
    std::optional<std::int64_t> _min;
    std::optional<std::int64_t> _max;
    bool _allow_none;
};

struct FloatPropertyOptions {
    Value default_value = 0.0;
    std::optional<double> min;
    std::optional<double> max;
    bool allow_none = false;
    std::string doc;
    Comparator comparator;
    Validator validator;
};

class FloatProperty : public PropertyBase {
public:
    static Result<PropertyPtr> create(std::string name, FloatPropertyOptions options = {});
    const char* kind() const override { return "FloatProperty"; }
    const std::optional<double>& min() const { return _min; }
    const std::optional<double>& max() const { return _max; }
    bool allow_none() const { return _allow_none; }
    Dict metadata() const override;

protected:
    Result<Value> _check(const Value& value) const override;

private:
    FloatProperty(std::string name, FloatPropertyOptions options);
    std::optional<double> _min;
    std::optional<double> _max;
    bool _allow_none;
};

// ---------------------------------------------------------------------------
// Container properties, stored as ObservableList / ObservableDict
// ---------------------------------------------------------------------------

struct ListPropertyOptions {
    List default_value;
    std::string doc;
    Comparator comparator;
    Validator validator;
};

class ListProperty : public PropertyBase {
public:
    static Result<PropertyPtr> create(std::string name, ListPropertyOptions options = {});
    const char* kind() const override { return "ListProperty"; }
    bool is_container() const override { return true; }

protected:
    // Accepts List or ObservableList, yields a raw List
    Result<Value> _check(const Value& value) const override;

private:
    ListProperty(std::string name, ListPropertyOptions options)
        : PropertyBase(std::move(name), Value(std::move(options.default_value)), std::move(options.doc),
                       std::move(options.comparator), std::move(options.validator)) {}
};

struct DictPropertyOptions {
    Dict default_value;
    std::string doc;
    Comparator comparator;
    Validator validator;
};

class DictProperty : public PropertyBase {
public:
    static Result<PropertyPtr> create(std::string name, DictPropertyOptions options = {});
    const char* kind() const override { return "DictProperty"; }
    bool is_container() const override { return true; }

protected:
    // Accepts Dict or ObservableDict, yields a raw Dict
    Result<Value> _check(const Value& value) const override;

private:
    DictProperty(std::string name, DictPropertyOptions options)
        : PropertyBase(std::move(name), Value(std::move(options.default_value)), std::move(options.doc),
                       std::move(options.comparator), std::move(options.validator)) {}
};

} // namespace ydispatch
