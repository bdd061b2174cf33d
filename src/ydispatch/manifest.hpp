#pragma once

#include "result.hpp"
#include "property.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ydispatch {

class Manifest;
using ManifestPtr = std::shared_ptr<const Manifest>;

// Manifest - immutable declaration of the events and properties of one
// dispatcher class, merged from its bases at build time
class Manifest {
public:
    class Builder {
    public:
        explicit Builder(std::string class_name) : _class_name(std::move(class_name)) {}

        // Bases merge in call order
        Builder& inherit(ManifestPtr base);
        Builder& event(std::string name);
        Builder& events(const std::vector<std::string>& names);
        Builder& property(PropertyPtr descriptor);
        // Keeps the first failure for build() to report
        Builder& property(Result<PropertyPtr> descriptor);
        Builder& doc(std::string text);

        Result<ManifestPtr> build() const;

    private:
        std::string _class_name;
        std::string _doc;
        std::vector<ManifestPtr> _bases;
        std::vector<std::string> _events;
        std::vector<PropertyPtr> _properties;
        std::optional<Error> _error;
    };

    // Manifest with no events or properties
    static ManifestPtr empty(std::string class_name = "Dispatcher");

    const std::string& class_name() const { return _class_name; }
    const std::string& doc() const { return _doc; }
    const std::vector<std::string>& bases() const { return _bases; }

    // Declared events, excluding property events, in declaration order
    const std::vector<std::string>& event_names() const { return _events; }
    std::vector<std::string> property_names() const;
    const std::vector<PropertyPtr>& properties() const { return _properties; }
    PropertyPtr find_property(const std::string& name) const;

    bool has_event(const std::string& name) const;
    bool has_property(const std::string& name) const;

private:
    Manifest() = default;

    std::string _class_name;
    std::string _doc;
    std::vector<std::string> _bases;
    std::vector<std::string> _events;
    std::vector<PropertyPtr> _properties;
    std::map<std::string, std::size_t> _property_index;
};

} // namespace ydispatch
