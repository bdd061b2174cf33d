#include "manifest.hpp"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <set>

namespace ydispatch {

Manifest::Builder& Manifest::Builder::inherit(ManifestPtr base) {
    if (!base) {
        if (!_error) _error = Error(ErrorCode::Config, "Manifest::Builder(" + _class_name + "): null base manifest");
        return *this;
    }
    _bases.push_back(std::move(base));
    return *this;
}

Manifest::Builder& Manifest::Builder::event(std::string name) {
    _events.push_back(std::move(name));
    return *this;
}

Manifest::Builder& Manifest::Builder::events(const std::vector<std::string>& names) {
    _events.insert(_events.end(), names.begin(), names.end());
    return *this;
}

Manifest::Builder& Manifest::Builder::property(PropertyPtr descriptor) {
    if (!descriptor) {
        if (!_error) _error = Error(ErrorCode::Config, "Manifest::Builder(" + _class_name + "): null property");
        return *this;
    }
    _properties.push_back(std::move(descriptor));
    return *this;
}

Manifest::Builder& Manifest::Builder::property(Result<PropertyPtr> descriptor) {
    if (!descriptor) {
        if (!_error) _error = Error("Manifest::Builder(" + _class_name + "): property rejected", descriptor.error());
        return *this;
    }
    return property(std::move(*descriptor));
}

Manifest::Builder& Manifest::Builder::doc(std::string text) {
    _doc = std::move(text);
    return *this;
}

Result<ManifestPtr> Manifest::Builder::build() const {
    if (_error) {
        return std::unexpected(*_error);
    }

    auto manifest = std::shared_ptr<Manifest>(new Manifest());
    manifest->_class_name = _class_name;
    manifest->_doc = _doc;

    std::set<std::string> event_set;

    auto add_event = [&](const std::string& name, const std::string& origin) -> Result<void> {
        if (manifest->_property_index.count(name)) {
            return Err<void>(ErrorCode::PropertyExists,
                "Manifest(" + _class_name + "): event '" + name + "' from " + origin + " is already a property");
        }
        if (event_set.insert(name).second) {
            manifest->_events.push_back(name);
        }
        return Ok();
    };

    auto add_property = [&](const PropertyPtr& descriptor, const std::string& origin) -> Result<void> {
        const auto& name = descriptor->name();
        if (event_set.count(name)) {
            return Err<void>(ErrorCode::EventExists,
                "Manifest(" + _class_name + "): property '" + name + "' from " + origin + " is already an event");
        }
        auto it = manifest->_property_index.find(name);
        if (it != manifest->_property_index.end()) {
            // Later declarations override earlier ones
            manifest->_properties[it->second] = descriptor;
        } else {
            manifest->_property_index[name] = manifest->_properties.size();
            manifest->_properties.push_back(descriptor);
        }
        return Ok();
    };

    for (const auto& base : _bases) {
        manifest->_bases.push_back(base->class_name());
        std::string origin = "base " + base->class_name();
        for (const auto& descriptor : base->properties()) {
            if (auto res = add_property(descriptor, origin); !res) {
                return Err<ManifestPtr>("Manifest::Builder::build: inheritance conflict", res);
            }
        }
        for (const auto& name : base->event_names()) {
            if (auto res = add_event(name, origin); !res) {
                return Err<ManifestPtr>("Manifest::Builder::build: inheritance conflict", res);
            }
        }
    }

    std::set<std::string> own_properties;
    for (const auto& descriptor : _properties) {
        if (!own_properties.insert(descriptor->name()).second) {
            return Err<ManifestPtr>(ErrorCode::PropertyExists,
                "Manifest(" + _class_name + "): property '" + descriptor->name() + "' declared twice");
        }
        if (auto res = add_property(descriptor, _class_name); !res) {
            return Err<ManifestPtr>("Manifest::Builder::build: declaration conflict", res);
        }
    }

    for (const auto& name : _events) {
        if (name.empty()) {
            return Err<ManifestPtr>(ErrorCode::Config, "Manifest(" + _class_name + "): empty event name");
        }
        if (auto res = add_event(name, _class_name); !res) {
            return Err<ManifestPtr>("Manifest::Builder::build: declaration conflict", res);
        }
    }

    ydebug("Manifest::build: {} with {} event(s), {} propert(ies)",
           _class_name, manifest->_events.size(), manifest->_properties.size());
    return ManifestPtr(std::move(manifest));
}

ManifestPtr Manifest::empty(std::string class_name) {
    auto manifest = std::shared_ptr<Manifest>(new Manifest());
    manifest->_class_name = std::move(class_name);
    return manifest;
}

std::vector<std::string> Manifest::property_names() const {
    std::vector<std::string> names;
    names.reserve(_properties.size());
    for (const auto& descriptor : _properties) {
        names.push_back(descriptor->name());
    }
    return names;
}

PropertyPtr Manifest::find_property(const std::string& name) const {
    auto it = _property_index.find(name);
    return it == _property_index.end() ? nullptr : _properties[it->second];
}

bool Manifest::has_event(const std::string& name) const {
    return std::find(_events.begin(), _events.end(), name) != _events.end();
}

bool Manifest::has_property(const std::string& name) const {
    return _property_index.count(name) > 0;
}

} // namespace ydispatch
