#include "schema.hpp"
#include "dispatcher.hpp"
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <charconv>

namespace ydispatch {

namespace {

// Keys of a property entry
const char* const k_kind = "kind";
const char* const k_default = "default";
const char* const k_min = "min";
const char* const k_max = "max";
const char* const k_allow_none = "allow-none";
const char* const k_doc = "doc";

Result<void> config_error(const std::string& msg) {
    return Err<void>(ErrorCode::Config, msg);
}

std::optional<bool> bool_entry(const Dict& dict, const char* key) {
    auto it = dict.find(key);
    if (it == dict.end()) {
        return std::nullopt;
    }
    if (auto b = std::any_cast<bool>(&it->second)) {
        return *b;
    }
    return std::nullopt;
}

std::string string_entry(const Dict& dict, const char* key) {
    auto it = dict.find(key);
    if (it == dict.end()) {
        return {};
    }
    return as_string(it->second).value_or(value_to_string(it->second));
}

// Names given as a list or a single string
Result<std::vector<std::string>> name_list(const Dict& dict, const char* key, const std::string& where) {
    std::vector<std::string> names;
    auto it = dict.find(key);
    if (it == dict.end() || is_none(it->second)) {
        return names;
    }
    if (auto name = as_string(it->second)) {
        names.push_back(*name);
        return names;
    }
    auto list = std::any_cast<List>(&it->second);
    if (!list) {
        return Err<std::vector<std::string>>(ErrorCode::Config,
            where + ": '" + key + "' must be a name or a list of names");
    }
    for (const auto& item : *list) {
        auto name = as_string(item);
        if (!name) {
            return Err<std::vector<std::string>>(ErrorCode::Config,
                where + ": '" + key + "' entry " + value_to_string(item) + " is not a name");
        }
        names.push_back(*name);
    }
    return names;
}

} // namespace

Result<std::shared_ptr<Schema>> Schema::create(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Err<std::shared_ptr<Schema>>(ErrorCode::Config,
            "Schema::create: YAML parse error in " + path.string() + ": " + std::string(e.what()));
    }

    auto schema = std::shared_ptr<Schema>(new Schema());
    if (auto res = schema->_load(root); !res) {
        return Err<std::shared_ptr<Schema>>("Schema::create: failed to load " + path.string(), res);
    }
    return schema;
}

Result<std::shared_ptr<Schema>> Schema::create_from_string(const std::string& yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        return Err<std::shared_ptr<Schema>>(ErrorCode::Config,
            "Schema::create_from_string: YAML parse error: " + std::string(e.what()));
    }

    auto schema = std::shared_ptr<Schema>(new Schema());
    if (auto res = schema->_load(root); !res) {
        return Err<std::shared_ptr<Schema>>("Schema::create_from_string: failed to load", res);
    }
    return schema;
}

Result<void> Schema::_load(const YAML::Node& root) {
    if (root.IsNull()) {
        return Ok();
    }
    if (!root.IsMap()) {
        return config_error("Schema::_load: document root must be a map");
    }

    // Process 'settings' section
    if (root["settings"]) {
        if (!root["settings"].IsMap()) {
            return config_error("Schema::_load: 'settings' must be a map");
        }
        _settings = _yaml_to_dict(root["settings"]);
    }

    // Process 'classes' section
    if (root["classes"]) {
        if (!root["classes"].IsMap()) {
            return config_error("Schema::_load: 'classes' must be a map");
        }
        for (const auto& kv : root["classes"]) {
            if (!kv.first.IsScalar()) {
                return config_error("Schema::_load: class names must be scalars");
            }
            std::string class_name = kv.first.Scalar();
            if (!kv.second.IsNull() && !kv.second.IsMap()) {
                return config_error("Schema::_load: class '" + class_name + "' must be a map");
            }
            _class_definitions[class_name] = _yaml_to_dict(kv.second);
            _class_order.push_back(class_name);
        }
    }

    for (const auto& class_name : _class_order) {
        std::set<std::string> visiting;
        if (auto res = _build_class(class_name, visiting); !res) {
            return Err<void>("Schema::_load: class '" + class_name + "'", res);
        }
    }
    ydebug("Schema: loaded {} classes", _class_order.size());
    return Ok();
}

Result<ManifestPtr> Schema::_build_class(const std::string& class_name, std::set<std::string>& visiting) {
    if (auto it = _manifests.find(class_name); it != _manifests.end()) {
        return it->second;
    }
    auto def_it = _class_definitions.find(class_name);
    if (def_it == _class_definitions.end()) {
        return Err<ManifestPtr>(ErrorCode::Config, "Schema: unknown class '" + class_name + "'");
    }
    if (!visiting.insert(class_name).second) {
        return Err<ManifestPtr>(ErrorCode::Config, "Schema: inheritance cycle through '" + class_name + "'");
    }
    const Dict& def = def_it->second;
    const std::string where = "Schema: class '" + class_name + "'";

    Manifest::Builder builder(class_name);
    builder.doc(string_entry(def, k_doc));

    auto bases = name_list(def, "inherits", where);
    if (!bases) {
        return std::unexpected(bases.error());
    }
    for (const auto& base_name : *bases) {
        auto base = _build_class(base_name, visiting);
        if (!base) {
            return Err<ManifestPtr>(where + ": base '" + base_name + "' failed", base);
        }
        builder.inherit(*base);
    }

    auto events = name_list(def, "events", where);
    if (!events) {
        return std::unexpected(events.error());
    }
    builder.events(*events);

    if (auto it = def.find("properties"); it != def.end() && !is_none(it->second)) {
        auto properties = std::any_cast<Dict>(&it->second);
        if (!properties) {
            return Err<ManifestPtr>(ErrorCode::Config, where + ": 'properties' must be a map");
        }
        for (const auto& [property_name, declaration] : *properties) {
            auto descriptor = _build_property(class_name, property_name, declaration);
            if (!descriptor) {
                return Err<ManifestPtr>(where + ": property '" + property_name + "'", descriptor);
            }
            builder.property(*descriptor);
        }
    }

    auto manifest = builder.build();
    if (!manifest) {
        return Err<ManifestPtr>(where + ": manifest build failed", manifest);
    }
    visiting.erase(class_name);
    _manifests[class_name] = *manifest;
    return *manifest;
}

Result<PropertyPtr> Schema::_build_property(const std::string& class_name,
                                            const std::string& property_name,
                                            const Value& declaration) {
    const std::string where = "Schema: " + class_name + "." + property_name;

    // "name: int" is shorthand for "name: {kind: int}"
    Dict entry;
    if (auto kind = as_string(declaration)) {
        entry[k_kind] = *kind;
    } else if (auto dict = std::any_cast<Dict>(&declaration)) {
        entry = *dict;
    } else if (!is_none(declaration)) {
        return Err<PropertyPtr>(ErrorCode::Config, where + ": expected a kind or a map");
    }

    std::string kind = entry.count(k_kind) ? string_entry(entry, k_kind) : "any";
    std::string doc = string_entry(entry, k_doc);
    auto allow_none = bool_entry(entry, k_allow_none);
    auto default_it = entry.find(k_default);
    bool has_default = default_it != entry.end();
    Value default_value = has_default ? default_it->second : Value{};
    auto min_it = entry.find(k_min);
    auto max_it = entry.find(k_max);

    if (kind == "any") {
        return Property::create(property_name, {.default_value = default_value, .doc = doc});
    }
    if (kind == "string") {
        StringPropertyOptions options;
        options.default_value = default_value;
        options.allow_none = allow_none.value_or(true);
        options.doc = doc;
        return StringProperty::create(property_name, std::move(options));
    }
    if (kind == "bool") {
        BoolPropertyOptions options;
        if (has_default) options.default_value = default_value;
        options.allow_none = allow_none.value_or(false);
        options.doc = doc;
        return BoolProperty::create(property_name, std::move(options));
    }
    if (kind == "int") {
        IntPropertyOptions options;
        if (has_default) options.default_value = default_value;
        if (min_it != entry.end()) {
            options.min = as_integer(min_it->second);
            if (!options.min) {
                return Err<PropertyPtr>(ErrorCode::Config, where + ": 'min' must be an integer");
            }
        }
        if (max_it != entry.end()) {
            options.max = as_integer(max_it->second);
            if (!options.max) {
                return Err<PropertyPtr>(ErrorCode::Config, where + ": 'max' must be an integer");
            }
        }
        options.allow_none = allow_none.value_or(false);
        options.doc = doc;
        return IntProperty::create(property_name, std::move(options));
    }
    if (kind == "float") {
        FloatPropertyOptions options;
        if (has_default) options.default_value = default_value;
        if (min_it != entry.end()) {
            options.min = as_number(min_it->second);
            if (!options.min) {
                return Err<PropertyPtr>(ErrorCode::Config, where + ": 'min' must be a number");
            }
        }
        if (max_it != entry.end()) {
            options.max = as_number(max_it->second);
            if (!options.max) {
                return Err<PropertyPtr>(ErrorCode::Config, where + ": 'max' must be a number");
            }
        }
        options.allow_none = allow_none.value_or(false);
        options.doc = doc;
        return FloatProperty::create(property_name, std::move(options));
    }
    if (kind == "list") {
        ListPropertyOptions options;
        if (has_default && !is_none(default_value)) {
            auto list = std::any_cast<List>(&default_value);
            if (!list) {
                return Err<PropertyPtr>(ErrorCode::Config, where + ": list default must be a sequence");
            }
            options.default_value = *list;
        }
        options.doc = doc;
        return ListProperty::create(property_name, std::move(options));
    }
    if (kind == "dict") {
        DictPropertyOptions options;
        if (has_default && !is_none(default_value)) {
            auto dict = std::any_cast<Dict>(&default_value);
            if (!dict) {
                return Err<PropertyPtr>(ErrorCode::Config, where + ": dict default must be a map");
            }
            options.default_value = *dict;
        }
        options.doc = doc;
        return DictProperty::create(property_name, std::move(options));
    }
    return Err<PropertyPtr>(ErrorCode::Config, where + ": unknown kind '" + kind + "'");
}

Result<void> Schema::apply_settings() const {
    auto it = _settings.find("log-level");
    if (it == _settings.end()) {
        return Ok();
    }
    auto name = as_string(it->second);
    if (!name) {
        return config_error("Schema::apply_settings: log-level must be a string");
    }
    auto level = spdlog::level::from_str(*name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && *name != "off") {
        return config_error("Schema::apply_settings: invalid log-level '" + *name + "'");
    }
    spdlog::set_level(level);
    return Ok();
}

Result<ManifestPtr> Schema::manifest(const std::string& class_name) const {
    auto it = _manifests.find(class_name);
    if (it == _manifests.end()) {
        return Err<ManifestPtr>(ErrorCode::DoesNotExist, "Schema::manifest: no class '" + class_name + "'");
    }
    return it->second;
}

std::vector<ManifestPtr> Schema::manifests() const {
    std::vector<ManifestPtr> result;
    for (const auto& class_name : _class_order) {
        result.push_back(_manifests.at(class_name));
    }
    return result;
}

Result<ManifestTreePtr> Schema::tree() const {
    auto tree = ManifestTree::create(manifests());
    if (!tree) {
        return Err<ManifestTreePtr>("Schema::tree: failed to build tree", tree);
    }
    return *tree;
}

Result<std::shared_ptr<Dispatcher>> Schema::instantiate(const std::string& class_name) const {
    auto m = manifest(class_name);
    if (!m) {
        return std::unexpected(m.error());
    }
    auto dispatcher = Dispatcher::create(*m);
    if (!dispatcher) {
        return Err<std::shared_ptr<Dispatcher>>("Schema::instantiate: '" + class_name + "'", dispatcher);
    }
    return *dispatcher;
}

Dict Schema::_yaml_to_dict(const YAML::Node& node) {
    Dict result;
    if (!node.IsMap()) {
        return result;
    }

    for (const auto& kv : node) {
        std::string key = kv.first.Scalar();
        result[key] = _yaml_to_value(kv.second);
    }

    return result;
}

Value Schema::_yaml_to_value(const YAML::Node& node) {
    if (node.IsNull()) {
        return Value{};
    }

    if (node.IsScalar()) {
        const std::string& str = node.Scalar();

        // Quoted scalars stay strings
        if (node.Tag() == "!") {
            return Value(str);
        }

        if (str == "true" || str == "True" || str == "TRUE") {
            return Value(true);
        }
        if (str == "false" || str == "False" || str == "FALSE") {
            return Value(false);
        }
        if (str == "~" || str == "null" || str == "Null" || str == "NULL") {
            return Value{};
        }

        const char* first = str.data();
        const char* last = str.data() + str.size();

        std::int64_t i = 0;
        if (auto [ptr, ec] = std::from_chars(first, last, i); ec == std::errc() && ptr == last) {
            return Value(i);
        }

        double d = 0.0;
        if (auto [ptr, ec] = std::from_chars(first, last, d); ec == std::errc() && ptr == last) {
            return Value(d);
        }

        return Value(str);
    }

    if (node.IsSequence()) {
        List list;
        for (const auto& item : node) {
            list.push_back(_yaml_to_value(item));
        }
        return Value(list);
    }

    if (node.IsMap()) {
        return Value(_yaml_to_dict(node));
    }

    return Value{};
}

} // namespace ydispatch
