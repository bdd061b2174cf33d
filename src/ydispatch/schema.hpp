#pragma once

#include "result.hpp"
#include "types.hpp"
#include "manifest.hpp"
#include "manifest_tree.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace ydispatch {

class Dispatcher;

// Schema - YAML declarations of dispatcher classes
//
//   settings:
//     log-level: debug
//   classes:
//     Counter:
//       doc: "Counts things"
//       events: [on_reset]
//       properties:
//         value: {kind: int, default: 0, min: 0}
//     Labelled:
//       inherits: [Counter]
//       properties:
//         label: {kind: string, allow-none: false, default: ""}
class Schema {
public:
    static Result<std::shared_ptr<Schema>> create(const std::filesystem::path& path);
    static Result<std::shared_ptr<Schema>> create_from_string(const std::string& yaml_content);

    const Dict& settings() const { return _settings; }

    // Applies settings.log-level to spdlog
    Result<void> apply_settings() const;

    Result<ManifestPtr> manifest(const std::string& class_name) const;
    // Declaration order
    std::vector<ManifestPtr> manifests() const;
    const std::vector<std::string>& class_names() const { return _class_order; }

    Result<ManifestTreePtr> tree() const;

    // Plain Dispatcher carrying the class manifest
    Result<std::shared_ptr<Dispatcher>> instantiate(const std::string& class_name) const;

private:
    Schema() = default;

    Result<void> _load(const YAML::Node& root);
    Result<ManifestPtr> _build_class(const std::string& class_name, std::set<std::string>& visiting);
    static Result<PropertyPtr> _build_property(const std::string& class_name,
                                               const std::string& property_name,
                                               const Value& declaration);

    // YAML to Dict conversion
    static Dict _yaml_to_dict(const YAML::Node& node);
    static Value _yaml_to_value(const YAML::Node& node);

    Dict _settings;
    std::map<std::string, Dict> _class_definitions;
    std::vector<std::string> _class_order;
    std::map<std::string, ManifestPtr> _manifests;
};

using SchemaPtr = std::shared_ptr<Schema>;

} // namespace ydispatch
