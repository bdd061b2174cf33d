#include "manifest_tree.hpp"
#include <algorithm>

namespace ydispatch {

namespace {

const char* const k_events = "events";
const char* const k_properties = "properties";

Result<void> not_found(const DataPath& path) {
    return Err<void>(ErrorCode::DoesNotExist, "ManifestTree: no node at '" + path.to_string() + "'");
}

} // namespace

Result<std::shared_ptr<ManifestTree>> ManifestTree::create(const std::vector<ManifestPtr>& manifests) {
    auto tree = std::shared_ptr<ManifestTree>(new ManifestTree());
    for (const auto& manifest : manifests) {
        if (!manifest) {
            return Err<std::shared_ptr<ManifestTree>>(ErrorCode::Config, "ManifestTree::create: null manifest");
        }
        if (!tree->_by_name.emplace(manifest->class_name(), manifest).second) {
            return Err<std::shared_ptr<ManifestTree>>(ErrorCode::Config,
                "ManifestTree::create: duplicate class '" + manifest->class_name() + "'");
        }
        tree->_manifests.push_back(manifest);
    }
    return tree;
}

Result<ManifestPtr> ManifestTree::_find(const std::string& class_name) const {
    auto it = _by_name.find(class_name);
    if (it == _by_name.end()) {
        return Err<ManifestPtr>(ErrorCode::DoesNotExist, "ManifestTree: no class '" + class_name + "'");
    }
    return it->second;
}

Result<std::vector<std::string>> ManifestTree::get_children_names(const DataPath& path) {
    if (path.size() == 0) {
        std::vector<std::string> names;
        for (const auto& manifest : _manifests) {
            names.push_back(manifest->class_name());
        }
        return names;
    }

    auto manifest = _find(path[0]);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }
    const auto& m = **manifest;

    if (path.size() == 1) {
        return std::vector<std::string>{k_events, k_properties};
    }
    if (path.size() == 2 && path[1] == k_events) {
        return m.event_names();
    }
    if (path.size() == 2 && path[1] == k_properties) {
        return m.property_names();
    }
    if (path.size() == 3 && path[1] == k_events && m.has_event(path[2])) {
        return std::vector<std::string>{};
    }
    if (path.size() == 3 && path[1] == k_properties && m.has_property(path[2])) {
        return std::vector<std::string>{};
    }
    return std::unexpected(not_found(path).error());
}

Result<Dict> ManifestTree::get_metadata(const DataPath& path) {
    Dict meta;
    if (path.size() == 0) {
        meta["name"] = std::string("/");
        meta["classes"] = static_cast<std::int64_t>(_manifests.size());
        return meta;
    }

    auto manifest = _find(path[0]);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }
    const auto& m = **manifest;

    if (path.size() == 1) {
        List bases;
        for (const auto& base : m.bases()) {
            bases.push_back(base);
        }
        meta["class"] = m.class_name();
        meta["doc"] = m.doc();
        meta["bases"] = bases;
        return meta;
    }
    if (path.size() == 2 && (path[1] == k_events || path[1] == k_properties)) {
        meta["name"] = path[1];
        return meta;
    }
    if (path.size() == 3 && path[1] == k_events && m.has_event(path[2])) {
        meta["name"] = path[2];
        meta["kind"] = std::string("Event");
        return meta;
    }
    if (path.size() == 3 && path[1] == k_properties) {
        if (auto descriptor = m.find_property(path[2])) {
            return descriptor->metadata();
        }
    }
    return std::unexpected(not_found(path).error());
}

Result<std::vector<std::string>> ManifestTree::get_metadata_keys(const DataPath& path) {
    auto meta = get_metadata(path);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    std::vector<std::string> keys;
    for (const auto& [key, value] : *meta) {
        keys.push_back(key);
    }
    return keys;
}

Result<Value> ManifestTree::get(const DataPath& path) {
    if (path.size() == 0) {
        return Err<Value>(ErrorCode::KeyError, "ManifestTree::get: path has no key");
    }
    auto meta = get_metadata(path.dirname());
    if (!meta) {
        return std::unexpected(meta.error());
    }
    auto it = meta->find(path.filename());
    if (it == meta->end()) {
        return Err<Value>(ErrorCode::KeyError,
                          "ManifestTree::get: no key '" + path.filename() + "' at '" + path.dirname().to_string() + "'");
    }
    return it->second;
}

Result<std::string> ManifestTree::as_tree(const DataPath& path, int depth) {
    std::string out;
    if (auto res = _render(path, 0, depth, out); !res) {
        return Err<std::string>("ManifestTree::as_tree: render failed", res);
    }
    return out;
}

Result<void> ManifestTree::_render(const DataPath& path, int level, int depth, std::string& out) {
    auto meta = get_metadata(path);
    if (!meta) {
        return Err<void>("ManifestTree::_render: metadata", meta);
    }

    std::string line(static_cast<std::size_t>(level) * 2, ' ');
    line += path.size() == 0 ? "/" : path.filename();
    auto kind = meta->find("kind");
    if (kind != meta->end() && path.size() == 3 && path[1] == k_properties) {
        line += " [" + as_string(kind->second).value_or("?") + "]";
        line += " default=" + value_to_string(meta->at("default"));
        for (const char* key : {"min", "max"}) {
            if (auto bound = meta->find(key); bound != meta->end()) {
                line += std::string(" ") + key + "=" + value_to_string(bound->second);
            }
        }
    }
    if (path.size() == 1) {
        auto doc = as_string(meta->at("doc")).value_or("");
        if (!doc.empty()) {
            line += "  # " + doc;
        }
    }
    out += line + "\n";

    if (depth >= 0 && level >= depth) {
        return Ok();
    }

    auto children = get_children_names(path);
    if (!children) {
        return Err<void>("ManifestTree::_render: children", children);
    }
    for (const auto& child : *children) {
        if (auto res = _render(path / child, level + 1, depth, out); !res) {
            return res;
        }
    }
    return Ok();
}

} // namespace ydispatch
