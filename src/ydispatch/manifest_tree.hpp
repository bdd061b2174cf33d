#pragma once

#include "result.hpp"
#include "types.hpp"
#include "manifest.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ydispatch {

// ManifestTree - read-only view of declared classes, no instances needed.
//
//   /                          class names
//   /<class>                   events, properties   (meta: class, doc, bases)
//   /<class>/events/<name>                          (meta: name, kind)
//   /<class>/properties/<name>                      (meta: descriptor metadata)
class ManifestTree : public TreeLike {
public:
    static Result<std::shared_ptr<ManifestTree>> create(const std::vector<ManifestPtr>& manifests);

    Result<std::vector<std::string>> get_children_names(const DataPath& path) override;
    Result<Dict> get_metadata(const DataPath& path) override;
    Result<std::vector<std::string>> get_metadata_keys(const DataPath& path) override;
    Result<Value> get(const DataPath& path) override;
    Result<std::string> as_tree(const DataPath& path, int depth = -1) override;

private:
    ManifestTree() = default;

    Result<ManifestPtr> _find(const std::string& class_name) const;
    Result<void> _render(const DataPath& path, int level, int depth, std::string& out);

    std::vector<ManifestPtr> _manifests;
    std::map<std::string, ManifestPtr> _by_name;
};

using ManifestTreePtr = std::shared_ptr<ManifestTree>;

} // namespace ydispatch
