#include "registry/folder_type_registry.hpp"

#include <algorithm>

namespace packager::registry {

std::optional<std::string_view> FolderTypeRegistry::Lookup(std::string_view folder_name) {
    auto it = std::ranges::find(kFolderTypes, folder_name, &FolderTypeEntry::folder_name);
    if(it == kFolderTypes.end()) {
        return std::nullopt;
    }
    return it->type_name;
}

}  // namespace packager::registry
