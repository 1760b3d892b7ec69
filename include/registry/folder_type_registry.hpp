#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace packager::registry {

struct FolderTypeEntry {
    std::string_view folder_name;
    std::string_view type_name;
};

inline constexpr std::array<FolderTypeEntry, 8> kFolderTypes = {{
    {"aura", "AuraDefinitionBundle"},
    {"classes", "ApexClass"},
    {"components", "ApexComponent"},
    {"pages", "ApexPage"},
    {"triggers", "ApexTrigger"},
    {"staticresources", "StaticResource"},
    {"objects", "CustomObject"},
    {"profiles", "Profile"},
}};

class FolderTypeRegistry {
    public:
    // Имя типа метаданных для папки или std::nullopt, если папки нет в таблице.
    static std::optional<std::string_view> Lookup(std::string_view folder_name);

    static const auto& Entries() {
        return kFolderTypes;
    }
};

}  // namespace packager::registry
