#include "manifest/manifest_builder.hpp"

#include <format>
#include <stdexcept>
#include <utility>

#include "logger.hpp"
#include "registry/folder_type_registry.hpp"

namespace packager::manifest {

ManifestBuilder::ManifestBuilder(std::shared_ptr<scanner::IDirectoryScanner> scanner,
                                 std::string api_version,
                                 std::string xml_namespace,
                                 std::vector<std::string> exclude_patterns):
    scanner_(std::move(scanner)),
    api_version_(std::move(api_version)),
    xml_namespace_(std::move(xml_namespace)),
    exclude_patterns_(std::move(exclude_patterns)) {
    if(!scanner_) {
        throw std::invalid_argument("Manifest builder requires a directory scanner");
    }
}

Manifest ManifestBuilder::Build(const std::filesystem::path& root) const {
    Manifest manifest;
    manifest.api_version   = api_version_;
    manifest.xml_namespace = xml_namespace_;

    for(const auto& folder: scanner_->ListSubfolders(root)) {
        manifest.groups.push_back(BuildGroup(folder));
    }
    Logger::Get().Debug(std::format("Collected {} type groups under {}", manifest.groups.size(), root.string()));
    return manifest;
}

TypeGroup ManifestBuilder::BuildGroup(const std::filesystem::path& folder) const {
    const auto folder_name = folder.filename().string();

    TypeGroup group;
    group.members = scanner_->ListEntries(folder, exclude_patterns_, false);

    if(auto type_name = registry::FolderTypeRegistry::Lookup(folder_name)) {
        group.type_name = std::string(*type_name);
    }
    else {
        // Неизвестная папка попадает в манифест под собственным именем.
        group.type_name = folder_name;
        group.mapped    = false;
        Logger::Get().Warn(std::format("Folder '{}' has no known metadata type, using the folder name", folder_name));
    }
    return group;
}

}  // namespace packager::manifest
