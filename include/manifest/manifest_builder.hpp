#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "scanner/scanner.hpp"
#include "types.hpp"

namespace packager::manifest {

class ManifestBuilder {
    std::shared_ptr<scanner::IDirectoryScanner> scanner_ = nullptr;
    std::string api_version_;
    std::string xml_namespace_;
    std::vector<std::string> exclude_patterns_;

    public:
    explicit ManifestBuilder(std::shared_ptr<scanner::IDirectoryScanner> scanner,
                             std::string api_version                   = std::string(kDefaultApiVersion),
                             std::string xml_namespace                 = std::string(kDefaultXmlNamespace),
                             std::vector<std::string> exclude_patterns = kManifestExcludePatterns);

    // Одна группа <types> на каждую подпапку root, в порядке листинга. Любая ошибка
    // сканирования прерывает сборку целиком.
    Manifest Build(const std::filesystem::path& root) const;

    private:
    TypeGroup BuildGroup(const std::filesystem::path& folder) const;
};

}  // namespace packager::manifest
