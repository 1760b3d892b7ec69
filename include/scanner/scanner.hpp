#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace packager::scanner {

namespace fs = std::filesystem;

class IDirectoryScanner {
    public:
    virtual ~IDirectoryScanner() = default;

    // Непосредственные подпапки root в порядке листинга. Скрытые папки не отбрасываются.
    virtual std::vector<fs::path> ListSubfolders(const fs::path& root) = 0;

    // Имена сущностей папки без расширения. Сущности, имя которых подходит под один из
    // exclude_patterns, пропускаются.
    virtual std::vector<std::string> ListEntries(const fs::path& folder,
                                                 const std::vector<std::string>& exclude_patterns,
                                                 bool recursive) = 0;
};

}  // namespace packager::scanner
