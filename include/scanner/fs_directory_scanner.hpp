#pragma once

#include "scanner/scanner.hpp"

namespace packager::scanner {

class FsDirectoryScanner: public IDirectoryScanner {
    public:
    FsDirectoryScanner() = default;

    std::vector<fs::path> ListSubfolders(const fs::path& root) override;

    std::vector<std::string> ListEntries(const fs::path& folder,
                                         const std::vector<std::string>& exclude_patterns,
                                         bool recursive) override;
};

// Имя сущности так, как оно попадает в <members>: у файла отрезается последнее расширение,
// у папки имя остается целиком.
std::string MemberName(const fs::directory_entry& entry);

}  // namespace packager::scanner
