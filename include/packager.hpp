#pragma once

#include <filesystem>
#include <memory>
#include <ostream>

#include "config.hpp"
#include "scanner/fs_directory_scanner.hpp"
#include "scanner/scanner.hpp"

namespace packager {

enum class Mode {
    FullManifest,
    MemberList,
};

class Packager {
    Options options_;
    std::shared_ptr<scanner::IDirectoryScanner> scanner_ = nullptr;

    public:
    explicit Packager(Options options,
                      std::shared_ptr<scanner::IDirectoryScanner> scanner = std::make_shared<scanner::FsDirectoryScanner>());

    Mode GetMode() const;

    // Выбирает режим по options.dir: список <members> в out либо package.xml в root.
    void Run(std::ostream& out) const;

    void ListMembers(std::ostream& out) const;

    std::filesystem::path WriteManifest() const;
};

}  // namespace packager
