#include "packager.hpp"

#include <format>
#include <stdexcept>
#include <utility>

#include "logger.hpp"
#include "manifest/manifest_builder.hpp"
#include "manifest/manifest_writer.hpp"

namespace packager {

Packager::Packager(Options options, std::shared_ptr<scanner::IDirectoryScanner> scanner):
    options_(std::move(options)), scanner_(std::move(scanner)) {
    if(!scanner_) {
        throw std::invalid_argument("Packager requires a directory scanner");
    }
}

Mode Packager::GetMode() const {
    return options_.dir.empty() ? Mode::FullManifest : Mode::MemberList;
}

void Packager::Run(std::ostream& out) const {
    switch(GetMode()) {
        case Mode::MemberList: ListMembers(out); break;
        case Mode::FullManifest: WriteManifest(); break;
    }
}

void Packager::ListMembers(std::ostream& out) const {
    const auto folder = options_.root / options_.dir;
    Logger::Get().Debug(std::format("Listing members of {}", folder.string()));

    // Рекурсивно и без фильтра, в отличие от сборки полного манифеста.
    for(const auto& name: scanner_->ListEntries(folder, kMemberListExcludePatterns, true)) {
        out << "<members>" << name << "</members>" << manifest::kLineBreak;
    }
    out.flush();
}

std::filesystem::path Packager::WriteManifest() const {
    manifest::ManifestBuilder builder(scanner_, options_.api_version, options_.xml_namespace);
    const auto manifest    = builder.Build(options_.root);
    const auto destination = options_.root / options_.package_name;
    manifest::ManifestWriter::Write(manifest, destination);
    return destination;
}

}  // namespace packager
