#include "scanner/fs_directory_scanner.hpp"

#include <format>
#include <system_error>

#include "errors.hpp"
#include "logger.hpp"
#include "scanner/glob.hpp"

namespace packager::scanner {

namespace {

void RequireDirectory(const fs::path& path) {
    std::error_code ec;
    if(!fs::is_directory(path, ec)) {
        throw NotFoundError(std::format("Directory not found: {}", path.string()));
    }
}

[[noreturn]] void ThrowScanError(const fs::path& path, const std::error_code& ec) {
    throw ScanError(std::format("Failed to enumerate {}: {}", path.string(), ec.message()));
}

// Общий обход для обычного и рекурсивного итератора. Ошибка на любом шаге прерывает весь скан.
template<typename Iterator>
std::vector<std::string> CollectEntries(const fs::path& folder, const std::vector<std::string>& exclude_patterns) {
    std::vector<std::string> names;
    std::error_code ec;

    Iterator it(folder, fs::directory_options::none, ec);
    if(ec) {
        ThrowScanError(folder, ec);
    }
    // При ошибке increment() переводит итератор в конец, ec проверяем после цикла.
    for(; it != Iterator(); it.increment(ec)) {
        const auto filename = it->path().filename().string();
        if(MatchesAny(filename, exclude_patterns)) {
            Logger::Get().Debug(std::format("Excluded {}", it->path().string()));
            continue;
        }
        names.push_back(MemberName(*it));
    }
    if(ec) {
        ThrowScanError(folder, ec);
    }
    return names;
}

}  // namespace

std::string MemberName(const fs::directory_entry& entry) {
    std::error_code ec;
    // Битая символическая ссылка дает ошибку в ec, такую сущность считаем файлом.
    if(entry.is_directory(ec) && !ec) {
        return entry.path().filename().string();
    }
    return entry.path().stem().string();
}

std::vector<fs::path> FsDirectoryScanner::ListSubfolders(const fs::path& root) {
    RequireDirectory(root);

    std::vector<fs::path> folders;
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if(ec) {
        ThrowScanError(root, ec);
    }
    for(; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code status_ec;
        if(it->is_directory(status_ec) && !status_ec) {
            folders.push_back(it->path());
        }
    }
    if(ec) {
        ThrowScanError(root, ec);
    }
    return folders;
}

std::vector<std::string> FsDirectoryScanner::ListEntries(const fs::path& folder,
                                                         const std::vector<std::string>& exclude_patterns,
                                                         bool recursive) {
    RequireDirectory(folder);

    if(recursive) {
        return CollectEntries<fs::recursive_directory_iterator>(folder, exclude_patterns);
    }
    return CollectEntries<fs::directory_iterator>(folder, exclude_patterns);
}

}  // namespace packager::scanner
