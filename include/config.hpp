#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace packager {

inline constexpr std::string_view kDefaultApiVersion   = "31.0";
inline constexpr std::string_view kDefaultPackageName  = "package.xml";
inline constexpr std::string_view kDefaultXmlNamespace = "http://soap.sforce.com/2006/04/metadata";

// Служебные файлы, которые не попадают в <types> при сборке полного манифеста.
inline const std::vector<std::string> kManifestExcludePatterns = {"*.txt", "*.log", "*.xml"};

// В режиме одной папки фильтр не применяется (в отличие от kManifestExcludePatterns).
inline const std::vector<std::string> kMemberListExcludePatterns = {};

struct Options {
    std::filesystem::path root = std::filesystem::current_path();
    std::string dir;
    std::string api_version   = std::string(kDefaultApiVersion);
    std::string package_name  = std::string(kDefaultPackageName);
    std::string xml_namespace = std::string(kDefaultXmlNamespace);
    bool verbose{false};
    bool show_help{false};
};

}  // namespace packager
