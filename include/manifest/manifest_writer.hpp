#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

#include "types.hpp"

namespace packager::manifest {

inline constexpr std::string_view kLineBreak = "\r\n";
inline constexpr char kIndent                = '\t';

class ManifestWriter {
    public:
    // Пишет документ во временный файл рядом с destination и переименовывает его только после
    // успешной записи. При ошибке бросает IOError, а прежний destination остается нетронутым.
    static void Write(const Manifest& manifest, const std::filesystem::path& destination);

    static void Write(const Manifest& manifest, std::ostream& out);
};

// Экранирует &, <, >, " и ' для текста и значений атрибутов.
std::string EscapeXml(std::string_view text);

}  // namespace packager::manifest
