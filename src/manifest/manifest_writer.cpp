#include "manifest/manifest_writer.hpp"

#include <format>
#include <fstream>
#include <system_error>
#include <utility>

#include "errors.hpp"
#include "logger.hpp"

namespace packager::manifest {

namespace {

void WriteLine(std::ostream& out, int depth, std::string_view text) {
    for(int i = 0; i < depth; ++i) {
        out << kIndent;
    }
    out << text << kLineBreak;
}

void WriteElement(std::ostream& out, int depth, std::string_view name, std::string_view value) {
    WriteLine(out, depth, std::format("<{0}>{1}</{0}>", name, EscapeXml(value)));
}

// Удаляет временный файл, если до переименования дело не дошло.
class TempFileGuard {
    std::filesystem::path path_;
    bool committed_{false};

    public:
    explicit TempFileGuard(std::filesystem::path path): path_(std::move(path)) {}

    TempFileGuard(const TempFileGuard&)            = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void Commit() {
        committed_ = true;
    }

    ~TempFileGuard() {
        if(!committed_) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            if(ec) {
                Logger::Get().Warn(std::format("Failed to remove {}: {}", path_.string(), ec.message()));
            }
        }
    }
};

}  // namespace

std::string EscapeXml(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for(char c: text) {
        switch(c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

void ManifestWriter::Write(const Manifest& manifest, std::ostream& out) {
    // Без атрибута encoding. Байты при этом все равно UTF-8.
    WriteLine(out, 0, R"(<?xml version="1.0"?>)");
    WriteLine(out, 0, std::format(R"(<Package xmlns="{}">)", EscapeXml(manifest.xml_namespace)));

    for(const auto& group: manifest.groups) {
        WriteLine(out, 1, "<types>");
        for(const auto& member: group.members) {
            WriteElement(out, 2, "members", member);
        }
        WriteElement(out, 2, "name", group.type_name);
        WriteLine(out, 1, "</types>");
    }

    WriteElement(out, 1, "version", manifest.api_version);
    WriteLine(out, 0, "</Package>");
}

void ManifestWriter::Write(const Manifest& manifest, const std::filesystem::path& destination) {
    auto temp_path = destination;
    temp_path += ".tmp";
    TempFileGuard guard(temp_path);

    {
        // Поток закрывается при выходе из блока, в том числе по исключению.
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if(!out) {
            throw IOError(std::format("Cannot open {} for writing", temp_path.string()));
        }
        Write(manifest, out);
        out.close();
        if(!out) {
            throw IOError(std::format("Failed to write {}", temp_path.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, destination, ec);
    if(ec) {
        throw IOError(std::format("Cannot replace {}: {}", destination.string(), ec.message()));
    }
    guard.Commit();
    Logger::Get().Log(std::format("Manifest written to {}", destination.string()));
}

}  // namespace packager::manifest
