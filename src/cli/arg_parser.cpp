#include "cli/arg_parser.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <optional>
#include <vector>

#include "errors.hpp"
#include "registry/folder_type_registry.hpp"

namespace packager::cli {

namespace {

enum class Key {
    Root,
    Dir,
    ApiVersion,
    PackageName,
    XmlNamespace,
    Verbose,
    Help,
};

struct OptionName {
    std::string_view name;
    Key key;
};

constexpr OptionName kOptionNames[] = {
    {"root", Key::Root},
    {"dir", Key::Dir},
    {"api-version", Key::ApiVersion},
    {"apiVersion", Key::ApiVersion},
    {"package-name", Key::PackageName},
    {"packageName", Key::PackageName},
    {"xmlns", Key::XmlNamespace},
    {"xmlnsSource", Key::XmlNamespace},
    {"verbose", Key::Verbose},
    {"help", Key::Help},
    {"h", Key::Help},
};

std::optional<Key> FindKey(std::string_view name) {
    auto it = std::ranges::find(kOptionNames, name, &OptionName::name);
    if(it == std::end(kOptionNames)) {
        return std::nullopt;
    }
    return it->key;
}

bool IsFlag(Key key) {
    return key == Key::Verbose || key == Key::Help;
}

}  // namespace

Options ArgParser::Parse(std::span<const std::string_view> args) {
    Options options;

    for(size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        if(!arg.starts_with('-') || arg == "-" || arg == "--") {
            throw UsageError(std::format("Unexpected argument: {}", arg));
        }
        arg.remove_prefix(arg.starts_with("--") ? 2 : 1);

        std::optional<std::string_view> value;
        if(auto eq = arg.find('='); eq != std::string_view::npos) {
            value = arg.substr(eq + 1);
            arg   = arg.substr(0, eq);
        }

        const auto key = FindKey(arg);
        if(!key) {
            throw UsageError(std::format("Unknown option: {}", args[i]));
        }

        if(IsFlag(*key)) {
            if(value) {
                throw UsageError(std::format("Option --{} does not take a value", arg));
            }
            if(*key == Key::Verbose) {
                options.verbose = true;
            }
            else {
                options.show_help = true;
            }
            continue;
        }

        if(!value) {
            if(i + 1 >= args.size()) {
                throw UsageError(std::format("Option --{} requires a value", arg));
            }
            value = args[++i];
        }

        switch(*key) {
            case Key::Root: options.root = std::string(*value); break;
            case Key::Dir: options.dir = std::string(*value); break;
            case Key::ApiVersion: options.api_version = std::string(*value); break;
            case Key::PackageName: options.package_name = std::string(*value); break;
            case Key::XmlNamespace: options.xml_namespace = std::string(*value); break;
            case Key::Verbose:
            case Key::Help: break;
        }
    }

    if(options.package_name.empty()) {
        throw UsageError("Package name must not be empty");
    }
    return options;
}

Options ArgParser::Parse(int argc, char* argv[]) {
    std::vector<std::string_view> args;
    args.reserve(argc > 0 ? argc - 1 : 0);
    for(int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return Parse(args);
}

std::string ArgParser::Usage(std::string_view program) {
    std::string usage = std::format(
        "Usage: {} [--root <path>] [--dir <name>] [--api-version <version>]\n"
        "       [--package-name <file>] [--xmlns <url>] [--verbose] [--help]\n\n"
        "Without --dir writes <root>/<package-name> listing every subfolder of <root>.\n"
        "With --dir prints <members> lines for <root>/<dir> to standard output.\n\n"
        "Known folders:\n",
        program);
    for(const auto& entry: registry::FolderTypeRegistry::Entries()) {
        usage += std::format("  {:<16} {}\n", entry.folder_name, entry.type_name);
    }
    return usage;
}

}  // namespace packager::cli
