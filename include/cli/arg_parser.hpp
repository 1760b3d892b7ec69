#pragma once

#include <span>
#include <string>
#include <string_view>

#include "config.hpp"

namespace packager::cli {

class ArgParser {
    public:
    // Принимает "--opt value", "--opt=value" и имена параметров исходного скрипта ("-apiVersion 32.0").
    // При ошибке бросает UsageError.
    static Options Parse(std::span<const std::string_view> args);

    static Options Parse(int argc, char* argv[]);

    static std::string Usage(std::string_view program);
};

}  // namespace packager::cli
