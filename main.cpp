#include <format>
#include <iostream>
#include <print>

#include "cli/arg_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "packager.hpp"

using namespace packager;

int main(int argc, char* argv[]) {
    const char* program = argc > 0 ? argv[0] : "sf-packager";

    try {
        const auto options = cli::ArgParser::Parse(argc, argv);
        if(options.show_help) {
            std::print("{}", cli::ArgParser::Usage(program));
            return 0;
        }
        Logger::Get().SetVerbose(options.verbose);

        Packager app(options);
        app.Run(std::cout);
    }
    catch(const UsageError& e) {
        Logger::Get().Error(e.what());
        std::print(stderr, "{}", cli::ArgParser::Usage(program));
        return 2;
    }
    catch(const PackagerError& e) {
        Logger::Get().Error(e.what());
        return 1;
    }
    catch(const std::exception& e) {  // Например, std::bad_alloc или ошибка std::filesystem::current_path().
        Logger::Get().Error(std::format("Unexpected failure: {}", e.what()));
        return 1;
    }
    return 0;
}
