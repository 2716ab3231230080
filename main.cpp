#include <cstdlib>
#include <iostream>
#include <string>

#include "app/StenoDeskApp.hpp"

using namespace stenodesk;

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <settings.json>] [--port <n>]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    app::LaunchOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            options.port = std::atoi(argv[++i]);
            if (options.port <= 0 || options.port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 2;
            }
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 2;
        }
    }

    app::StenoDeskApp application(options);
    return application.Run();
}
