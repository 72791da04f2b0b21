#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include "app/WorldPulseApp.hpp"

using namespace worldpulse;

namespace {

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config settings.json] [--input dir] [--state dir] [--once] [--serve]\n";
}

void HandleSignal(int) {
    app::WorldPulseApp::RequestStop();
}

} // namespace

int main(int argc, char** argv) {
    app::AppOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << name << " needs a value" << std::endl;
                std::exit(1);
            }
            return argv[++i];
        };
        if (arg == "--config") {
            options.settingsPath = next("--config");
        } else if (arg == "--input") {
            options.inputDir = next("--input");
        } else if (arg == "--state") {
            options.stateDir = next("--state");
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--serve") {
            options.serve = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app::WorldPulseApp application(options);
    return application.Run();
}
