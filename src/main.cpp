#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        vidscan::app::Application app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        std::cerr << "vidscan: " << e.what() << "\n";
        return 1;
    }
}
