#include "core/Config.hpp"
#include "ui/GridDrawerUI.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    AppConfig config;
    try {
        config = ParseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n" << Usage(argv[0]);
        return 1;
    }
    if (config.showHelp) {
        std::cout << Usage(argv[0]);
        return 0;
    }

    GridDrawerUI app(config);
    return app.run();
}
