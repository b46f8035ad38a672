#include "gui_sdl/Application.hpp"
#include "gui_sdl/GameScreen.hpp"
#include "controller/CommandLine.hpp"

#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    blockfall::controller::CommandLineOptions options;
    try {
        options = blockfall::controller::parseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "blockfall: " << e.what() << '\n'
                  << blockfall::controller::usage(argv[0]);
        return 1;
    }
    if (options.showHelp) {
        std::cout << blockfall::controller::usage(argv[0]);
        return 0;
    }

    blockfall::gui_sdl::Application app;
    if (!app.init("Blockfall", 600, 660)) {
        return 1;
    }

    app.setScreen(std::make_unique<blockfall::gui_sdl::GameScreen>(options.config));
    return app.run();
}
