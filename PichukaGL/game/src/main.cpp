#include "Game.hpp"
#include <Pichuka/Core/Config.hpp>
#include <Pichuka/Core/Logger.hpp>
#include <iostream>
#include <cstdlib>

using Pichuka::Core::Logger;
using Pichuka::Core::LogOutput;

int main(int argc, char** argv) {
    Pichuka::Config::GameConfig config;

    // Optional JSON configuration; the defaults reproduce the reference game
    if (argc > 1) {
        auto loaded = Pichuka::Config::ConfigLoader().load(argv[1]);
        if (loaded.isFailure()) {
            std::cerr << "Invalid configuration " << argv[1] << ": "
                      << Pichuka::describeError(loaded.error()) << std::endl;
            return EXIT_FAILURE;
        }
        config = loaded.value();
    }

    LogOutput outputs = LogOutput::Console;
    if (!config.logging.filePath.empty()) {
        outputs = outputs | LogOutput::File;
    }
    if (!Logger::Instance().Initialize(config.logging.level, outputs, config.logging.filePath)) {
        std::cerr << "Logging unavailable, continuing without it" << std::endl;
    }

    PICHUKA_LOG_INFO("PICHUKA starting");

    int status = EXIT_SUCCESS;
    {
        PichukaGL::Game game(config);

        if (game.Initialize()) {
            game.Run();
        } else {
            PICHUKA_LOG_CRITICAL("Failed to initialize game!");
            status = EXIT_FAILURE;
        }

        game.Shutdown();
    }

    PICHUKA_LOG_INFO("PICHUKA exited");
    Logger::Instance().Shutdown();
    return status;
}
