#pragma once
#include <iostream>
#include <string>
#include <cstdlib>
#include "logging.hpp"
#include "detector/detector_interface.hpp"

namespace debug
{

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cout << "=====================================\n";
        std::cout << "  " << appName << " v" << version << " starting...\n";
        std::cout << "=====================================\n";
    }

    // Print configuration details
    inline void printConfig(const Region &region, const std::string &coordsPath, int intervalMs,
                            const std::string &display, char startKey, char pauseKey)
    {
        std::cout << "Configuration:\n";
        std::cout << "  - Coordinates file: " << coordsPath << "\n";
        std::cout << "  - Region: " << region.toString() << "\n";
        std::cout << "  - Interval: " << intervalMs << " ms\n";
        std::cout << "  - Display: " << display << "\n";
        std::cout << "  - Keys: start '" << startKey << "', pause '" << pauseKey << "'\n";
        std::cout << "-------------------------------------" << std::endl;
    }

    // Print the controls once the bot is ready
    inline void printControls(char startKey, char pauseKey)
    {
        log_info("Controls:");
        log_info(std::string("  - Press '") + startKey + "' to start the bot");
        log_info(std::string("  - Press '") + pauseKey + "' to stop the bot");
        log_info("  - Press CTRL + C to exit the program");
        log_debug("Make sure the target window is inside the watched region");
        log_debug("Bot is ready to start. Waiting for user input...");
    }

    // Print version information and exit
    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "AutoClicker runtime version: " << version << std::endl;
        exit(0);
    }

    // Print help message and exit
    inline void printHelpAndExit()
    {
        std::cout << "Usage: autoclicker [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --coords <path>      Coordinates file with start_x, end_x, start_y, end_y (default: window_coordinates.txt)\n";
        std::cout << "  --interval <ms>      Polling period in milliseconds (default: 10)\n";
        std::cout << "  --display <name>     X display to watch and click on (default: $DISPLAY)\n";
        std::cout << "  --start-key <key>    Key that starts the bot (default: s)\n";
        std::cout << "  --pause-key <key>    Key that pauses the bot (default: p)\n";
        std::cout << "  --debug, -d          Enable debug mode (debug log, log file, frames in debug_frames/)\n";
        std::cout << "  --quiet, -q          Quiet mode (only show errors)\n";
        std::cout << "  --timestamps         Prefix console log lines with the time\n";
        std::cout << "  --version            Show version information\n";
        std::cout << "  --help               Show this help message\n";
        exit(0);
    }

} // namespace debug
