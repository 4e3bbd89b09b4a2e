#pragma once
#include <csignal>
#include <functional>
#include "logging.hpp"

namespace signals
{

    // Global callback for signal handling
    inline std::function<void()> shutdownCallback;

    // Signal handler function
    inline void signalHandler(int signal)
    {
        log_warning("Received signal " + std::to_string(signal) + ", shutting down...");

        // The loop notices the callback and unwinds on its own
        if (shutdownCallback)
        {
            shutdownCallback();
        }
    }

    // Register signal handlers and shutdown callback
    inline void setupSignalHandlers(std::function<void()> callback)
    {
        shutdownCallback = callback;
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        log_debug("Signal handlers registered for graceful shutdown");
    }

} // namespace signals
