#include "clicker/clicker.hpp"
#include "utils/args.hpp"
#include "utils/debug.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include "utils/coordinates.hpp"
#include "screen/display.hpp"
#include <string>
#include <thread>
#include <chrono>
#include <optional>

using namespace std;

// version string for the application
const string version = "0.1.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  // Parse command line arguments with defaults
  ClickerConfig config;
  string coords_path = getArg(argc, argv, "--coords", coordinates::DEFAULT_FILENAME);
  config.display_name = getArg(argc, argv, "--display", "");
  config.debug_mode = hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d");
  bool quiet_mode = hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q");
  logging::setShowTimestamp(hasFlag(argc, argv, "--timestamps"));

  try
  {
    config.start_key = getArg(argc, argv, "--start-key", 's');
    config.pause_key = getArg(argc, argv, "--pause-key", 'p');
    config.interval_ms = getArg(argc, argv, "--interval", 10);
  }
  catch (const invalid_argument &e)
  {
    log_error(e.what());
    return 1;
  }
  if (config.interval_ms < 0)
  {
    log_error("--interval must not be negative");
    return 1;
  }

  // set log level based on debug mode
  if (config.debug_mode)
  {
    logging::setLogLevel(logging::LogLevel::DEBUG); // Show everything
    logging::setFileLogging(true);
    log_info("Debug mode enabled - showing all log messages");
  }
  else if (quiet_mode)
  {
    logging::setLogLevel(logging::LogLevel::ERROR); // Only errors
  }

  debug::printStartup("AutoClicker", version);

  // The watched region comes from the coordinates file
  optional<Region> region = coordinates::load(coords_path);
  if (!region)
  {
    // Leave the message on screen for a moment before the window closes
    this_thread::sleep_for(chrono::seconds(3));
    return 1;
  }

  debug::printConfig(*region, coords_path, config.interval_ms, x11::describeDisplay(config.display_name),
                     config.start_key, config.pause_key);

  try
  {
    Clicker clicker(*region, config);

    // Register signal handlers with a lambda to stop the clicker
    signals::setupSignalHandlers([&clicker]()
                                 { clicker.stop(); });

    debug::printControls(config.start_key, config.pause_key);

    clicker.run();

    // The loop is gone, stop routing signals into it
    signals::setupSignalHandlers(nullptr);
  }
  catch (const ClickerError &e)
  {
    log_error(e.what());
    return 1;
  }

  return 0;
}
