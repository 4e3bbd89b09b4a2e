#include "clicker.hpp"
#include "detector/color/color_detector.hpp"
#include "screen/screen_capture.hpp"
#include "screen/mouse_sink.hpp"
#include "screen/keyboard.hpp"
#include "utils.hpp"
#include <thread>
#include <chrono>

using namespace std;

Clicker::Clicker(const Region &region, const ClickerConfig &config)
    : Clicker(region, config,
              std::make_unique<ScreenCapture>(config.display_name),
              std::make_unique<MouseSink>(config.display_name),
              std::make_unique<KeyboardPoller>(config.display_name, config.start_key, config.pause_key),
              std::make_unique<ColorDetector>(config.debug_mode))
{
}

Clicker::Clicker(const Region &region, const ClickerConfig &config,
                 std::unique_ptr<CaptureInterface> capture,
                 std::unique_ptr<ClickSinkInterface> mouse,
                 std::unique_ptr<KeyboardInterface> keyboard,
                 std::unique_ptr<DetectorInterface> detector)
    : region(region), config(config), capture(std::move(capture)), mouse(std::move(mouse)),
      keyboard(std::move(keyboard)), detector(std::move(detector))
{
    log_info("Watching region " + region.toString() + " on display " + x11::describeDisplay(config.display_name));
}

Clicker::~Clicker()
{
    stop();
}

void Clicker::stop()
{
    running = false;
}

void Clicker::logTransition(RunTransition transition)
{
    switch (transition)
    {
    case RunTransition::STARTED:
        log_info("Started Bot...");
        break;
    case RunTransition::PAUSED:
        log_info("Paused Bot...");
        break;
    case RunTransition::NONE:
        break;
    }
}

int Clicker::runCycle()
{
    try
    {
        // 1. Capture the region
        Mat frame = capture->capture(region);

        // 2. Detect and select
        DetectorResult result = detector->process(frame, region);

        // 3. Click whatever was selected
        if (result)
        {
            int clicks = mouse->clickSelection(result.selection);
            log_debug("Clicked " + log_string(clicks) + " point(s), first at (" +
                      to_string(result.selection.points.front().x) + "," + to_string(result.selection.points.front().y) + ")" +
                      " | Pink: " + to_string(result.pink_count) +
                      " | Green: " + to_string(result.green_count) +
                      " | Hazards: " + to_string(result.hazard_count) +
                      " | Processing: " + to_string(result.processing_time_ms) + "ms");
            return clicks;
        }
    }
    catch (const InvalidRegionError &e)
    {
        // Nothing the next tick can fix
        log_error(string("Invalid region: ") + e.what());
        stop();
    }
    catch (const CaptureError &e)
    {
        log_warning(string("Capture failed, skipping cycle: ") + e.what());
    }
    catch (const ClickerError &e)
    {
        log_warning(string("Click failed: ") + e.what());
    }

    return 0;
}

void Clicker::run()
{
    running = true;
    log_info("Clicker polling every " + to_string(config.interval_ms) + " ms");

    const auto period = chrono::milliseconds(config.interval_ms);

    while (running)
    {
        auto tick_start = chrono::steady_clock::now();

        KeyState keys = keyboard->poll();
        logTransition(run_state.update(keys.start_pressed, keys.pause_pressed));

        if (run_state.isRunning())
        {
            runCycle();
        }

        // Overrunning cycles are followed immediately, missed ticks are not made up
        auto next_tick = tick_start + period;
        if (chrono::steady_clock::now() < next_tick)
        {
            this_thread::sleep_until(next_tick);
        }
    }

    log_info("Clicker stopped");
}
