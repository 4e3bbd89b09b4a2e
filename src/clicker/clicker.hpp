#pragma once
#include <string>
#include <atomic>
#include <memory>
#include <opencv2/opencv.hpp>
#include "detector/detector_interface.hpp"
#include "screen/screen_interface.hpp"
#include "run_state.hpp"

using namespace std;

// Runtime settings of the polling loop
struct ClickerConfig
{
    string display_name = "";  // "" = $DISPLAY
    int interval_ms = 10;      // Polling period
    char start_key = 's';
    char pause_key = 'p';
    bool debug_mode = false;
};

class Clicker
{
public:
    // X11 capture, click and keyboard plus the color detector.
    // Throws ClickerError when the X display cannot be opened.
    Clicker(const Region &region, const ClickerConfig &config);

    // Caller-supplied components
    Clicker(const Region &region, const ClickerConfig &config,
            std::unique_ptr<CaptureInterface> capture,
            std::unique_ptr<ClickSinkInterface> mouse,
            std::unique_ptr<KeyboardInterface> keyboard,
            std::unique_ptr<DetectorInterface> detector);
    ~Clicker();

    void run();
    void stop();
    bool isRunning() const { return running; }

    // One capture -> detect -> click pass, returns the number of clicks sent
    int runCycle();

private:
    void logTransition(RunTransition transition);

    // Configuration
    Region region;
    ClickerConfig config;

    // Hardware
    std::unique_ptr<CaptureInterface> capture;
    std::unique_ptr<ClickSinkInterface> mouse;
    std::unique_ptr<KeyboardInterface> keyboard;
    std::unique_ptr<DetectorInterface> detector;

    // Simple control
    atomic<bool> running{false};
    RunState run_state;
};
