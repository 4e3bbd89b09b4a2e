#pragma once
#include <atomic>

// What changed in the last update
enum class RunTransition
{
    NONE,
    STARTED,
    PAUSED
};

// Start/pause flag driven by key polls. The loop thread is the only writer;
// reads from anywhere else go through the atomic.
class RunState
{
public:
    // Start key wins when both keys are held, no key keeps the current state
    RunTransition update(bool start_pressed, bool pause_pressed)
    {
        bool was_running = running.load();
        bool now_running = was_running;

        if (start_pressed)
            now_running = true;
        else if (pause_pressed)
            now_running = false;

        running.store(now_running);

        if (now_running && !was_running)
            return RunTransition::STARTED;
        if (!now_running && was_running)
            return RunTransition::PAUSED;
        return RunTransition::NONE;
    }

    bool isRunning() const { return running.load(); }

private:
    std::atomic<bool> running{false}; // The bot starts paused
};
