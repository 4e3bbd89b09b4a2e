#pragma once
#include <string>
#include "display.hpp"
#include "screen_interface.hpp"

using namespace std;

// Reads the global key map of the X server, no focus or grab needed
class KeyboardPoller : public KeyboardInterface
{
public:
    // Throws ClickerError when the display cannot be opened or a key has no keycode
    KeyboardPoller(const string &display_name, char start_key, char pause_key);

    KeyState poll() override;

    // Printable Latin-1 characters are their own keysym, throws ClickerError otherwise
    static unsigned long keysymFor(char key);

private:
    bool isDown(const char keymap[32], unsigned char keycode) const;

    x11::DisplayPtr display;
    unsigned char start_keycode = 0;
    unsigned char pause_keycode = 0;
};
