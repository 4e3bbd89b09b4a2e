#include "keyboard.hpp"
#include "utils.hpp"

#include <X11/Xlib.h>

using namespace std;

namespace
{
    unsigned char lookupKeycode(Display *display, char key)
    {
        KeyCode keycode = XKeysymToKeycode(display, static_cast<KeySym>(KeyboardPoller::keysymFor(key)));
        if (keycode == 0)
        {
            throw ClickerError("Key '" + string(1, key) + "' is not on the current keyboard map");
        }
        return keycode;
    }
}

unsigned long KeyboardPoller::keysymFor(char key)
{
    // Latin-1 keysyms 0x20-0x7e and 0xa0-0xff equal the character code
    unsigned char code = static_cast<unsigned char>(key);
    if (code < 0x20 || (code > 0x7e && code < 0xa0))
    {
        throw ClickerError("Key code " + to_string(code) + " is not a printable key");
    }
    return code;
}

KeyboardPoller::KeyboardPoller(const string &display_name, char start_key, char pause_key)
    : display(x11::openDisplay(display_name))
{
    start_keycode = lookupKeycode(display.get(), start_key);
    pause_keycode = lookupKeycode(display.get(), pause_key);
}

bool KeyboardPoller::isDown(const char keymap[32], unsigned char keycode) const
{
    // One bit per keycode, 8 keycodes per byte
    return (keymap[keycode / 8] & (1 << (keycode % 8))) != 0;
}

KeyState KeyboardPoller::poll()
{
    char keymap[32] = {0};
    XQueryKeymap(display.get(), keymap);

    KeyState state;
    state.start_pressed = isDown(keymap, start_keycode);
    state.pause_pressed = isDown(keymap, pause_keycode);
    return state;
}
