// Per-frame keyboard snapshot handed to behaviors by the host.
#pragma once

#include <array>

namespace Sprig {

enum class InputKey {
    Left = 0,
    Right,
    Up,
    Down,
    Fire,
    Pause,
    Count
};

class InputState {
public:
    void setKeyDown(InputKey key, bool down) { keys_[static_cast<int>(key)] = down; }
    bool isDown(InputKey key) const { return keys_[static_cast<int>(key)]; }

    // True only on the frame the key went down.
    bool wasPressed(InputKey key) const { return pressed_[static_cast<int>(key)]; }
    void markPressed(InputKey key) { pressed_[static_cast<int>(key)] = true; }

    void nextFrame() { pressed_.fill(false); }

    // Drops held keys, e.g. when the window loses focus and key-up events go elsewhere.
    void releaseAll() { keys_.fill(false); }

private:
    std::array<bool, static_cast<int>(InputKey::Count)> keys_{};
    std::array<bool, static_cast<int>(InputKey::Count)> pressed_{};
};

}  // namespace Sprig
