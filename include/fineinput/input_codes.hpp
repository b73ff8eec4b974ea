#pragma once

/**
 * @file input_codes.hpp
 * @brief Physical key, button and axis identifiers
 *
 * Values match GLFW constants so a host can cast GLFW codes directly.
 * The core never includes GLFW itself.
 */

#include <cstdint>
#include <string_view>

namespace fineinput {

enum class KeyCode : uint16_t {
    Space = 32,

    Digit0 = 48, Digit1, Digit2, Digit3, Digit4,
    Digit5, Digit6, Digit7, Digit8, Digit9,

    KeyA = 65, KeyB, KeyC, KeyD, KeyE, KeyF, KeyG, KeyH, KeyI, KeyJ,
    KeyK, KeyL, KeyM, KeyN, KeyO, KeyP, KeyQ, KeyR, KeyS, KeyT,
    KeyU, KeyV, KeyW, KeyX, KeyY, KeyZ,

    Escape = 256,
    Enter = 257,
    Tab = 258,
    Backspace = 259,

    ArrowRight = 262,
    ArrowLeft = 263,
    ArrowDown = 264,
    ArrowUp = 265,

    F1 = 290, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,

    Numpad0 = 320, Numpad1, Numpad2, Numpad3, Numpad4,
    Numpad5, Numpad6, Numpad7, Numpad8, Numpad9,
    NumpadDecimal = 330,
    NumpadDivide = 331,
    NumpadMultiply = 332,
    NumpadSubtract = 333,
    NumpadAdd = 334,
    NumpadEnter = 335,

    ShiftLeft = 340,
    ControlLeft = 341,
    AltLeft = 342,
    SuperLeft = 343,
    ShiftRight = 344,
    ControlRight = 345,
    AltRight = 346,
    SuperRight = 347,
};

enum class MouseButton : uint8_t {
    Left = 0,
    Right = 1,
    Middle = 2,
    Back = 3,
    Forward = 4,
};

/// Gamepad buttons, named by face position (South = A on Xbox layouts).
/// Triggers are reported as analog buttons.
enum class GamepadButton : uint8_t {
    South = 0,
    East = 1,
    West = 2,
    North = 3,
    LeftBumper = 4,
    RightBumper = 5,
    Select = 6,
    Start = 7,
    Mode = 8,
    LeftThumb = 9,
    RightThumb = 10,
    DPadUp = 11,
    DPadRight = 12,
    DPadDown = 13,
    DPadLeft = 14,
    LeftTrigger = 15,
    RightTrigger = 16,
};

enum class GamepadAxis : uint8_t {
    LeftStickX = 0,
    LeftStickY = 1,
    RightStickX = 2,
    RightStickY = 3,
    LeftZ = 4,
    RightZ = 5,
};

/// Display names ("KeyA", "ArrowUp", "North", "LeftStickX", ...).
/// Unknown values render as "Unknown".
[[nodiscard]] std::string_view keyName(KeyCode key);
[[nodiscard]] std::string_view mouseButtonName(MouseButton button);
[[nodiscard]] std::string_view gamepadButtonName(GamepadButton button);
[[nodiscard]] std::string_view gamepadAxisName(GamepadAxis axis);

}  // namespace fineinput
