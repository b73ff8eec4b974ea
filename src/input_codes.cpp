#include "fineinput/input_codes.hpp"

#include <array>

namespace fineinput {

namespace {

constexpr std::array<std::string_view, 26> LETTER_NAMES = {
    "KeyA", "KeyB", "KeyC", "KeyD", "KeyE", "KeyF", "KeyG", "KeyH", "KeyI",
    "KeyJ", "KeyK", "KeyL", "KeyM", "KeyN", "KeyO", "KeyP", "KeyQ", "KeyR",
    "KeyS", "KeyT", "KeyU", "KeyV", "KeyW", "KeyX", "KeyY", "KeyZ",
};

constexpr std::array<std::string_view, 10> DIGIT_NAMES = {
    "Digit0", "Digit1", "Digit2", "Digit3", "Digit4",
    "Digit5", "Digit6", "Digit7", "Digit8", "Digit9",
};

constexpr std::array<std::string_view, 10> NUMPAD_NAMES = {
    "Numpad0", "Numpad1", "Numpad2", "Numpad3", "Numpad4",
    "Numpad5", "Numpad6", "Numpad7", "Numpad8", "Numpad9",
};

constexpr std::array<std::string_view, 12> FUNCTION_NAMES = {
    "F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12",
};

// Index into a contiguous range of enum values, or -1 if outside it
template<typename E>
int rangeIndex(E value, E first, size_t count) {
    auto v = static_cast<int>(value);
    auto f = static_cast<int>(first);
    if (v < f || v >= f + static_cast<int>(count)) {
        return -1;
    }
    return v - f;
}

}  // namespace

std::string_view keyName(KeyCode key) {
    if (int i = rangeIndex(key, KeyCode::KeyA, LETTER_NAMES.size()); i >= 0) {
        return LETTER_NAMES[static_cast<size_t>(i)];
    }
    if (int i = rangeIndex(key, KeyCode::Digit0, DIGIT_NAMES.size()); i >= 0) {
        return DIGIT_NAMES[static_cast<size_t>(i)];
    }
    if (int i = rangeIndex(key, KeyCode::Numpad0, NUMPAD_NAMES.size()); i >= 0) {
        return NUMPAD_NAMES[static_cast<size_t>(i)];
    }
    if (int i = rangeIndex(key, KeyCode::F1, FUNCTION_NAMES.size()); i >= 0) {
        return FUNCTION_NAMES[static_cast<size_t>(i)];
    }

    switch (key) {
        case KeyCode::Space:          return "Space";
        case KeyCode::Escape:         return "Escape";
        case KeyCode::Enter:          return "Enter";
        case KeyCode::Tab:            return "Tab";
        case KeyCode::Backspace:      return "Backspace";
        case KeyCode::ArrowRight:     return "ArrowRight";
        case KeyCode::ArrowLeft:      return "ArrowLeft";
        case KeyCode::ArrowDown:      return "ArrowDown";
        case KeyCode::ArrowUp:        return "ArrowUp";
        case KeyCode::NumpadDecimal:  return "NumpadDecimal";
        case KeyCode::NumpadDivide:   return "NumpadDivide";
        case KeyCode::NumpadMultiply: return "NumpadMultiply";
        case KeyCode::NumpadSubtract: return "NumpadSubtract";
        case KeyCode::NumpadAdd:      return "NumpadAdd";
        case KeyCode::NumpadEnter:    return "NumpadEnter";
        case KeyCode::ShiftLeft:      return "ShiftLeft";
        case KeyCode::ControlLeft:    return "ControlLeft";
        case KeyCode::AltLeft:        return "AltLeft";
        case KeyCode::SuperLeft:      return "SuperLeft";
        case KeyCode::ShiftRight:     return "ShiftRight";
        case KeyCode::ControlRight:   return "ControlRight";
        case KeyCode::AltRight:       return "AltRight";
        case KeyCode::SuperRight:     return "SuperRight";
        default:                      return "Unknown";
    }
}

std::string_view mouseButtonName(MouseButton button) {
    switch (button) {
        case MouseButton::Left:    return "Left";
        case MouseButton::Right:   return "Right";
        case MouseButton::Middle:  return "Middle";
        case MouseButton::Back:    return "Back";
        case MouseButton::Forward: return "Forward";
    }
    return "Unknown";
}

std::string_view gamepadButtonName(GamepadButton button) {
    switch (button) {
        case GamepadButton::South:        return "South";
        case GamepadButton::East:         return "East";
        case GamepadButton::West:         return "West";
        case GamepadButton::North:        return "North";
        case GamepadButton::LeftBumper:   return "LeftBumper";
        case GamepadButton::RightBumper:  return "RightBumper";
        case GamepadButton::Select:       return "Select";
        case GamepadButton::Start:        return "Start";
        case GamepadButton::Mode:         return "Mode";
        case GamepadButton::LeftThumb:    return "LeftThumb";
        case GamepadButton::RightThumb:   return "RightThumb";
        case GamepadButton::DPadUp:       return "DPadUp";
        case GamepadButton::DPadRight:    return "DPadRight";
        case GamepadButton::DPadDown:     return "DPadDown";
        case GamepadButton::DPadLeft:     return "DPadLeft";
        case GamepadButton::LeftTrigger:  return "LeftTrigger";
        case GamepadButton::RightTrigger: return "RightTrigger";
    }
    return "Unknown";
}

std::string_view gamepadAxisName(GamepadAxis axis) {
    switch (axis) {
        case GamepadAxis::LeftStickX:  return "LeftStickX";
        case GamepadAxis::LeftStickY:  return "LeftStickY";
        case GamepadAxis::RightStickX: return "RightStickX";
        case GamepadAxis::RightStickY: return "RightStickY";
        case GamepadAxis::LeftZ:       return "LeftZ";
        case GamepadAxis::RightZ:      return "RightZ";
    }
    return "Unknown";
}

}  // namespace fineinput
