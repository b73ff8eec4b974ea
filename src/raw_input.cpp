#include "fineinput/raw_input.hpp"

#include <stdexcept>

namespace fineinput {

RawInput RawInput::key(KeyCode key, ModKeys modKeys) {
    return RawInput(KeyboardSource{key}, modKeys);
}

RawInput RawInput::mouseButton(MouseButton button, ModKeys modKeys) {
    return RawInput(MouseButtonSource{button}, modKeys);
}

RawInput RawInput::mouseMotion(ModKeys modKeys) {
    return RawInput(MouseMotionSource{}, modKeys);
}

RawInput RawInput::mouseWheel(ModKeys modKeys) {
    return RawInput(MouseWheelSource{}, modKeys);
}

RawInput RawInput::gamepadButton(GamepadButton button) {
    return RawInput(GamepadButtonSource{button}, ModKeys::empty());
}

RawInput RawInput::gamepadAxis(GamepadAxis axis) {
    return RawInput(GamepadAxisSource{axis}, ModKeys::empty());
}

bool RawInput::isGamepad() const {
    return kind() == InputKind::GamepadButton || kind() == InputKind::GamepadAxis;
}

std::optional<RawInput> RawInput::tryWithModKeys(ModKeys modKeys) const {
    if (isGamepad()) {
        return std::nullopt;
    }
    return RawInput(source_, modKeys);
}

RawInput RawInput::withModKeys(ModKeys modKeys) const {
    auto result = tryWithModKeys(modKeys);
    if (!result) {
        throw std::invalid_argument("Keyboard modifiers can't be applied to gamepad input " + toString());
    }
    return *result;
}

RawInput RawInput::withoutModKeys() const {
    return RawInput(source_, ModKeys::empty());
}

ActionValueDim RawInput::capturedDim() const {
    switch (kind()) {
        case InputKind::Keyboard:
        case InputKind::MouseButton:
            return ActionValueDim::Bool;
        case InputKind::MouseMotion:
        case InputKind::MouseWheel:
            return ActionValueDim::Axis2D;
        case InputKind::GamepadButton:
        case InputKind::GamepadAxis:
            return ActionValueDim::Axis1D;
    }
    return ActionValueDim::Bool;
}

std::string RawInput::toString() const {
    std::string result;
    if (!modKeys_.isEmpty()) {
        result = modKeys_.toString() + " + ";
    }

    switch (kind()) {
        case InputKind::Keyboard:
            result += keyName(std::get<KeyboardSource>(source_).key);
            break;
        case InputKind::MouseButton:
            result += "Mouse ";
            result += mouseButtonName(std::get<MouseButtonSource>(source_).button);
            break;
        case InputKind::MouseMotion:
            result += "Mouse Motion";
            break;
        case InputKind::MouseWheel:
            result += "Scroll Wheel";
            break;
        case InputKind::GamepadButton:
            result += gamepadButtonName(std::get<GamepadButtonSource>(source_).button);
            break;
        case InputKind::GamepadAxis:
            result += gamepadAxisName(std::get<GamepadAxisSource>(source_).axis);
            break;
    }
    return result;
}

}  // namespace fineinput
