#include "fineinput/presets.hpp"

namespace fineinput {

namespace {

// A press arrives as +X; these reorient it
InputBinding positiveX(const RawInput& input) {
    return InputBinding(input);
}

InputBinding negativeX(const RawInput& input) {
    return InputBinding(input, {Negate::x()});
}

InputBinding positiveY(const RawInput& input) {
    return InputBinding(input, {SwizzleAxis{SwizzleOrder::YXZ}});
}

InputBinding negativeY(const RawInput& input) {
    return InputBinding(input, {SwizzleAxis{SwizzleOrder::YXZ}, Negate::y()});
}

InputBinding positiveZ(const RawInput& input) {
    return InputBinding(input, {SwizzleAxis{SwizzleOrder::ZYX}});
}

InputBinding negativeZ(const RawInput& input) {
    return InputBinding(input, {SwizzleAxis{SwizzleOrder::ZYX}, Negate::z()});
}

// Diagonals copy X into Y, then flip whichever half points negative
InputBinding diagonal(const RawInput& input, bool negX, bool negY) {
    InputBinding binding(input, {SwizzleAxis{SwizzleOrder::XXX}});
    if (negX || negY) {
        binding.withModifier(Negate{negX, negY, false});
    }
    return binding;
}

}  // namespace

// ============================================================================
// Cardinal
// ============================================================================

Cardinal Cardinal::wasdKeys() {
    return Cardinal{KeyCode::KeyW, KeyCode::KeyD, KeyCode::KeyS, KeyCode::KeyA};
}

Cardinal Cardinal::arrowKeys() {
    return Cardinal{KeyCode::ArrowUp, KeyCode::ArrowRight, KeyCode::ArrowDown, KeyCode::ArrowLeft};
}

Cardinal Cardinal::dpadButtons() {
    return Cardinal{GamepadButton::DPadUp, GamepadButton::DPadRight,
                    GamepadButton::DPadDown, GamepadButton::DPadLeft};
}

std::vector<InputBinding> Cardinal::bindings() const {
    return {positiveY(north), positiveX(east), negativeY(south), negativeX(west)};
}

// ============================================================================
// Bidirectional / Axial
// ============================================================================

std::vector<InputBinding> Bidirectional::bindings() const {
    return {positiveX(positive), negativeX(negative)};
}

Axial Axial::leftStick() {
    return Axial{GamepadAxis::LeftStickX, GamepadAxis::LeftStickY};
}

Axial Axial::rightStick() {
    return Axial{GamepadAxis::RightStickX, GamepadAxis::RightStickY};
}

std::vector<InputBinding> Axial::bindings() const {
    return {positiveX(x), positiveY(y)};
}

// ============================================================================
// Spatial
// ============================================================================

Spatial Spatial::wasdSpaceShift() {
    return Spatial{KeyCode::KeyW, KeyCode::KeyS, KeyCode::KeyA, KeyCode::KeyD,
                   KeyCode::Space, KeyCode::ShiftLeft};
}

std::vector<InputBinding> Spatial::bindings() const {
    return {
        negativeZ(forward), positiveZ(backward),
        negativeX(left), positiveX(right),
        positiveY(up), negativeY(down),
    };
}

// ============================================================================
// Ordinal
// ============================================================================

Ordinal Ordinal::numpadKeys() {
    return Ordinal{
        KeyCode::Numpad8, KeyCode::Numpad9, KeyCode::Numpad6, KeyCode::Numpad3,
        KeyCode::Numpad2, KeyCode::Numpad1, KeyCode::Numpad4, KeyCode::Numpad7,
    };
}

Ordinal Ordinal::hjklyubn() {
    return Ordinal{
        KeyCode::KeyK, KeyCode::KeyU, KeyCode::KeyL, KeyCode::KeyN,
        KeyCode::KeyJ, KeyCode::KeyB, KeyCode::KeyH, KeyCode::KeyY,
    };
}

std::vector<InputBinding> Ordinal::bindings() const {
    return {
        positiveY(north), diagonal(northEast, false, false),
        positiveX(east), diagonal(southEast, false, true),
        negativeY(south), diagonal(southWest, true, true),
        negativeX(west), diagonal(northWest, true, false),
    };
}

}  // namespace fineinput
