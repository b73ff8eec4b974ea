#include "fineinput/input_snapshot.hpp"

#include <algorithm>

namespace fineinput {

// ============================================================================
// InputSnapshot
// ============================================================================

void InputSnapshot::beginFrame() {
    keysJustPressed_.clear();
    keysJustReleased_.clear();
    mouseJustPressed_.clear();
    mouseJustReleased_.clear();
    mouseMotion_ = glm::vec2(0.0f);
    mouseWheel_ = glm::vec2(0.0f);
}

void InputSnapshot::clear() {
    beginFrame();
    keysPressed_.clear();
    mousePressed_.clear();
    gamepads_.clear();
}

void InputSnapshot::pressKey(KeyCode key) {
    if (keysPressed_.insert(key).second) {
        keysJustPressed_.insert(key);
    }
}

void InputSnapshot::releaseKey(KeyCode key) {
    if (keysPressed_.erase(key) > 0) {
        keysJustReleased_.insert(key);
    }
}

bool InputSnapshot::keyPressed(KeyCode key) const {
    return keysPressed_.contains(key);
}

bool InputSnapshot::keyJustPressed(KeyCode key) const {
    return keysJustPressed_.contains(key);
}

bool InputSnapshot::keyJustReleased(KeyCode key) const {
    return keysJustReleased_.contains(key);
}

void InputSnapshot::pressMouseButton(MouseButton button) {
    if (mousePressed_.insert(button).second) {
        mouseJustPressed_.insert(button);
    }
}

void InputSnapshot::releaseMouseButton(MouseButton button) {
    if (mousePressed_.erase(button) > 0) {
        mouseJustReleased_.insert(button);
    }
}

bool InputSnapshot::mouseButtonPressed(MouseButton button) const {
    return mousePressed_.contains(button);
}

bool InputSnapshot::mouseButtonJustPressed(MouseButton button) const {
    return mouseJustPressed_.contains(button);
}

bool InputSnapshot::mouseButtonJustReleased(MouseButton button) const {
    return mouseJustReleased_.contains(button);
}

void InputSnapshot::connectGamepad(GamepadId id) {
    gamepads_.try_emplace(id);
}

void InputSnapshot::disconnectGamepad(GamepadId id) {
    gamepads_.erase(id);
}

bool InputSnapshot::gamepadConnected(GamepadId id) const {
    return gamepads_.contains(id);
}

std::vector<GamepadId> InputSnapshot::connectedGamepads() const {
    std::vector<GamepadId> result;
    result.reserve(gamepads_.size());
    for (const auto& [id, state] : gamepads_) {
        result.push_back(id);
    }
    return result;
}

void InputSnapshot::setGamepadButton(GamepadId id, GamepadButton button, float value) {
    gamepads_[id].buttons[button] = value;
}

float InputSnapshot::gamepadButton(GamepadId id, GamepadButton button) const {
    auto it = gamepads_.find(id);
    if (it == gamepads_.end()) {
        return 0.0f;
    }
    auto bit = it->second.buttons.find(button);
    return bit != it->second.buttons.end() ? bit->second : 0.0f;
}

void InputSnapshot::setGamepadAxis(GamepadId id, GamepadAxis axis, float value) {
    gamepads_[id].axes[axis] = value;
}

float InputSnapshot::gamepadAxis(GamepadId id, GamepadAxis axis) const {
    auto it = gamepads_.find(id);
    if (it == gamepads_.end()) {
        return 0.0f;
    }
    auto ait = it->second.axes.find(axis);
    return ait != it->second.axes.end() ? ait->second : 0.0f;
}

// ============================================================================
// InputReader
// ============================================================================

InputReader::InputReader(const InputSnapshot& snapshot)
    : snapshot_(snapshot) {
}

bool InputReader::keyAvailable(KeyCode key) const {
    return snapshot_.keyPressed(key) && !consumedKeys_.contains(key);
}

ModKeys InputReader::availableModKeys() const {
    ModKeys result;
    for (const auto& pair : ModKeys::all().keys()) {
        if (keyAvailable(pair[0]) || keyAvailable(pair[1])) {
            result |= ModKeys::fromKey(pair[0]);
        }
    }
    return result;
}

float InputReader::readGamepadButton(GamepadButton button) const {
    if (gamepad_.id) {
        return snapshot_.gamepadButton(*gamepad_.id, button);
    }
    float strongest = 0.0f;
    for (GamepadId id : snapshot_.connectedGamepads()) {
        strongest = std::max(strongest, snapshot_.gamepadButton(id, button));
    }
    return strongest;
}

float InputReader::readGamepadAxis(GamepadAxis axis) const {
    if (gamepad_.id) {
        return snapshot_.gamepadAxis(*gamepad_.id, axis);
    }
    float sum = 0.0f;
    for (GamepadId id : snapshot_.connectedGamepads()) {
        sum += snapshot_.gamepadAxis(id, axis);
    }
    return sum;
}

ActionValue InputReader::value(const RawInput& input) const {
    if (isConsumed(input) || !availableModKeys().contains(input.modKeys())) {
        return ActionValue::zero(input.capturedDim());
    }

    const auto& source = input.source();
    switch (input.kind()) {
        case InputKind::Keyboard:
            return ActionValue(snapshot_.keyPressed(std::get<KeyboardSource>(source).key));
        case InputKind::MouseButton:
            return ActionValue(snapshot_.mouseButtonPressed(std::get<MouseButtonSource>(source).button));
        case InputKind::MouseMotion:
            return ActionValue(snapshot_.mouseMotion());
        case InputKind::MouseWheel:
            return ActionValue(snapshot_.mouseWheel());
        case InputKind::GamepadButton:
            return ActionValue(readGamepadButton(std::get<GamepadButtonSource>(source).button));
        case InputKind::GamepadAxis:
            return ActionValue(readGamepadAxis(std::get<GamepadAxisSource>(source).axis));
    }
    return ActionValue::zero(input.capturedDim());
}

void InputReader::consume(const RawInput& input) {
    const auto& source = input.source();
    switch (input.kind()) {
        case InputKind::Keyboard:
            consumedKeys_.insert(std::get<KeyboardSource>(source).key);
            break;
        case InputKind::MouseButton:
            consumedMouseButtons_.insert(std::get<MouseButtonSource>(source).button);
            break;
        case InputKind::MouseMotion:
            consumedMouseMotion_ = true;
            break;
        case InputKind::MouseWheel:
            consumedMouseWheel_ = true;
            break;
        case InputKind::GamepadButton:
            consumedGamepadButtons_.insert(std::get<GamepadButtonSource>(source).button);
            break;
        case InputKind::GamepadAxis:
            consumedGamepadAxes_.insert(std::get<GamepadAxisSource>(source).axis);
            break;
    }

    for (const auto& pair : input.modKeys().keys()) {
        consumedKeys_.insert(pair[0]);
        consumedKeys_.insert(pair[1]);
    }
}

bool InputReader::isConsumed(const RawInput& input) const {
    const auto& source = input.source();
    switch (input.kind()) {
        case InputKind::Keyboard:
            return consumedKeys_.contains(std::get<KeyboardSource>(source).key);
        case InputKind::MouseButton:
            return consumedMouseButtons_.contains(std::get<MouseButtonSource>(source).button);
        case InputKind::MouseMotion:
            return consumedMouseMotion_;
        case InputKind::MouseWheel:
            return consumedMouseWheel_;
        case InputKind::GamepadButton:
            return consumedGamepadButtons_.contains(std::get<GamepadButtonSource>(source).button);
        case InputKind::GamepadAxis:
            return consumedGamepadAxes_.contains(std::get<GamepadAxisSource>(source).axis);
    }
    return false;
}

void InputReader::resetConsumed() {
    consumedKeys_.clear();
    consumedMouseButtons_.clear();
    consumedGamepadButtons_.clear();
    consumedGamepadAxes_.clear();
    consumedMouseMotion_ = false;
    consumedMouseWheel_ = false;
}

}  // namespace fineinput
