#pragma once

/**
 * @file input_binding.hpp
 * @brief One raw input plus the modifiers applied to it alone
 */

#include "fineinput/input_modifier.hpp"
#include "fineinput/raw_input.hpp"

#include <utility>
#include <vector>

namespace fineinput {

/// Input-level modifiers run after the raw value is converted to the
/// action's dimension and before it is accumulated with other inputs.
struct InputBinding {
    RawInput input;
    std::vector<InputModifier> modifiers;

    InputBinding(RawInput input) : input(input) {}
    InputBinding(KeyCode key) : input(key) {}
    InputBinding(MouseButton button) : input(button) {}
    InputBinding(GamepadButton button) : input(button) {}
    InputBinding(GamepadAxis axis) : input(axis) {}
    InputBinding(RawInput input, std::vector<InputModifier> modifiers)
        : input(input), modifiers(std::move(modifiers)) {}

    InputBinding& withModifier(InputModifier modifier) {
        modifiers.push_back(std::move(modifier));
        return *this;
    }
};

}  // namespace fineinput
