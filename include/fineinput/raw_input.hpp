#pragma once

/**
 * @file raw_input.hpp
 * @brief One physical input source plus its required keyboard modifiers
 *
 * Source kinds: keyboard key, mouse button, mouse motion, mouse wheel,
 * gamepad button, gamepad axis. Keyboard modifiers are a keyboard/mouse
 * concept only; gamepad inputs always carry an empty ModKeys and refuse
 * to be given one.
 */

#include "fineinput/action_value.hpp"
#include "fineinput/input_codes.hpp"
#include "fineinput/mod_keys.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace fineinput {

// ============================================================================
// Source kinds
// ============================================================================

struct KeyboardSource {
    KeyCode key;
    bool operator==(const KeyboardSource&) const = default;
};

struct MouseButtonSource {
    MouseButton button;
    bool operator==(const MouseButtonSource&) const = default;
};

struct MouseMotionSource {
    bool operator==(const MouseMotionSource&) const = default;
};

struct MouseWheelSource {
    bool operator==(const MouseWheelSource&) const = default;
};

struct GamepadButtonSource {
    GamepadButton button;
    bool operator==(const GamepadButtonSource&) const = default;
};

struct GamepadAxisSource {
    GamepadAxis axis;
    bool operator==(const GamepadAxisSource&) const = default;
};

using InputSource = std::variant<
    KeyboardSource,
    MouseButtonSource,
    MouseMotionSource,
    MouseWheelSource,
    GamepadButtonSource,
    GamepadAxisSource
>;

/// Matches the InputSource alternative order
enum class InputKind : uint8_t {
    Keyboard,
    MouseButton,
    MouseMotion,
    MouseWheel,
    GamepadButton,
    GamepadAxis,
};

// ============================================================================
// RawInput
// ============================================================================

class RawInput {
public:
    // Implicit conversions from plain codes, no modifiers
    RawInput(KeyCode key) : source_(KeyboardSource{key}) {}
    RawInput(MouseButton button) : source_(MouseButtonSource{button}) {}
    RawInput(GamepadButton button) : source_(GamepadButtonSource{button}) {}
    RawInput(GamepadAxis axis) : source_(GamepadAxisSource{axis}) {}

    [[nodiscard]] static RawInput key(KeyCode key, ModKeys modKeys = ModKeys::empty());
    [[nodiscard]] static RawInput mouseButton(MouseButton button, ModKeys modKeys = ModKeys::empty());
    [[nodiscard]] static RawInput mouseMotion(ModKeys modKeys = ModKeys::empty());
    [[nodiscard]] static RawInput mouseWheel(ModKeys modKeys = ModKeys::empty());
    [[nodiscard]] static RawInput gamepadButton(GamepadButton button);
    [[nodiscard]] static RawInput gamepadAxis(GamepadAxis axis);

    [[nodiscard]] InputKind kind() const { return static_cast<InputKind>(source_.index()); }
    [[nodiscard]] const InputSource& source() const { return source_; }
    [[nodiscard]] bool isGamepad() const;

    /// Required modifiers; always empty for gamepad kinds
    [[nodiscard]] ModKeys modKeys() const { return modKeys_; }
    [[nodiscard]] int modKeysCount() const { return modKeys_.count(); }

    /// Copy with the modifiers replaced.
    /// @throws std::invalid_argument when called on a gamepad input
    [[nodiscard]] RawInput withModKeys(ModKeys modKeys) const;

    /// Same as withModKeys but returns nullopt for gamepad inputs
    [[nodiscard]] std::optional<RawInput> tryWithModKeys(ModKeys modKeys) const;

    /// Copy with no modifiers
    [[nodiscard]] RawInput withoutModKeys() const;

    /// Dimension the device reports before any conversion:
    /// buttons are Bool, mouse motion/wheel Axis2D, gamepad Axis1D
    [[nodiscard]] ActionValueDim capturedDim() const;

    /// "{mods} + {source}" when mods are present, else "{source}"
    [[nodiscard]] std::string toString() const;

    bool operator==(const RawInput&) const = default;

private:
    RawInput(InputSource source, ModKeys modKeys)
        : source_(source), modKeys_(modKeys) {}

    InputSource source_;
    ModKeys modKeys_;
};

// ============================================================================
// GamepadDevice
// ============================================================================

using GamepadId = uint32_t;

/// Which gamepad an input context listens to.
/// Any: axes sum across all connected gamepads, buttons take the
/// strongest press (logical OR for digital buttons).
struct GamepadDevice {
    std::optional<GamepadId> id;

    [[nodiscard]] static GamepadDevice any() { return GamepadDevice{}; }
    [[nodiscard]] static GamepadDevice single(GamepadId id) { return GamepadDevice{id}; }

    [[nodiscard]] bool isAny() const { return !id.has_value(); }

    bool operator==(const GamepadDevice&) const = default;
};

}  // namespace fineinput
