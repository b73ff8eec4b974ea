#pragma once

/**
 * @file input_snapshot.hpp
 * @brief Per-frame device state and the reader that turns it into values
 *
 * InputSnapshot is filled by the host's platform layer (GLFW callbacks,
 * SDL events, ...). InputReader wraps one snapshot for one evaluation pass
 * and tracks which inputs have been consumed by earlier actions.
 */

#include "fineinput/action_value.hpp"
#include "fineinput/raw_input.hpp"

#include <glm/glm.hpp>

#include <map>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fineinput {

// ============================================================================
// InputSnapshot - Raw device state for one frame
// ============================================================================
//
// Held state persists across frames; just-pressed/just-released sets and
// mouse deltas are per frame and cleared by beginFrame().
//
class InputSnapshot {
public:
    /// Clear per-frame state (edges and mouse deltas). Held state is kept.
    void beginFrame();

    /// Release everything and disconnect all gamepads
    void clear();

    // ========================================================================
    // Keyboard
    // ========================================================================

    void pressKey(KeyCode key);
    void releaseKey(KeyCode key);
    [[nodiscard]] bool keyPressed(KeyCode key) const;
    [[nodiscard]] bool keyJustPressed(KeyCode key) const;
    [[nodiscard]] bool keyJustReleased(KeyCode key) const;

    // ========================================================================
    // Mouse
    // ========================================================================

    void pressMouseButton(MouseButton button);
    void releaseMouseButton(MouseButton button);
    [[nodiscard]] bool mouseButtonPressed(MouseButton button) const;
    [[nodiscard]] bool mouseButtonJustPressed(MouseButton button) const;
    [[nodiscard]] bool mouseButtonJustReleased(MouseButton button) const;

    /// Accumulate cursor motion for this frame (pixels)
    void addMouseMotion(glm::vec2 delta) { mouseMotion_ += delta; }
    [[nodiscard]] glm::vec2 mouseMotion() const { return mouseMotion_; }

    /// Accumulate wheel scroll for this frame
    void addMouseWheel(glm::vec2 delta) { mouseWheel_ += delta; }
    [[nodiscard]] glm::vec2 mouseWheel() const { return mouseWheel_; }

    // ========================================================================
    // Gamepads
    // ========================================================================

    void connectGamepad(GamepadId id);
    void disconnectGamepad(GamepadId id);
    [[nodiscard]] bool gamepadConnected(GamepadId id) const;

    /// Connected gamepads in ascending id order
    [[nodiscard]] std::vector<GamepadId> connectedGamepads() const;

    /// Analog button value in [0, 1]. Connects the gamepad if needed.
    void setGamepadButton(GamepadId id, GamepadButton button, float value);
    [[nodiscard]] float gamepadButton(GamepadId id, GamepadButton button) const;

    /// Axis value in [-1, 1]. Connects the gamepad if needed.
    void setGamepadAxis(GamepadId id, GamepadAxis axis, float value);
    [[nodiscard]] float gamepadAxis(GamepadId id, GamepadAxis axis) const;

private:
    struct GamepadState {
        std::unordered_map<GamepadButton, float> buttons;
        std::unordered_map<GamepadAxis, float> axes;
    };

    std::unordered_set<KeyCode> keysPressed_;
    std::unordered_set<KeyCode> keysJustPressed_;
    std::unordered_set<KeyCode> keysJustReleased_;

    std::unordered_set<MouseButton> mousePressed_;
    std::unordered_set<MouseButton> mouseJustPressed_;
    std::unordered_set<MouseButton> mouseJustReleased_;

    glm::vec2 mouseMotion_{0.0f};
    glm::vec2 mouseWheel_{0.0f};

    std::map<GamepadId, GamepadState> gamepads_;
};

// ============================================================================
// InputReader - Reads RawInput values from a snapshot during one pass
// ============================================================================

class InputReader {
public:
    explicit InputReader(const InputSnapshot& snapshot);

    /// Gamepad scope for subsequent reads
    void setGamepad(GamepadDevice gamepad) { gamepad_ = gamepad; }
    [[nodiscard]] GamepadDevice gamepad() const { return gamepad_; }

    /// Current value of an input in its captured dimension.
    /// Zero when the input (or a required modifier) is consumed, or when
    /// its required modifiers are not all held.
    [[nodiscard]] ActionValue value(const RawInput& input) const;

    /// Hide an input and its modifier keys from the rest of the pass
    void consume(const RawInput& input);

    [[nodiscard]] bool isConsumed(const RawInput& input) const;

    /// Forget all consumption (start of a new pass)
    void resetConsumed();

    [[nodiscard]] const InputSnapshot& snapshot() const { return snapshot_; }

private:
    [[nodiscard]] ModKeys availableModKeys() const;
    [[nodiscard]] bool keyAvailable(KeyCode key) const;
    [[nodiscard]] float readGamepadButton(GamepadButton button) const;
    [[nodiscard]] float readGamepadAxis(GamepadAxis axis) const;

    const InputSnapshot& snapshot_;
    GamepadDevice gamepad_;

    std::unordered_set<KeyCode> consumedKeys_;
    std::unordered_set<MouseButton> consumedMouseButtons_;
    std::unordered_set<GamepadButton> consumedGamepadButtons_;
    std::unordered_set<GamepadAxis> consumedGamepadAxes_;
    bool consumedMouseMotion_ = false;
    bool consumedMouseWheel_ = false;
};

}  // namespace fineinput
