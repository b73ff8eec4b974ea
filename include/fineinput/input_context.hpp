#pragma once

/**
 * @file input_context.hpp
 * @brief A named group of action bindings evaluated together
 *
 * Usage:
 *   InputContext ctx("player");
 *   ctx.bind("move", ActionValueDim::Axis2D)
 *       .to(Cardinal::wasdKeys())
 *       .withModifiers({DeltaScale{}});
 *   ctx.bind("jump", ActionValueDim::Bool)
 *       .to(KeyCode::Space)
 *       .withConditions({Press{}});
 *
 *   InputReader reader(snapshot);
 *   ctx.update(reader, time);
 *   if (ctx.action("jump")->events().fired()) { ... }
 *
 * Bindings are evaluated in declaration order. A binding can only see
 * (through Chord/BlockBy) actions declared before it, and an action that
 * consumes its inputs hides them from actions declared after it. Declare
 * modifier combinations (Ctrl+C) before the plain key (C).
 */

#include "fineinput/action.hpp"
#include "fineinput/action_map.hpp"
#include "fineinput/config.hpp"
#include "fineinput/input_binding.hpp"
#include "fineinput/input_condition.hpp"
#include "fineinput/input_modifier.hpp"
#include "fineinput/input_snapshot.hpp"
#include "fineinput/presets.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fineinput {

// ============================================================================
// ActionBinding - One action with its inputs, modifiers and conditions
// ============================================================================

class ActionBinding {
public:
    ActionBinding(std::string name, ActionValueDim dim, ActionSettings settings = {});

    // Inputs (appended in order)
    ActionBinding& to(InputBinding input);
    ActionBinding& to(std::vector<InputBinding> inputs);
    ActionBinding& to(const Cardinal& preset) { return to(preset.bindings()); }
    ActionBinding& to(const Bidirectional& preset) { return to(preset.bindings()); }
    ActionBinding& to(const Axial& preset) { return to(preset.bindings()); }
    ActionBinding& to(const Spatial& preset) { return to(preset.bindings()); }
    ActionBinding& to(const Ordinal& preset) { return to(preset.bindings()); }

    /// Action-level modifiers, applied after inputs are accumulated
    ActionBinding& withModifiers(std::vector<InputModifier> modifiers);

    ActionBinding& withConditions(std::vector<InputCondition> conditions);

    [[nodiscard]] const std::string& name() const { return action_.name(); }
    [[nodiscard]] const Action& action() const { return action_; }
    [[nodiscard]] const std::vector<InputBinding>& inputs() const { return inputs_; }
    [[nodiscard]] const std::vector<InputModifier>& modifiers() const { return modifiers_; }
    [[nodiscard]] const std::vector<InputCondition>& conditions() const { return conditions_; }

    /// True while requireReset holds the action at None
    [[nodiscard]] bool awaitingReset() const { return awaitingReset_; }

    /// Evaluate one frame. `actions` holds the bindings evaluated earlier
    /// in this pass.
    void update(InputReader& reader, const ActionMap& actions, const InputTime& time,
                float actuationThreshold);

    /// Action back to None, condition and modifier state cleared,
    /// requireReset armed again
    void reset();

private:
    [[nodiscard]] ActionValue accumulate(const ActionValue& total, const ActionValue& value) const;

    Action action_;
    std::vector<InputBinding> inputs_;
    std::vector<InputModifier> modifiers_;
    std::vector<InputCondition> conditions_;
    bool awaitingReset_ = false;
};

// ============================================================================
// InputContext
// ============================================================================

class InputContext {
public:
    explicit InputContext(std::string name, InputSettings settings = {});

    InputContext(const InputContext&) = delete;
    InputContext& operator=(const InputContext&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const InputSettings& settings() const { return settings_; }

    /// Declare an action. Binding an existing name replaces it in place,
    /// keeping its evaluation slot.
    /// @throws std::invalid_argument if name is empty
    ActionBinding& bind(std::string name, ActionValueDim dim, ActionSettings settings = {});

    /// Remove a binding; false if not bound
    bool unbind(std::string_view name);

    void clear();

    [[nodiscard]] ActionBinding* binding(std::string_view name);
    [[nodiscard]] size_t size() const { return bindings_.size(); }

    /// Gamepad this context reads from (default: any)
    void setGamepad(GamepadDevice gamepad) { gamepad_ = gamepad; }
    [[nodiscard]] GamepadDevice gamepad() const { return gamepad_; }

    /// Evaluate every binding in declaration order
    void update(InputReader& reader, const InputTime& time);

    /// Return every action to None (used when the context is deactivated)
    void resetActions();

    // Results of the last update
    [[nodiscard]] const Action* action(std::string_view name) const;
    [[nodiscard]] ActionValue value(std::string_view name) const;
    [[nodiscard]] ActionState state(std::string_view name) const;
    [[nodiscard]] const ActionMap& actions() const { return actions_; }

private:
    [[nodiscard]] const ActionBinding* findBinding(std::string_view name) const;

    std::string name_;
    InputSettings settings_;
    GamepadDevice gamepad_;

    std::vector<std::unique_ptr<ActionBinding>> bindings_;

    // Rebuilt on every update; points into bindings_
    ActionMap actions_;
};

}  // namespace fineinput
