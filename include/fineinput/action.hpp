#pragma once

/**
 * @file action.hpp
 * @brief Per-action state machine: state, events, value and timers
 *
 * The condition evaluator decides the state each frame; Action records it,
 * derives the transition events and advances its timers.
 *
 *   None ──> Ongoing ──> Fired
 *    ^          |          |
 *    └──────────┴──────────┘
 *
 * Level-triggered: an action stays Fired every frame its conditions hold.
 */

#include "fineinput/action_value.hpp"
#include "fineinput/input_time.hpp"

#include <cstdint>
#include <string>

namespace fineinput {

// ============================================================================
// ActionState
// ============================================================================

/// Ordered: None < Ongoing < Fired
enum class ActionState : uint8_t {
    None,
    Ongoing,
    Fired,
};

[[nodiscard]] const char* actionStateName(ActionState state);

// ============================================================================
// ActionEvents - Transition flags for one frame
// ============================================================================

class ActionEvents {
public:
    static constexpr uint8_t STARTED   = 0b00001;
    static constexpr uint8_t ONGOING   = 0b00010;
    static constexpr uint8_t FIRED     = 0b00100;
    static constexpr uint8_t CANCELED  = 0b01000;
    static constexpr uint8_t COMPLETED = 0b10000;

    constexpr ActionEvents() = default;
    constexpr explicit ActionEvents(uint8_t bits) : bits_(bits) {}

    /// Events produced by moving from prev to next
    [[nodiscard]] static ActionEvents fromTransition(ActionState prev, ActionState next);

    [[nodiscard]] constexpr uint8_t bits() const { return bits_; }
    [[nodiscard]] constexpr bool isEmpty() const { return bits_ == 0; }
    [[nodiscard]] constexpr bool contains(uint8_t flags) const { return (bits_ & flags) == flags; }

    [[nodiscard]] bool started() const { return contains(STARTED); }
    [[nodiscard]] bool ongoing() const { return contains(ONGOING); }
    [[nodiscard]] bool fired() const { return contains(FIRED); }
    [[nodiscard]] bool canceled() const { return contains(CANCELED); }
    [[nodiscard]] bool completed() const { return contains(COMPLETED); }

    /// "Started | Fired" style listing, "" when empty
    [[nodiscard]] std::string toString() const;

    constexpr bool operator==(const ActionEvents&) const = default;

private:
    uint8_t bits_ = 0;
};

// ============================================================================
// ActionSettings
// ============================================================================

/// How the values of several inputs bound to one action combine
enum class Accumulation : uint8_t {
    Cumulative,  ///< Per-axis sum (opposite directions cancel); OR for Bool
    MaxAbs,      ///< Per-axis value with the largest magnitude
};

struct ActionSettings {
    Accumulation accumulation = Accumulation::Cumulative;

    /// Hide this action's inputs from later actions while it is actuated
    bool consumeInput = true;

    /// After (re)activation, stay None until every input reads zero once
    bool requireReset = false;
};

// ============================================================================
// Action
// ============================================================================

class Action {
public:
    Action(std::string name, ActionValueDim dim, ActionSettings settings = {});

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] ActionValueDim dim() const { return dim_; }
    [[nodiscard]] const ActionSettings& settings() const { return settings_; }

    /// Advance one frame. The value is converted to the declared dimension
    /// and kept even when the state is None.
    void update(const InputTime& time, ActionState state, const ActionValue& value);

    /// Back to None with a zero value and cleared timers
    void reset();

    [[nodiscard]] ActionState state() const { return state_; }
    [[nodiscard]] ActionEvents events() const { return events_; }
    [[nodiscard]] const ActionValue& value() const { return value_; }

    /// Seconds spent in the current state (reset on every state change)
    [[nodiscard]] float timeInState() const { return timeInState_; }

    /// Seconds since the action left None (0 while None)
    [[nodiscard]] float elapsedSecs() const { return elapsedSecs_; }

    /// Seconds spent Fired without interruption (0 unless Fired)
    [[nodiscard]] float firedSecs() const { return firedSecs_; }

private:
    std::string name_;
    ActionValueDim dim_;
    ActionSettings settings_;

    ActionState state_ = ActionState::None;
    ActionEvents events_;
    ActionValue value_;

    float timeInState_ = 0.0f;
    float elapsedSecs_ = 0.0f;
    float firedSecs_ = 0.0f;
};

}  // namespace fineinput
