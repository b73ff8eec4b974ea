#pragma once

/**
 * @file input_condition.hpp
 * @brief Conditions that classify a modified value into an ActionState
 *
 * Kinds:
 *   Explicit  decides firing on its own (Down, Press, Hold, Tap, ...)
 *   Implicit  must also be satisfied, or passes its state through (Chord)
 *   Blocker   vetoes the action while it reports None (BlockBy)
 *
 * Combination (evaluateConditions):
 *   - any Blocker reporting None          -> None
 *   - all Explicit AND all Implicit Fired -> Fired
 *   - any Explicit/Implicit not None      -> Ongoing
 *   - otherwise                           -> None
 * With no Explicit or Implicit condition the value itself must be
 * actuated at the default threshold to fire.
 *
 * Conditions never throw. Data that is missing this frame (an unbound
 * chord target) degrades to None with a logged warning.
 */

#include "fineinput/action.hpp"
#include "fineinput/action_value.hpp"
#include "fineinput/input_time.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace fineinput {

class ActionMap;
struct InputSettings;

enum class ConditionKind : uint8_t {
    Explicit,
    Implicit,
    Blocker,
};

/// Fired while the value is actuated
struct Down {
    float actuation = 0.5f;

    [[nodiscard]] static Down fromSettings(const InputSettings& settings);

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value) const;
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Explicit; }
};

/// Fired on the first actuated frame only
struct Press {
    float actuation = 0.5f;
    bool actuated = false;

    [[nodiscard]] static Press fromSettings(const InputSettings& settings);

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value);
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Explicit; }
};

/// Ongoing while actuated, Fired on the frame the value is released
struct Release {
    float actuation = 0.5f;
    bool actuated = false;

    [[nodiscard]] static Release fromSettings(const InputSettings& settings);

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value);
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Explicit; }
};

/// Ongoing while held below holdTime, Fired once held long enough.
/// A one-shot hold fires for one frame per press and is None afterwards.
struct Hold {
    float holdTime = 0.5f;
    bool oneShot = false;
    float actuation = 0.5f;
    float timer = 0.0f;
    bool fired = false;

    [[nodiscard]] static Hold fromSettings(const InputSettings& settings, bool oneShot = false);

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value);
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Explicit; }
};

/// Ongoing while held, Fired on release if held for at least holdTime
struct HoldAndRelease {
    float holdTime = 0.5f;
    float actuation = 0.5f;
    float timer = 0.0f;
    bool actuated = false;

    [[nodiscard]] static HoldAndRelease fromSettings(const InputSettings& settings);

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value);
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Explicit; }
};

/// Ongoing while held up to releaseTime, Fired on a release within it.
/// Holding longer cancels the tap (None).
struct Tap {
    float releaseTime = 0.2f;
    float actuation = 0.5f;
    float timer = 0.0f;
    bool actuated = false;

    [[nodiscard]] static Tap fromSettings(const InputSettings& settings);

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value);
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Explicit; }
};

/// Fires every interval while held, Ongoing in between.
/// triggerLimit 0 means unlimited; once the limit is hit the state is None
/// until the input is released.
struct Pulse {
    float interval = 0.1f;
    uint32_t triggerLimit = 0;
    bool triggerOnStart = true;
    float actuation = 0.5f;
    float timer = 0.0f;
    uint32_t triggerCount = 0;

    [[nodiscard]] static Pulse fromSettings(const InputSettings& settings);

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value);
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Explicit; }
};

/// Inherits the state of another action evaluated earlier in the same pass
struct Chord {
    std::string action;

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value) const;
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Implicit; }
};

/// Blocks while another action (evaluated earlier in the pass) is Fired
struct BlockBy {
    std::string action;

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value) const;
    [[nodiscard]] ConditionKind kind() const { return ConditionKind::Blocker; }
};

/// Extension point for host-defined conditions
class InputConditionFn {
public:
    virtual ~InputConditionFn() = default;

    [[nodiscard]] virtual ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                               const ActionValue& value) = 0;
    [[nodiscard]] virtual ConditionKind kind() const { return ConditionKind::Explicit; }
};

struct CustomCondition {
    std::shared_ptr<InputConditionFn> fn;

    [[nodiscard]] ActionState evaluate(const ActionMap& actions, const InputTime& time,
                                       const ActionValue& value) const;
    [[nodiscard]] ConditionKind kind() const;
};

using InputCondition = std::variant<
    Down,
    Press,
    Release,
    Hold,
    HoldAndRelease,
    Tap,
    Pulse,
    Chord,
    BlockBy,
    CustomCondition
>;

[[nodiscard]] ConditionKind conditionKind(const InputCondition& condition);

/// Clear timers and edge flags, keeping the configured parameters
void resetConditionState(InputCondition& condition);

[[nodiscard]] ActionState evaluateCondition(InputCondition& condition, const ActionMap& actions,
                                            const InputTime& time, const ActionValue& value);

/// Evaluate every condition (stateful ones advance even when the result is
/// already decided) and combine them as described above.
[[nodiscard]] ActionState evaluateConditions(std::vector<InputCondition>& conditions,
                                             const ActionMap& actions, const InputTime& time,
                                             const ActionValue& value,
                                             float defaultActuation = 0.5f);

}  // namespace fineinput
