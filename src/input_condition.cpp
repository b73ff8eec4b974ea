#include "fineinput/input_condition.hpp"
#include "fineinput/action_map.hpp"
#include "fineinput/config.hpp"
#include "fineinput/log.hpp"

namespace fineinput {

namespace {

const Action* findDependency(const ActionMap& actions, const std::string& name) {
    const Action* action = actions.find(name);
    if (!action) {
        log::warn("Action `" + name + "` is not present in context");
    }
    return action;
}

}  // namespace

// ============================================================================
// Down / Press / Release
// ============================================================================

Down Down::fromSettings(const InputSettings& settings) {
    return Down{settings.actuationThreshold};
}

ActionState Down::evaluate(const ActionMap&, const InputTime&, const ActionValue& value) const {
    return value.isActuated(actuation) ? ActionState::Fired : ActionState::None;
}

Press Press::fromSettings(const InputSettings& settings) {
    return Press{settings.actuationThreshold};
}

ActionState Press::evaluate(const ActionMap&, const InputTime&, const ActionValue& value) {
    bool previous = actuated;
    actuated = value.isActuated(actuation);
    return actuated && !previous ? ActionState::Fired : ActionState::None;
}

Release Release::fromSettings(const InputSettings& settings) {
    return Release{settings.actuationThreshold};
}

ActionState Release::evaluate(const ActionMap&, const InputTime&, const ActionValue& value) {
    bool previous = actuated;
    actuated = value.isActuated(actuation);
    if (actuated) {
        return ActionState::Ongoing;
    }
    return previous ? ActionState::Fired : ActionState::None;
}

// ============================================================================
// Hold / HoldAndRelease
// ============================================================================

Hold Hold::fromSettings(const InputSettings& settings, bool oneShot) {
    return Hold{settings.holdTime, oneShot, settings.actuationThreshold};
}

ActionState Hold::evaluate(const ActionMap&, const InputTime& time, const ActionValue& value) {
    if (!value.isActuated(actuation)) {
        timer = 0.0f;
        fired = false;
        return ActionState::None;
    }

    timer += time.delta;
    if (timer < holdTime) {
        return ActionState::Ongoing;
    }
    if (oneShot && fired) {
        return ActionState::None;
    }
    fired = true;
    return ActionState::Fired;
}

HoldAndRelease HoldAndRelease::fromSettings(const InputSettings& settings) {
    return HoldAndRelease{settings.holdTime, settings.actuationThreshold};
}

ActionState HoldAndRelease::evaluate(const ActionMap&, const InputTime& time, const ActionValue& value) {
    bool wasActuated = actuated;
    actuated = value.isActuated(actuation);
    if (actuated) {
        timer += time.delta;
        return ActionState::Ongoing;
    }
    if (!wasActuated) {
        timer = 0.0f;
        return ActionState::None;
    }

    // The release frame still counts toward the held duration
    float held = timer + time.delta;
    timer = 0.0f;
    return held >= holdTime ? ActionState::Fired : ActionState::None;
}

// ============================================================================
// Tap
// ============================================================================

Tap Tap::fromSettings(const InputSettings& settings) {
    return Tap{settings.tapReleaseTime, settings.actuationThreshold};
}

ActionState Tap::evaluate(const ActionMap&, const InputTime& time, const ActionValue& value) {
    bool wasActuated = actuated;
    float heldBefore = timer;

    actuated = value.isActuated(actuation);
    if (actuated) {
        timer += time.delta;
    } else {
        timer = 0.0f;
    }

    if (wasActuated && !actuated && heldBefore <= releaseTime) {
        return ActionState::Fired;
    }
    if (timer > releaseTime) {
        return ActionState::None;
    }
    return actuated ? ActionState::Ongoing : ActionState::None;
}

// ============================================================================
// Pulse
// ============================================================================

Pulse Pulse::fromSettings(const InputSettings& settings) {
    Pulse pulse;
    pulse.interval = settings.pulseInterval;
    pulse.actuation = settings.actuationThreshold;
    return pulse;
}

ActionState Pulse::evaluate(const ActionMap&, const InputTime& time, const ActionValue& value) {
    if (!value.isActuated(actuation)) {
        timer = 0.0f;
        triggerCount = 0;
        return ActionState::None;
    }

    timer += time.delta;
    if (triggerLimit != 0 && triggerCount >= triggerLimit) {
        return ActionState::None;
    }

    // Pulse n is due at n * interval (n counted from 0 when firing on start)
    uint32_t next = triggerOnStart ? triggerCount : triggerCount + 1;
    if (timer >= interval * static_cast<float>(next)) {
        ++triggerCount;
        return ActionState::Fired;
    }
    return ActionState::Ongoing;
}

// ============================================================================
// Chord / BlockBy
// ============================================================================

ActionState Chord::evaluate(const ActionMap& actions, const InputTime&, const ActionValue&) const {
    const Action* dependency = findDependency(actions, action);
    return dependency ? dependency->state() : ActionState::None;
}

ActionState BlockBy::evaluate(const ActionMap& actions, const InputTime&, const ActionValue&) const {
    const Action* blocker = findDependency(actions, action);
    if (!blocker || blocker->state() == ActionState::Fired) {
        return ActionState::None;
    }
    return ActionState::Fired;
}

// ============================================================================
// CustomCondition
// ============================================================================

ActionState CustomCondition::evaluate(const ActionMap& actions, const InputTime& time,
                                      const ActionValue& value) const {
    if (!fn) {
        return ActionState::None;
    }
    return fn->evaluate(actions, time, value);
}

ConditionKind CustomCondition::kind() const {
    return fn ? fn->kind() : ConditionKind::Explicit;
}

// ============================================================================
// Dispatch and combination
// ============================================================================

ConditionKind conditionKind(const InputCondition& condition) {
    return std::visit([](const auto& c) { return c.kind(); }, condition);
}

void resetConditionState(InputCondition& condition) {
    if (auto* press = std::get_if<Press>(&condition)) {
        press->actuated = false;
    } else if (auto* release = std::get_if<Release>(&condition)) {
        release->actuated = false;
    } else if (auto* hold = std::get_if<Hold>(&condition)) {
        hold->timer = 0.0f;
        hold->fired = false;
    } else if (auto* holdAndRelease = std::get_if<HoldAndRelease>(&condition)) {
        holdAndRelease->timer = 0.0f;
        holdAndRelease->actuated = false;
    } else if (auto* tap = std::get_if<Tap>(&condition)) {
        tap->timer = 0.0f;
        tap->actuated = false;
    } else if (auto* pulse = std::get_if<Pulse>(&condition)) {
        pulse->timer = 0.0f;
        pulse->triggerCount = 0;
    }
}

ActionState evaluateCondition(InputCondition& condition, const ActionMap& actions,
                              const InputTime& time, const ActionValue& value) {
    return std::visit([&](auto& c) { return c.evaluate(actions, time, value); }, condition);
}

ActionState evaluateConditions(std::vector<InputCondition>& conditions, const ActionMap& actions,
                               const InputTime& time, const ActionValue& value,
                               float defaultActuation) {
    bool foundGate = false;
    bool allFired = true;
    bool anyActive = false;
    bool blocked = false;

    for (auto& condition : conditions) {
        ActionState state = evaluateCondition(condition, actions, time, value);
        switch (conditionKind(condition)) {
            case ConditionKind::Explicit:
            case ConditionKind::Implicit:
                foundGate = true;
                allFired = allFired && state == ActionState::Fired;
                anyActive = anyActive || state != ActionState::None;
                break;
            case ConditionKind::Blocker:
                blocked = blocked || state == ActionState::None;
                break;
        }
    }

    if (blocked) {
        return ActionState::None;
    }
    if (!foundGate) {
        return value.isActuated(defaultActuation) ? ActionState::Fired : ActionState::None;
    }
    if (allFired) {
        return ActionState::Fired;
    }
    return anyActive ? ActionState::Ongoing : ActionState::None;
}

}  // namespace fineinput
