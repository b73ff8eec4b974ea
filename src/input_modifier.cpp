#include "fineinput/input_modifier.hpp"
#include "fineinput/action_map.hpp"
#include "fineinput/config.hpp"

#include <algorithm>
#include <cmath>

namespace fineinput {

namespace {

// Bool is treated as a 0/1 magnitude by the arithmetic modifiers
ActionValue widenBool(const ActionValue& value) {
    if (value.dim() == ActionValueDim::Bool) {
        return ActionValue(value.asAxis1D());
    }
    return value;
}

// Rebuild a value of the given dimension from a vec3
ActionValue fromVec3(const glm::vec3& v, ActionValueDim dim) {
    return ActionValue(v).convert(dim);
}

}  // namespace

// ============================================================================
// Scale / DeltaScale / Negate
// ============================================================================

ActionValue Scale::apply(const ActionMap&, const InputTime&, const ActionValue& value) const {
    ActionValue v = widenBool(value);
    return fromVec3(v.asAxis3D() * factor, v.dim());
}

ActionValue DeltaScale::apply(const ActionMap&, const InputTime& time, const ActionValue& value) const {
    ActionValue v = widenBool(value);
    return fromVec3(v.asAxis3D() * time.delta, v.dim());
}

ActionValue Negate::apply(const ActionMap&, const InputTime&, const ActionValue& value) const {
    ActionValue v = widenBool(value);
    glm::vec3 sign(negateX ? -1.0f : 1.0f, negateY ? -1.0f : 1.0f, negateZ ? -1.0f : 1.0f);
    return fromVec3(v.asAxis3D() * sign, v.dim());
}

// ============================================================================
// SwizzleAxis
// ============================================================================

ActionValue SwizzleAxis::apply(const ActionMap&, const InputTime&, const ActionValue& value) const {
    ActionValue v = widenBool(value);
    glm::vec3 in = v.asAxis3D();
    glm::vec3 out;
    // Dimension an Axis1D input needs once x has moved
    ActionValueDim widened = ActionValueDim::Axis1D;

    switch (order) {
        case SwizzleOrder::YXZ:
            out = glm::vec3(in.y, in.x, in.z);
            widened = ActionValueDim::Axis2D;
            break;
        case SwizzleOrder::ZYX:
            out = glm::vec3(in.z, in.y, in.x);
            widened = ActionValueDim::Axis3D;
            break;
        case SwizzleOrder::XZY:
            out = glm::vec3(in.x, in.z, in.y);
            break;
        case SwizzleOrder::YZX:
            out = glm::vec3(in.y, in.z, in.x);
            widened = ActionValueDim::Axis3D;
            break;
        case SwizzleOrder::ZXY:
            out = glm::vec3(in.z, in.x, in.y);
            widened = ActionValueDim::Axis2D;
            break;
        case SwizzleOrder::XXX:
            out = glm::vec3(in.x);
            widened = ActionValueDim::Axis3D;
            break;
        case SwizzleOrder::YYY:
            out = glm::vec3(in.y);
            break;
        case SwizzleOrder::ZZZ:
            out = glm::vec3(in.z);
            break;
    }

    ActionValueDim dim = v.dim() == ActionValueDim::Axis1D ? widened : v.dim();
    return fromVec3(out, dim);
}

// ============================================================================
// DeadZone
// ============================================================================

DeadZone DeadZone::fromSettings(const InputSettings& settings, DeadZoneKind kind) {
    return DeadZone{kind, settings.deadZoneLower, settings.deadZoneUpper};
}

float DeadZone::remap(float axisValue) const {
    float magnitude = std::abs(axisValue);
    if (magnitude < lower) {
        return 0.0f;
    }
    float range = upper - lower;
    float scaled = range > 0.0f ? (magnitude - lower) / range : 1.0f;
    return std::copysign(std::min(scaled, 1.0f), axisValue);
}

ActionValue DeadZone::apply(const ActionMap&, const InputTime&, const ActionValue& value) const {
    switch (value.dim()) {
        case ActionValueDim::Bool:
            return value;
        case ActionValueDim::Axis1D:
            return ActionValue(remap(value.asAxis1D()));
        case ActionValueDim::Axis2D:
        case ActionValueDim::Axis3D:
            break;
    }

    glm::vec3 v = value.asAxis3D();
    if (kind == DeadZoneKind::Axial) {
        return fromVec3(glm::vec3(remap(v.x), remap(v.y), remap(v.z)), value.dim());
    }

    float length = glm::length(v);
    if (length == 0.0f) {
        return ActionValue::zero(value.dim());
    }
    return fromVec3(v / length * remap(length), value.dim());
}

// ============================================================================
// Clamp / ExponentialCurve
// ============================================================================

ActionValue Clamp::apply(const ActionMap&, const InputTime&, const ActionValue& value) const {
    if (value.dim() == ActionValueDim::Bool) {
        return value;
    }
    return fromVec3(glm::clamp(value.asAxis3D(), min, max), value.dim());
}

ActionValue ExponentialCurve::apply(const ActionMap&, const InputTime&, const ActionValue& value) const {
    ActionValue v = widenBool(value);
    glm::vec3 in = v.asAxis3D();
    glm::vec3 out;
    for (int i = 0; i < 3; ++i) {
        out[i] = std::copysign(std::pow(std::abs(in[i]), exponent[i]), in[i]);
    }
    return fromVec3(out, v.dim());
}

// ============================================================================
// SmoothNudge
// ============================================================================

ActionValue SmoothNudge::apply(const ActionMap&, const InputTime& time, const ActionValue& value) {
    ActionValue v = widenBool(value);
    glm::vec3 target = v.asAxis3D();

    glm::vec3 diff = target - current;
    if (glm::dot(diff, diff) < 1e-4f) {
        current = target;
        return v;
    }

    float t = 1.0f - std::exp(-decayRate * time.delta);
    current = glm::mix(current, target, t);
    return fromVec3(current, v.dim());
}

// ============================================================================
// CustomModifier
// ============================================================================

ActionValue CustomModifier::apply(const ActionMap& actions, const InputTime& time,
                                  const ActionValue& value) const {
    if (!fn) {
        return value;
    }
    return fn->apply(actions, time, value);
}

// ============================================================================
// Dispatch
// ============================================================================

void resetModifierState(InputModifier& modifier) {
    if (auto* nudge = std::get_if<SmoothNudge>(&modifier)) {
        nudge->current = glm::vec3(0.0f);
    }
}

ActionValue applyModifier(InputModifier& modifier, const ActionMap& actions,
                          const InputTime& time, const ActionValue& value) {
    return std::visit([&](auto& m) { return m.apply(actions, time, value); }, modifier);
}

ActionValue applyModifiers(std::vector<InputModifier>& modifiers, const ActionMap& actions,
                           const InputTime& time, const ActionValue& value) {
    ActionValue result = value;
    for (auto& modifier : modifiers) {
        result = applyModifier(modifier, actions, time, result);
    }
    return result;
}

}  // namespace fineinput
