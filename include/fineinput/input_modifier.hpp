#pragma once

/**
 * @file input_modifier.hpp
 * @brief Value transforms applied before conditions
 *
 * Modifiers run in declaration order; each one sees the previous output,
 * never the raw value. Built-in kinds form a closed variant; hosts add
 * their own through InputModifierFn.
 *
 * All built-ins except SmoothNudge are stateless. SmoothNudge keeps its
 * smoothed value in the binding's own copy.
 */

#include "fineinput/action_value.hpp"
#include "fineinput/input_time.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace fineinput {

class ActionMap;
struct InputSettings;

/// Multiplies each component by the matching factor component.
/// Bool becomes Axis1D first.
struct Scale {
    glm::vec3 factor{1.0f};

    [[nodiscard]] static Scale splat(float value) { return Scale{glm::vec3(value)}; }

    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value) const;
};

/// Multiplies every component by the frame delta in seconds.
/// Bool becomes Axis1D first.
struct DeltaScale {
    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value) const;
};

/// Flips the sign of the selected components. Bool becomes Axis1D first.
struct Negate {
    bool negateX = true;
    bool negateY = true;
    bool negateZ = true;

    [[nodiscard]] static Negate all() { return Negate{true, true, true}; }
    [[nodiscard]] static Negate x() { return Negate{true, false, false}; }
    [[nodiscard]] static Negate y() { return Negate{false, true, false}; }
    [[nodiscard]] static Negate z() { return Negate{false, false, true}; }

    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value) const;
};

/// New component order, named by where each output component comes from.
/// YXZ swaps x and y; XXX copies x everywhere.
enum class SwizzleOrder : uint8_t {
    YXZ,
    ZYX,
    XZY,
    YZX,
    ZXY,
    XXX,
    YYY,
    ZZZ,
};

/// Reorders components. Bool becomes Axis1D first; an Axis1D input widens
/// to the dimension that holds its moved component (YXZ gives Axis2D(0, v)).
struct SwizzleAxis {
    SwizzleOrder order = SwizzleOrder::YXZ;

    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value) const;
};

enum class DeadZoneKind : uint8_t {
    Radial,  ///< Applied to the vector length, keeps direction
    Axial,   ///< Applied to each component independently
};

/// Zeroes values below lower and remaps [lower, upper] to [0, 1].
/// Bool passes through unchanged.
struct DeadZone {
    DeadZoneKind kind = DeadZoneKind::Radial;
    float lower = 0.2f;
    float upper = 1.0f;

    [[nodiscard]] static DeadZone fromSettings(const InputSettings& settings,
                                               DeadZoneKind kind = DeadZoneKind::Radial);

    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value) const;

    [[nodiscard]] float remap(float axisValue) const;
};

/// Per-component clamp. Bool passes through unchanged.
struct Clamp {
    glm::vec3 min{-1.0f};
    glm::vec3 max{1.0f};

    [[nodiscard]] static Clamp symmetric(float limit) {
        return Clamp{glm::vec3(-limit), glm::vec3(limit)};
    }

    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value) const;
};

/// sign(v) * |v|^exponent per component. Bool becomes Axis1D first.
struct ExponentialCurve {
    glm::vec3 exponent{1.0f};

    [[nodiscard]] static ExponentialCurve splat(float value) {
        return ExponentialCurve{glm::vec3(value)};
    }

    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value) const;
};

/// Exponential smoothing toward the incoming value.
/// current = mix(current, target, 1 - exp(-decayRate * dt)).
/// Bool becomes Axis1D first. Stateful.
struct SmoothNudge {
    float decayRate = 8.0f;
    glm::vec3 current{0.0f};

    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value);
};

/// Extension point for host-defined modifiers
class InputModifierFn {
public:
    virtual ~InputModifierFn() = default;

    [[nodiscard]] virtual ActionValue apply(const ActionMap& actions, const InputTime& time,
                                            const ActionValue& value) = 0;
};

/// Shares the host object; a stateless implementation may be reused by
/// several bindings.
struct CustomModifier {
    std::shared_ptr<InputModifierFn> fn;

    [[nodiscard]] ActionValue apply(const ActionMap& actions, const InputTime& time,
                                    const ActionValue& value) const;
};

using InputModifier = std::variant<
    Scale,
    DeltaScale,
    Negate,
    SwizzleAxis,
    DeadZone,
    Clamp,
    ExponentialCurve,
    SmoothNudge,
    CustomModifier
>;

/// Forget smoothing state (SmoothNudge); other kinds are untouched
void resetModifierState(InputModifier& modifier);

/// Apply one modifier
[[nodiscard]] ActionValue applyModifier(InputModifier& modifier, const ActionMap& actions,
                                        const InputTime& time, const ActionValue& value);

/// Apply a chain in order
[[nodiscard]] ActionValue applyModifiers(std::vector<InputModifier>& modifiers, const ActionMap& actions,
                                         const InputTime& time, const ActionValue& value);

}  // namespace fineinput
