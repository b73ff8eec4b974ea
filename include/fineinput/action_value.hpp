#pragma once

/**
 * @file action_value.hpp
 * @brief Dimensional action value (Bool, Axis1D, Axis2D, Axis3D)
 *
 * Conversion rules:
 *   Bool -> axis       true = 1 in the first component, false = zero
 *   axis -> Bool       any nonzero component
 *   widening           value goes to the leading components, rest zero
 *   narrowing          keeps the leading components, drops the rest
 */

#include <glm/glm.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace fineinput {

enum class ActionValueDim : uint8_t {
    Bool,
    Axis1D,
    Axis2D,
    Axis3D,
};

[[nodiscard]] const char* dimName(ActionValueDim dim);

class ActionValue {
public:
    ActionValue() : value_(false) {}
    ActionValue(bool value) : value_(value) {}
    ActionValue(float value) : value_(value) {}
    ActionValue(glm::vec2 value) : value_(value) {}
    ActionValue(glm::vec3 value) : value_(value) {}
    ActionValue(float x, float y) : value_(glm::vec2(x, y)) {}
    ActionValue(float x, float y, float z) : value_(glm::vec3(x, y, z)) {}

    /// Zero value of a dimension (false for Bool)
    [[nodiscard]] static ActionValue zero(ActionValueDim dim);

    [[nodiscard]] ActionValueDim dim() const { return static_cast<ActionValueDim>(value_.index()); }

    /// Convert to another dimension using the rules above
    [[nodiscard]] ActionValue convert(ActionValueDim dim) const;

    [[nodiscard]] bool asBool() const;
    [[nodiscard]] float asAxis1D() const;
    [[nodiscard]] glm::vec2 asAxis2D() const;
    [[nodiscard]] glm::vec3 asAxis3D() const;

    /// Bool: the flag itself. Axes: squared length >= threshold^2.
    [[nodiscard]] bool isActuated(float threshold) const;

    /// True if every component is zero (or the Bool is false)
    [[nodiscard]] bool isZero() const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const ActionValue&) const = default;

private:
    std::variant<bool, float, glm::vec2, glm::vec3> value_;
};

}  // namespace fineinput
