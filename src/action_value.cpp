#include "fineinput/action_value.hpp"

#include <sstream>

namespace fineinput {

const char* dimName(ActionValueDim dim) {
    switch (dim) {
        case ActionValueDim::Bool:   return "Bool";
        case ActionValueDim::Axis1D: return "Axis1D";
        case ActionValueDim::Axis2D: return "Axis2D";
        case ActionValueDim::Axis3D: return "Axis3D";
    }
    return "Unknown";
}

ActionValue ActionValue::zero(ActionValueDim dim) {
    switch (dim) {
        case ActionValueDim::Bool:   return ActionValue(false);
        case ActionValueDim::Axis1D: return ActionValue(0.0f);
        case ActionValueDim::Axis2D: return ActionValue(glm::vec2(0.0f));
        case ActionValueDim::Axis3D: return ActionValue(glm::vec3(0.0f));
    }
    return ActionValue(false);
}

ActionValue ActionValue::convert(ActionValueDim dim) const {
    switch (dim) {
        case ActionValueDim::Bool:   return ActionValue(asBool());
        case ActionValueDim::Axis1D: return ActionValue(asAxis1D());
        case ActionValueDim::Axis2D: return ActionValue(asAxis2D());
        case ActionValueDim::Axis3D: return ActionValue(asAxis3D());
    }
    return *this;
}

bool ActionValue::asBool() const {
    switch (dim()) {
        case ActionValueDim::Bool:   return std::get<bool>(value_);
        case ActionValueDim::Axis1D: return std::get<float>(value_) != 0.0f;
        case ActionValueDim::Axis2D: return std::get<glm::vec2>(value_) != glm::vec2(0.0f);
        case ActionValueDim::Axis3D: return std::get<glm::vec3>(value_) != glm::vec3(0.0f);
    }
    return false;
}

float ActionValue::asAxis1D() const {
    switch (dim()) {
        case ActionValueDim::Bool:   return std::get<bool>(value_) ? 1.0f : 0.0f;
        case ActionValueDim::Axis1D: return std::get<float>(value_);
        case ActionValueDim::Axis2D: return std::get<glm::vec2>(value_).x;
        case ActionValueDim::Axis3D: return std::get<glm::vec3>(value_).x;
    }
    return 0.0f;
}

glm::vec2 ActionValue::asAxis2D() const {
    switch (dim()) {
        case ActionValueDim::Bool:
        case ActionValueDim::Axis1D:
            return glm::vec2(asAxis1D(), 0.0f);
        case ActionValueDim::Axis2D:
            return std::get<glm::vec2>(value_);
        case ActionValueDim::Axis3D: {
            const auto& v = std::get<glm::vec3>(value_);
            return glm::vec2(v.x, v.y);
        }
    }
    return glm::vec2(0.0f);
}

glm::vec3 ActionValue::asAxis3D() const {
    switch (dim()) {
        case ActionValueDim::Bool:
        case ActionValueDim::Axis1D:
            return glm::vec3(asAxis1D(), 0.0f, 0.0f);
        case ActionValueDim::Axis2D: {
            const auto& v = std::get<glm::vec2>(value_);
            return glm::vec3(v.x, v.y, 0.0f);
        }
        case ActionValueDim::Axis3D:
            return std::get<glm::vec3>(value_);
    }
    return glm::vec3(0.0f);
}

bool ActionValue::isActuated(float threshold) const {
    if (dim() == ActionValueDim::Bool) {
        return std::get<bool>(value_);
    }
    glm::vec3 v = asAxis3D();
    if (threshold <= 0.0f) {
        return v != glm::vec3(0.0f);
    }
    return glm::dot(v, v) >= threshold * threshold;
}

bool ActionValue::isZero() const {
    return !asBool();
}

std::string ActionValue::toString() const {
    std::ostringstream oss;
    switch (dim()) {
        case ActionValueDim::Bool:
            oss << (std::get<bool>(value_) ? "true" : "false");
            break;
        case ActionValueDim::Axis1D:
            oss << std::get<float>(value_);
            break;
        case ActionValueDim::Axis2D: {
            const auto& v = std::get<glm::vec2>(value_);
            oss << "(" << v.x << ", " << v.y << ")";
            break;
        }
        case ActionValueDim::Axis3D: {
            const auto& v = std::get<glm::vec3>(value_);
            oss << "(" << v.x << ", " << v.y << ", " << v.z << ")";
            break;
        }
    }
    return oss.str();
}

}  // namespace fineinput
