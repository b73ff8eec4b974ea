#include "fineinput/input_context.hpp"
#include "fineinput/log.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace fineinput {

// ============================================================================
// ActionBinding
// ============================================================================

ActionBinding::ActionBinding(std::string name, ActionValueDim dim, ActionSettings settings)
    : action_(std::move(name), dim, settings)
    , awaitingReset_(settings.requireReset)
{
}

ActionBinding& ActionBinding::to(InputBinding input) {
    inputs_.push_back(std::move(input));
    return *this;
}

ActionBinding& ActionBinding::to(std::vector<InputBinding> inputs) {
    for (auto& input : inputs) {
        inputs_.push_back(std::move(input));
    }
    return *this;
}

ActionBinding& ActionBinding::withModifiers(std::vector<InputModifier> modifiers) {
    for (auto& modifier : modifiers) {
        modifiers_.push_back(std::move(modifier));
    }
    return *this;
}

ActionBinding& ActionBinding::withConditions(std::vector<InputCondition> conditions) {
    for (auto& condition : conditions) {
        conditions_.push_back(std::move(condition));
    }
    return *this;
}

ActionValue ActionBinding::accumulate(const ActionValue& total, const ActionValue& value) const {
    if (total.dim() == ActionValueDim::Bool) {
        return ActionValue(total.asBool() || value.asBool());
    }

    glm::vec3 sum = total.asAxis3D();
    glm::vec3 next = value.asAxis3D();
    if (action_.settings().accumulation == Accumulation::Cumulative) {
        return ActionValue(sum + next).convert(total.dim());
    }

    for (int i = 0; i < 3; ++i) {
        if (std::abs(next[i]) > std::abs(sum[i])) {
            sum[i] = next[i];
        }
    }
    return ActionValue(sum).convert(total.dim());
}

void ActionBinding::update(InputReader& reader, const ActionMap& actions, const InputTime& time,
                           float actuationThreshold) {
    const ActionValueDim dim = action_.dim();

    // 1. Read, convert and modify each input, then accumulate
    ActionValue accumulated = ActionValue::zero(dim);
    bool anyInputHeld = false;
    for (auto& input : inputs_) {
        ActionValue raw = reader.value(input.input);
        anyInputHeld = anyInputHeld || !raw.isZero();

        ActionValue value = applyModifiers(input.modifiers, actions, time, raw.convert(dim));
        accumulated = accumulate(accumulated, value.convert(dim));
    }

    // 2. Held at None until every input has been released once
    if (awaitingReset_) {
        if (anyInputHeld) {
            action_.update(time, ActionState::None, ActionValue::zero(dim));
            return;
        }
        awaitingReset_ = false;
    }

    // 3. Action-level modifiers, then conditions
    ActionValue value = applyModifiers(modifiers_, actions, time, accumulated);
    ActionState state = evaluateConditions(conditions_, actions, time, value, actuationThreshold);

    ActionState previous = action_.state();
    action_.update(time, state, value);
    if (state != previous && log::debugEnabled()) {
        log::debug("Action `" + action_.name() + "` " + actionStateName(previous) +
                   " -> " + actionStateName(state));
    }

    // 4. Hide the inputs from later actions
    if (action_.settings().consumeInput && value.isActuated(actuationThreshold)) {
        for (const auto& input : inputs_) {
            reader.consume(input.input);
        }
    }
}

void ActionBinding::reset() {
    action_.reset();
    for (auto& input : inputs_) {
        for (auto& modifier : input.modifiers) {
            resetModifierState(modifier);
        }
    }
    for (auto& modifier : modifiers_) {
        resetModifierState(modifier);
    }
    for (auto& condition : conditions_) {
        resetConditionState(condition);
    }
    awaitingReset_ = action_.settings().requireReset;
}

// ============================================================================
// InputContext
// ============================================================================

InputContext::InputContext(std::string name, InputSettings settings)
    : name_(std::move(name))
    , settings_(settings)
{
}

ActionBinding& InputContext::bind(std::string name, ActionValueDim dim, ActionSettings settings) {
    if (name.empty()) {
        throw std::invalid_argument("Action name must not be empty (context `" + name_ + "`)");
    }

    // The map may hold a pointer to the binding being replaced
    actions_.clear();

    auto replacement = std::make_unique<ActionBinding>(name, dim, settings);
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&](const auto& b) { return b->name() == name; });
    if (it != bindings_.end()) {
        *it = std::move(replacement);
        return **it;
    }

    bindings_.push_back(std::move(replacement));
    return *bindings_.back();
}

bool InputContext::unbind(std::string_view name) {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&](const auto& b) { return b->name() == name; });
    if (it == bindings_.end()) {
        return false;
    }
    actions_.clear();
    bindings_.erase(it);
    return true;
}

void InputContext::clear() {
    actions_.clear();
    bindings_.clear();
}

ActionBinding* InputContext::binding(std::string_view name) {
    return const_cast<ActionBinding*>(findBinding(name));
}

const ActionBinding* InputContext::findBinding(std::string_view name) const {
    for (const auto& b : bindings_) {
        if (b->name() == name) {
            return b.get();
        }
    }
    return nullptr;
}

void InputContext::update(InputReader& reader, const InputTime& time) {
    GamepadDevice previousGamepad = reader.gamepad();
    reader.setGamepad(gamepad_);

    actions_.clear();
    for (auto& b : bindings_) {
        b->update(reader, actions_, time, settings_.actuationThreshold);
        actions_.insert(b->action());
    }

    reader.setGamepad(previousGamepad);
}

void InputContext::resetActions() {
    for (auto& b : bindings_) {
        b->reset();
    }
}

const Action* InputContext::action(std::string_view name) const {
    const ActionBinding* b = findBinding(name);
    return b ? &b->action() : nullptr;
}

ActionValue InputContext::value(std::string_view name) const {
    const Action* a = action(name);
    return a ? a->value() : ActionValue();
}

ActionState InputContext::state(std::string_view name) const {
    const Action* a = action(name);
    return a ? a->state() : ActionState::None;
}

}  // namespace fineinput
