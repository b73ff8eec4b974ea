#include "fineinput/action.hpp"

namespace fineinput {

const char* actionStateName(ActionState state) {
    switch (state) {
        case ActionState::None:    return "None";
        case ActionState::Ongoing: return "Ongoing";
        case ActionState::Fired:   return "Fired";
    }
    return "Unknown";
}

// ============================================================================
// ActionEvents
// ============================================================================

ActionEvents ActionEvents::fromTransition(ActionState prev, ActionState next) {
    switch (prev) {
        case ActionState::None:
            switch (next) {
                case ActionState::None:    return ActionEvents();
                case ActionState::Ongoing: return ActionEvents(STARTED | ONGOING);
                case ActionState::Fired:   return ActionEvents(STARTED | FIRED);
            }
            break;
        case ActionState::Ongoing:
            switch (next) {
                case ActionState::None:    return ActionEvents(CANCELED);
                case ActionState::Ongoing: return ActionEvents(ONGOING);
                case ActionState::Fired:   return ActionEvents(FIRED);
            }
            break;
        case ActionState::Fired:
            switch (next) {
                case ActionState::None:    return ActionEvents(COMPLETED);
                case ActionState::Ongoing: return ActionEvents(ONGOING);
                case ActionState::Fired:   return ActionEvents(FIRED);
            }
            break;
    }
    return ActionEvents();
}

std::string ActionEvents::toString() const {
    static constexpr struct {
        uint8_t flag;
        const char* name;
    } NAMES[] = {
        {STARTED, "Started"},
        {ONGOING, "Ongoing"},
        {FIRED, "Fired"},
        {CANCELED, "Canceled"},
        {COMPLETED, "Completed"},
    };

    std::string result;
    for (const auto& entry : NAMES) {
        if (!(bits_ & entry.flag)) {
            continue;
        }
        if (!result.empty()) {
            result += " | ";
        }
        result += entry.name;
    }
    return result;
}

// ============================================================================
// Action
// ============================================================================

Action::Action(std::string name, ActionValueDim dim, ActionSettings settings)
    : name_(std::move(name))
    , dim_(dim)
    , settings_(settings)
    , value_(ActionValue::zero(dim))
{
}

void Action::update(const InputTime& time, ActionState state, const ActionValue& value) {
    events_ = ActionEvents::fromTransition(state_, state);

    if (state != state_) {
        timeInState_ = 0.0f;
    } else {
        timeInState_ += time.delta;
    }

    switch (state) {
        case ActionState::None:
            elapsedSecs_ = 0.0f;
            firedSecs_ = 0.0f;
            break;
        case ActionState::Ongoing:
            elapsedSecs_ += time.delta;
            firedSecs_ = 0.0f;
            break;
        case ActionState::Fired:
            elapsedSecs_ += time.delta;
            firedSecs_ += time.delta;
            break;
    }

    state_ = state;
    value_ = value.convert(dim_);
}

void Action::reset() {
    state_ = ActionState::None;
    events_ = ActionEvents();
    value_ = ActionValue::zero(dim_);
    timeInState_ = 0.0f;
    elapsedSecs_ = 0.0f;
    firedSecs_ = 0.0f;
}

}  // namespace fineinput
