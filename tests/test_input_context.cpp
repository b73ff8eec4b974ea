#include <gtest/gtest.h>
#include "fineinput/input_context.hpp"
#include "fineinput/log.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace fineinput;

class InputContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::setSink([this](log::Level level, std::string_view message) {
            if (level == log::Level::Warning) {
                warnings.emplace_back(message);
            }
        });
    }

    void TearDown() override {
        log::resetSink();
    }

    // One pass with a fresh reader, advancing time by dt
    void step(InputContext& context, float dt = 0.016f) {
        time = time.advanced(dt);
        InputReader reader(snapshot);
        context.update(reader, time);
    }

    InputSnapshot snapshot;
    InputTime time;
    std::vector<std::string> warnings;
};

// ============================================================================
// Binding management
// ============================================================================

TEST_F(InputContextTest, BindAndLookup) {
    InputContext context("player");
    EXPECT_EQ(context.name(), "player");

    context.bind("jump", ActionValueDim::Bool).to(KeyCode::Space);
    ASSERT_NE(context.action("jump"), nullptr);
    EXPECT_EQ(context.action("jump")->dim(), ActionValueDim::Bool);
    EXPECT_EQ(context.action("crouch"), nullptr);
    EXPECT_EQ(context.state("crouch"), ActionState::None);
    EXPECT_EQ(context.size(), 1u);
}

TEST_F(InputContextTest, EmptyNameThrows) {
    InputContext context("player");
    EXPECT_THROW(context.bind("", ActionValueDim::Bool), std::invalid_argument);
}

TEST_F(InputContextTest, RebindKeepsSlot) {
    InputContext context("player");
    context.bind("a", ActionValueDim::Bool).to(KeyCode::KeyA);
    context.bind("b", ActionValueDim::Bool).to(KeyCode::KeyB);
    context.bind("a", ActionValueDim::Axis1D).to(KeyCode::KeyZ);

    EXPECT_EQ(context.size(), 2u);
    EXPECT_EQ(context.action("a")->dim(), ActionValueDim::Axis1D);

    step(context);
    ASSERT_EQ(context.actions().size(), 2u);
    EXPECT_EQ(context.actions().actions()[0]->name(), "a");
    EXPECT_EQ(context.actions().actions()[1]->name(), "b");
}

TEST_F(InputContextTest, UnbindAndClear) {
    InputContext context("player");
    context.bind("a", ActionValueDim::Bool).to(KeyCode::KeyA);
    context.bind("b", ActionValueDim::Bool).to(KeyCode::KeyB);

    EXPECT_TRUE(context.unbind("a"));
    EXPECT_FALSE(context.unbind("a"));
    EXPECT_EQ(context.action("a"), nullptr);
    EXPECT_EQ(context.size(), 1u);

    context.clear();
    EXPECT_EQ(context.size(), 0u);
}

TEST_F(InputContextTest, BindingExposesItsParts) {
    InputContext context("player");
    context.bind("move", ActionValueDim::Axis2D)
        .to(Cardinal::wasdKeys())
        .withModifiers({DeltaScale{}})
        .withConditions({Down{}});

    ActionBinding* binding = context.binding("move");
    ASSERT_NE(binding, nullptr);
    EXPECT_EQ(binding->inputs().size(), 4u);
    EXPECT_EQ(binding->modifiers().size(), 1u);
    EXPECT_EQ(binding->conditions().size(), 1u);
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(InputContextTest, WasdScenario) {
    InputContext context("player");
    context.bind("move", ActionValueDim::Axis2D)
        .to(Cardinal::wasdKeys())
        .withConditions({Down{}});

    snapshot.pressKey(KeyCode::KeyD);
    step(context);
    const Action* move = context.action("move");
    EXPECT_EQ(move->value(), ActionValue(1.0f, 0.0f));
    EXPECT_EQ(move->state(), ActionState::Fired);
    EXPECT_TRUE(move->events().started());
    EXPECT_TRUE(move->events().fired());

    snapshot.releaseKey(KeyCode::KeyD);
    step(context);
    EXPECT_EQ(move->value(), ActionValue(0.0f, 0.0f));
    EXPECT_EQ(move->state(), ActionState::None);
    EXPECT_TRUE(move->events().completed());
}

TEST_F(InputContextTest, OppositeDirectionsCancel) {
    InputContext context("player");
    context.bind("move", ActionValueDim::Axis2D).to(Cardinal::wasdKeys());

    snapshot.pressKey(KeyCode::KeyA);
    snapshot.pressKey(KeyCode::KeyD);
    step(context);
    EXPECT_EQ(context.value("move"), ActionValue(0.0f, 0.0f));
    EXPECT_EQ(context.state("move"), ActionState::None);

    snapshot.pressKey(KeyCode::KeyW);
    step(context);
    EXPECT_EQ(context.value("move"), ActionValue(0.0f, 1.0f));
}

TEST_F(InputContextTest, DiagonalIsNotNormalized) {
    InputContext context("player");
    context.bind("move", ActionValueDim::Axis2D).to(Cardinal::wasdKeys());

    snapshot.pressKey(KeyCode::KeyW);
    snapshot.pressKey(KeyCode::KeyD);
    step(context);
    EXPECT_EQ(context.value("move"), ActionValue(1.0f, 1.0f));
}

TEST_F(InputContextTest, GamepadChordScenario) {
    InputContext context("player");
    context.bind("a", ActionValueDim::Bool)
        .to(KeyCode::ShiftLeft)
        .withConditions({Down{}});
    context.bind("b", ActionValueDim::Bool)
        .to(GamepadButton::South)
        .withConditions({Chord{"a"}});

    snapshot.pressKey(KeyCode::ShiftLeft);
    snapshot.setGamepadButton(0, GamepadButton::South, 1.0f);
    for (int frame = 0; frame < 3; ++frame) {
        step(context);
        EXPECT_EQ(context.state("a"), ActionState::Fired);
        EXPECT_EQ(context.state("b"), context.state("a"));
    }
    EXPECT_TRUE(warnings.empty());
}

TEST_F(InputContextTest, ChordWithPressFiresOnlyOnPressFrame) {
    // Explicit and Implicit conditions combine with AND
    InputContext context("player");
    context.bind("a", ActionValueDim::Bool)
        .to(KeyCode::ShiftLeft)
        .withConditions({Down{}});
    context.bind("b", ActionValueDim::Bool)
        .to(GamepadButton::South)
        .withConditions({Press{}, Chord{"a"}});

    snapshot.pressKey(KeyCode::ShiftLeft);
    snapshot.setGamepadButton(0, GamepadButton::South, 1.0f);
    step(context);
    EXPECT_EQ(context.state("b"), ActionState::Fired);

    step(context);
    EXPECT_EQ(context.state("a"), ActionState::Fired);
    EXPECT_EQ(context.state("b"), ActionState::Ongoing);
}

TEST_F(InputContextTest, ChordOnlyInheritsState) {
    InputContext context("player");
    context.bind("a", ActionValueDim::Bool).to(KeyCode::ShiftLeft);
    context.bind("b", ActionValueDim::Bool)
        .to(GamepadButton::South)
        .withConditions({Chord{"a"}});

    snapshot.pressKey(KeyCode::ShiftLeft);
    step(context);
    EXPECT_EQ(context.state("b"), ActionState::Fired);

    snapshot.releaseKey(KeyCode::ShiftLeft);
    step(context);
    EXPECT_EQ(context.state("b"), ActionState::None);
}

TEST_F(InputContextTest, ChordOnLaterActionSeesNothing) {
    InputContext context("player");
    context.bind("b", ActionValueDim::Bool)
        .to(KeyCode::KeyB)
        .withConditions({Chord{"a"}});
    context.bind("a", ActionValueDim::Bool).to(KeyCode::KeyA);

    snapshot.pressKey(KeyCode::KeyA);
    snapshot.pressKey(KeyCode::KeyB);
    step(context);

    EXPECT_EQ(context.state("a"), ActionState::Fired);
    EXPECT_EQ(context.state("b"), ActionState::None);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("`a`"), std::string::npos);
}

TEST_F(InputContextTest, ReevaluationIsIdempotent) {
    InputContext context("player");
    context.bind("move", ActionValueDim::Axis2D)
        .to(Cardinal::wasdKeys())
        .withConditions({Down{}});
    context.bind("fire", ActionValueDim::Bool)
        .to(MouseButton::Left)
        .withConditions({Hold{0.1f}});

    snapshot.pressKey(KeyCode::KeyS);
    snapshot.pressMouseButton(MouseButton::Left);
    step(context, 0.05f);

    ActionValue moveValue = context.value("move");
    ActionState moveState = context.state("move");
    ActionValue fireValue = context.value("fire");
    ActionState fireState = context.state("fire");
    float elapsed = context.action("move")->elapsedSecs();

    step(context, 0.0f);
    EXPECT_EQ(context.value("move"), moveValue);
    EXPECT_EQ(context.state("move"), moveState);
    EXPECT_EQ(context.value("fire"), fireValue);
    EXPECT_EQ(context.state("fire"), fireState);
    EXPECT_GE(context.action("move")->elapsedSecs(), elapsed);
}

// ============================================================================
// Modifiers in the pipeline
// ============================================================================

TEST_F(InputContextTest, ActionModifiersRunAfterAccumulation) {
    InputContext context("player");
    context.bind("move", ActionValueDim::Axis2D)
        .to(Cardinal::wasdKeys())
        .withModifiers({Scale::splat(3.0f)});

    snapshot.pressKey(KeyCode::KeyW);
    snapshot.pressKey(KeyCode::KeyD);
    step(context);
    EXPECT_EQ(context.value("move"), ActionValue(3.0f, 3.0f));
}

TEST_F(InputContextTest, InputModifiersApplyPerInput) {
    InputContext context("player");
    context.bind("zoom", ActionValueDim::Axis1D)
        .to(InputBinding(KeyCode::NumpadAdd).withModifier(Scale::splat(2.0f)))
        .to(InputBinding(KeyCode::NumpadSubtract).withModifier(Negate::all()));

    snapshot.pressKey(KeyCode::NumpadAdd);
    snapshot.pressKey(KeyCode::NumpadSubtract);
    step(context);
    EXPECT_EQ(context.value("zoom"), ActionValue(1.0f));
}

TEST_F(InputContextTest, MaxAbsAccumulation) {
    InputContext context("player");
    ActionSettings settings;
    settings.accumulation = Accumulation::MaxAbs;
    context.bind("steer", ActionValueDim::Axis1D, settings)
        .to(GamepadAxis::LeftStickX)
        .to(GamepadAxis::RightStickX);

    snapshot.setGamepadAxis(0, GamepadAxis::LeftStickX, 0.25f);
    snapshot.setGamepadAxis(0, GamepadAxis::RightStickX, -0.75f);
    step(context);
    EXPECT_EQ(context.value("steer"), ActionValue(-0.75f));
}

TEST_F(InputContextTest, DeltaScaledMovement) {
    InputContext context("player");
    context.bind("move", ActionValueDim::Axis2D)
        .to(Cardinal::wasdKeys())
        .withModifiers({DeltaScale{}});

    snapshot.pressKey(KeyCode::KeyD);
    step(context, 0.5f);
    EXPECT_EQ(context.value("move"), ActionValue(0.5f, 0.0f));
}

// ============================================================================
// Consumption and requireReset
// ============================================================================

TEST_F(InputContextTest, ModifierComboConsumesPlainKey) {
    InputContext context("editor");
    context.bind("copy", ActionValueDim::Bool).to(RawInput::key(KeyCode::KeyC, ModKeys::control()));
    context.bind("cut", ActionValueDim::Bool).to(KeyCode::KeyC);

    snapshot.pressKey(KeyCode::ControlLeft);
    snapshot.pressKey(KeyCode::KeyC);
    step(context);
    EXPECT_EQ(context.state("copy"), ActionState::Fired);
    EXPECT_EQ(context.state("cut"), ActionState::None);

    snapshot.releaseKey(KeyCode::ControlLeft);
    step(context);
    EXPECT_EQ(context.state("copy"), ActionState::None);
    EXPECT_EQ(context.state("cut"), ActionState::Fired);
}

TEST_F(InputContextTest, NonConsumingActionSharesInput) {
    InputContext context("player");
    ActionSettings shared;
    shared.consumeInput = false;
    context.bind("first", ActionValueDim::Bool, shared).to(KeyCode::KeyF);
    context.bind("second", ActionValueDim::Bool).to(KeyCode::KeyF);

    snapshot.pressKey(KeyCode::KeyF);
    step(context);
    EXPECT_EQ(context.state("first"), ActionState::Fired);
    EXPECT_EQ(context.state("second"), ActionState::Fired);
}

TEST_F(InputContextTest, RequireResetWaitsForRelease) {
    InputContext context("player");
    ActionSettings settings;
    settings.requireReset = true;
    context.bind("jump", ActionValueDim::Bool, settings).to(KeyCode::Space);

    snapshot.pressKey(KeyCode::Space);
    step(context);
    EXPECT_EQ(context.state("jump"), ActionState::None);
    EXPECT_TRUE(context.binding("jump")->awaitingReset());

    snapshot.releaseKey(KeyCode::Space);
    step(context);
    EXPECT_FALSE(context.binding("jump")->awaitingReset());

    snapshot.pressKey(KeyCode::Space);
    step(context);
    EXPECT_EQ(context.state("jump"), ActionState::Fired);
}

TEST_F(InputContextTest, ResetActions) {
    InputContext context("player");
    context.bind("jump", ActionValueDim::Bool)
        .to(KeyCode::Space)
        .withConditions({Press{}});

    snapshot.pressKey(KeyCode::Space);
    step(context);
    EXPECT_EQ(context.state("jump"), ActionState::Fired);

    context.resetActions();
    EXPECT_EQ(context.state("jump"), ActionState::None);

    // Press state was cleared too, so the held key counts as a new press
    step(context);
    EXPECT_EQ(context.state("jump"), ActionState::Fired);
}

TEST_F(InputContextTest, SingleGamepadContext) {
    InputContext context("player2");
    context.setGamepad(GamepadDevice::single(1));
    context.bind("jump", ActionValueDim::Bool).to(GamepadButton::South);

    snapshot.setGamepadButton(0, GamepadButton::South, 1.0f);
    step(context);
    EXPECT_EQ(context.state("jump"), ActionState::None);

    snapshot.setGamepadButton(1, GamepadButton::South, 1.0f);
    step(context);
    EXPECT_EQ(context.state("jump"), ActionState::Fired);
}
