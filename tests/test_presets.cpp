#include <gtest/gtest.h>
#include "fineinput/presets.hpp"
#include "fineinput/action_map.hpp"

using namespace fineinput;

namespace {

// Value one preset input contributes when pressed, for an action of `dim`
ActionValue pressedValue(InputBinding binding, ActionValueDim dim) {
    ActionMap actions;
    InputTime time{0.016f, 0.0};
    ActionValue raw = binding.input.capturedDim() == ActionValueDim::Bool ? ActionValue(true)
                                                                          : ActionValue(1.0f);
    return applyModifiers(binding.modifiers, actions, time, raw.convert(dim)).convert(dim);
}

}  // namespace

// ============================================================================
// Cardinal / Bidirectional / Axial
// ============================================================================

TEST(PresetsTest, CardinalDirections) {
    auto bindings = Cardinal::wasdKeys().bindings();
    ASSERT_EQ(bindings.size(), 4u);
    EXPECT_EQ(bindings[0].input, RawInput(KeyCode::KeyW));
    EXPECT_EQ(pressedValue(bindings[0], ActionValueDim::Axis2D), ActionValue(0.0f, 1.0f));
    EXPECT_EQ(pressedValue(bindings[1], ActionValueDim::Axis2D), ActionValue(1.0f, 0.0f));
    EXPECT_EQ(pressedValue(bindings[2], ActionValueDim::Axis2D), ActionValue(0.0f, -1.0f));
    EXPECT_EQ(pressedValue(bindings[3], ActionValueDim::Axis2D), ActionValue(-1.0f, 0.0f));
}

TEST(PresetsTest, CardinalFactories) {
    auto arrows = Cardinal::arrowKeys();
    EXPECT_EQ(arrows.north, RawInput(KeyCode::ArrowUp));
    EXPECT_EQ(arrows.west, RawInput(KeyCode::ArrowLeft));

    auto dpad = Cardinal::dpadButtons();
    EXPECT_EQ(dpad.south, RawInput(GamepadButton::DPadDown));
    EXPECT_EQ(pressedValue(dpad.bindings()[0], ActionValueDim::Axis2D), ActionValue(0.0f, 1.0f));
}

TEST(PresetsTest, Bidirectional) {
    auto bindings = Bidirectional{KeyCode::KeyE, KeyCode::KeyQ}.bindings();
    ASSERT_EQ(bindings.size(), 2u);
    EXPECT_EQ(pressedValue(bindings[0], ActionValueDim::Axis1D), ActionValue(1.0f));
    EXPECT_EQ(pressedValue(bindings[1], ActionValueDim::Axis1D), ActionValue(-1.0f));
}

TEST(PresetsTest, AxialMapsYAxisToY) {
    auto bindings = Axial::leftStick().bindings();
    ASSERT_EQ(bindings.size(), 2u);
    EXPECT_EQ(bindings[1].input, RawInput(GamepadAxis::LeftStickY));
    EXPECT_EQ(pressedValue(bindings[0], ActionValueDim::Axis2D), ActionValue(1.0f, 0.0f));
    EXPECT_EQ(pressedValue(bindings[1], ActionValueDim::Axis2D), ActionValue(0.0f, 1.0f));
    EXPECT_EQ(Axial::rightStick().x, RawInput(GamepadAxis::RightStickX));
}

// ============================================================================
// Spatial / Ordinal
// ============================================================================

TEST(PresetsTest, SpatialDirections) {
    auto bindings = Spatial::wasdSpaceShift().bindings();
    ASSERT_EQ(bindings.size(), 6u);
    auto dim = ActionValueDim::Axis3D;
    EXPECT_EQ(pressedValue(bindings[0], dim), ActionValue(0.0f, 0.0f, -1.0f));  // forward
    EXPECT_EQ(pressedValue(bindings[1], dim), ActionValue(0.0f, 0.0f, 1.0f));   // backward
    EXPECT_EQ(pressedValue(bindings[2], dim), ActionValue(-1.0f, 0.0f, 0.0f));  // left
    EXPECT_EQ(pressedValue(bindings[3], dim), ActionValue(1.0f, 0.0f, 0.0f));   // right
    EXPECT_EQ(pressedValue(bindings[4], dim), ActionValue(0.0f, 1.0f, 0.0f));   // up
    EXPECT_EQ(pressedValue(bindings[5], dim), ActionValue(0.0f, -1.0f, 0.0f));  // down
}

TEST(PresetsTest, OrdinalDiagonals) {
    auto bindings = Ordinal::numpadKeys().bindings();
    ASSERT_EQ(bindings.size(), 8u);
    auto dim = ActionValueDim::Axis2D;
    EXPECT_EQ(bindings[1].input, RawInput(KeyCode::Numpad9));
    EXPECT_EQ(pressedValue(bindings[0], dim), ActionValue(0.0f, 1.0f));
    EXPECT_EQ(pressedValue(bindings[1], dim), ActionValue(1.0f, 1.0f));
    EXPECT_EQ(pressedValue(bindings[2], dim), ActionValue(1.0f, 0.0f));
    EXPECT_EQ(pressedValue(bindings[3], dim), ActionValue(1.0f, -1.0f));
    EXPECT_EQ(pressedValue(bindings[4], dim), ActionValue(0.0f, -1.0f));
    EXPECT_EQ(pressedValue(bindings[5], dim), ActionValue(-1.0f, -1.0f));
    EXPECT_EQ(pressedValue(bindings[6], dim), ActionValue(-1.0f, 0.0f));
    EXPECT_EQ(pressedValue(bindings[7], dim), ActionValue(-1.0f, 1.0f));
}

TEST(PresetsTest, HjklyubnLayout) {
    auto vi = Ordinal::hjklyubn();
    EXPECT_EQ(vi.north, RawInput(KeyCode::KeyK));
    EXPECT_EQ(vi.west, RawInput(KeyCode::KeyH));
    EXPECT_EQ(vi.southEast, RawInput(KeyCode::KeyN));
    EXPECT_EQ(vi.northWest, RawInput(KeyCode::KeyY));
}
