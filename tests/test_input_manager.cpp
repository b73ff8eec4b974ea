#include <gtest/gtest.h>
#include "fineinput/input_manager.hpp"

#include <stdexcept>

using namespace fineinput;

class InputManagerTest : public ::testing::Test {
protected:
    InputManager manager;
    InputSnapshot snapshot;
};

// ============================================================================
// Registration
// ============================================================================

TEST_F(InputManagerTest, AddAndLookup) {
    InputContext& menu = manager.addContext("menu");
    manager.addContext("gameplay", false);

    EXPECT_EQ(manager.contextCount(), 2u);
    EXPECT_EQ(manager.context("menu"), &menu);
    EXPECT_TRUE(manager.isActive("menu"));
    EXPECT_FALSE(manager.isActive("gameplay"));
    EXPECT_EQ(manager.context("editor"), nullptr);
    EXPECT_FALSE(manager.isActive("editor"));
}

TEST_F(InputManagerTest, InvalidNamesThrow) {
    manager.addContext("menu");
    EXPECT_THROW(manager.addContext("menu"), std::invalid_argument);
    EXPECT_THROW(manager.addContext(""), std::invalid_argument);
    EXPECT_EQ(manager.contextCount(), 1u);
}

TEST_F(InputManagerTest, RemoveContext) {
    manager.addContext("menu");
    EXPECT_TRUE(manager.removeContext("menu"));
    EXPECT_FALSE(manager.removeContext("menu"));
    EXPECT_EQ(manager.contextCount(), 0u);
    EXPECT_FALSE(manager.setActive("menu", true));
}

TEST_F(InputManagerTest, ContextsInheritSettings) {
    InputSettings settings;
    settings.actuationThreshold = 0.8f;
    InputManager tuned(settings);
    EXPECT_FLOAT_EQ(tuned.addContext("player").settings().actuationThreshold, 0.8f);
}

// ============================================================================
// Evaluation
// ============================================================================

TEST_F(InputManagerTest, TimeAdvances) {
    manager.update(snapshot, 0.25f);
    manager.update(snapshot, 0.5f);
    EXPECT_FLOAT_EQ(manager.time().delta, 0.5f);
    EXPECT_DOUBLE_EQ(manager.time().elapsed, 0.75);
}

TEST_F(InputManagerTest, EarlierContextConsumesInput) {
    InputContext& menu = manager.addContext("menu");
    InputContext& gameplay = manager.addContext("gameplay");
    menu.bind("confirm", ActionValueDim::Bool).to(KeyCode::Enter);
    gameplay.bind("interact", ActionValueDim::Bool).to(KeyCode::Enter);
    gameplay.bind("jump", ActionValueDim::Bool).to(KeyCode::Space);

    snapshot.pressKey(KeyCode::Enter);
    snapshot.pressKey(KeyCode::Space);
    manager.update(snapshot, 0.016f);

    EXPECT_EQ(menu.state("confirm"), ActionState::Fired);
    EXPECT_EQ(gameplay.state("interact"), ActionState::None);
    EXPECT_EQ(gameplay.state("jump"), ActionState::Fired);
}

TEST_F(InputManagerTest, InactiveContextSkipped) {
    InputContext& menu = manager.addContext("menu", false);
    InputContext& gameplay = manager.addContext("gameplay");
    menu.bind("confirm", ActionValueDim::Bool).to(KeyCode::Enter);
    gameplay.bind("interact", ActionValueDim::Bool).to(KeyCode::Enter);

    snapshot.pressKey(KeyCode::Enter);
    manager.update(snapshot, 0.016f);

    EXPECT_EQ(menu.state("confirm"), ActionState::None);
    EXPECT_EQ(gameplay.state("interact"), ActionState::Fired);
}

TEST_F(InputManagerTest, DeactivateResetsActions) {
    InputContext& gameplay = manager.addContext("gameplay");
    gameplay.bind("jump", ActionValueDim::Bool).to(KeyCode::Space);

    snapshot.pressKey(KeyCode::Space);
    manager.update(snapshot, 0.016f);
    ASSERT_EQ(gameplay.state("jump"), ActionState::Fired);

    EXPECT_TRUE(manager.setActive("gameplay", false));
    EXPECT_EQ(gameplay.state("jump"), ActionState::None);
    EXPECT_EQ(gameplay.value("jump"), ActionValue(false));

    // No further evaluation while inactive
    manager.update(snapshot, 0.016f);
    EXPECT_EQ(gameplay.state("jump"), ActionState::None);
}

TEST_F(InputManagerTest, ReactivateWaitsForRelease) {
    InputContext& gameplay = manager.addContext("gameplay");
    ActionSettings settings;
    settings.requireReset = true;
    gameplay.bind("fire", ActionValueDim::Bool, settings).to(MouseButton::Left);
    gameplay.bind("jump", ActionValueDim::Bool).to(KeyCode::Space);

    // Button held from the start is ignored until released once
    snapshot.pressMouseButton(MouseButton::Left);
    snapshot.pressKey(KeyCode::Space);
    manager.update(snapshot, 0.016f);
    EXPECT_EQ(gameplay.state("fire"), ActionState::None);
    EXPECT_EQ(gameplay.state("jump"), ActionState::Fired);

    snapshot.releaseMouseButton(MouseButton::Left);
    manager.update(snapshot, 0.016f);
    snapshot.pressMouseButton(MouseButton::Left);
    manager.update(snapshot, 0.016f);
    EXPECT_EQ(gameplay.state("fire"), ActionState::Fired);

    // Toggling the context re-arms the wait
    manager.setActive("gameplay", false);
    manager.setActive("gameplay", true);
    manager.update(snapshot, 0.016f);
    EXPECT_EQ(gameplay.state("fire"), ActionState::None);
    EXPECT_EQ(gameplay.state("jump"), ActionState::Fired);

    snapshot.releaseMouseButton(MouseButton::Left);
    manager.update(snapshot, 0.016f);
    snapshot.pressMouseButton(MouseButton::Left);
    manager.update(snapshot, 0.016f);
    EXPECT_EQ(gameplay.state("fire"), ActionState::Fired);
}

TEST_F(InputManagerTest, SetActiveSameStateKeepsActions) {
    InputContext& gameplay = manager.addContext("gameplay");
    gameplay.bind("jump", ActionValueDim::Bool).to(KeyCode::Space);

    snapshot.pressKey(KeyCode::Space);
    manager.update(snapshot, 0.016f);
    EXPECT_TRUE(manager.setActive("gameplay", true));
    EXPECT_EQ(gameplay.state("jump"), ActionState::Fired);
}
