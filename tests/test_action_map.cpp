#include <gtest/gtest.h>
#include "fineinput/action_map.hpp"

#include <string_view>

using namespace fineinput;

TEST(ActionMapTest, FindByName) {
    Action jump("jump", ActionValueDim::Bool);
    Action move("move", ActionValueDim::Axis2D);

    ActionMap map;
    EXPECT_TRUE(map.empty());
    map.insert(jump);
    map.insert(move);

    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.find("jump"), &jump);
    EXPECT_EQ(map.find("move"), &move);
    EXPECT_EQ(map.find("crouch"), nullptr);
    EXPECT_TRUE(map.contains("move"));
}

TEST(ActionMapTest, FindBySubstringView) {
    Action jump("jump", ActionValueDim::Bool);
    ActionMap map;
    map.insert(jump);

    std::string_view text = "jumping";
    EXPECT_EQ(map.find(text.substr(0, 4)), &jump);
    EXPECT_EQ(map.find(text), nullptr);
}

TEST(ActionMapTest, KeepsInsertionOrder) {
    Action b("b", ActionValueDim::Bool);
    Action a("a", ActionValueDim::Bool);
    Action c("c", ActionValueDim::Bool);

    ActionMap map;
    map.insert(b);
    map.insert(a);
    map.insert(c);

    ASSERT_EQ(map.actions().size(), 3u);
    EXPECT_EQ(map.actions()[0]->name(), "b");
    EXPECT_EQ(map.actions()[1]->name(), "a");
    EXPECT_EQ(map.actions()[2]->name(), "c");
}

TEST(ActionMapTest, ReinsertReplacesInPlace) {
    Action first("fire", ActionValueDim::Bool);
    Action other("aim", ActionValueDim::Bool);
    Action second("fire", ActionValueDim::Axis1D);

    ActionMap map;
    map.insert(first);
    map.insert(other);
    map.insert(second);

    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.find("fire"), &second);
    EXPECT_EQ(map.actions()[0], &second);
}

TEST(ActionMapTest, Clear) {
    Action jump("jump", ActionValueDim::Bool);
    ActionMap map;
    map.insert(jump);
    map.clear();
    EXPECT_TRUE(map.empty());
    EXPECT_FALSE(map.contains("jump"));
}
