#include <gtest/gtest.h>
#include "InputManager.hpp"

using lplay::InputManager;
using Button = lplay::IInputManager::MouseButton;

TEST(InputManager, PointerIsOptional) {
    InputManager input;
    EXPECT_FALSE(input.GetPointerWorldPosition().has_value());

    input.SetPointerWorldPosition({ 3.0f, -4.0f });
    ASSERT_TRUE(input.GetPointerWorldPosition().has_value());
    EXPECT_FLOAT_EQ(input.GetPointerWorldPosition()->x, 3.0f);
    EXPECT_FLOAT_EQ(input.GetPointerWorldPosition()->y, -4.0f);

    input.ClearPointer();
    EXPECT_FALSE(input.GetPointerWorldPosition().has_value());
}

TEST(InputManager, JustPressedOnlyOnRisingEdge) {
    InputManager input;

    input.SetMouseButton(Button::Left, true);
    EXPECT_TRUE(input.IsMouseButtonJustPressed(Button::Left));
    EXPECT_TRUE(input.IsMouseButtonDown(Button::Left));
    EXPECT_FALSE(input.IsMouseButtonJustPressed(Button::Right));

    input.EndFrame();
    input.SetMouseButton(Button::Left, true);
    EXPECT_FALSE(input.IsMouseButtonJustPressed(Button::Left));
    EXPECT_TRUE(input.IsMouseButtonDown(Button::Left));

    input.SetMouseButton(Button::Left, false);
    input.EndFrame();
    EXPECT_FALSE(input.IsMouseButtonDown(Button::Left));

    input.SetMouseButton(Button::Left, true);
    EXPECT_TRUE(input.IsMouseButtonJustPressed(Button::Left));
}
