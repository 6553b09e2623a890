// ButtonCatalogTest.cpp

#include <gtest/gtest.h>

#include "src/domain/ButtonCatalog.h"

TEST(ButtonCatalogTest, ClassifiesByNamePattern) {
  EXPECT_EQ(ButtonKind::Touch, ButtonCatalog::classify("A1"));
  EXPECT_EQ(ButtonKind::Touch, ButtonCatalog::classify("A12"));
  EXPECT_EQ(ButtonKind::Digital, ButtonCatalog::classify("D5"));
  EXPECT_EQ(ButtonKind::Digital, ButtonCatalog::classify("BUTTON_A"));
  EXPECT_EQ(ButtonKind::Gamepad, ButtonCatalog::classify("GAMEPAD_START"));
}

TEST(ButtonCatalogTest, RejectsLookalikes) {
  EXPECT_EQ(ButtonKind::Unknown, ButtonCatalog::classify(""));
  EXPECT_EQ(ButtonKind::Unknown, ButtonCatalog::classify("A"));
  EXPECT_EQ(ButtonKind::Unknown, ButtonCatalog::classify("A1B"));
  EXPECT_EQ(ButtonKind::Unknown, ButtonCatalog::classify("D"));
  EXPECT_EQ(ButtonKind::Unknown, ButtonCatalog::classify("BUTTON_"));
  EXPECT_EQ(ButtonKind::Unknown, ButtonCatalog::classify("GAMEPAD_Q"));
  EXPECT_EQ(ButtonKind::Unknown, ButtonCatalog::classify("JOYSTICK_X"));
}

TEST(ButtonCatalogTest, GamepadLayoutMasks) {
  ASSERT_EQ(8u, ButtonCatalog::kGamepadLayoutSize);
  uint8_t mask = 0;
  ASSERT_TRUE(ButtonCatalog::gamepadMask("GAMEPAD_A", mask));
  EXPECT_EQ(0x02, mask);
  ASSERT_TRUE(ButtonCatalog::gamepadMask("GAMEPAD_B", mask));
  EXPECT_EQ(0x01, mask);
  ASSERT_TRUE(ButtonCatalog::gamepadMask("GAMEPAD_R", mask));
  EXPECT_EQ(0x80, mask);
  EXPECT_FALSE(ButtonCatalog::gamepadMask("BUTTON_A", mask));

  uint8_t all = 0;
  for (size_t i = 0; i < ButtonCatalog::kGamepadLayoutSize; ++i) {
    EXPECT_EQ(0, all & ButtonCatalog::kGamepadLayout[i].mask);
    all |= ButtonCatalog::kGamepadLayout[i].mask;
  }
  EXPECT_EQ(0xFF, all);
}

TEST(ButtonCatalogTest, JoystickAxes) {
  EXPECT_TRUE(ButtonCatalog::isJoystickAxis("JOYSTICK_X"));
  EXPECT_FALSE(ButtonCatalog::isJoystickAxis("JOYSTICK_"));
  EXPECT_FALSE(ButtonCatalog::isJoystickAxis("A1"));
}
