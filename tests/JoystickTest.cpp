// JoystickTest.cpp

#include <gtest/gtest.h>

#include "src/domain/Joystick.h"

namespace {

JoystickConfig config(float deadzone, int32_t low, int32_t high) {
  JoystickConfig c;
  c.deadzone = deadzone;
  c.low = low;
  c.high = high;
  return c;
}

}  // namespace

TEST(JoystickTest, RailsClampToFullDeflection) {
  Joystick j(config(0.1f, 0, 65536));
  EXPECT_FLOAT_EQ(-1.0f, j.normalize(0));
  EXPECT_FLOAT_EQ(-1.0f, j.normalize(-500));
  EXPECT_FLOAT_EQ(1.0f, j.normalize(65536));
  EXPECT_FLOAT_EQ(1.0f, j.normalize(70000));
}

TEST(JoystickTest, CenterInsideDeadzoneIsExactlyZero) {
  Joystick j(config(0.1f, 0, 1000));
  EXPECT_EQ(0.0f, j.normalize(500));
  EXPECT_EQ(0.0f, j.normalize(540));  // 0.08
  EXPECT_EQ(0.0f, j.normalize(460));  // -0.08
}

TEST(JoystickTest, OutsideDeadzoneScalesLinearly) {
  Joystick j(config(0.1f, 0, 1000));
  EXPECT_NEAR(0.5f, j.normalize(750), 1e-6);
  EXPECT_NEAR(-0.5f, j.normalize(250), 1e-6);
  EXPECT_NEAR(0.2f, j.normalize(600), 1e-6);
}

TEST(JoystickTest, NearRailSnapsToFullDeflection) {
  Joystick j(config(0.1f, 0, 1000));
  EXPECT_EQ(1.0f, j.normalize(996));   // 0.992
  EXPECT_EQ(-1.0f, j.normalize(4));    // -0.992
  EXPECT_LT(j.normalize(990), 1.0f);   // 0.98 stays
}

TEST(JoystickTest, RescaleHonorsNonZeroLowRail) {
  Joystick j(config(0.05f, 1000, 3000));
  EXPECT_EQ(0.0f, j.normalize(2000));
  EXPECT_NEAR(0.5f, j.normalize(2500), 1e-6);
  EXPECT_FLOAT_EQ(-1.0f, j.normalize(1000));
}

TEST(JoystickTest, DefaultsMatchSixteenBitRange) {
  Joystick j;
  EXPECT_FLOAT_EQ(0.1f, j.config().deadzone);
  EXPECT_EQ(0, j.config().low);
  EXPECT_EQ(65536, j.config().high);
  EXPECT_EQ(0.0f, j.normalize(32768));
}
