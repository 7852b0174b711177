#include <gtest/gtest.h>

#include <ArduinoFake.h>

namespace {

// TinyGPS++ stamps every committed field with millis()
class ArduinoEnvironment : public ::testing::Environment {
public:
  void SetUp() override {
    When(Method(ArduinoFake(), millis)).AlwaysReturn(0);
  }
};

::testing::Environment* const arduinoEnvironment =
    ::testing::AddGlobalTestEnvironment(new ArduinoEnvironment);

}  // namespace
