#include <gtest/gtest.h>

#include "fakes.h"
#include "ridesafe/motion_sensor.h"

using ridesafe::Fault;
using ridesafe::MotionSample;
using ridesafe::MotionSensor;
using ridesafe::fakes::FakeClock;
using ridesafe::fakes::FakeI2cBus;

class MotionSensorTest : public ::testing::Test {
protected:
  FakeClock clock;
  FakeI2cBus bus;
  MotionSensor sensor{bus, clock};

  void SetUp() override {
    bus.registers[0x75] = 0x68;   // WHO_AM_I
  }
};

TEST_F(MotionSensorTest, InitializeWakesSensor) {
  EXPECT_EQ(sensor.initialize(), MotionSensor::READY);
  EXPECT_TRUE(sensor.isInitialized());
  EXPECT_EQ(sensor.getDeviceId(), 0x68);

  ASSERT_EQ(bus.writes.size(), 1u);
  EXPECT_EQ(bus.writes[0].first, 0x6B);
  EXPECT_EQ(bus.writes[0].second, 0x00);
  EXPECT_TRUE(clock.sleptFor(100));
}

TEST_F(MotionSensorTest, UnknownDeviceIdIsAccepted) {
  bus.registers[0x75] = 0x12;
  EXPECT_EQ(sensor.initialize(), MotionSensor::READY);
  EXPECT_TRUE(MotionSensor::modelName(0x12) == nullptr);
  EXPECT_STREQ(MotionSensor::modelName(0x71), "MPU9250");
}

TEST_F(MotionSensorTest, ReadSampleScalesRawCounts) {
  ASSERT_EQ(sensor.initialize(), MotionSensor::READY);

  bus.setWord(0x3B, 16384);    // ax = +1 g
  bus.setWord(0x3D, 8192);     // ay = +0.5 g
  bus.setWord(0x3F, -16384);   // az = -1 g
  bus.setWord(0x41, 1234);     // temperature, ignored
  bus.setWord(0x43, 131);      // gx = +1 °/s
  bus.setWord(0x45, 0);
  bus.setWord(0x47, -262);     // gz = -2 °/s

  MotionSample sample;
  EXPECT_EQ(sensor.readSample(sample), Fault::NONE);
  EXPECT_FLOAT_EQ(sample.accel.x, 1.0f);
  EXPECT_FLOAT_EQ(sample.accel.y, 0.5f);
  EXPECT_FLOAT_EQ(sample.accel.z, -1.0f);
  EXPECT_FLOAT_EQ(sample.gyro.x, 1.0f);
  EXPECT_FLOAT_EQ(sample.gyro.y, 0.0f);
  EXPECT_FLOAT_EQ(sample.gyro.z, -2.0f);
}

TEST_F(MotionSensorTest, NegativeFullScaleIsSigned) {
  ASSERT_EQ(sensor.initialize(), MotionSensor::READY);
  bus.registers[0x3B] = 0x80;
  bus.registers[0x3C] = 0x00;   // -32768 -> -2 g

  MotionSample sample;
  EXPECT_EQ(sensor.readSample(sample), Fault::NONE);
  EXPECT_FLOAT_EQ(sample.accel.x, -2.0f);
}

TEST_F(MotionSensorTest, UninitializedSensorReturnsZeroedSample) {
  bus.failWrites = true;
  EXPECT_EQ(sensor.initialize(), MotionSensor::UNAVAILABLE);
  EXPECT_FALSE(sensor.isInitialized());

  bus.setWord(0x3B, 16384);
  MotionSample sample;
  EXPECT_EQ(sensor.readSample(sample), Fault::NONE);
  EXPECT_EQ(sample.accel.x, 0.0f);
  EXPECT_EQ(sample.gyro.z, 0.0f);
  EXPECT_EQ(bus.reads, 0);
}

TEST_F(MotionSensorTest, BusFailureReportsSensorFault) {
  ASSERT_EQ(sensor.initialize(), MotionSensor::READY);
  bus.setWord(0x3B, 16384);
  bus.failReads = true;

  MotionSample sample;
  EXPECT_EQ(sensor.readSample(sample), Fault::SENSOR_FAULT);
  EXPECT_EQ(sample.accel.x, 0.0f);
}
