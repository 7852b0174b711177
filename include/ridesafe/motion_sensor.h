#ifndef __RIDESAFE_MOTION_SENSOR_H__
#define __RIDESAFE_MOTION_SENSOR_H__

#include <stdint.h>

#include "ridesafe/config.h"
#include "ridesafe/faults.h"
#include "ridesafe/hal.h"

namespace ridesafe {

struct Vector3 {
  float x, y, z;
};

/**
 * One reading of the inertial sensor
 */
struct MotionSample {
  Vector3 accel;   // g
  Vector3 gyro;    // °/s
};

/**
 * MPU6050 6-Axis Motion Sensor Driver
 *
 * Reads accelerometer and gyroscope data over the I2C capability.
 * A sensor that failed to initialize keeps answering with zeroed samples so
 * the fusion stage degrades to "no event" instead of stopping the loop.
 */
class MotionSensor {
private:
  // MPU6050 register definitions
  static const uint8_t REG_PWR_MGMT_1 = 0x6B;     // Power management register
  static const uint8_t REG_WHO_AM_I = 0x75;       // Device ID register
  static const uint8_t REG_ACCEL_XOUT_H = 0x3B;   // Start of accel/temp/gyro block

  I2cBus& bus;
  Clock& clock;
  uint8_t address;
  bool initialized;
  uint8_t deviceId;

public:
  enum Status {
    READY = 0,
    UNAVAILABLE = 1
  };

  // Scale factors for the power-on ranges
  static constexpr float ACCEL_SCALE = 16384.0f;   // LSB/g for ±2g
  static constexpr float GYRO_SCALE = 131.0f;      // LSB/(°/s) for ±250°/s

  MotionSensor(I2cBus& bus, Clock& clock, uint8_t address = MPU6050_ADDRESS);

  /**
   * Wake the sensor from sleep mode and verify communication
   * @return READY if the wake command was acknowledged
   */
  Status initialize();

  /**
   * Read one accelerometer + gyroscope sample
   * @param out Receives the sample, zeroed on failure or when uninitialized
   * @return Fault::NONE, or Fault::SENSOR_FAULT if the bus read failed
   */
  Fault readSample(MotionSample& out);

  bool isInitialized() const { return initialized; }
  uint8_t getDeviceId() const { return deviceId; }

  /**
   * Name of the part reporting the given WHO_AM_I value
   */
  static const char* modelName(uint8_t whoAmI);
};

}  // namespace ridesafe

#endif  // __RIDESAFE_MOTION_SENSOR_H__
