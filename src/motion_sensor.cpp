#include "ridesafe/motion_sensor.h"

#include "ridesafe/log.h"

namespace ridesafe {

namespace {

MotionSample zeroSample() {
  MotionSample sample = {{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}};
  return sample;
}

// Registers are big-endian, high byte first
int16_t readWord(const uint8_t* data) {
  return static_cast<int16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

}  // namespace

MotionSensor::MotionSensor(I2cBus& bus, Clock& clock, uint8_t address)
    : bus(bus), clock(clock), address(address), initialized(false), deviceId(0) {}

const char* MotionSensor::modelName(uint8_t whoAmI) {
  switch (whoAmI) {
    case 0x68: return "MPU6050";
    case 0x70: return "MPU6500";
    case 0x71: return "MPU9250";
    case 0x73: return "MPU9255";
    case 0x98: return "MPU6050 (alt)";
    default: return nullptr;
  }
}

MotionSensor::Status MotionSensor::initialize() {
  initialized = false;

  // Wake up MPU6050 (it starts in sleep mode by default)
  if (!bus.writeRegister(address, REG_PWR_MGMT_1, 0x00)) {
    logLine("❌ MPU6050 did not acknowledge wake command");
    return UNAVAILABLE;
  }
  clock.delay(100);

  uint8_t id = 0;
  if (!bus.readRegisters(address, REG_WHO_AM_I, &id, 1)) {
    logLine("⚠️  Could not read WHO_AM_I, continuing with unverified sensor");
  }
  deviceId = id;

  const char* name = modelName(id);
  if (name != nullptr) {
    logPrintf("Device ID: 0x%02X - %s detected!\n", id, name);
  } else {
    // Some clones use different IDs
    logPrintf("Device ID: 0x%02X - Unknown/Unsupported device, attempting to continue...\n", id);
  }

  initialized = true;
  logLine("✅ Motion sensor initialized successfully!");
  return READY;
}

Fault MotionSensor::readSample(MotionSample& out) {
  out = zeroSample();
  if (!initialized) {
    return Fault::NONE;
  }

  // 14 bytes: ax, ay, az, temp, gx, gy, gz
  uint8_t raw[14];
  if (!bus.readRegisters(address, REG_ACCEL_XOUT_H, raw, sizeof(raw))) {
    return Fault::SENSOR_FAULT;
  }

  out.accel.x = readWord(&raw[0]) / ACCEL_SCALE;
  out.accel.y = readWord(&raw[2]) / ACCEL_SCALE;
  out.accel.z = readWord(&raw[4]) / ACCEL_SCALE;

  out.gyro.x = readWord(&raw[8]) / GYRO_SCALE;
  out.gyro.y = readWord(&raw[10]) / GYRO_SCALE;
  out.gyro.z = readWord(&raw[12]) / GYRO_SCALE;

  return Fault::NONE;
}

}  // namespace ridesafe
