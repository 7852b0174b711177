#include "ridesafe/fusion_engine.h"

#include <math.h>

namespace ridesafe {

namespace {

float norm(const Vector3& v) {
  return sqrtf(v.x * v.x + v.y * v.y + v.z * v.z);
}

}  // namespace

float FusionEngine::accelMagnitude(const Vector3& accel) {
  return norm(accel) * GRAVITY;
}

float FusionEngine::gyroMagnitude(const Vector3& gyro) {
  return norm(gyro);
}

FusionResult FusionEngine::evaluate(const MotionSample& sample, uint16_t audioLevel) const {
  FusionResult result;
  result.accelMagnitude = accelMagnitude(sample.accel);
  result.gyroMagnitude = gyroMagnitude(sample.gyro);
  result.audioLevel = audioLevel;

  result.eventDetected = result.accelMagnitude > thresholds.acceleration &&
                         result.gyroMagnitude > thresholds.angularRate &&
                         audioLevel > thresholds.sound;
  return result;
}

}  // namespace ridesafe
