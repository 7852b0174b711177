#ifndef __RIDESAFE_FUSION_ENGINE_H__
#define __RIDESAFE_FUSION_ENGINE_H__

#include <stdint.h>

#include "ridesafe/config.h"
#include "ridesafe/motion_sensor.h"

namespace ridesafe {

/**
 * Outcome of one fusion tick
 */
struct FusionResult {
  bool eventDetected;
  float accelMagnitude;   // m/s²
  float gyroMagnitude;    // °/s
  uint16_t audioLevel;
};

/**
 * Threshold fusion of motion and sound.
 *
 * An event needs a hard impact, a tumble and a loud noise at the same time:
 *   accel  = |a| * 9.8        > ACC_THRESHOLD
 *   gyro   = |w|              > GYRO_THRESHOLD
 *   audio                     > SOUND_THRESHOLD
 * Vibration alone or noise alone never triggers. A failed microphone read
 * arrives as 0 and can never satisfy the audio term.
 */
class FusionEngine {
private:
  Thresholds thresholds;

public:
  static constexpr float GRAVITY = 9.8f;   // g -> m/s²

  explicit FusionEngine(const Thresholds& thresholds) : thresholds(thresholds) {}

  FusionResult evaluate(const MotionSample& sample, uint16_t audioLevel) const;

  /**
   * Acceleration magnitude in m/s² for a sample given in g
   */
  static float accelMagnitude(const Vector3& accel);

  /**
   * Angular-rate magnitude in °/s
   */
  static float gyroMagnitude(const Vector3& gyro);

  const Thresholds& getThresholds() const { return thresholds; }
};

}  // namespace ridesafe

#endif  // __RIDESAFE_FUSION_ENGINE_H__
