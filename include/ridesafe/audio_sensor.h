#ifndef __RIDESAFE_AUDIO_SENSOR_H__
#define __RIDESAFE_AUDIO_SENSOR_H__

#include <stdint.h>

#include "ridesafe/hal.h"

namespace ridesafe {

/**
 * Microphone level on an analog input (MAX4466 breakout)
 */
class AudioSensor {
private:
  AnalogInput& input;

public:
  explicit AudioSensor(AnalogInput& input) : input(input) {}

  /**
   * Read the current sound level
   * @return 16-bit sample magnitude, 0 if the ADC read failed
   */
  uint16_t readLevel();
};

}  // namespace ridesafe

#endif  // __RIDESAFE_AUDIO_SENSOR_H__
