#include "ridesafe/audio_sensor.h"

#include "ridesafe/log.h"

namespace ridesafe {

uint16_t AudioSensor::readLevel() {
  uint16_t level = 0;
  if (!input.read(level)) {
    logLine("❌ Error reading microphone data, using 0");
    return 0;
  }
  return level;
}

}  // namespace ridesafe
