#ifndef __RIDESAFE_BUZZER_H__
#define __RIDESAFE_BUZZER_H__

#include <stdint.h>

#include "ridesafe/hal.h"

namespace ridesafe {

/**
 * Local alarm on a digital output
 */
class Buzzer {
private:
  DigitalOutput& pin;
  Clock& clock;
  bool sounding;

public:
  Buzzer(DigitalOutput& pin, Clock& clock) : pin(pin), clock(clock), sounding(false) {}

  /** Drive the output low */
  void begin();

  /**
   * Play the alarm pattern: cycles x (on pulseMs, off pulseMs)
   *
   * Runs synchronously for 2 * cycles * pulseMs. A call made while a
   * pattern is already playing is ignored.
   */
  void sound(uint8_t cycles, uint32_t pulseMs);

  bool isSounding() const { return sounding; }
};

}  // namespace ridesafe

#endif  // __RIDESAFE_BUZZER_H__
