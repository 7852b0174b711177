#include "ridesafe/buzzer.h"

#include "ridesafe/log.h"

namespace ridesafe {

void Buzzer::begin() {
  pin.write(false);
}

void Buzzer::sound(uint8_t cycles, uint32_t pulseMs) {
  if (sounding) {
    return;
  }
  sounding = true;

  logPrintf("🚨 Alarm: %u pulses of %lu ms\n", static_cast<unsigned>(cycles),
            static_cast<unsigned long>(pulseMs));
  for (uint8_t i = 0; i < cycles; i++) {
    pin.write(true);
    clock.delay(pulseMs);
    pin.write(false);
    clock.delay(pulseMs);
  }

  sounding = false;
}

}  // namespace ridesafe
