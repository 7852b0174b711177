#ifndef __RIDESAFE_CONTROL_LOOP_H__
#define __RIDESAFE_CONTROL_LOOP_H__

#include "ridesafe/alert_dispatcher.h"
#include "ridesafe/audio_sensor.h"
#include "ridesafe/config.h"
#include "ridesafe/connectivity_manager.h"
#include "ridesafe/device_state.h"
#include "ridesafe/fusion_engine.h"
#include "ridesafe/hal.h"
#include "ridesafe/motion_sensor.h"
#include "ridesafe/time_source.h"

namespace ridesafe {

/**
 * ControlLoop - the device's cyclic controller
 *
 * Each iteration:
 *   1. keep the WiFi session up (capture the bike start time once)
 *   2. offline -> skip sensing this cycle
 *   3. sample motion + sound and run fusion
 *   4. event    -> alert sequence, then cooldown
 *      no event -> log the current trusted time
 *   5. sleep until the next cycle
 *
 * Nothing raised by a sensor or the network stops the loop.
 */
class ControlLoop {
private:
  const Config& config;
  Clock& clock;
  ConnectivityManager& connectivity;
  TimeSource& timeSource;
  MotionSensor& motion;
  AudioSensor& audio;
  FusionEngine& fusion;
  AlertDispatcher& dispatcher;

  DeviceState state;
  uint32_t cycleCount;

  bool ensureSession();
  void logCurrentTime();

public:
  ControlLoop(const Config& config, Clock& clock, ConnectivityManager& connectivity,
              TimeSource& timeSource, MotionSensor& motion, AudioSensor& audio,
              FusionEngine& fusion, AlertDispatcher& dispatcher);

  /**
   * Run one full iteration, including its sleeps
   */
  void runOnce();

  const DeviceState& getState() const { return state; }
  uint32_t getCycleCount() const { return cycleCount; }
};

}  // namespace ridesafe

#endif  // __RIDESAFE_CONTROL_LOOP_H__
