#include "ridesafe/control_loop.h"

#include "ridesafe/log.h"

namespace ridesafe {

ControlLoop::ControlLoop(const Config& config, Clock& clock, ConnectivityManager& connectivity,
                         TimeSource& timeSource, MotionSensor& motion, AudioSensor& audio,
                         FusionEngine& fusion, AlertDispatcher& dispatcher)
    : config(config), clock(clock), connectivity(connectivity), timeSource(timeSource),
      motion(motion), audio(audio), fusion(fusion), dispatcher(dispatcher),
      cycleCount(0) {}

bool ControlLoop::ensureSession() {
  if (state.wifiConnected && !connectivity.isConnected()) {
    logLine("⚠️  WiFi link lost, detection suspended until reconnected");
    state.wifiConnected = false;
  }

  if (!state.wifiConnected) {
    state.wifiConnected = connectivity.ensureConnected(config.wifiSsid, config.wifiPassword,
                                                       config.wifiMaxAttempts,
                                                       config.wifiAttemptIntervalMs);

    // The bike start time is taken once, on the first successful connection
    if (state.wifiConnected && !state.bikeSessionStartTime) {
      state.bikeSessionStartTime = timeSource.fetchTrustedTime();
      if (state.bikeSessionStartTime) {
        logPrintf("🚲 Bike started at %s\n", formatTimestamp(*state.bikeSessionStartTime).c_str());
      } else {
        logLine("⚠️  Failed to get time at bike start. Time will be inaccurate.");
      }
    }
  }

  return state.wifiConnected;
}

void ControlLoop::logCurrentTime() {
  std::optional<Timestamp> now = timeSource.fetchTrustedTime();
  if (now) {
    logPrintf("Current Time: %s\n", formatTimestamp(*now).c_str());
  } else {
    logLine("Current Time: unavailable");
  }
}

void ControlLoop::runOnce() {
  cycleCount++;

  if (!ensureSession()) {
    logPrintf("%s: Connect the Fall Detector to WiFi to start the Bike\n",
              faultName(Fault::NETWORK_UNAVAILABLE));
    clock.delay(config.cycleIntervalMs);
    return;
  }

  MotionSample sample;
  Fault sensorFault = motion.readSample(sample);
  if (sensorFault != Fault::NONE) {
    logPrintf("❌ %s: motion read failed, using zeroed sample\n", faultName(sensorFault));
  }
  uint16_t soundLevel = audio.readLevel();

  FusionResult result = fusion.evaluate(sample, soundLevel);
  logPrintf("Accel: %.2f, Gyro: %.2f, Sound: %u\n", result.accelMagnitude,
            result.gyroMagnitude, static_cast<unsigned>(result.audioLevel));

  if (result.eventDetected) {
    logLine("Fall Detected");
    dispatcher.dispatchIfNewEvent(result, state);
    clock.delay(config.alertCooldownMs);
  } else {
    logCurrentTime();
    logLine("Conditions not met.");
  }

  clock.delay(config.cycleIntervalMs);
}

}  // namespace ridesafe
