#include "ridesafe/alert_dispatcher.h"

#include <stdio.h>

#include "ridesafe/log.h"

namespace ridesafe {

AlertDispatcher::AlertDispatcher(LocationProvider& location, TimeSource& timeSource,
                                 Notifier& notifier, Buzzer& buzzer, const Config& config)
    : location(location), timeSource(timeSource), notifier(notifier), buzzer(buzzer),
      gpsTimeoutMs(config.gpsTimeoutMs),
      buzzerCycles(config.buzzerCycles),
      buzzerPulseMs(config.buzzerPulseMs) {}

std::string mapLink(const FixResult& fix) {
  char buffer[80];
  snprintf(buffer, sizeof(buffer), "http://maps.google.com/?q=%.6f,%.6f",
           fix.latitude, fix.longitude);
  return std::string(buffer);
}

std::string composeAlertMessage(const std::optional<Timestamp>& sessionStart,
                                const std::optional<Timestamp>& fallTime,
                                const std::optional<FixResult>& fix,
                                const FusionResult& result) {
  std::string message = "Helmet Fall Detected!\n";

  if (sessionStart) {
    message += "Bike Start Time: " + formatTimestamp(*sessionStart) + "\n";
  }
  if (fallTime) {
    message += "Fall Detected Time: " + formatTimestamp(*fallTime) + "\n";
  }

  message += "Bike Fall Detected\n";
  message += "Location: ";
  message += fix ? mapLink(*fix) : std::string("Unknown");
  message += "\n";

  char line[64];
  snprintf(line, sizeof(line), "Acceleration: %.2f m/s^2\n", result.accelMagnitude);
  message += line;
  snprintf(line, sizeof(line), "Gyroscope: %.2f deg/s\n", result.gyroMagnitude);
  message += line;
  snprintf(line, sizeof(line), "Sound: %u\n", static_cast<unsigned>(result.audioLevel));
  message += line;

  return message;
}

void AlertDispatcher::dispatchIfNewEvent(const FusionResult& result, DeviceState& state) {
  if (!result.eventDetected) {
    return;
  }
  if (state.fallAlreadyReported) {
    logLine("ℹ️  Fall already reported this session, alert suppressed");
    return;
  }
  state.fallAlreadyReported = true;

  logLine("\n╔══════════════════════════════════════════════════════════╗");
  logLine("║              🚨 FALL DETECTED - SENDING ALERT              ║");
  logLine("╚══════════════════════════════════════════════════════════╝");

  std::optional<FixResult> fix = location.acquireFix(gpsTimeoutMs);
  if (!fix) {
    logPrintf("⚠️  %s: location will be reported as Unknown\n",
              faultName(Fault::LOCATION_TIMEOUT));
  }

  std::optional<Timestamp> fallTime = timeSource.fetchTrustedTime();
  if (!fallTime) {
    logPrintf("⚠️  %s: failed to get time at fall\n", faultName(Fault::TIME_SYNC_FAILURE));
  }

  std::string message = composeAlertMessage(state.bikeSessionStartTime, fallTime, fix, result);

  Fault sent = notifier.send(message);
  if (sent == Fault::NONE) {
    logLine("✅ Alert sent");
  } else {
    logPrintf("❌ Alert not delivered (%s), not retrying\n", faultName(sent));
  }

  buzzer.sound(buzzerCycles, buzzerPulseMs);
}

}  // namespace ridesafe
