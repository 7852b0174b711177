#ifndef __RIDESAFE_ALERT_DISPATCHER_H__
#define __RIDESAFE_ALERT_DISPATCHER_H__

#include <stdint.h>

#include <optional>
#include <string>

#include "ridesafe/buzzer.h"
#include "ridesafe/config.h"
#include "ridesafe/device_state.h"
#include "ridesafe/fusion_engine.h"
#include "ridesafe/location_provider.h"
#include "ridesafe/notifier.h"
#include "ridesafe/time_source.h"

namespace ridesafe {

/**
 * AlertDispatcher - response sequence for a detected fall
 *
 *   1. mark the fall as reported (one alert per boot)
 *   2. GPS fix, bounded by gpsTimeoutMs
 *   3. trusted time of the fall
 *   4. compose and send the message
 *   5. sound the alarm (blocks for the whole pattern)
 *
 * Missing location or time never holds back the message.
 */
class AlertDispatcher {
private:
  LocationProvider& location;
  TimeSource& timeSource;
  Notifier& notifier;
  Buzzer& buzzer;

  uint32_t gpsTimeoutMs;
  uint8_t buzzerCycles;
  uint32_t buzzerPulseMs;

public:
  AlertDispatcher(LocationProvider& location, TimeSource& timeSource,
                  Notifier& notifier, Buzzer& buzzer, const Config& config);

  /**
   * Run the alert sequence if this is the first detected event
   * @param result Fusion decision of the current tick
   * @param state Controller state; fallAlreadyReported is set here
   */
  void dispatchIfNewEvent(const FusionResult& result, DeviceState& state);
};

/**
 * Build the alert text
 * @param sessionStart Bike session start, omitted when empty
 * @param fallTime Time of the fall, omitted when empty
 * @param fix Position, "Unknown" when empty
 * @param result Fusion magnitudes, printed with two decimals
 */
std::string composeAlertMessage(const std::optional<Timestamp>& sessionStart,
                                const std::optional<Timestamp>& fallTime,
                                const std::optional<FixResult>& fix,
                                const FusionResult& result);

/**
 * Google Maps link for a fix
 */
std::string mapLink(const FixResult& fix);

}  // namespace ridesafe

#endif  // __RIDESAFE_ALERT_DISPATCHER_H__
