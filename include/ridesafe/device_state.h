#ifndef __RIDESAFE_DEVICE_STATE_H__
#define __RIDESAFE_DEVICE_STATE_H__

#include <optional>

#include "ridesafe/time_source.h"

namespace ridesafe {

/**
 * Process-wide controller state, owned by ControlLoop.
 *
 * fallAlreadyReported is set by the first alert and stays set until reboot:
 * the device reports one fall per power cycle.
 */
struct DeviceState {
  bool wifiConnected = false;
  std::optional<Timestamp> bikeSessionStartTime;
  bool fallAlreadyReported = false;
};

}  // namespace ridesafe

#endif  // __RIDESAFE_DEVICE_STATE_H__
