#ifndef __RIDESAFE_CONNECTIVITY_MANAGER_H__
#define __RIDESAFE_CONNECTIVITY_MANAGER_H__

#include <stdint.h>

#include "ridesafe/hal.h"

namespace ridesafe {

/**
 * ConnectivityManager - WiFi association with bounded retries
 *
 * DISCONNECTED -> CONNECTING -> CONNECTED
 * DISCONNECTED -> CONNECTING -> DISCONNECTED   (attempts exhausted)
 *
 * Every network feature is gated on this. A failed attempt is never fatal;
 * the caller simply tries again on its next cycle.
 */
class ConnectivityManager {
public:
  enum State {
    DISCONNECTED = 0,
    CONNECTING = 1,
    CONNECTED = 2
  };

  static const uint8_t DEFAULT_MAX_ATTEMPTS = 20;
  static const uint32_t DEFAULT_ATTEMPT_INTERVAL_MS = 500;

  ConnectivityManager(WifiStation& wifi, Clock& clock);

  /**
   * Make sure the station is associated
   *
   * Returns immediately if already connected. Otherwise blocks for at most
   * maxAttempts * attemptIntervalMs while polling the association status.
   *
   * @param ssid Access point name
   * @param password Pre-shared key
   * @param maxAttempts Number of status polls
   * @param attemptIntervalMs Wait between polls
   * @return true if connected when the call returns
   */
  bool ensureConnected(const char* ssid, const char* password,
                       uint8_t maxAttempts = DEFAULT_MAX_ATTEMPTS,
                       uint32_t attemptIntervalMs = DEFAULT_ATTEMPT_INTERVAL_MS);

  /**
   * Live association status; drops the state back to DISCONNECTED on link loss
   */
  bool isConnected();

  State state() const { return currentState; }

  static const char* stateName(State state);

private:
  WifiStation& wifi;
  Clock& clock;
  State currentState;
};

}  // namespace ridesafe

#endif  // __RIDESAFE_CONNECTIVITY_MANAGER_H__
