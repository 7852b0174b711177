#include "ridesafe/connectivity_manager.h"

#include "ridesafe/log.h"

namespace ridesafe {

ConnectivityManager::ConnectivityManager(WifiStation& wifi, Clock& clock)
    : wifi(wifi), clock(clock), currentState(DISCONNECTED) {}

const char* ConnectivityManager::stateName(State state) {
  switch (state) {
    case DISCONNECTED: return "DISCONNECTED";
    case CONNECTING: return "CONNECTING";
    case CONNECTED: return "CONNECTED";
  }
  return "UNKNOWN";
}

bool ConnectivityManager::ensureConnected(const char* ssid, const char* password,
                                          uint8_t maxAttempts, uint32_t attemptIntervalMs) {
  if (wifi.isConnected()) {
    currentState = CONNECTED;
    return true;
  }

  currentState = CONNECTING;
  logPrintf("📡 Connecting to WiFi \"%s\"...\n", ssid);
  wifi.begin(ssid, password);

  bool connected = false;
  for (uint8_t attempt = 0; attempt < maxAttempts; attempt++) {
    if (wifi.isConnected()) {
      connected = true;
      break;
    }
    clock.delay(attemptIntervalMs);
  }
  // Association may complete during the last wait
  if (!connected) {
    connected = wifi.isConnected();
  }

  if (connected) {
    currentState = CONNECTED;
    logPrintf("✅ WiFi connected, IP: %s\n", wifi.localIp().c_str());
    return true;
  }

  // Stop the association attempt so the next cycle starts clean
  wifi.disconnect();
  currentState = DISCONNECTED;
  logPrintf("❌ WiFi connection failed after %u attempts\n", static_cast<unsigned>(maxAttempts));
  return false;
}

bool ConnectivityManager::isConnected() {
  bool connected = wifi.isConnected();
  if (!connected && currentState == CONNECTED) {
    currentState = DISCONNECTED;
  } else if (connected) {
    currentState = CONNECTED;
  }
  return connected;
}

}  // namespace ridesafe
