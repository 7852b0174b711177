#include "ridesafe/config.h"

namespace ridesafe {

Config defaultConfig() {
  Config config;

  config.wifiSsid = RIDESAFE_WIFI_SSID;
  config.wifiPassword = RIDESAFE_WIFI_PASSWORD;
  config.wifiMaxAttempts = 20;
  config.wifiAttemptIntervalMs = 500;

  config.botToken = RIDESAFE_BOT_TOKEN;
  config.chatId = RIDESAFE_CHAT_ID;

  config.timeSyncUrl = "http://www.google.com";
  config.timezoneOffsetSeconds = 19800;  // IST, +05:30
  config.timeSyncCooldownMs = 2000;

  config.thresholds.acceleration = 1.0f;
  config.thresholds.angularRate = 1.0f;
  config.thresholds.sound = 1000;

  config.gpsTimeoutMs = 10000;
  config.buzzerCycles = 10;
  config.buzzerPulseMs = 4000;

  config.cycleIntervalMs = 2000;
  config.alertCooldownMs = 15000;

  return config;
}

}  // namespace ridesafe
