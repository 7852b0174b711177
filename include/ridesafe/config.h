#ifndef __RIDESAFE_CONFIG_H__
#define __RIDESAFE_CONFIG_H__

#include <stdint.h>

// ============================================================================
// Build-time settings (override with -D build flags)
// ============================================================================

#ifndef RIDESAFE_WIFI_SSID
#define RIDESAFE_WIFI_SSID "your-ssid"
#endif

#ifndef RIDESAFE_WIFI_PASSWORD
#define RIDESAFE_WIFI_PASSWORD "your-password"
#endif

#ifndef RIDESAFE_BOT_TOKEN
#define RIDESAFE_BOT_TOKEN "your-bot-token"
#endif

#ifndef RIDESAFE_CHAT_ID
#define RIDESAFE_CHAT_ID "000000000"
#endif

// Pin assignment for ESP32 DevKit
#ifndef RIDESAFE_PIN_SDA
#define RIDESAFE_PIN_SDA 21
#endif
#ifndef RIDESAFE_PIN_SCL
#define RIDESAFE_PIN_SCL 22
#endif
#ifndef RIDESAFE_PIN_BUZZER
#define RIDESAFE_PIN_BUZZER 15
#endif
#ifndef RIDESAFE_PIN_MIC
#define RIDESAFE_PIN_MIC 34
#endif
#ifndef RIDESAFE_PIN_GPS_RX
#define RIDESAFE_PIN_GPS_RX 16
#endif
#ifndef RIDESAFE_PIN_GPS_TX
#define RIDESAFE_PIN_GPS_TX 17
#endif

namespace ridesafe {

// ============================================================================
// Hardware Constants
// ============================================================================

const uint32_t SERIAL_BAUD_RATE = 115200;  // USB console
const uint32_t GPS_BAUD_RATE = 9600;       // NMEA receiver factory rate
const uint32_t I2C_FREQUENCY = 100000;     // 100kHz standard mode
const uint8_t MPU6050_ADDRESS = 0x68;

// ============================================================================
// Runtime Configuration
// ============================================================================

/**
 * Fusion thresholds. An event needs all three strictly exceeded.
 */
struct Thresholds {
  float acceleration;   // m/s²
  float angularRate;    // °/s
  uint16_t sound;       // 16-bit ADC scale
};

struct Config {
  // --- Network ---
  const char* wifiSsid;
  const char* wifiPassword;
  uint8_t wifiMaxAttempts;
  uint32_t wifiAttemptIntervalMs;

  // --- Notification ---
  const char* botToken;
  const char* chatId;

  // --- Time sync ---
  const char* timeSyncUrl;
  int32_t timezoneOffsetSeconds;
  uint32_t timeSyncCooldownMs;

  // --- Detection ---
  Thresholds thresholds;

  // --- Response ---
  uint32_t gpsTimeoutMs;
  uint8_t buzzerCycles;
  uint32_t buzzerPulseMs;

  // --- Loop timing ---
  uint32_t cycleIntervalMs;
  uint32_t alertCooldownMs;
};

/**
 * Build the configuration from the compile-time settings above
 * @return Config populated with the device defaults
 */
Config defaultConfig();

}  // namespace ridesafe

#endif  // __RIDESAFE_CONFIG_H__
