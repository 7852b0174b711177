/**
 * RideSafe - helmet / bike fall detector for ESP32
 *
 * Samples an MPU6050 and a MAX4466 microphone, fuses them into a fall
 * decision, and on a fall sends a Telegram alert with GPS position and
 * trusted time before sounding the buzzer.
 */

#include <Arduino.h>
#include <HardwareSerial.h>
#include <Wire.h>

#include "ridesafe/alert_dispatcher.h"
#include "ridesafe/audio_sensor.h"
#include "ridesafe/buzzer.h"
#include "ridesafe/config.h"
#include "ridesafe/connectivity_manager.h"
#include "ridesafe/control_loop.h"
#include "ridesafe/fusion_engine.h"
#include "ridesafe/location_provider.h"
#include "ridesafe/log.h"
#include "ridesafe/motion_sensor.h"
#include "ridesafe/notifier.h"
#include "ridesafe/platform/arduino_hal.h"
#include "ridesafe/time_source.h"

using namespace ridesafe;

// ============================================================================
// Global Objects
// ============================================================================

const Config config = defaultConfig();

HardwareSerial gpsSerial(2);

ArduinoClock systemClock;
WireI2cBus i2cBus(Wire);
AdcInput micInput(RIDESAFE_PIN_MIC);
GpioOutput buzzerPin(RIDESAFE_PIN_BUZZER);
UartStream gpsStream(gpsSerial);
EspWifiStation wifiStation;
EspHttpClient httpClient;

MotionSensor motionSensor(i2cBus, systemClock);
AudioSensor microphone(micInput);
FusionEngine fusionEngine(config.thresholds);
ConnectivityManager connectivity(wifiStation, systemClock);
TimeSource timeSource(httpClient, systemClock, config.timeSyncUrl,
                      config.timezoneOffsetSeconds, config.timeSyncCooldownMs);
LocationProvider locationProvider(gpsStream, systemClock);
TelegramNotifier telegram(httpClient, config.botToken, config.chatId);
Buzzer buzzer(buzzerPin, systemClock);
AlertDispatcher alertDispatcher(locationProvider, timeSource, telegram, buzzer, config);
ControlLoop controlLoop(config, systemClock, connectivity, timeSource,
                        motionSensor, microphone, fusionEngine, alertDispatcher);

// ============================================================================
// Arduino Setup Function
// ============================================================================

void setup() {
  Serial.begin(SERIAL_BAUD_RATE);
  delay(100);

  logLine("\n========================================");
  logLine("   RideSafe Fall Detector");
  logLine("   Motion + Sound + GPS + Telegram");
  logLine("========================================\n");

  // Buzzer first so the pin is not left floating
  buzzerPin.begin();
  buzzer.begin();

  Wire.begin(RIDESAFE_PIN_SDA, RIDESAFE_PIN_SCL);
  Wire.setClock(I2C_FREQUENCY);
  delay(100);
  logPrintf("I2C initialized: SDA=GPIO%d, SCL=GPIO%d, Frequency=%lukHz\n\n",
            RIDESAFE_PIN_SDA, RIDESAFE_PIN_SCL,
            static_cast<unsigned long>(I2C_FREQUENCY / 1000));
  i2cBus.scan();

  logLine("Initializing MPU6050...");
  if (motionSensor.initialize() != MotionSensor::READY) {
    // Keep running: zeroed samples never trigger an alert
    logLine("ERROR: MPU6050 initialization failed!");
    logLine("Please check your wiring and connections.");
  }

  logLine("Initializing microphone...");
  micInput.begin();

  logLine("Initializing GPS receiver...");
  gpsStream.begin(GPS_BAUD_RATE, RIDESAFE_PIN_GPS_RX, RIDESAFE_PIN_GPS_TX);

  const Thresholds& thresholds = fusionEngine.getThresholds();
  logLine("\n========================================");
  logLine("  ALL SYSTEMS READY");
  logLine("========================================");
  logPrintf("  Accel threshold:  %.2f m/s^2\n", thresholds.acceleration);
  logPrintf("  Gyro threshold:   %.2f deg/s\n", thresholds.angularRate);
  logPrintf("  Sound threshold:  %u\n", static_cast<unsigned>(thresholds.sound));
  logPrintf("  GPS timeout:      %lu ms\n", static_cast<unsigned long>(config.gpsTimeoutMs));
  logLine("========================================\n");

  logLine("Starting monitoring loop...\n");
}

// ============================================================================
// Arduino Main Loop
// ============================================================================

void loop() {
  controlLoop.runOnce();
}
