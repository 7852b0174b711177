#ifndef __RIDESAFE_PLATFORM_ARDUINO_HAL_H__
#define __RIDESAFE_PLATFORM_ARDUINO_HAL_H__

#include <Arduino.h>
#include <HardwareSerial.h>
#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClientSecure.h>
#include <Wire.h>

#include "ridesafe/hal.h"

/**
 * Arduino ESP32 bindings for the capability interfaces in ridesafe/hal.h
 */

namespace ridesafe {

class ArduinoClock : public Clock {
public:
  uint32_t millis() override;
  void delay(uint32_t ms) override;
};

/**
 * I2C register access through a TwoWire instance
 */
class WireI2cBus : public I2cBus {
private:
  TwoWire& wire;

public:
  explicit WireI2cBus(TwoWire& wire) : wire(wire) {}

  bool writeRegister(uint8_t address, uint8_t reg, uint8_t value) override;
  bool readRegisters(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) override;

  /**
   * Scan the bus and log every responding address
   * @return Number of devices found
   */
  int scan();
};

/**
 * ESP32 ADC pin, 12-bit reading expanded to 16-bit
 */
class AdcInput : public AnalogInput {
private:
  uint8_t pin;

public:
  explicit AdcInput(uint8_t pin) : pin(pin) {}

  void begin();
  bool read(uint16_t& value) override;
};

class GpioOutput : public DigitalOutput {
private:
  uint8_t pin;

public:
  explicit GpioOutput(uint8_t pin) : pin(pin) {}

  void begin();
  void write(bool high) override;
};

/**
 * NMEA receiver on a hardware UART
 */
class UartStream : public SerialStream {
private:
  HardwareSerial& serial;

public:
  explicit UartStream(HardwareSerial& serial) : serial(serial) {}

  void begin(uint32_t baud, int8_t rxPin, int8_t txPin);

  size_t available() override;
  bool read(uint8_t& byte) override;
  void drain() override;
};

class EspWifiStation : public WifiStation {
public:
  void begin(const char* ssid, const char* password) override;
  bool isConnected() override;
  std::string localIp() override;
  void disconnect() override;
};

/**
 * HTTPClient wrapper. https URLs go through WiFiClientSecure without
 * certificate pinning.
 */
class EspHttpClient : public HttpClient {
private:
  WiFiClient plainClient;
  WiFiClientSecure secureClient;

  bool open(HTTPClient& http, const std::string& url);

public:
  static const uint16_t TIMEOUT_MS = 5000;

  EspHttpClient();

  HttpResponse get(const std::string& url, const char* collectHeader) override;
  HttpResponse postForm(const std::string& url, const std::string& body) override;
};

}  // namespace ridesafe

#endif  // __RIDESAFE_PLATFORM_ARDUINO_HAL_H__
