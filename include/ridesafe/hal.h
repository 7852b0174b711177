#ifndef __RIDESAFE_HAL_H__
#define __RIDESAFE_HAL_H__

#include <stddef.h>
#include <stdint.h>

#include <string>

/**
 * ==============================================================================
 * HARDWARE CAPABILITY INTERFACES
 * ==============================================================================
 *
 * Everything the controller touches outside the CPU goes through one of
 * these classes. The firmware wires them to the Arduino ESP32 core
 * (include/ridesafe/platform/arduino_hal.h); the unit tests wire them to fakes.
 * ==============================================================================
 */

namespace ridesafe {

/**
 * Monotonic millisecond clock and blocking sleep
 */
class Clock {
public:
  virtual ~Clock() {}
  virtual uint32_t millis() = 0;
  virtual void delay(uint32_t ms) = 0;
};

/**
 * Register-level access to an I2C device
 */
class I2cBus {
public:
  virtual ~I2cBus() {}

  /**
   * Write a single byte to a device register
   * @return true if the device acknowledged the transfer
   */
  virtual bool writeRegister(uint8_t address, uint8_t reg, uint8_t value) = 0;

  /**
   * Read consecutive registers starting at reg
   * @return true if exactly length bytes were received
   */
  virtual bool readRegisters(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) = 0;
};

/**
 * Analog input reporting on a 16-bit unsigned scale
 */
class AnalogInput {
public:
  virtual ~AnalogInput() {}
  virtual bool read(uint16_t& value) = 0;
};

class DigitalOutput {
public:
  virtual ~DigitalOutput() {}
  virtual void write(bool high) = 0;
};

/**
 * Byte-oriented view of a UART receiver
 */
class SerialStream {
public:
  virtual ~SerialStream() {}

  /** Number of bytes waiting in the receive buffer */
  virtual size_t available() = 0;

  /**
   * Read one byte
   * @return false if nothing was waiting
   */
  virtual bool read(uint8_t& byte) = 0;

  /** Discard everything currently buffered */
  virtual void drain() = 0;
};

/**
 * WiFi station interface
 */
class WifiStation {
public:
  virtual ~WifiStation() {}
  virtual void begin(const char* ssid, const char* password) = 0;
  virtual bool isConnected() = 0;
  virtual std::string localIp() = 0;
  virtual void disconnect() = 0;
};

/**
 * Result of a single HTTP exchange.
 * statusCode <= 0 means the request never completed (transport error).
 */
struct HttpResponse {
  int statusCode;
  std::string body;
  std::string header;   // value of the header requested via collectHeader
};

class HttpClient {
public:
  virtual ~HttpClient() {}

  /**
   * Perform a GET request
   * @param url Absolute URL
   * @param collectHeader Response header to capture into HttpResponse::header
   */
  virtual HttpResponse get(const std::string& url, const char* collectHeader) = 0;

  /**
   * POST an application/x-www-form-urlencoded body
   */
  virtual HttpResponse postForm(const std::string& url, const std::string& body) = 0;
};

}  // namespace ridesafe

#endif  // __RIDESAFE_HAL_H__
