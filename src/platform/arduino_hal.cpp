#include "ridesafe/platform/arduino_hal.h"

#include "ridesafe/log.h"

namespace ridesafe {

// ============================================================================
// Clock
// ============================================================================

uint32_t ArduinoClock::millis() {
  return ::millis();
}

void ArduinoClock::delay(uint32_t ms) {
  ::delay(ms);
}

// ============================================================================
// I2C
// ============================================================================

bool WireI2cBus::writeRegister(uint8_t address, uint8_t reg, uint8_t value) {
  wire.beginTransmission(address);
  wire.write(reg);
  wire.write(value);
  return wire.endTransmission() == 0;
}

bool WireI2cBus::readRegisters(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) {
  wire.beginTransmission(address);
  wire.write(reg);
  if (wire.endTransmission(false) != 0) {
    return false;
  }

  size_t received = wire.requestFrom(address, static_cast<uint8_t>(length));
  if (received != length) {
    // Flush the partial transfer
    while (wire.available()) wire.read();
    return false;
  }

  for (size_t i = 0; i < length; i++) {
    buffer[i] = wire.read();
  }
  return true;
}

int WireI2cBus::scan() {
  logLine("Scanning I2C bus...");

  int devicesFound = 0;
  for (uint8_t address = 1; address < 127; address++) {
    wire.beginTransmission(address);
    if (wire.endTransmission() == 0) {
      logPrintf("  Device found at address 0x%02X\n", address);
      devicesFound++;
    }
  }

  if (devicesFound == 0) {
    logLine("  No I2C devices found!");
  } else {
    logPrintf("  Total devices found: %d\n", devicesFound);
  }
  return devicesFound;
}

// ============================================================================
// ADC / GPIO
// ============================================================================

void AdcInput::begin() {
  analogReadResolution(12);         // 12-bit ADC (0-4095)
  analogSetAttenuation(ADC_11db);   // Full range up to ~3.3V
}

bool AdcInput::read(uint16_t& value) {
  uint16_t raw = analogRead(pin) & 0x0FFF;
  // Stretch 12 bits over the 16-bit scale the thresholds are expressed in
  value = static_cast<uint16_t>((raw << 4) | (raw >> 8));
  return true;
}

void GpioOutput::begin() {
  pinMode(pin, OUTPUT);
}

void GpioOutput::write(bool high) {
  digitalWrite(pin, high ? HIGH : LOW);
}

// ============================================================================
// UART
// ============================================================================

void UartStream::begin(uint32_t baud, int8_t rxPin, int8_t txPin) {
  serial.begin(baud, SERIAL_8N1, rxPin, txPin);
}

size_t UartStream::available() {
  return static_cast<size_t>(serial.available());
}

bool UartStream::read(uint8_t& byte) {
  int c = serial.read();
  if (c < 0) {
    return false;
  }
  byte = static_cast<uint8_t>(c);
  return true;
}

void UartStream::drain() {
  while (serial.available()) {
    serial.read();
  }
}

// ============================================================================
// WiFi
// ============================================================================

void EspWifiStation::begin(const char* ssid, const char* password) {
  WiFi.mode(WIFI_STA);
  WiFi.begin(ssid, password);
}

bool EspWifiStation::isConnected() {
  return WiFi.status() == WL_CONNECTED;
}

std::string EspWifiStation::localIp() {
  return std::string(WiFi.localIP().toString().c_str());
}

void EspWifiStation::disconnect() {
  WiFi.disconnect();
}

// ============================================================================
// HTTP
// ============================================================================

EspHttpClient::EspHttpClient() {
  secureClient.setInsecure();
}

bool EspHttpClient::open(HTTPClient& http, const std::string& url) {
  http.setTimeout(TIMEOUT_MS);
  if (url.compare(0, 8, "https://") == 0) {
    return http.begin(secureClient, url.c_str());
  }
  return http.begin(plainClient, url.c_str());
}

HttpResponse EspHttpClient::get(const std::string& url, const char* collectHeader) {
  HttpResponse response;
  response.statusCode = HTTPC_ERROR_CONNECTION_REFUSED;

  HTTPClient http;
  if (!open(http, url)) {
    return response;
  }

  if (collectHeader != nullptr) {
    const char* headerKeys[] = {collectHeader};
    http.collectHeaders(headerKeys, 1);
  }

  response.statusCode = http.GET();
  if (response.statusCode > 0 && collectHeader != nullptr) {
    response.header = http.header(collectHeader).c_str();
  }
  http.end();
  return response;
}

HttpResponse EspHttpClient::postForm(const std::string& url, const std::string& body) {
  HttpResponse response;
  response.statusCode = HTTPC_ERROR_CONNECTION_REFUSED;

  HTTPClient http;
  if (!open(http, url)) {
    return response;
  }

  http.addHeader("Content-Type", "application/x-www-form-urlencoded");
  response.statusCode = http.POST(String(body.c_str()));
  if (response.statusCode > 0) {
    response.body = http.getString().c_str();
  }
  http.end();
  return response;
}

}  // namespace ridesafe
