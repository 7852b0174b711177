#include "ridesafe/location_provider.h"

#include <string.h>

#include "ridesafe/log.h"

#include <TinyGPS++.h>

namespace ridesafe {

namespace {

// GGA term numbers
const int GGA_LATITUDE = 2;
const int GGA_LONGITUDE = 4;
const int GGA_FIX_QUALITY = 6;

/**
 * Raw GGA terms of one talker, captured next to TinyGPS++'s own decoding
 */
struct GgaTerms {
  TinyGPSCustom quality;
  TinyGPSCustom latitude;
  TinyGPSCustom longitude;

  GgaTerms(TinyGPSPlus& gps, const char* sentence)
      : quality(gps, sentence, GGA_FIX_QUALITY),
        latitude(gps, sentence, GGA_LATITUDE),
        longitude(gps, sentence, GGA_LONGITUDE) {}
};

/**
 * Byte-fed GGA decoder. Yields a fix once per accepted sentence.
 */
class GgaDecoder {
private:
  TinyGPSPlus gps;
  GgaTerms gpTerms;
  GgaTerms gnTerms;

public:
  GgaDecoder() : gpTerms(gps, "GPGGA"), gnTerms(gps, "GNGGA") {}

  std::optional<FixResult> encode(char c) {
    if (!gps.encode(c)) {
      return std::nullopt;
    }

    // A checksummed sentence just completed
    bool hasPosition = gps.location.isUpdated() && gps.location.isValid();
    FixResult fix;
    fix.latitude = gps.location.lat();    // reading clears the update flag
    fix.longitude = gps.location.lng();

    GgaTerms* terms = nullptr;
    if (gpTerms.quality.isUpdated()) {
      terms = &gpTerms;
    } else if (gnTerms.quality.isUpdated()) {
      terms = &gnTerms;
    }
    if (terms == nullptr) {
      return std::nullopt;   // RMC and friends also move the location
    }

    bool fixReported = strcmp(terms->quality.value(), "0") != 0;
    bool wellFormed = nmeaToDegrees(terms->latitude.value()).has_value() &&
                      nmeaToDegrees(terms->longitude.value()).has_value();
    if (!hasPosition || !fixReported || !wellFormed) {
      return std::nullopt;
    }
    return fix;
  }

  uint32_t passedChecksum() { return gps.passedChecksum(); }
  uint32_t failedChecksum() { return gps.failedChecksum(); }
};

}  // namespace

std::optional<double> nmeaToDegrees(const std::string& raw) {
  if (raw.size() < 5) {
    return std::nullopt;
  }

  // Minutes are always the two digits left of the decimal point
  size_t dot = raw.find('.');
  size_t integerDigits = (dot == std::string::npos) ? raw.size() : dot;
  if (integerDigits < 3) {
    return std::nullopt;
  }
  for (size_t i = 0; i < raw.size(); i++) {
    if (i == dot) continue;
    if (raw[i] < '0' || raw[i] > '9') return std::nullopt;
  }
  int minutes = (raw[integerDigits - 2] - '0') * 10 + (raw[integerDigits - 1] - '0');
  if (minutes >= 60) {
    return std::nullopt;
  }

  RawDegrees degrees;
  TinyGPSPlus::parseDegrees(raw.c_str(), degrees);
  return degrees.deg + degrees.billionths / 1000000000.0;
}

std::optional<FixResult> parseGgaSentence(const std::string& line) {
  GgaDecoder decoder;
  std::optional<FixResult> fix;
  for (size_t i = 0; i < line.size() && !fix; i++) {
    fix = decoder.encode(line[i]);
  }
  if (!fix && (line.empty() || line.back() != '\n')) {
    fix = decoder.encode('\r');
  }
  return fix;
}

std::optional<FixResult> LocationProvider::acquireFix(uint32_t timeoutMs) {
  gps.drain();

  GgaDecoder decoder;
  uint32_t start = clock.millis();
  while (clock.millis() - start < timeoutMs) {
    uint8_t byte = 0;
    if (gps.available() == 0 || !gps.read(byte)) {
      clock.delay(POLL_INTERVAL_MS);
      continue;
    }

    std::optional<FixResult> fix = decoder.encode(static_cast<char>(byte));
    if (fix) {
      logPrintf("📍 GPS fix: %.6f, %.6f\n", fix->latitude, fix->longitude);
      return fix;
    }
  }

  logPrintf("❌ No GPS fix within %lu ms (%lu sentences ok, %lu failed checksum)\n",
            static_cast<unsigned long>(timeoutMs),
            static_cast<unsigned long>(decoder.passedChecksum()),
            static_cast<unsigned long>(decoder.failedChecksum()));
  return std::nullopt;
}

}  // namespace ridesafe
