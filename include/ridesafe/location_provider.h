#ifndef __RIDESAFE_LOCATION_PROVIDER_H__
#define __RIDESAFE_LOCATION_PROVIDER_H__

#include <stdint.h>

#include <optional>
#include <string>

#include "ridesafe/hal.h"

namespace ridesafe {

/**
 * Position fix in decimal degrees (negative = south / west)
 */
struct FixResult {
  double latitude;
  double longitude;
};

/**
 * LocationProvider - one-shot GPS fix from an NMEA receiver
 *
 * Receiver bytes are decoded with TinyGPS++. Only checksummed GGA sentences
 * ($GPGGA, $GNGGA) reporting a fix are accepted. Anything else, and any GGA
 * sentence without a usable position, is skipped until the window runs out.
 */
class LocationProvider {
private:
  SerialStream& gps;
  Clock& clock;

public:
  static const uint32_t POLL_INTERVAL_MS = 10;   // idle wait when the UART is empty

  LocationProvider(SerialStream& gps, Clock& clock) : gps(gps), clock(clock) {}

  /**
   * Wait for a position fix
   *
   * Stale buffered input is discarded first so the fix is fresh.
   * Blocks for at most timeoutMs.
   *
   * @param timeoutMs Acquisition window
   * @return Fix, or empty if none arrived in time
   */
  std::optional<FixResult> acquireFix(uint32_t timeoutMs);
};

/**
 * Convert an NMEA (d)ddmm.mmmm field to decimal degrees
 * @return Degrees, or empty for empty/short/malformed input
 */
std::optional<double> nmeaToDegrees(const std::string& raw);

/**
 * Extract the position from a single GGA sentence
 * @return Fix, or empty if the sentence fails its checksum or carries no
 *         valid position
 */
std::optional<FixResult> parseGgaSentence(const std::string& line);

}  // namespace ridesafe

#endif  // __RIDESAFE_LOCATION_PROVIDER_H__
