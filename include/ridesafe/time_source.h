#ifndef __RIDESAFE_TIME_SOURCE_H__
#define __RIDESAFE_TIME_SOURCE_H__

#include <stdint.h>

#include <optional>
#include <string>

#include "ridesafe/hal.h"

namespace ridesafe {

/**
 * Seconds since 1970-01-01 00:00:00, shifted by the local timezone offset
 */
typedef int64_t Timestamp;

/**
 * TimeSource - wall clock from an HTTP Date header
 *
 * The device has no RTC, so the time shown in alerts is borrowed from the
 * Date header of a well-known web server. This is opportunistic: any
 * failure returns an empty optional and callers leave the time out.
 *
 * Each request is followed by a cooldown sleep so the shared service is
 * never hit more than once every few seconds.
 */
class TimeSource {
private:
  HttpClient& http;
  Clock& clock;
  std::string url;
  int32_t timezoneOffsetSeconds;
  uint32_t cooldownMs;

public:
  TimeSource(HttpClient& http, Clock& clock, const char* url,
             int32_t timezoneOffsetSeconds, uint32_t cooldownMs);

  /**
   * Request the endpoint and convert its Date header to local time
   * @return Local timestamp, or empty on network or parse failure
   */
  std::optional<Timestamp> fetchTrustedTime();

  /**
   * Parse an RFC 1123 date ("Thu, 15 May 2025 10:25:39 GMT")
   * @param header Date header value
   * @return UTC seconds since the epoch, or empty if malformed
   */
  static std::optional<Timestamp> parseHttpDate(const std::string& header);

  /**
   * Seconds since the epoch for a UTC calendar date and time
   */
  static Timestamp toEpochSeconds(int year, int month, int day,
                                  int hour, int minute, int second);
};

/**
 * Render a timestamp as "YYYY-MM-DD HH:MM:SS"
 */
std::string formatTimestamp(Timestamp timestamp);

}  // namespace ridesafe

#endif  // __RIDESAFE_TIME_SOURCE_H__
