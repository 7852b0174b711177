#include "ridesafe/time_source.h"

#include <stdio.h>

#include <sstream>
#include <vector>

#include "ridesafe/log.h"

namespace ridesafe {

namespace {

const char* const MONTHS[12] = {
  "Jan", "Feb", "Mar", "Apr", "May", "Jun",
  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

const int64_t SECONDS_PER_DAY = 86400;

// Unsigned decimal field, digits only
bool parseNumber(const std::string& text, int& value) {
  if (text.empty() || text.size() > 9) return false;
  int result = 0;
  for (size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    if (c < '0' || c > '9') return false;
    result = result * 10 + (c - '0');
  }
  value = result;
  return true;
}

int monthFromName(const std::string& name) {
  for (int i = 0; i < 12; i++) {
    if (name == MONTHS[i]) return i + 1;
  }
  return 0;
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) return 29;
  return DAYS[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t daysFromCivil(int year, int month, int day) {
  year -= month <= 2 ? 1 : 0;
  const int64_t era = (year >= 0 ? year : year - 399) / 400;
  const int64_t yoe = year - era * 400;
  const int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

void civilFromDays(int64_t days, int& year, int& month, int& day) {
  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const int64_t doe = days - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

}  // namespace

TimeSource::TimeSource(HttpClient& http, Clock& clock, const char* url,
                       int32_t timezoneOffsetSeconds, uint32_t cooldownMs)
    : http(http), clock(clock), url(url),
      timezoneOffsetSeconds(timezoneOffsetSeconds), cooldownMs(cooldownMs) {}

Timestamp TimeSource::toEpochSeconds(int year, int month, int day,
                                     int hour, int minute, int second) {
  return daysFromCivil(year, month, day) * SECONDS_PER_DAY +
         hour * 3600 + minute * 60 + second;
}

std::optional<Timestamp> TimeSource::parseHttpDate(const std::string& header) {
  // "<DOW>, DD Mon YYYY HH:MM:SS GMT"
  std::istringstream stream(header);
  std::vector<std::string> parts;
  std::string token;
  while (stream >> token) {
    parts.push_back(token);
  }
  if (parts.size() < 5) {
    return std::nullopt;
  }

  int day = 0;
  int year = 0;
  int month = monthFromName(parts[2]);
  if (!parseNumber(parts[1], day) || month == 0 || !parseNumber(parts[3], year)) {
    return std::nullopt;
  }

  // HH:MM:SS, fixed width
  const std::string& clockField = parts[4];
  if (clockField.size() != 8 || clockField[2] != ':' || clockField[5] != ':') {
    return std::nullopt;
  }
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!parseNumber(clockField.substr(0, 2), hour) ||
      !parseNumber(clockField.substr(3, 2), minute) ||
      !parseNumber(clockField.substr(6, 2), second)) {
    return std::nullopt;
  }

  if (year < 1970 || day < 1 || day > daysInMonth(year, month) ||
      hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  return toEpochSeconds(year, month, day, hour, minute, second);
}

std::optional<Timestamp> TimeSource::fetchTrustedTime() {
  HttpResponse response = http.get(url, "Date");

  // Cooldown applies on every outcome
  clock.delay(cooldownMs);

  if (response.statusCode <= 0) {
    logPrintf("❌ Time sync request failed, code: %d\n", response.statusCode);
    return std::nullopt;
  }
  if (response.header.empty()) {
    logLine("❌ Failed to get date from headers.");
    return std::nullopt;
  }

  std::optional<Timestamp> utc = parseHttpDate(response.header);
  if (!utc) {
    logPrintf("❌ Unparsable Date header: \"%s\"\n", response.header.c_str());
    return std::nullopt;
  }
  return *utc + timezoneOffsetSeconds;
}

std::string formatTimestamp(Timestamp timestamp) {
  int64_t days = timestamp / SECONDS_PER_DAY;
  int64_t secondsOfDay = timestamp % SECONDS_PER_DAY;
  if (secondsOfDay < 0) {
    secondsOfDay += SECONDS_PER_DAY;
    days -= 1;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  civilFromDays(days, year, month, day);

  char buffer[32];
  snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d",
           year, month, day,
           static_cast<int>(secondsOfDay / 3600),
           static_cast<int>((secondsOfDay % 3600) / 60),
           static_cast<int>(secondsOfDay % 60));
  return std::string(buffer);
}

}  // namespace ridesafe
