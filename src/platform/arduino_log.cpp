#include <Arduino.h>
#include <stdarg.h>
#include <stdio.h>

#include <string>

#include "ridesafe/log.h"

namespace ridesafe {

void logPrintf(const char* format, ...) {
  char buffer[256];

  va_list args;
  va_start(args, format);
  va_list retry;
  va_copy(retry, args);
  int length = vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);

  if (length < 0) {
    va_end(retry);
    return;
  }

  if (static_cast<size_t>(length) < sizeof(buffer)) {
    Serial.print(buffer);
  } else {
    // Alert messages can exceed the stack buffer
    std::string large(static_cast<size_t>(length) + 1, '\0');
    vsnprintf(&large[0], large.size(), format, retry);
    Serial.print(large.c_str());
  }
  va_end(retry);
}

void logLine(const char* line) {
  Serial.println(line);
}

}  // namespace ridesafe
