#ifndef __RIDESAFE_LOG_H__
#define __RIDESAFE_LOG_H__

/**
 * Console logging used by every component.
 *
 * The firmware binds these to the USB Serial port (src/platform/arduino_log.cpp).
 * Host test builds bind them to an in-memory capture.
 */

namespace ridesafe {

/**
 * Print a formatted message (no newline appended)
 * @param format printf-style format string
 */
void logPrintf(const char* format, ...) __attribute__((format(printf, 1, 2)));

/**
 * Print a line followed by a newline
 * @param line Text to print
 */
void logLine(const char* line);

}  // namespace ridesafe

#endif  // __RIDESAFE_LOG_H__
