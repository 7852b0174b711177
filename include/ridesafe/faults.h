#ifndef __RIDESAFE_FAULTS_H__
#define __RIDESAFE_FAULTS_H__

#include <stdint.h>

namespace ridesafe {

/**
 * Failure taxonomy for every hardware and network boundary.
 * Each layer converts its own failures into one of these values and
 * never lets them escape as a crash.
 */
enum class Fault : uint8_t {
  NONE = 0,
  SENSOR_FAULT,          // I2C/ADC read failed, reading degraded to zero
  NETWORK_UNAVAILABLE,   // WiFi association failed or timed out
  TIME_SYNC_FAILURE,     // Date header missing or unparsable
  LOCATION_TIMEOUT,      // No valid fix within the window
  NOTIFY_FAILURE         // Alert could not be delivered
};

const char* faultName(Fault fault);

}  // namespace ridesafe

#endif  // __RIDESAFE_FAULTS_H__
