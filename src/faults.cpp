#include "ridesafe/faults.h"

namespace ridesafe {

const char* faultName(Fault fault) {
  switch (fault) {
    case Fault::NONE: return "NONE";
    case Fault::SENSOR_FAULT: return "SENSOR_FAULT";
    case Fault::NETWORK_UNAVAILABLE: return "NETWORK_UNAVAILABLE";
    case Fault::TIME_SYNC_FAILURE: return "TIME_SYNC_FAILURE";
    case Fault::LOCATION_TIMEOUT: return "LOCATION_TIMEOUT";
    case Fault::NOTIFY_FAILURE: return "NOTIFY_FAILURE";
  }
  return "UNKNOWN";
}

}  // namespace ridesafe
