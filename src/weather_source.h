#pragma once

#include <stdint.h>

#include "station_settings.h"
#include "weather_snapshot.h"

// Coarse cause of a failed acquisition.
enum class AcquisitionStatus : uint8_t {
  Ok,
  Network,
  BadStatus,
  ParseError
};

inline const char *acquisitionStatusName(AcquisitionStatus status) {
  switch (status) {
    case AcquisitionStatus::Ok: return "ok";
    case AcquisitionStatus::Network: return "network";
    case AcquisitionStatus::BadStatus: return "bad-status";
    case AcquisitionStatus::ParseError: return "parse-error";
    default: return "?";
  }
}

// Anything that can produce a snapshot for the configured location.
class WeatherSource {
 public:
  virtual ~WeatherSource() = default;

  // One request per call. `out` is written only when Ok is returned.
  virtual AcquisitionStatus fetch(const StationSettings &settings, WeatherSnapshot &out) = 0;
};
