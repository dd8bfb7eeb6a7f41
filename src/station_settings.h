#pragma once

#include <stdint.h>

#include <string>

#include "station_config.h"

// Fixed at startup, never changed while the station runs.
struct StationSettings {
  double latitude = STATION_DEFAULT_LATITUDE;
  double longitude = STATION_DEFAULT_LONGITUDE;
  std::string label = STATION_DEFAULT_LABEL;
  std::string timezone = STATION_DEFAULT_TIMEZONE;
  uint8_t mainBacklight = STATION_DEFAULT_MAIN_BACKLIGHT;
  uint8_t sideBacklight = STATION_DEFAULT_SIDE_BACKLIGHT;
  uint32_t refreshIntervalSec = STATION_DEFAULT_REFRESH_SEC;
};

constexpr size_t STATION_MAX_LABEL_LEN = 31;

// Returns false and fills `reason` when a setting is out of range.
bool validateSettings(const StationSettings &settings, std::string &reason);
