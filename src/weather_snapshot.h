#pragma once

#include <math.h>
#include <stdint.h>

// One successful provider response. Units: Celsius, km/h, degrees, percent.
// Optional values are NAN (numbers) or "" (strings) when the provider omitted them.
struct WeatherSnapshot {
  float temperature = NAN;
  float feelsLike = NAN;
  int conditionCode = -1;
  float tempHigh = NAN;
  float tempLow = NAN;
  float humidity = NAN;
  float windSpeed = NAN;
  float windDirection = NAN;
  float uvIndex = NAN;
  char sunrise[6] = "";       // "HH:MM" local
  char sunset[6] = "";        // "HH:MM" local
  char observedDate[11] = ""; // "YYYY-MM-DD" local
  char observedTime[6] = "";  // "HH:MM" local
  uint32_t fetchedAt = 0;     // epoch seconds, 0 if the clock was not synced
};

inline bool hasValue(float value) { return !isnan(value); }
