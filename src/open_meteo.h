#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "station_settings.h"
#include "weather_snapshot.h"
#include "weather_source.h"

// Full forecast URL for the configured location (current conditions plus
// today's extremes and sun times).
std::string buildForecastUrl(const StationSettings &settings);

// Parse an Open-Meteo forecast response. Returns ParseError unless the whole
// document is valid; `out` is untouched in that case.
AcquisitionStatus parseForecast(const char *payload, size_t length, uint32_t fetchedAt,
                                WeatherSnapshot &out);
