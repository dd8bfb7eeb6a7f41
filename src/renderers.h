#pragma once

#include "display_id.h"
#include "rendered_image.h"
#include "station_settings.h"
#include "weather_snapshot.h"

// The three layouts are pure functions of their arguments: the same inputs
// always yield an identical frame.

// 240x240: location, date, high/low, icon, temperature, condition, UV, time.
// `stale` marks a frame drawn from an earlier cycle's snapshot after the
// latest fetch failed.
class MainRenderer {
 public:
  RenderedImage render(const WeatherSnapshot &snapshot, const StationSettings &settings,
                       bool stale = false) const;
};

// Top-right dot on the main panel while the shown data is stale.
constexpr int STALE_MARK_X = 228;
constexpr int STALE_MARK_Y = 12;
constexpr int STALE_MARK_RADIUS = 4;

// 160x80: humidity and wind.
class LeftRenderer {
 public:
  RenderedImage render(const WeatherSnapshot &snapshot, const StationSettings &settings) const;
};

// 160x80: sunrise and sunset.
class RightRenderer {
 public:
  RenderedImage render(const WeatherSnapshot &snapshot, const StationSettings &settings) const;
};

// Centered one- or two-line notice, used for the boot splash and fatal errors.
RenderedImage renderMessage(DisplayId target, const char *line1, const char *line2 = nullptr);

// "15.2", "17", "-3.5"; "--" when missing.
std::string formatTemperature(float celsius);

// "2024-05-01" -> "Wed 01 May"; "" when the date is malformed.
std::string formatObservedDate(const char *isoDate);
