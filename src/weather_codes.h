#pragma once

#include <stdint.h>

enum class WeatherIcon : uint8_t {
  Clear,
  PartlyCloudy,
  Cloudy,
  Fog,
  Drizzle,
  Rain,
  Snow,
  Thunder,
  Unknown
};

// WMO weather interpretation code -> short English text.
const char *conditionText(int code);

// WMO weather interpretation code -> icon to draw.
WeatherIcon iconForCode(int code);

// Eight-point compass label for a direction in degrees.
const char *windCompass(float degrees);

// RGB565 colour for a temperature in Celsius.
uint16_t temperatureColor(float celsius);

// RGB565 colour for a UV index.
uint16_t uvColor(float uv);

constexpr uint16_t rgb565(uint8_t r, uint8_t g, uint8_t b) {
  return static_cast<uint16_t>(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
}
