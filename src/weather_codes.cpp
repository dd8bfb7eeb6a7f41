#include "weather_codes.h"

#include <math.h>

namespace {

struct ConditionEntry {
  int code;
  const char *text;
  WeatherIcon icon;
};

const ConditionEntry kConditions[] = {
    {0, "Clear", WeatherIcon::Clear},
    {1, "Mostly Clear", WeatherIcon::Clear},
    {2, "Partly Cloudy", WeatherIcon::PartlyCloudy},
    {3, "Overcast", WeatherIcon::Cloudy},
    {45, "Foggy", WeatherIcon::Fog},
    {48, "Icy Fog", WeatherIcon::Fog},
    {51, "Light Drizzle", WeatherIcon::Drizzle},
    {53, "Drizzle", WeatherIcon::Drizzle},
    {55, "Heavy Drizzle", WeatherIcon::Drizzle},
    {61, "Light Rain", WeatherIcon::Rain},
    {63, "Rain", WeatherIcon::Rain},
    {65, "Heavy Rain", WeatherIcon::Rain},
    {71, "Light Snow", WeatherIcon::Snow},
    {73, "Snow", WeatherIcon::Snow},
    {75, "Heavy Snow", WeatherIcon::Snow},
    {77, "Snow Grains", WeatherIcon::Snow},
    {80, "Showers", WeatherIcon::Rain},
    {81, "Rain Showers", WeatherIcon::Rain},
    {82, "Heavy Showers", WeatherIcon::Rain},
    {85, "Snow Showers", WeatherIcon::Snow},
    {86, "Heavy Snow Showers", WeatherIcon::Snow},
    {95, "Thunderstorm", WeatherIcon::Thunder},
    {96, "Storm+Hail", WeatherIcon::Thunder},
    {99, "Severe Storm", WeatherIcon::Thunder},
};

const ConditionEntry *findCondition(int code) {
  for (const auto &entry : kConditions) {
    if (entry.code == code) return &entry;
  }
  return nullptr;
}

const char *const kCompass[8] = {"N", "NE", "E", "SE", "S", "SW", "W", "NW"};

}  // namespace

const char *conditionText(int code) {
  const ConditionEntry *entry = findCondition(code);
  return entry ? entry->text : "Unknown";
}

WeatherIcon iconForCode(int code) {
  const ConditionEntry *entry = findCondition(code);
  return entry ? entry->icon : WeatherIcon::Unknown;
}

const char *windCompass(float degrees) {
  if (isnan(degrees)) return "";
  long sector = lroundf(degrees / 45.0f) % 8;
  if (sector < 0) sector += 8;
  return kCompass[sector];
}

uint16_t temperatureColor(float celsius) {
  if (isnan(celsius)) return rgb565(120, 120, 130);
  if (celsius < 5) return rgb565(100, 180, 255);
  if (celsius < 12) return rgb565(60, 200, 200);
  if (celsius < 18) return rgb565(80, 220, 140);
  if (celsius < 24) return rgb565(200, 200, 100);
  if (celsius < 28) return rgb565(255, 160, 60);
  return rgb565(255, 80, 60);
}

uint16_t uvColor(float uv) {
  if (isnan(uv)) return rgb565(120, 120, 130);
  if (uv <= 2) return rgb565(100, 200, 100);
  if (uv <= 5) return rgb565(240, 200, 60);
  if (uv <= 7) return rgb565(255, 160, 60);
  if (uv <= 10) return rgb565(255, 100, 60);
  return rgb565(200, 60, 100);
}
