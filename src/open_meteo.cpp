#include "open_meteo.h"

#include <math.h>
#include <stdio.h>
#include <string.h>

#include <ArduinoJson.h>

#include "station_config.h"

namespace {

const char kCurrentFields[] =
    "temperature_2m,apparent_temperature,relative_humidity_2m,"
    "wind_speed_10m,wind_direction_10m,weather_code,uv_index";
const char kDailyFields[] = "temperature_2m_max,temperature_2m_min,sunrise,sunset";

// WMO codes stop at 99; anything past a byte is not a weather code.
constexpr float kMaxWeatherCode = 255.0f;

std::string urlEncode(const std::string &value) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                      (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    if (unreserved) {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

// Null is allowed and means "not reported".
bool readOptionalNumber(JsonVariantConst value, float &out) {
  if (value.isNull()) {
    out = NAN;
    return true;
  }
  if (!value.is<float>()) return false;
  out = value.as<float>();
  return true;
}

// Open-Meteo local timestamps look like "2024-05-01T06:42".
bool isLocalTimestamp(const char *text) {
  if (!text || strlen(text) < 16) return false;
  return text[4] == '-' && text[7] == '-' && text[10] == 'T' && text[13] == ':';
}

bool readTimestamp(JsonVariantConst value, char *date, size_t dateLen, char *clock,
                   size_t clockLen) {
  if (value.isNull()) return true;
  if (!value.is<const char *>()) return false;
  const char *text = value.as<const char *>();
  if (!isLocalTimestamp(text)) return false;
  if (date) snprintf(date, dateLen, "%.10s", text);
  if (clock) snprintf(clock, clockLen, "%.5s", text + 11);
  return true;
}

// First element of a daily series; a missing series is allowed, a series of
// the wrong shape is not.
bool firstOfSeries(JsonObjectConst daily, const char *key, JsonVariantConst &out) {
  JsonVariantConst series = daily[key];
  if (series.isNull()) {
    out = JsonVariantConst();
    return true;
  }
  if (!series.is<JsonArrayConst>()) return false;
  out = series[0];
  return true;
}

}  // namespace

std::string buildForecastUrl(const StationSettings &settings) {
  char coords[64];
  snprintf(coords, sizeof(coords), "?latitude=%.4f&longitude=%.4f", settings.latitude,
           settings.longitude);

  std::string url = WEATHER_API_BASE_URL;
  url += coords;
  url += "&current=";
  url += kCurrentFields;
  url += "&daily=";
  url += kDailyFields;
  url += "&timezone=";
  url += urlEncode(settings.timezone);
  url += "&forecast_days=1";
  return url;
}

AcquisitionStatus parseForecast(const char *payload, size_t length, uint32_t fetchedAt,
                                WeatherSnapshot &out) {
  if (!payload || length == 0) return AcquisitionStatus::ParseError;

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, payload, length);
  if (err) return AcquisitionStatus::ParseError;

  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) return AcquisitionStatus::ParseError;

  JsonObjectConst current = root["current"].as<JsonObjectConst>();
  if (current.isNull()) return AcquisitionStatus::ParseError;

  WeatherSnapshot snap;

  JsonVariantConst temp = current["temperature_2m"];
  if (!temp.is<float>()) return AcquisitionStatus::ParseError;
  snap.temperature = temp.as<float>();

  JsonVariantConst code = current["weather_code"];
  if (!code.is<float>()) return AcquisitionStatus::ParseError;
  float codeValue = code.as<float>();
  if (codeValue < 0 || codeValue > kMaxWeatherCode || codeValue != floorf(codeValue)) {
    return AcquisitionStatus::ParseError;
  }
  snap.conditionCode = static_cast<int>(codeValue);

  if (!readOptionalNumber(current["apparent_temperature"], snap.feelsLike) ||
      !readOptionalNumber(current["relative_humidity_2m"], snap.humidity) ||
      !readOptionalNumber(current["wind_speed_10m"], snap.windSpeed) ||
      !readOptionalNumber(current["wind_direction_10m"], snap.windDirection) ||
      !readOptionalNumber(current["uv_index"], snap.uvIndex)) {
    return AcquisitionStatus::ParseError;
  }
  if (hasValue(snap.humidity) && (snap.humidity < 0 || snap.humidity > 100)) {
    return AcquisitionStatus::ParseError;
  }

  if (!readTimestamp(current["time"], snap.observedDate, sizeof(snap.observedDate),
                     snap.observedTime, sizeof(snap.observedTime))) {
    return AcquisitionStatus::ParseError;
  }

  JsonVariantConst dailyVariant = root["daily"];
  if (!dailyVariant.isNull()) {
    JsonObjectConst daily = dailyVariant.as<JsonObjectConst>();
    if (daily.isNull()) return AcquisitionStatus::ParseError;

    JsonVariantConst high, low, sunrise, sunset;
    if (!firstOfSeries(daily, "temperature_2m_max", high) ||
        !firstOfSeries(daily, "temperature_2m_min", low) ||
        !firstOfSeries(daily, "sunrise", sunrise) ||
        !firstOfSeries(daily, "sunset", sunset)) {
      return AcquisitionStatus::ParseError;
    }
    if (!readOptionalNumber(high, snap.tempHigh) || !readOptionalNumber(low, snap.tempLow)) {
      return AcquisitionStatus::ParseError;
    }
    if (!readTimestamp(sunrise, nullptr, 0, snap.sunrise, sizeof(snap.sunrise)) ||
        !readTimestamp(sunset, nullptr, 0, snap.sunset, sizeof(snap.sunset))) {
      return AcquisitionStatus::ParseError;
    }
  }

  snap.fetchedAt = fetchedAt;
  out = snap;
  return AcquisitionStatus::Ok;
}
