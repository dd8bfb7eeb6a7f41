#include "settings_store.h"

#include <Arduino.h>
#include <Preferences.h>

#include "station_config.h"

// NVS keys (max 15 chars each)
static const char *KEY_LATITUDE = "lat";
static const char *KEY_LONGITUDE = "lon";
static const char *KEY_LABEL = "label";
static const char *KEY_TIMEZONE = "tz";
static const char *KEY_MAIN_BACKLIGHT = "bl_main";
static const char *KEY_SIDE_BACKLIGHT = "bl_side";
static const char *KEY_INTERVAL = "interval";

bool loadStationSettings(StationSettings &out) {
  out = StationSettings();

  Preferences prefs;
  if (!prefs.begin(STATION_PREFS_NAMESPACE, true)) {  // read-only
    Serial.println("Station: no stored settings, using defaults");
    return false;
  }

  out.latitude = prefs.getDouble(KEY_LATITUDE, STATION_DEFAULT_LATITUDE);
  out.longitude = prefs.getDouble(KEY_LONGITUDE, STATION_DEFAULT_LONGITUDE);
  out.label = prefs.getString(KEY_LABEL, STATION_DEFAULT_LABEL).c_str();
  out.timezone = prefs.getString(KEY_TIMEZONE, STATION_DEFAULT_TIMEZONE).c_str();
  out.mainBacklight = prefs.getUChar(KEY_MAIN_BACKLIGHT, STATION_DEFAULT_MAIN_BACKLIGHT);
  out.sideBacklight = prefs.getUChar(KEY_SIDE_BACKLIGHT, STATION_DEFAULT_SIDE_BACKLIGHT);
  out.refreshIntervalSec = prefs.getULong(KEY_INTERVAL, STATION_DEFAULT_REFRESH_SEC);
  prefs.end();

  Serial.printf("Station: settings loaded: %s (%.4f, %.4f), %s, every %lu s\n",
                out.label.c_str(), out.latitude, out.longitude, out.timezone.c_str(),
                static_cast<unsigned long>(out.refreshIntervalSec));
  return true;
}
