#include "station_settings.h"

#include <math.h>

bool validateSettings(const StationSettings &settings, std::string &reason) {
  if (isnan(settings.latitude) || settings.latitude < -90.0 || settings.latitude > 90.0) {
    reason = "latitude out of range";
    return false;
  }
  if (isnan(settings.longitude) || settings.longitude < -180.0 || settings.longitude > 180.0) {
    reason = "longitude out of range";
    return false;
  }
  if (settings.label.empty()) {
    reason = "label is empty";
    return false;
  }
  if (settings.label.size() > STATION_MAX_LABEL_LEN) {
    reason = "label too long";
    return false;
  }
  if (settings.timezone.empty()) {
    reason = "timezone is empty";
    return false;
  }
  if (settings.mainBacklight > 100) {
    reason = "main backlight above 100";
    return false;
  }
  if (settings.sideBacklight > 100) {
    reason = "side backlight above 100";
    return false;
  }
  if (settings.refreshIntervalSec < STATION_MIN_REFRESH_SEC) {
    reason = "refresh interval below 60 s";
    return false;
  }
  if (settings.refreshIntervalSec > STATION_MAX_REFRESH_SEC) {
    reason = "refresh interval above 86400 s";
    return false;
  }
  reason.clear();
  return true;
}
