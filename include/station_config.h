#pragma once

#include <stdint.h>

// Defaults used when the NVS namespace holds no override.
static const char STATION_DEFAULT_LABEL[] = "Streatham";
static const char STATION_DEFAULT_TIMEZONE[] = "Europe/London";
constexpr double STATION_DEFAULT_LATITUDE = 51.4279;
constexpr double STATION_DEFAULT_LONGITUDE = -0.1255;

// Backlight duty in percent (0-100).
constexpr uint8_t STATION_DEFAULT_MAIN_BACKLIGHT = 90;
constexpr uint8_t STATION_DEFAULT_SIDE_BACKLIGHT = 45;

// Seconds between the start of two refresh cycles.
constexpr uint32_t STATION_DEFAULT_REFRESH_SEC = 300;
// Lower bound accepted for refreshIntervalSec.
constexpr uint32_t STATION_MIN_REFRESH_SEC = 60;
// Upper bound accepted for refreshIntervalSec (one day).
constexpr uint32_t STATION_MAX_REFRESH_SEC = 86400;

// NVS namespace holding per-device overrides.
static const char STATION_PREFS_NAMESPACE[] = "tripanel";

// Panel resolutions.
constexpr int MAIN_PANEL_WIDTH = 240;
constexpr int MAIN_PANEL_HEIGHT = 240;
constexpr int SIDE_PANEL_WIDTH = 160;
constexpr int SIDE_PANEL_HEIGHT = 80;

// Provider request.
static const char WEATHER_API_BASE_URL[] = "https://api.open-meteo.com/v1/forecast";
constexpr uint32_t WEATHER_HTTP_TIMEOUT_MS = 10000;

// Scheduler wait is cut into slices so a stop request is noticed quickly.
constexpr uint32_t SCHEDULER_STOP_POLL_MS = 200;

// Network bring-up.
constexpr uint32_t WIFI_CONNECT_TIMEOUT_MS = 12000;
constexpr uint32_t NTP_SYNC_TIMEOUT_MS = 5000;

// NTP servers used when syncing time.
static const char NTP_SERVER_1[] = "pool.ntp.org";
static const char NTP_SERVER_2[] = "time.nist.gov";
static const char NTP_SERVER_3[] = "time.google.com";
