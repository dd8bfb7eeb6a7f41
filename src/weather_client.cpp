#include "weather_client.h"

#include <HTTPClient.h>
#include <WiFi.h>
#include <time.h>

#include "open_meteo.h"
#include "station_config.h"

namespace {

// Anything earlier means SNTP has not answered yet.
constexpr time_t kEpochSanityFloor = 1600000000;

}  // namespace

WeatherClient::WeatherClient(ESP32Time &rtc) : rtc_(rtc) {
  client_.setInsecure();
}

bool WeatherClient::setTime() {
  configTime(0, 0, NTP_SERVER_1, NTP_SERVER_2, NTP_SERVER_3);
  struct tm timeinfo;
  if (!getLocalTime(&timeinfo, NTP_SYNC_TIMEOUT_MS)) {
    Serial.println("Weather: NTP sync timed out, timestamps stay 0 until it answers.");
    return false;
  }
  rtc_.setTimeStruct(timeinfo);
  return true;
}

uint32_t WeatherClient::acquisitionEpoch() {
  if (time(nullptr) < kEpochSanityFloor) return 0;
  return static_cast<uint32_t>(rtc_.getEpoch());
}

AcquisitionStatus WeatherClient::fetch(const StationSettings &settings, WeatherSnapshot &out) {
  if (WiFi.status() != WL_CONNECTED) {
    Serial.println("Weather: WiFi not connected.");
    return AcquisitionStatus::Network;
  }

  HTTPClient http;
  std::string url = buildForecastUrl(settings);
  http.setConnectTimeout(WEATHER_HTTP_TIMEOUT_MS);
  http.setTimeout(WEATHER_HTTP_TIMEOUT_MS);
  if (!http.begin(client_, url.c_str())) {
    Serial.println("Weather: could not open connection.");
    return AcquisitionStatus::Network;
  }

  int httpCode = http.GET();
  if (httpCode < 0) {
    Serial.printf("Weather: request failed: %s\n", HTTPClient::errorToString(httpCode).c_str());
    http.end();
    return AcquisitionStatus::Network;
  }
  if (httpCode != HTTP_CODE_OK) {
    Serial.printf("Weather: provider answered HTTP %d\n", httpCode);
    http.end();
    return AcquisitionStatus::BadStatus;
  }

  String payload = http.getString();
  http.end();

  AcquisitionStatus status =
      parseForecast(payload.c_str(), payload.length(), acquisitionEpoch(), out);
  if (status != AcquisitionStatus::Ok) {
    Serial.printf("Weather: response rejected (%u bytes)\n",
                  static_cast<unsigned>(payload.length()));
  }
  return status;
}
