#pragma once

#include <Arduino.h>
#include <ESP32Time.h>
#include <WiFiClientSecure.h>

#include "weather_source.h"

// Open-Meteo over HTTPS. One GET per fetch(), no retries: the scheduler
// decides what to do with a failure.
class WeatherClient : public WeatherSource {
 public:
  explicit WeatherClient(ESP32Time &rtc);

  // Sync RTC with NTP. Returns false if no answer arrived in time.
  bool setTime();

  AcquisitionStatus fetch(const StationSettings &settings, WeatherSnapshot &out) override;

 private:
  uint32_t acquisitionEpoch();

  ESP32Time &rtc_;
  WiFiClientSecure client_;
};
