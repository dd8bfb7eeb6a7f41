#include <Arduino.h>
#include <ESP32Time.h>
#include <WiFi.h>

#include <memory>
#include <string>

#include "board_pins.h"
#include "panel_driver.h"
#include "secrets.h"
#include "settings_store.h"
#include "station_clock.h"
#include "station_config.h"
#include "station_scheduler.h"
#include "station_settings.h"
#include "weather_client.h"

// Three-panel weather station
// - Main 240x240: location, date, high/low, icon, temperature, condition, UV
// - Left 160x80:  humidity and wind
// - Right 160x80: sunrise and sunset
// - Refreshes from Open-Meteo every refreshIntervalSec (NVS "tripanel")
// - BOOT button stops the station and blanks the panels

// Serial
static const unsigned long BAUD = 115200;

// millis()/delay() behind the scheduler's clock interface
class ArduinoClock : public StationClock
{
public:
    uint32_t nowMs() override { return millis(); }
    void sleepMs(uint32_t ms) override { delay(ms); }
};

ESP32Time rtc(0);
PanelDriver panels;
WeatherClient weatherClient(rtc);
ArduinoClock stationClock;
static std::unique_ptr<StationScheduler> scheduler;

static bool halted = false;

// Raised by the BOOT button ISR, polled by the scheduler.
static volatile bool stopButtonPressed = false;

// ------------------- Logging -------------------
static void logLine(const char *line)
{
    Serial.println(line);
}

// ------------------- Stop button -------------------
static void IRAM_ATTR onStopButton()
{
    stopButtonPressed = true;
}

// ------------------- WiFi connect -------------------
static bool wifiConnect()
{
    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(true);
    WiFi.begin(WIFI_SSID, WIFI_PASSWORD);

    uint32_t start = millis();
    while (WiFi.status() != WL_CONNECTED && millis() - start < WIFI_CONNECT_TIMEOUT_MS)
    {
        delay(250);
        yield();
    }

    if (WiFi.status() == WL_CONNECTED)
    {
        Serial.printf("Station: WiFi OK, IP=%s RSSI=%d dBm\n",
                      WiFi.localIP().toString().c_str(), WiFi.RSSI());
        return true;
    }
    Serial.printf("Station: WiFi not connected (status %d), will keep retrying\n",
                  static_cast<int>(WiFi.status()));
    return false;
}

// ------------------- Halt -------------------
static void halt(const char *message)
{
    Serial.println(message);
    halted = true;
}

// ------------------- Setup / Loop -------------------
void setup()
{
    Serial.begin(BAUD);
    delay(200);
    Serial.println("Station: starting");

    StationSettings settings;
    if (!loadStationSettings(settings))
        Serial.println("Station: NVS unavailable, running on defaults");

    if (!panels.begin())
        Serial.println("Station: not every panel is available");

    std::string reason;
    if (!validateSettings(settings, reason))
    {
        Serial.printf("Station: invalid settings: %s\n", reason.c_str());
        panels.showFatal(reason.c_str());
        halt("Station: halted");
        return;
    }

    wifiConnect();
    if (!weatherClient.setTime())
        Serial.println("Station: clock not synced yet");

    scheduler = std::make_unique<StationScheduler>(settings, weatherClient, panels, stationClock);
    scheduler->bindLogger(logLine);
    scheduler->bindStopSignal(&stopButtonPressed);

    pinMode(STOP_BUTTON_PIN, INPUT_PULLUP);
    attachInterrupt(digitalPinToInterrupt(STOP_BUTTON_PIN), onStopButton, FALLING);

    Serial.printf("Station: running, every %lu s\n",
                  static_cast<unsigned long>(settings.refreshIntervalSec));
}

void loop()
{
    if (halted)
    {
        delay(1000);
        return;
    }

    bool running = scheduler->step();
    Serial.printf("Station: free heap %u bytes\n", static_cast<unsigned>(ESP.getFreeHeap()));

    if (!running)
    {
        detachInterrupt(digitalPinToInterrupt(STOP_BUTTON_PIN));
        panels.shutdown();
        halt("Station: stopped");
    }
}
