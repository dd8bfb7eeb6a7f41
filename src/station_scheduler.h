#pragma once

#include <stdint.h>

#include <atomic>

#include "display_driver.h"
#include "renderers.h"
#include "station_clock.h"
#include "station_settings.h"
#include "weather_snapshot.h"
#include "weather_source.h"

// Phase of the refresh cycle.
enum class CycleState : uint8_t {
  Idle,
  Fetching,
  Rendering,
  Pushing
};

const char *cycleStateName(CycleState state);

// Outcome of one cycle, mainly for logging and tests.
struct CycleReport {
  uint32_t cycle = 0;
  AcquisitionStatus fetchStatus = AcquisitionStatus::Ok;
  // Rendered from the snapshot of an earlier cycle.
  bool usedCachedSnapshot = false;
  bool rendered = false;
  // Abandoned because a stop was requested while fetching.
  bool abandoned = false;
  uint8_t pushedCount = 0;
  // Bit per DisplayId whose backlight or push failed.
  uint8_t failedMask = 0;
  uint32_t elapsedMs = 0;
};

// Fetch -> render -> push on a fixed-delay cadence. Sole writer to the panels.
class StationScheduler {
 public:
  StationScheduler(const StationSettings &settings, WeatherSource &source,
                   DisplayDriver &displays, StationClock &clock);

  // Plain function sink for log lines (no trailing newline).
  void bindLogger(void (*logger)(const char *line));

  // One fetch/render/push pass. Never fails; errors are logged and reported.
  CycleReport runCycle();

  // Sleep until the next cycle is due; returns early on a stop request.
  void waitForNextCycle();

  // runCycle() + waitForNextCycle(). Returns false once stopped.
  bool step();

  // Loop until requestStop().
  void run();

  // Safe to call from another task.
  void requestStop() { stopRequested_.store(true); }

  // Flag owned by the caller (e.g. set from an ISR); once true it counts as a
  // stop request.
  void bindStopSignal(const volatile bool *signal) { stopSignal_ = signal; }

  bool stopRequested() const {
    return stopRequested_.load() || (stopSignal_ != nullptr && *stopSignal_);
  }

  CycleState state() const { return state_; }
  uint32_t cycleCount() const { return cycleCount_; }
  bool hasSnapshot() const { return hasSnapshot_; }
  const WeatherSnapshot &snapshot() const { return snapshot_; }
  const StationSettings &settings() const { return settings_; }

  // Delay between the end of a cycle and the start of the next one.
  uint32_t delayAfterCycleMs(uint32_t elapsedMs) const;

 private:
  void pushAll(const RenderedImage *images, CycleReport &report);
  uint8_t backlightFor(DisplayId id) const;
  void log(const char *fmt, ...);

  const StationSettings settings_;
  WeatherSource &source_;
  DisplayDriver &displays_;
  StationClock &clock_;
  void (*logger_)(const char *line) = nullptr;

  MainRenderer mainRenderer_;
  LeftRenderer leftRenderer_;
  RightRenderer rightRenderer_;

  CycleState state_ = CycleState::Idle;
  std::atomic<bool> stopRequested_{false};
  const volatile bool *stopSignal_ = nullptr;
  uint32_t cycleCount_ = 0;
  uint32_t cycleStartMs_ = 0;

  WeatherSnapshot snapshot_;
  bool hasSnapshot_ = false;
  uint32_t snapshotCycle_ = 0;

  // Last level successfully applied per display; -1 when unknown.
  int16_t appliedBacklight_[DISPLAY_COUNT] = {-1, -1, -1};
};
