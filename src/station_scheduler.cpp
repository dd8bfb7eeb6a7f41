#include "station_scheduler.h"

#include <stdarg.h>
#include <stdio.h>

#include "station_config.h"
#include "weather_codes.h"

const char *cycleStateName(CycleState state) {
  switch (state) {
    case CycleState::Idle: return "idle";
    case CycleState::Fetching: return "fetching";
    case CycleState::Rendering: return "rendering";
    case CycleState::Pushing: return "pushing";
    default: return "?";
  }
}

StationScheduler::StationScheduler(const StationSettings &settings, WeatherSource &source,
                                   DisplayDriver &displays, StationClock &clock)
    : settings_(settings), source_(source), displays_(displays), clock_(clock) {}

void StationScheduler::bindLogger(void (*logger)(const char *line)) {
  logger_ = logger;
}

void StationScheduler::log(const char *fmt, ...) {
  if (!logger_) return;
  char line[160];
  int prefix = snprintf(line, sizeof(line), "Scheduler: [cycle %lu] ",
                        static_cast<unsigned long>(cycleCount_));
  if (prefix < 0 || prefix >= static_cast<int>(sizeof(line))) prefix = 0;
  va_list args;
  va_start(args, fmt);
  vsnprintf(line + prefix, sizeof(line) - prefix, fmt, args);
  va_end(args);
  logger_(line);
}

uint8_t StationScheduler::backlightFor(DisplayId id) const {
  return id == DisplayId::Main ? settings_.mainBacklight : settings_.sideBacklight;
}

CycleReport StationScheduler::runCycle() {
  CycleReport report;
  cycleStartMs_ = clock_.nowMs();
  report.cycle = ++cycleCount_;

  // Fetching
  state_ = CycleState::Fetching;
  WeatherSnapshot fresh;
  report.fetchStatus = source_.fetch(settings_, fresh);

  if (stopRequested()) {
    log("stop requested during fetch, cycle abandoned");
    report.abandoned = true;
    state_ = CycleState::Idle;
    report.elapsedMs = clock_.nowMs() - cycleStartMs_;
    return report;
  }

  if (report.fetchStatus == AcquisitionStatus::Ok) {
    snapshot_ = fresh;
    hasSnapshot_ = true;
    snapshotCycle_ = report.cycle;
    log("fetch ok: %s C, %s", formatTemperature(snapshot_.temperature).c_str(),
        conditionText(snapshot_.conditionCode));
  } else if (hasSnapshot_) {
    report.usedCachedSnapshot = true;
    log("fetch failed (%s), keeping snapshot from cycle %lu",
        acquisitionStatusName(report.fetchStatus), static_cast<unsigned long>(snapshotCycle_));
  } else {
    log("fetch failed (%s), no data yet, skipping render",
        acquisitionStatusName(report.fetchStatus));
    state_ = CycleState::Idle;
    report.elapsedMs = clock_.nowMs() - cycleStartMs_;
    return report;
  }

  // Rendering
  state_ = CycleState::Rendering;
  const RenderedImage images[DISPLAY_COUNT] = {
      mainRenderer_.render(snapshot_, settings_, report.usedCachedSnapshot),
      leftRenderer_.render(snapshot_, settings_),
      rightRenderer_.render(snapshot_, settings_),
  };
  report.rendered = true;

  // Pushing
  state_ = CycleState::Pushing;
  pushAll(images, report);

  state_ = CycleState::Idle;
  report.elapsedMs = clock_.nowMs() - cycleStartMs_;
  log("done in %lu ms, %u/%u displays updated", static_cast<unsigned long>(report.elapsedMs),
      static_cast<unsigned>(report.pushedCount), static_cast<unsigned>(DISPLAY_COUNT));
  return report;
}

void StationScheduler::pushAll(const RenderedImage *images, CycleReport &report) {
  for (DisplayId id : ALL_DISPLAYS) {
    const uint8_t idx = displayIndex(id);
    const uint8_t level = backlightFor(id);

    if (appliedBacklight_[idx] != level) {
      if (displays_.setBacklight(id, level)) {
        appliedBacklight_[idx] = level;
      } else {
        appliedBacklight_[idx] = -1;
        report.failedMask |= static_cast<uint8_t>(1u << idx);
        log("display %s backlight failed", displayName(id));
      }
    }

    if (displays_.pushImage(id, images[idx])) {
      ++report.pushedCount;
    } else {
      report.failedMask |= static_cast<uint8_t>(1u << idx);
      log("display %s push failed", displayName(id));
    }
  }
}

uint32_t StationScheduler::delayAfterCycleMs(uint32_t elapsedMs) const {
  uint64_t intervalMs = static_cast<uint64_t>(settings_.refreshIntervalSec) * 1000ULL;
  if (intervalMs > UINT32_MAX) intervalMs = UINT32_MAX;
  return elapsedMs >= intervalMs ? 0 : static_cast<uint32_t>(intervalMs - elapsedMs);
}

void StationScheduler::waitForNextCycle() {
  uint32_t remaining = delayAfterCycleMs(clock_.nowMs() - cycleStartMs_);
  while (remaining > 0 && !stopRequested()) {
    uint32_t slice = remaining < SCHEDULER_STOP_POLL_MS ? remaining : SCHEDULER_STOP_POLL_MS;
    clock_.sleepMs(slice);
    remaining -= slice;
  }
}

bool StationScheduler::step() {
  if (stopRequested()) return false;
  runCycle();
  waitForNextCycle();
  return !stopRequested();
}

void StationScheduler::run() {
  log("starting, every %lu s", static_cast<unsigned long>(settings_.refreshIntervalSec));
  while (step()) {
  }
  state_ = CycleState::Idle;
  log("stopped");
}
