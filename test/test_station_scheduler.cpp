#include <gtest/gtest.h>

#include <string.h>

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "station_scheduler.h"

namespace {

class FakeClock : public StationClock {
 public:
  uint32_t nowMs() override { return now; }
  void sleepMs(uint32_t ms) override {
    sleeps.push_back(ms);
    now += ms;
    if (stopAfterSleeps && sleeps.size() == stopAfterSleeps && stopTarget) {
      stopTarget->requestStop();
    }
  }

  uint32_t totalSlept() const {
    uint32_t total = 0;
    for (uint32_t s : sleeps) total += s;
    return total;
  }

  uint32_t now = 1000;
  std::vector<uint32_t> sleeps;
  size_t stopAfterSleeps = 0;
  StationScheduler *stopTarget = nullptr;
};

class FakeSource : public WeatherSource {
 public:
  explicit FakeSource(FakeClock &clock) : clock_(clock) {}

  AcquisitionStatus fetch(const StationSettings &, WeatherSnapshot &out) override {
    fetchStarts.push_back(clock_.now);
    clock_.now += fetchDurationMs;
    AcquisitionStatus status = AcquisitionStatus::Network;
    if (!results.empty()) {
      status = results.front().first;
      if (status == AcquisitionStatus::Ok) out = results.front().second;
      results.pop_front();
    }
    if (stopOnFetch && fetchStarts.size() == stopOnFetch && stopTarget) {
      stopTarget->requestStop();
    }
    return status;
  }

  void succeed(const WeatherSnapshot &snap) { results.emplace_back(AcquisitionStatus::Ok, snap); }
  void fail(AcquisitionStatus status) { results.emplace_back(status, WeatherSnapshot()); }

  std::deque<std::pair<AcquisitionStatus, WeatherSnapshot>> results;
  std::vector<uint32_t> fetchStarts;
  uint32_t fetchDurationMs = 0;
  size_t stopOnFetch = 0;
  StationScheduler *stopTarget = nullptr;

 private:
  FakeClock &clock_;
};

class RecordingDisplays : public DisplayDriver {
 public:
  bool pushImage(DisplayId id, const RenderedImage &image) override {
    pushes.emplace_back(id, image);
    return !failing[displayIndex(id)];
  }

  bool setBacklight(DisplayId id, uint8_t level) override {
    backlights.emplace_back(id, level);
    return !failing[displayIndex(id)];
  }

  size_t pushCount(DisplayId id) const {
    size_t n = 0;
    for (const auto &p : pushes) {
      if (p.first == id) ++n;
    }
    return n;
  }

  std::vector<std::pair<DisplayId, RenderedImage>> pushes;
  std::vector<std::pair<DisplayId, uint8_t>> backlights;
  bool failing[DISPLAY_COUNT] = {false, false, false};
};

std::vector<std::string> gLogLines;

void captureLog(const char *line) { gLogLines.push_back(line); }

bool logContains(const std::string &fragment) {
  for (const auto &line : gLogLines) {
    if (line.find(fragment) != std::string::npos) return true;
  }
  return false;
}

WeatherSnapshot snapshotAt(float temperature) {
  WeatherSnapshot snap;
  snap.temperature = temperature;
  snap.tempHigh = 17.0f;
  snap.tempLow = 9.0f;
  snap.humidity = 70.0f;
  snap.windSpeed = 12.0f;
  snap.conditionCode = 1;
  strcpy(snap.sunrise, "06:42");
  strcpy(snap.sunset, "20:15");
  return snap;
}

class StationSchedulerTest : public ::testing::Test {
 protected:
  StationSchedulerTest() : source(clock), scheduler(settings, source, displays, clock) {
    gLogLines.clear();
    scheduler.bindLogger(captureLog);
  }

  StationSettings settings;
  FakeClock clock;
  FakeSource source;
  RecordingDisplays displays;
  StationScheduler scheduler;
};

}  // namespace

TEST_F(StationSchedulerTest, SuccessfulCyclePushesAllDisplays) {
  source.succeed(snapshotAt(15.2f));

  CycleReport report = scheduler.runCycle();

  EXPECT_EQ(report.cycle, 1u);
  EXPECT_EQ(report.fetchStatus, AcquisitionStatus::Ok);
  EXPECT_TRUE(report.rendered);
  EXPECT_FALSE(report.usedCachedSnapshot);
  EXPECT_EQ(report.pushedCount, 3);
  EXPECT_EQ(report.failedMask, 0);
  EXPECT_EQ(scheduler.state(), CycleState::Idle);
  ASSERT_TRUE(scheduler.hasSnapshot());
  EXPECT_FLOAT_EQ(scheduler.snapshot().temperature, 15.2f);

  ASSERT_EQ(displays.pushes.size(), 3u);
  EXPECT_EQ(displays.pushes[0].first, DisplayId::Main);
  EXPECT_EQ(displays.pushes[1].first, DisplayId::Left);
  EXPECT_EQ(displays.pushes[2].first, DisplayId::Right);
  EXPECT_TRUE(displays.pushes[0].second.containsText("Streatham"));
  EXPECT_TRUE(displays.pushes[0].second.containsText("15.2\xC2\xB0"));
  EXPECT_TRUE(displays.pushes[0].second.containsText("17/9"));
  EXPECT_TRUE(displays.pushes[1].second.containsText("70%"));
  EXPECT_TRUE(displays.pushes[1].second.containsText("12"));
  EXPECT_TRUE(displays.pushes[2].second.containsText("06:42"));
  EXPECT_TRUE(displays.pushes[2].second.containsText("20:15"));
  EXPECT_TRUE(logContains("[cycle 1] fetch ok: 15.2 C"));
}

TEST_F(StationSchedulerTest, BacklightsAppliedOnceFromSettings) {
  source.succeed(snapshotAt(15.2f));
  source.succeed(snapshotAt(15.4f));

  scheduler.runCycle();
  scheduler.runCycle();

  ASSERT_EQ(displays.backlights.size(), 3u);
  EXPECT_EQ(displays.backlights[0], std::make_pair(DisplayId::Main, uint8_t(90)));
  EXPECT_EQ(displays.backlights[1], std::make_pair(DisplayId::Left, uint8_t(45)));
  EXPECT_EQ(displays.backlights[2], std::make_pair(DisplayId::Right, uint8_t(45)));
  EXPECT_EQ(displays.pushes.size(), 6u);
}

TEST_F(StationSchedulerTest, FailedFetchReusesCachedSnapshot) {
  source.succeed(snapshotAt(15.2f));
  source.fail(AcquisitionStatus::Network);

  scheduler.runCycle();
  CycleReport report = scheduler.runCycle();

  EXPECT_EQ(report.fetchStatus, AcquisitionStatus::Network);
  EXPECT_TRUE(report.usedCachedSnapshot);
  EXPECT_TRUE(report.rendered);
  EXPECT_EQ(report.pushedCount, 3);
  ASSERT_EQ(displays.pushes.size(), 6u);
  // Side panels repeat the cached frame; the main panel adds the stale mark.
  EXPECT_EQ(displays.pushes[1].second, displays.pushes[4].second);
  EXPECT_EQ(displays.pushes[2].second, displays.pushes[5].second);
  EXPECT_EQ(displays.pushes[3].second,
            MainRenderer().render(snapshotAt(15.2f), settings, true));
  EXPECT_NE(displays.pushes[0].second, displays.pushes[3].second);
  EXPECT_FLOAT_EQ(scheduler.snapshot().temperature, 15.2f);
  EXPECT_TRUE(logContains("fetch failed (network), keeping snapshot from cycle 1"));
}

TEST_F(StationSchedulerTest, ParseErrorDoesNotTouchCache) {
  source.succeed(snapshotAt(15.2f));
  source.fail(AcquisitionStatus::ParseError);

  scheduler.runCycle();
  CycleReport report = scheduler.runCycle();

  EXPECT_EQ(report.fetchStatus, AcquisitionStatus::ParseError);
  EXPECT_TRUE(report.usedCachedSnapshot);
  EXPECT_FLOAT_EQ(scheduler.snapshot().temperature, 15.2f);
}

TEST_F(StationSchedulerTest, FirstCycleFailureSkipsPush) {
  source.fail(AcquisitionStatus::BadStatus);

  CycleReport report = scheduler.runCycle();

  EXPECT_EQ(report.fetchStatus, AcquisitionStatus::BadStatus);
  EXPECT_FALSE(report.rendered);
  EXPECT_EQ(report.pushedCount, 0);
  EXPECT_FALSE(scheduler.hasSnapshot());
  EXPECT_TRUE(displays.pushes.empty());
  EXPECT_TRUE(displays.backlights.empty());
  EXPECT_TRUE(logContains("fetch failed (bad-status), no data yet, skipping render"));

  // The next successful cycle recovers normally.
  source.succeed(snapshotAt(11.0f));
  report = scheduler.runCycle();
  EXPECT_EQ(report.pushedCount, 3);
}

TEST_F(StationSchedulerTest, OneFailingDisplayDoesNotBlockOthers) {
  source.succeed(snapshotAt(15.2f));
  displays.failing[displayIndex(DisplayId::Left)] = true;

  CycleReport report = scheduler.runCycle();

  EXPECT_EQ(report.pushedCount, 2);
  EXPECT_EQ(report.failedMask, 1u << displayIndex(DisplayId::Left));
  EXPECT_EQ(displays.pushCount(DisplayId::Main), 1u);
  EXPECT_EQ(displays.pushCount(DisplayId::Left), 1u);
  EXPECT_EQ(displays.pushCount(DisplayId::Right), 1u);
  EXPECT_TRUE(logContains("display left push failed"));
}

TEST_F(StationSchedulerTest, BacklightRetriedAfterFailure) {
  source.succeed(snapshotAt(15.2f));
  source.succeed(snapshotAt(15.2f));
  displays.failing[displayIndex(DisplayId::Right)] = true;

  scheduler.runCycle();
  displays.failing[displayIndex(DisplayId::Right)] = false;
  scheduler.runCycle();

  size_t rightCalls = 0;
  size_t mainCalls = 0;
  for (const auto &b : displays.backlights) {
    if (b.first == DisplayId::Right) ++rightCalls;
    if (b.first == DisplayId::Main) ++mainCalls;
  }
  EXPECT_EQ(rightCalls, 2u);
  EXPECT_EQ(mainCalls, 1u);
}

TEST_F(StationSchedulerTest, FixedDelayCadence) {
  source.fetchDurationMs = 4000;
  source.succeed(snapshotAt(15.2f));
  source.succeed(snapshotAt(15.3f));

  EXPECT_TRUE(scheduler.step());
  EXPECT_EQ(clock.totalSlept(), 296000u);
  for (uint32_t s : clock.sleeps) EXPECT_LE(s, 200u);

  EXPECT_TRUE(scheduler.step());
  ASSERT_EQ(source.fetchStarts.size(), 2u);
  EXPECT_EQ(source.fetchStarts[1] - source.fetchStarts[0], 300000u);
}

TEST_F(StationSchedulerTest, OverlongCycleStartsNextImmediately) {
  source.fetchDurationMs = 320000;
  source.succeed(snapshotAt(15.2f));

  EXPECT_TRUE(scheduler.step());
  EXPECT_TRUE(clock.sleeps.empty());
  EXPECT_EQ(scheduler.delayAfterCycleMs(320000), 0u);
  EXPECT_EQ(scheduler.delayAfterCycleMs(300000), 0u);
  EXPECT_EQ(scheduler.delayAfterCycleMs(299999), 1u);
}

TEST_F(StationSchedulerTest, FreshFetchClearsStaleMark) {
  source.succeed(snapshotAt(15.2f));
  source.fail(AcquisitionStatus::Network);
  source.succeed(snapshotAt(15.2f));

  scheduler.runCycle();
  scheduler.runCycle();
  scheduler.runCycle();

  ASSERT_EQ(displays.pushes.size(), 9u);
  EXPECT_EQ(displays.pushes[0].second, displays.pushes[6].second);
}

TEST(StationSchedulerInterval, LongestIntervalDoesNotWrap) {
  StationSettings settings;
  settings.refreshIntervalSec = STATION_MAX_REFRESH_SEC;
  FakeClock clock;
  FakeSource source(clock);
  RecordingDisplays displays;
  StationScheduler scheduler(settings, source, displays, clock);
  EXPECT_EQ(scheduler.delayAfterCycleMs(0), 86400000u);
  EXPECT_EQ(scheduler.delayAfterCycleMs(4000), 86396000u);
}

TEST(StationSchedulerInterval, OutOfRangeIntervalSaturates) {
  StationSettings settings;
  settings.refreshIntervalSec = 4294968;
  FakeClock clock;
  FakeSource source(clock);
  RecordingDisplays displays;
  StationScheduler scheduler(settings, source, displays, clock);
  EXPECT_EQ(scheduler.delayAfterCycleMs(0), UINT32_MAX);
  EXPECT_GE(scheduler.delayAfterCycleMs(1000), 60000u);
}

TEST_F(StationSchedulerTest, BoundStopSignalEndsWait) {
  static volatile bool buttonPressed = false;
  buttonPressed = false;
  scheduler.bindStopSignal(&buttonPressed);
  source.succeed(snapshotAt(15.2f));

  EXPECT_TRUE(scheduler.runCycle().rendered);
  EXPECT_FALSE(scheduler.stopRequested());

  buttonPressed = true;
  EXPECT_TRUE(scheduler.stopRequested());
  scheduler.waitForNextCycle();
  EXPECT_TRUE(clock.sleeps.empty());
  EXPECT_FALSE(scheduler.step());
  EXPECT_EQ(source.fetchStarts.size(), 1u);
}

TEST_F(StationSchedulerTest, StopDuringSleepEndsWait) {
  source.succeed(snapshotAt(15.2f));
  clock.stopTarget = &scheduler;
  clock.stopAfterSleeps = 5;

  EXPECT_FALSE(scheduler.step());
  EXPECT_EQ(clock.sleeps.size(), 5u);
  EXPECT_EQ(clock.totalSlept(), 1000u);
  EXPECT_TRUE(scheduler.stopRequested());
  EXPECT_FALSE(scheduler.step());
  EXPECT_EQ(source.fetchStarts.size(), 1u);
}

TEST_F(StationSchedulerTest, StopDuringFetchAbandonsCycle) {
  source.succeed(snapshotAt(15.2f));
  source.stopTarget = &scheduler;
  source.stopOnFetch = 1;

  CycleReport report = scheduler.runCycle();

  EXPECT_TRUE(report.abandoned);
  EXPECT_FALSE(report.rendered);
  EXPECT_TRUE(displays.pushes.empty());
  EXPECT_FALSE(scheduler.hasSnapshot());
}

TEST_F(StationSchedulerTest, RunLoopsUntilStopped) {
  source.succeed(snapshotAt(15.2f));
  source.succeed(snapshotAt(15.3f));
  source.succeed(snapshotAt(15.4f));
  source.stopTarget = &scheduler;
  source.stopOnFetch = 3;

  scheduler.run();

  EXPECT_EQ(scheduler.cycleCount(), 3u);
  EXPECT_EQ(displays.pushes.size(), 6u);
  EXPECT_EQ(scheduler.state(), CycleState::Idle);
  EXPECT_TRUE(logContains("starting, every 300 s"));
  EXPECT_TRUE(logContains("stopped"));
}

TEST(CycleState, Names) {
  EXPECT_STREQ(cycleStateName(CycleState::Idle), "idle");
  EXPECT_STREQ(cycleStateName(CycleState::Fetching), "fetching");
  EXPECT_STREQ(cycleStateName(CycleState::Rendering), "rendering");
  EXPECT_STREQ(cycleStateName(CycleState::Pushing), "pushing");
  EXPECT_STREQ(acquisitionStatusName(AcquisitionStatus::ParseError), "parse-error");
}
