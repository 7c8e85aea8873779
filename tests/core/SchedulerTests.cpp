#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/Scheduler.h"
#include "TestFakes.h"

#include <algorithm>

using namespace redub;
using Catch::Matchers::WithinAbs;

namespace {

struct Fixture {
    AudioEngine engine;
    PlaybackSet playbackSet{engine};
    Scheduler scheduler{engine, playbackSet};
    SegmentStore store{48000.0};
    std::vector<DubSegment> segments;

    void addSegment(const std::string& id, double start, double end, double clipSeconds)
    {
        DubSegment seg;
        seg.id = id;
        seg.startTime = start;
        seg.endTime = end;
        segments.push_back(seg);
        if (clipSeconds > 0.0)
            store.put(id, test::makeClipSeconds(clipSeconds));
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Safe play times
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Scheduler pushes tight dialogue apart by clip length plus gap")
{
    Fixture f;
    f.addSegment("s1", 0.0, 1.0, 1.2);
    f.addSegment("s2", 1.0, 1.3, 0.3);
    f.addSegment("s3", 1.05, 1.5, 0.5);

    const double end = f.scheduler.scheduleAll(f.segments, f.store, 0.0);

    const auto& pass = f.scheduler.getLastPass();
    REQUIRE(pass.size() == 3);
    CHECK_THAT(pass[0].safePlayTime, WithinAbs(0.0, 1e-9));
    CHECK_THAT(pass[1].safePlayTime, WithinAbs(1.3, 1e-9));
    CHECK_THAT(pass[2].safePlayTime, WithinAbs(1.7, 1e-9));
    CHECK_THAT(end, WithinAbs(2.2, 1e-9));
    CHECK_THAT(f.scheduler.getLastSegmentEnd(), WithinAbs(2.2, 1e-9));
}

TEST_CASE("Scheduler keeps source timing when lines are far apart")
{
    Fixture f;
    f.addSegment("s1", 0.5, 1.5, 0.8);
    f.addSegment("s2", 4.0, 5.0, 0.8);

    f.scheduler.scheduleAll(f.segments, f.store, 0.0);
    const auto& pass = f.scheduler.getLastPass();
    CHECK_THAT(pass[0].safePlayTime, WithinAbs(0.5, 1e-9));
    CHECK_THAT(pass[1].safePlayTime, WithinAbs(4.0, 1e-9));
}

TEST_CASE("Scheduler processes segments in ascending start time")
{
    Fixture f;
    f.addSegment("late", 3.0, 4.0, 0.5);
    f.addSegment("early", 1.0, 2.0, 0.5);

    f.scheduler.scheduleAll(f.segments, f.store, 0.0);
    const auto& pass = f.scheduler.getLastPass();
    REQUIRE(pass.size() == 2);
    CHECK(pass[0].segmentId == "early");
    CHECK(pass[1].segmentId == "late");
}

TEST_CASE("Scheduler never lets adjacent clips come closer than the gap")
{
    Fixture f;
    juce::Random random(1234);
    double start = 0.0;
    for (int i = 0; i < 40; ++i)
    {
        start += random.nextDouble() * 1.5;
        const double clip = 0.1 + random.nextDouble() * 2.0;
        f.addSegment("s" + std::to_string(i), start, start + 0.5, clip);
    }

    f.scheduler.scheduleAll(f.segments, f.store, 0.0);
    const auto& pass = f.scheduler.getLastPass();
    REQUIRE(pass.size() == 40);
    for (size_t i = 0; i + 1 < pass.size(); ++i)
    {
        CHECK(pass[i + 1].safePlayTime
              >= pass[i].safePlayTime + pass[i].duration + Scheduler::kGapSeconds - 1e-9);
    }
}

TEST_CASE("Scheduler skips segments without audio and leaves the cursor alone")
{
    Fixture f;
    f.addSegment("s1", 0.0, 1.0, 1.0);
    f.addSegment("missing", 1.0, 2.0, 0.0);
    f.addSegment("s3", 1.5, 2.0, 0.5);

    const double end = f.scheduler.scheduleAll(f.segments, f.store, 0.0);
    const auto& pass = f.scheduler.getLastPass();
    REQUIRE(pass.size() == 2);
    CHECK(pass[1].segmentId == "s3");
    CHECK_THAT(pass[1].safePlayTime, WithinAbs(1.5, 1e-9));
    CHECK_THAT(end, WithinAbs(2.0, 1e-9));
    CHECK_FALSE(f.playbackSet.contains("missing"));
}

TEST_CASE("Scheduler results do not depend on an earlier pass")
{
    Fixture f;
    f.addSegment("s1", 0.0, 1.0, 1.2);
    f.addSegment("s2", 1.0, 1.3, 0.3);

    f.scheduler.scheduleAll(f.segments, f.store, 0.0);
    auto first = f.scheduler.getLastPass();

    // Leave the cursor somewhere far away before the next pass
    DubSegment stray;
    stray.id = "stray";
    stray.startTime = 50.0;
    stray.endTime = 51.0;
    f.scheduler.scheduleSegment(stray, test::makeClipSeconds(3.0), 0.0);
    REQUIRE(f.scheduler.getLastSegmentEnd() > 50.0);

    f.scheduler.scheduleAll(f.segments, f.store, 0.0);
    const auto& second = f.scheduler.getLastPass();
    REQUIRE(second.size() == first.size());
    for (size_t i = 0; i < first.size(); ++i)
        CHECK(second[i].safePlayTime == first[i].safePlayTime);
}

TEST_CASE("Scheduler computeSafePlayTime follows the cursor")
{
    Fixture f;
    CHECK(f.scheduler.computeSafePlayTime(0.7) == 0.7);

    DubSegment seg;
    seg.id = "s";
    seg.startTime = 0.0;
    seg.endTime = 1.0;
    f.scheduler.scheduleSegment(seg, test::makeClipSeconds(1.0), 0.0);

    CHECK_THAT(f.scheduler.computeSafePlayTime(0.2), WithinAbs(1.1, 1e-9));
    CHECK(f.scheduler.computeSafePlayTime(5.0) == 5.0);

    f.scheduler.resetCursor();
    CHECK(f.scheduler.getLastSegmentEnd() == 0.0);
    CHECK(f.scheduler.computeSafePlayTime(0.0) == 0.0);
}

// ═══════════════════════════════════════════════════════════════════
// Engine placement
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Scheduler starts voices relative to the engine clock")
{
    Fixture f;
    f.engine.render(4800);
    f.addSegment("s1", 0.0, 1.0, 0.5);
    f.addSegment("s2", 2.0, 3.0, 0.5);

    f.scheduler.scheduleAll(f.segments, f.store, 0.0);
    const auto& pass = f.scheduler.getLastPass();
    CHECK_THAT(pass[0].startAt, WithinAbs(0.1, 1e-9));
    CHECK_THAT(pass[1].startAt, WithinAbs(2.1, 1e-9));
    CHECK(pass[0].voiceId > 0);
    CHECK(f.playbackSet.getVoiceId("s1") == pass[0].voiceId);
    CHECK(f.playbackSet.getVoiceId("s2") == pass[1].voiceId);
}

TEST_CASE("Scheduler starts clips already behind the anchor immediately")
{
    Fixture f;
    f.addSegment("past", 1.0, 2.0, 0.5);
    f.addSegment("future", 5.0, 6.0, 0.5);

    f.scheduler.scheduleAll(f.segments, f.store, 3.0);
    const auto& pass = f.scheduler.getLastPass();
    CHECK(pass[0].startAt == 0.0);
    CHECK_THAT(pass[1].startAt, WithinAbs(2.0, 1e-9));
}

TEST_CASE("Scheduled clips are heard at their placed time")
{
    Fixture f;
    f.addSegment("s1", 0.0, 1.0, 0.01);     // 480 samples
    f.addSegment("s2", 0.0, 1.0, 0.01);     // pushed to 0.11 s = sample 5280

    f.scheduler.scheduleAll(f.segments, f.store, 0.0);

    juce::AudioBuffer<float> out(2, 6000);
    out.clear();
    f.engine.render(out);
    CHECK(out.getSample(0, 0) == 0.5f);
    CHECK(out.getSample(0, 479) == 0.5f);
    CHECK(out.getSample(0, 480) == 0.0f);
    CHECK(out.getSample(0, 5279) == 0.0f);
    CHECK(out.getSample(0, 5280) == 0.5f);
}

TEST_CASE("Scheduler scheduleSegment refuses a missing clip")
{
    Fixture f;
    DubSegment seg;
    seg.id = "s";
    ScheduledClip placed;
    CHECK_FALSE(f.scheduler.scheduleSegment(seg, nullptr, 0.0, VoiceRoute::mixBus, &placed));
    CHECK(f.scheduler.getLastSegmentEnd() == 0.0);
}

TEST_CASE("Scheduler preview clips use the preview handle")
{
    Fixture f;
    DubSegment seg;
    seg.id = "seg-3-1";
    seg.startTime = 2.0;
    seg.endTime = 3.0;

    ScheduledClip placed;
    REQUIRE(f.scheduler.scheduleSegment(seg, test::makeClipSeconds(0.5), 2.0,
                                        VoiceRoute::monitorOnly, &placed));
    CHECK(placed.startAt == 0.0);
    CHECK(f.playbackSet.contains(PlaybackSet::kPreviewHandle));
    CHECK_FALSE(f.playbackSet.contains("seg-3-1"));
}

TEST_CASE("Scheduler long timelines play every clip at its placed time")
{
    EngineConfig config;
    config.sampleRate = 16000.0;
    config.blockSize = 256;
    AudioEngine engine(config);
    PlaybackSet playbackSet(engine);
    Scheduler scheduler(engine, playbackSet);
    SegmentStore store(config.sampleRate);

    std::vector<DubSegment> segments;
    for (int i = 0; i < 200; ++i)
    {
        DubSegment seg;
        seg.id = "s" + std::to_string(i);
        seg.startTime = i * 0.05;
        seg.endTime = seg.startTime + 0.05;
        segments.push_back(seg);
        store.put(seg.id, test::makeClipSeconds(0.1, config.sampleRate));
    }

    test::FakeRecorder recorder;
    recorder.recording = true;
    engine.setCaptureSink(&recorder);

    const double end = scheduler.scheduleAll(segments, store, 0.0);
    const auto& pass = scheduler.getLastPass();
    REQUIRE(pass.size() == 200);
    CHECK_THAT(end, WithinAbs(39.9, 1e-6));
    CHECK(engine.getActiveVoiceCount() == 200);

    int ended = 0;
    std::vector<EngineEvent> events;
    test::advance(engine, 40.5, [&](const juce::AudioBuffer<float>&) {
        events.clear();
        engine.pollEvents(events);
        ended += static_cast<int>(events.size());
    });
    CHECK(ended == 200);
    CHECK(engine.getActiveVoiceCount() == 0);

    const auto last = static_cast<size_t>(std::llround(pass.back().startAt * config.sampleRate));
    REQUIRE(recorder.captured.size() > last + 1600);
    CHECK(recorder.captured[last - 1] == 0.0f);
    CHECK(recorder.captured[last] == 0.5f);
    CHECK(recorder.captured[last + 1599] == 0.5f);
    CHECK(recorder.captured[last + 1600] == 0.0f);

    // One burst of audio per line
    int onsets = recorder.captured.front() != 0.0f ? 1 : 0;
    for (size_t i = 1; i < recorder.captured.size(); ++i)
    {
        if (recorder.captured[i] != 0.0f && recorder.captured[i - 1] == 0.0f)
            ++onsets;
    }
    CHECK(onsets == 200);
}
