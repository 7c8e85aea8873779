#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/DubSession.h"
#include "TestFakes.h"

using namespace redub;
using Catch::Matchers::WithinAbs;

static constexpr double kRate = 16000.0;

static EngineConfig makeConfig()
{
    EngineConfig config;
    config.sampleRate = kRate;
    config.blockSize = 256;
    return config;
}

namespace {

struct Fixture {
    test::FakeSynthesisService synth;
    test::FakeRecorder recorder;
    DubSession session{makeConfig(), synth, recorder};

    void attachSilentProgram(double seconds)
    {
        std::string error;
        auto program = test::makeConstClip(2, static_cast<int>(seconds * kRate), 0.0f, kRate);
        REQUIRE(session.getEngine().attachProgramAudio(program, seconds, error));
    }

    /// Loads one segment per (start, end) pair; clipSeconds > 0 stores audio for it.
    void load(const std::vector<std::pair<double, double>>& times, double clipSeconds)
    {
        std::vector<AnalyzedSegment> analyzed;
        for (const auto& [start, end] : times)
        {
            AnalyzedSegment a;
            a.startTime = start;
            a.endTime = end;
            a.translatedText = "line";
            a.speakerLabel = "Speaker 1";
            analyzed.push_back(a);
        }
        session.getProject().loadSegments(analyzed);
        if (clipSeconds > 0.0)
        {
            for (const auto& seg : session.getProject().getSegments())
                session.getStore().put(seg.id, test::makeClipSeconds(clipSeconds, kRate));
        }
    }

    const std::string& idAt(int index)
    {
        return session.getProject().getSegments()[static_cast<size_t>(index)].id;
    }

    void run(double seconds)
    {
        test::advance(session.getEngine(), seconds,
                      [this](const juce::AudioBuffer<float>&) { session.update(); });
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Full preview
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Full preview plays the timeline and stops once everything ended")
{
    Fixture f;
    f.attachSilentProgram(1.0);
    f.load({{0.0, 0.4}, {0.9, 1.4}}, 0.5);
    auto& playback = f.session.getPlayback();

    playback.toggleFullPreview();
    CHECK(playback.getState() == PlaybackState::playingFull);
    CHECK(playback.isPlaying());
    CHECK(f.session.getPlaybackSet().size() == 2);

    f.run(0.5);
    CHECK(f.session.getEngine().isTransportPlaying());

    // Video is over but the second line runs until 1.4 s
    f.run(0.6);
    CHECK_FALSE(f.session.getEngine().isTransportPlaying());
    CHECK(playback.getState() == PlaybackState::playingFull);

    f.run(0.4);
    CHECK(playback.getState() == PlaybackState::stopped);
    CHECK(f.session.getPlaybackSet().empty());
}

TEST_CASE("Full preview toggles off")
{
    Fixture f;
    f.attachSilentProgram(5.0);
    f.load({{0.0, 2.0}, {2.5, 4.0}}, 1.5);
    auto& playback = f.session.getPlayback();

    playback.toggleFullPreview();
    f.run(0.2);
    REQUIRE(f.session.getEngine().getActiveVoiceCount() == 2);

    playback.toggleFullPreview();
    CHECK(playback.getState() == PlaybackState::stopped);
    CHECK(f.session.getPlaybackSet().empty());

    f.run(0.1);
    CHECK(f.session.getEngine().getActiveVoiceCount() == 0);
    CHECK(f.session.getEngine().getTransportState() == TransportState::paused);
}

TEST_CASE("Full preview restarts from the beginning at full monitor level")
{
    Fixture f;
    f.attachSilentProgram(5.0);
    f.load({{1.0, 2.0}}, 0.5);
    auto& engine = f.session.getEngine();

    engine.setMonitorGain(0.0f);
    engine.transportSeek(3.0);
    engine.render(256);

    f.session.getPlayback().toggleFullPreview();
    CHECK(engine.getMonitorGain() == 1.0f);
    engine.render(256);
    CHECK_THAT(engine.getTransportPosition(), WithinAbs(256.0 / kRate, 1e-9));
}

TEST_CASE("Full preview with nothing synthesized still runs the video")
{
    Fixture f;
    f.attachSilentProgram(0.5);
    f.load({{0.0, 0.4}}, 0.0);
    auto& playback = f.session.getPlayback();

    playback.toggleFullPreview();
    CHECK(f.session.getPlaybackSet().empty());
    f.run(0.6);
    CHECK(playback.getState() == PlaybackState::stopped);
}

// ═══════════════════════════════════════════════════════════════════
// Single-segment preview
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Segment preview plays on the monitor and stops on its own")
{
    Fixture f;
    f.attachSilentProgram(5.0);
    f.load({{2.0, 3.0}}, 0.3);
    auto& playback = f.session.getPlayback();
    auto& engine = f.session.getEngine();

    std::string error;
    REQUIRE(playback.previewSegment(f.idAt(0), error));
    CHECK(playback.getState() == PlaybackState::playingSingle);
    CHECK(f.session.getPlaybackSet().contains(PlaybackSet::kPreviewHandle));

    // Heard right away, from the segment's place in the video
    juce::AudioBuffer<float> out(2, 256);
    out.clear();
    engine.render(out);
    CHECK(out.getSample(0, 0) == 0.5f);
    CHECK_THAT(engine.getTransportPosition(), WithinAbs(2.0 + 256.0 / kRate, 1e-9));
    f.session.update();

    // Auto-stop at segment duration (1.0) + 1.5 s
    f.run(2.4 - 256.0 / kRate);
    CHECK(playback.getState() == PlaybackState::playingSingle);
    f.run(0.2);
    CHECK(playback.getState() == PlaybackState::stopped);
    CHECK(engine.getTransportState() == TransportState::paused);
}

TEST_CASE("Segment preview is not captured")
{
    Fixture f;
    f.attachSilentProgram(5.0);
    f.load({{0.0, 1.0}}, 0.3);
    f.recorder.recording = true;
    f.session.getEngine().setCaptureSink(&f.recorder);

    std::string error;
    REQUIRE(f.session.getPlayback().previewSegment(f.idAt(0), error));
    f.run(0.5);
    CHECK_FALSE(f.recorder.captured.empty());
    CHECK(f.recorder.capturedPeak() == 0.0f);
}

TEST_CASE("Segment preview replaces a full preview")
{
    Fixture f;
    f.attachSilentProgram(5.0);
    f.load({{0.0, 2.0}, {2.5, 4.0}}, 1.5);
    auto& playback = f.session.getPlayback();

    playback.toggleFullPreview();
    f.run(0.1);

    std::string error;
    REQUIRE(playback.previewSegment(f.idAt(1), error));
    CHECK(playback.getState() == PlaybackState::playingSingle);
    CHECK(f.session.getPlaybackSet().size() == 1);

    f.run(0.1);
    CHECK(f.session.getEngine().getActiveVoiceCount() == 1);

    // And a full preview replaces it again
    playback.toggleFullPreview();
    CHECK(playback.getState() == PlaybackState::playingFull);
    CHECK_FALSE(f.session.getPlaybackSet().contains(PlaybackSet::kPreviewHandle));
}

TEST_CASE("Previewing the same segment twice keeps one instance")
{
    Fixture f;
    f.attachSilentProgram(5.0);
    f.load({{0.0, 2.0}}, 1.5);
    auto& playback = f.session.getPlayback();

    std::string error;
    REQUIRE(playback.previewSegment(f.idAt(0), error));
    f.run(0.1);
    REQUIRE(playback.previewSegment(f.idAt(0), error));
    f.run(0.1);
    CHECK(f.session.getEngine().getActiveVoiceCount() == 1);
}

TEST_CASE("Segment preview fails for unknown or silent segments")
{
    Fixture f;
    f.attachSilentProgram(5.0);
    f.load({{0.0, 1.0}}, 0.0);
    auto& playback = f.session.getPlayback();

    std::string error;
    CHECK_FALSE(playback.previewSegment("seg-99-1", error));
    CHECK_FALSE(error.empty());

    error.clear();
    CHECK_FALSE(playback.previewSegment(f.idAt(0), error));
    CHECK_FALSE(error.empty());
    CHECK(playback.getState() == PlaybackState::stopped);
}

TEST_CASE("A failed preview leaves the running playback alone")
{
    Fixture f;
    f.attachSilentProgram(5.0);
    f.load({{0.0, 1.0}}, 0.5);
    auto& playback = f.session.getPlayback();

    playback.toggleFullPreview();
    std::string error;
    CHECK_FALSE(playback.previewSegment("missing", error));
    CHECK(playback.getState() == PlaybackState::playingFull);
    CHECK(f.session.getPlaybackSet().size() == 1);
}

TEST_CASE("PlaybackController stop is idempotent")
{
    Fixture f;
    auto& playback = f.session.getPlayback();
    playback.stop();
    playback.stop();
    CHECK(playback.getState() == PlaybackState::stopped);
    CHECK(std::string(playbackStateName(PlaybackState::playingSingle)) == "playingSingle");
}
