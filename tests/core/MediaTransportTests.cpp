#include <catch2/catch_test_macros.hpp>
#include "core/MediaTransport.h"
#include "TestFakes.h"

using namespace redub;

namespace {

// Left = 0.25, right = -0.25 over the whole clip
ProgramMedia makeMedia(int audioSamples, int64_t durationSamples)
{
    juce::AudioBuffer<float> data(2, audioSamples);
    juce::FloatVectorOperations::fill(data.getWritePointer(0), 0.25f, audioSamples);
    juce::FloatVectorOperations::fill(data.getWritePointer(1), -0.25f, audioSamples);
    ProgramMedia media;
    media.audio = ClipBuffer::createFromData(std::move(data), 48000.0, "program");
    media.durationSamples = durationSamples;
    return media;
}

} // namespace

TEST_CASE("MediaTransport starts stopped without media")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    CHECK(t.getState() == TransportState::stopped);
    CHECK(t.getMedia() == nullptr);
    CHECK(t.getDurationInSamples() == 0);
    CHECK(t.getPositionInSamples() == 0);
}

TEST_CASE("MediaTransport play is ignored without media")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    t.play();
    CHECK(t.getState() == TransportState::stopped);
}

TEST_CASE("MediaTransport setMedia returns the previous media and rewinds")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    auto first = makeMedia(4800, 4800);
    auto second = makeMedia(9600, 9600);

    CHECK(t.setMedia(&first) == nullptr);
    t.play();
    t.seek(1000);
    CHECK(t.setMedia(&second) == &first);
    CHECK(t.getState() == TransportState::stopped);
    CHECK(t.getPositionInSamples() == 0);
    CHECK(t.getDurationInSamples() == 9600);
}

TEST_CASE("MediaTransport renders program audio while playing")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    auto media = makeMedia(4800, 4800);
    t.setMedia(&media);

    juce::AudioBuffer<float> buf(2, 512);

    CHECK_FALSE(t.renderAndAdvance(buf, 512));
    CHECK(buf.getMagnitude(0, 512) == 0.0f);
    CHECK(t.getPositionInSamples() == 0);

    t.play();
    CHECK_FALSE(t.renderAndAdvance(buf, 512));
    CHECK(buf.getSample(0, 0) == 0.25f);
    CHECK(buf.getSample(1, 511) == -0.25f);
    CHECK(t.getPositionInSamples() == 512);
    CHECK(t.getPositionInSeconds() == 512.0 / 48000.0);
}

TEST_CASE("MediaTransport pause holds position and silences output")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    auto media = makeMedia(4800, 4800);
    t.setMedia(&media);

    juce::AudioBuffer<float> buf(2, 512);
    t.play();
    t.renderAndAdvance(buf, 512);
    t.pause();
    CHECK(t.getState() == TransportState::paused);

    t.renderAndAdvance(buf, 512);
    CHECK(buf.getMagnitude(0, 512) == 0.0f);
    CHECK(t.getPositionInSamples() == 512);
}

TEST_CASE("MediaTransport reports the end once and pauses there")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    auto media = makeMedia(1000, 1000);
    t.setMedia(&media);
    t.play();

    juce::AudioBuffer<float> buf(2, 512);
    CHECK_FALSE(t.renderAndAdvance(buf, 512));
    CHECK(t.renderAndAdvance(buf, 512));
    CHECK(t.getPositionInSamples() == 1000);
    CHECK(t.getState() == TransportState::paused);
    // Past the end within the block is silence
    CHECK(buf.getSample(0, 487) == 0.25f);
    CHECK(buf.getSample(0, 488) == 0.0f);

    CHECK_FALSE(t.renderAndAdvance(buf, 512));
}

TEST_CASE("MediaTransport keeps running silently past a short audio track")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    auto media = makeMedia(100, 2048);
    t.setMedia(&media);
    t.play();

    juce::AudioBuffer<float> buf(2, 512);
    t.renderAndAdvance(buf, 512);
    CHECK(buf.getSample(0, 99) == 0.25f);
    CHECK(buf.getSample(0, 100) == 0.0f);

    t.renderAndAdvance(buf, 512);
    t.renderAndAdvance(buf, 512);
    CHECK(t.renderAndAdvance(buf, 512));
}

TEST_CASE("MediaTransport runs for the declared duration with no audio track")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    ProgramMedia muted;
    muted.durationSamples = 1024;
    t.setMedia(&muted);
    t.play();

    juce::AudioBuffer<float> buf(2, 512);
    CHECK_FALSE(t.renderAndAdvance(buf, 512));
    CHECK(buf.getMagnitude(0, 512) == 0.0f);
    CHECK(t.renderAndAdvance(buf, 512));
}

TEST_CASE("MediaTransport play at the end restarts from zero")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    auto media = makeMedia(512, 512);
    t.setMedia(&media);
    t.play();

    juce::AudioBuffer<float> buf(2, 512);
    REQUIRE(t.renderAndAdvance(buf, 512));
    t.play();
    CHECK(t.getPositionInSamples() == 0);
    CHECK(t.isPlaying());
}

TEST_CASE("MediaTransport seek clamps and stop rewinds")
{
    MediaTransport t;
    t.prepare(48000.0, 512);
    auto media = makeMedia(4800, 4800);
    t.setMedia(&media);

    t.seek(10000);
    CHECK(t.getPositionInSamples() == 4800);
    t.seek(-5);
    CHECK(t.getPositionInSamples() == 0);
    t.seek(2400);
    t.stop();
    CHECK(t.getPositionInSamples() == 0);
    CHECK(t.getState() == TransportState::stopped);
}
