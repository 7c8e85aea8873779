#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/SegmentSynthesizer.h"
#include "TestFakes.h"

using namespace redub;
using Catch::Matchers::WithinAbs;

namespace {

struct Fixture {
    SegmentStore store{48000.0};
    DubProject project{store};
    test::FakeSynthesisService service;
    SegmentSynthesizer synthesizer{project, service};

    Fixture()
    {
        project.loadSegments({
            {0.0, 1.0, "one", "uno", "A"},
            {1.5, 2.5, "two", "dos", "B"},
            {3.0, 4.0, "three", "tres", "A"},
        });
    }

    const std::string& id(int index) const { return project.getSegments()[static_cast<size_t>(index)].id; }
};

} // namespace

TEST_CASE("SegmentSynthesizer stores a trimmed clip at the engine rate")
{
    Fixture f;
    std::string error;
    REQUIRE(f.synthesizer.synthesize(f.id(0), error));

    auto clip = f.store.get(f.id(0));
    REQUIRE(clip != nullptr);
    CHECK(clip->getSampleRate() == 48000.0);
    // 0.1 s of leading silence is gone, the 0.3 s tone is left
    CHECK_THAT(clip->getDurationSeconds(), WithinAbs(0.3, 0.01));
    CHECK_FALSE(f.project.findSegment(f.id(0))->synthesizing);
}

TEST_CASE("SegmentSynthesizer speaks with the speaker's voice")
{
    Fixture f;
    f.project.setSpeakerVoice("B", "Charon");
    std::string error;
    f.synthesizer.synthesize(f.id(0), error);
    f.synthesizer.synthesize(f.id(1), error);

    REQUIRE(f.service.requests.size() == 2);
    CHECK(f.service.requests[0].text == "uno");
    CHECK(f.service.requests[0].voiceId == "Kore");
    CHECK(f.service.requests[1].voiceId == "Charon");
}

TEST_CASE("SegmentSynthesizer service failure leaves the segment without audio")
{
    Fixture f;
    f.service.failAll = true;
    std::string error;

    CHECK_FALSE(f.synthesizer.synthesize(f.id(1), error));
    CHECK(error == "synthesis unavailable");
    CHECK_FALSE(f.project.isSynthesized(f.id(1)));
    CHECK_FALSE(f.project.findSegment(f.id(1))->synthesizing);
}

TEST_CASE("SegmentSynthesizer decode failure leaves the segment without audio")
{
    Fixture f;
    f.service.returnEmpty = true;
    std::string error;

    CHECK_FALSE(f.synthesizer.synthesize(f.id(0), error));
    CHECK_FALSE(error.empty());
    CHECK_FALSE(f.project.isSynthesized(f.id(0)));
    CHECK_FALSE(f.project.findSegment(f.id(0))->synthesizing);
}

TEST_CASE("SegmentSynthesizer rejects unknown segments")
{
    Fixture f;
    std::string error;
    CHECK_FALSE(f.synthesizer.synthesize("seg-9-9", error));
    CHECK(f.service.requests.empty());
}

TEST_CASE("SegmentSynthesizer synthesizeMissing only asks for segments without audio")
{
    Fixture f;
    f.store.put(f.id(1), test::makeConstClip(1, 100, 0.5f));
    f.service.failingTexts.insert("tres");

    CHECK(f.synthesizer.synthesizeMissing() == 1);
    REQUIRE(f.service.requests.size() == 2);
    CHECK(f.service.requests[0].text == "uno");
    CHECK(f.service.requests[1].text == "tres");
    CHECK(f.project.isSynthesized(f.id(0)));
    CHECK_FALSE(f.project.isSynthesized(f.id(2)));

    f.service.failingTexts.clear();
    CHECK(f.synthesizer.synthesizeMissing() == 0);
    CHECK(f.service.requests.size() == 3);
}
