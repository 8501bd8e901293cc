#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ContentNegotiator.h"
#include "mocks/FakeCommandBus.hpp"
#include "mocks/MockCommandBus.hpp"

#include <stdexcept>

using ::testing::_;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::DoAll;
using ::testing::ElementsAre;
using ::testing::Pair;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

constexpr const char* kDevice = "media_player.living_room_sonos";
constexpr const char* kUrl = "http://ha.local:8123/local/replay_1.mp3";

// Records grace waits instead of sleeping
class RecordingNegotiator : public ContentNegotiator {
public:
    using ContentNegotiator::ContentNegotiator;
    std::vector<unsigned int> waits;

protected:
    void waitFor(unsigned int ms) override { waits.push_back(ms); }
};

AnnounceConfig TestConfig() {
    AnnounceConfig config;
    config.verifyGraceMs = 20;
    config.correctiveGraceMs = 30;
    return config;
}

std::vector<std::string> PlayedTypes(const FakeCommandBus& bus) {
    std::vector<std::string> types;
    for (const auto& call : bus.CallsTo(BusAction::PLAY_MEDIA, kDevice)) {
        types.push_back(call.param(BusAction::CONTENT_TYPE));
    }
    return types;
}

} // namespace

TEST(ContentNegotiatorTests, CandidatesStartWithDeclaredTypeWithoutDuplicates) {
    auto candidates = ContentNegotiator::buildCandidates(
        "audio/mpeg", AnnounceDefaults::alternateContentTypes());
    EXPECT_THAT(candidates, ElementsAre("audio/mpeg", "audio/mp3", "music", "application/octet-stream"));

    candidates = ContentNegotiator::buildCandidates(
        "audio/webm", AnnounceDefaults::alternateContentTypes());
    EXPECT_THAT(candidates, ElementsAre("audio/webm", "audio/mpeg", "audio/mp3", "music",
                                       "application/octet-stream"));
}

TEST(ContentNegotiatorTests, EmptyCandidateListIsRejected) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    RecordingNegotiator negotiator(bus, TestConfig());

    EXPECT_THROW(negotiator.negotiate(kDevice, kUrl, {}), std::invalid_argument);
    EXPECT_TRUE(bus.Calls().empty());
}

TEST(ContentNegotiatorTests, FirstConfirmedCandidateWinsAndLaterOnesAreNotTried) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.AcceptOnly(kDevice, {"music"});
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.negotiate(kDevice, kUrl,
                                       {"audio/mpeg", "audio/mp3", "music", "application/octet-stream"});

    EXPECT_TRUE(result.delivered);
    EXPECT_EQ(result.winningContentType, "music");
    EXPECT_EQ(result.attemptIndex, 2u);
    EXPECT_EQ(result.playAttempts, 3);
    EXPECT_THAT(PlayedTypes(bus), ElementsAre("audio/mpeg", "audio/mp3", "music"));
    EXPECT_EQ(bus.CountCalls(BusAction::MEDIA_STOP, kDevice), 0u);
}

TEST(ContentNegotiatorTests, AcceptedButIgnoredPlayIsNotConfirmed) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.IgnorePlays(kDevice);
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.negotiate(kDevice, kUrl, {"audio/mpeg", "music"});

    EXPECT_FALSE(result.delivered);
    EXPECT_EQ(result.failure, FailureKind::NOT_CONFIRMED);
    EXPECT_EQ(result.playAttempts, 2);
    EXPECT_THAT(negotiator.waits, ElementsAre(20u, 20u));
}

TEST(ContentNegotiatorTests, BusyErrorStopsAndRetriesSameCandidateOnce) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.ScriptFailure(kDevice, BusAction::PLAY_MEDIA, "UPnP Error 701 (Transition not available)");
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.negotiate(kDevice, kUrl, {"audio/mpeg", "music"});

    EXPECT_TRUE(result.delivered);
    EXPECT_EQ(result.winningContentType, "audio/mpeg");
    EXPECT_EQ(result.playAttempts, 2);
    EXPECT_EQ(result.correctiveStops, 1);
    EXPECT_EQ(bus.CountCalls(BusAction::MEDIA_STOP, kDevice), 1u);
    EXPECT_THAT(PlayedTypes(bus), ElementsAre("audio/mpeg", "audio/mpeg"));
    // corrective grace before the retry, then the verify grace
    EXPECT_THAT(negotiator.waits, ElementsAre(30u, 20u));
}

TEST(ContentNegotiatorTests, BusyTwiceMovesToNextCandidate) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.ScriptFailure(kDevice, BusAction::PLAY_MEDIA, "Device busy");
    bus.ScriptFailure(kDevice, BusAction::PLAY_MEDIA, "Device busy");
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.negotiate(kDevice, kUrl, {"audio/mpeg", "music"});

    EXPECT_TRUE(result.delivered);
    EXPECT_EQ(result.winningContentType, "music");
    EXPECT_EQ(result.playAttempts, 3);
    EXPECT_EQ(bus.CountCalls(BusAction::MEDIA_STOP, kDevice), 1u);
    EXPECT_THAT(PlayedTypes(bus), ElementsAre("audio/mpeg", "audio/mpeg", "music"));
}

TEST(ContentNegotiatorTests, UnsupportedContentIsNotRetried) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.ScriptFailure(kDevice, BusAction::PLAY_MEDIA, "Unsupported media type");
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.negotiate(kDevice, kUrl, {"audio/mpeg", "music"});

    EXPECT_TRUE(result.delivered);
    EXPECT_EQ(result.winningContentType, "music");
    EXPECT_EQ(result.playAttempts, 2);
    EXPECT_EQ(result.correctiveStops, 0);
}

TEST(ContentNegotiatorTests, ExhaustionReportsLastFailure) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.FailAlways(kDevice, BusAction::PLAY_MEDIA, "Unsupported media type");
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.negotiate(kDevice, kUrl, {"audio/mpeg", "audio/mp3", "music"});

    EXPECT_FALSE(result.delivered);
    EXPECT_EQ(result.failure, FailureKind::UNSUPPORTED_CONTENT);
    EXPECT_EQ(result.playAttempts, 3);
    EXPECT_EQ(result.error, "Unsupported media type");
}

TEST(ContentNegotiatorTests, DeviceThatDisappearsFailsWithoutFurtherAttempts) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.VanishAfterPlay(kDevice);
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.negotiate(kDevice, kUrl, {"audio/mpeg", "audio/mp3", "music"});

    EXPECT_FALSE(result.delivered);
    EXPECT_EQ(result.failure, FailureKind::DEVICE_UNREACHABLE);
    EXPECT_EQ(result.playAttempts, 1);
}

TEST(ContentNegotiatorTests, RemovedDeviceFailsOnFirstRejectedPlay) {
    FakeCommandBus bus;
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.negotiate(kDevice, kUrl, ContentNegotiator::buildCandidates(
        "audio/webm", AnnounceDefaults::alternateContentTypes()));

    EXPECT_FALSE(result.delivered);
    EXPECT_EQ(result.failure, FailureKind::DEVICE_UNREACHABLE);
    EXPECT_EQ(result.playAttempts, 1);
    EXPECT_EQ(result.correctiveStops, 0);
    EXPECT_EQ(bus.CountCalls(BusAction::PLAY_MEDIA, kDevice), 1u);
}

TEST(ContentNegotiatorTests, SingleShotOnRemovedDeviceIsUnreachable) {
    FakeCommandBus bus;
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.playSingleShot(kDevice, kUrl, "audio/mpeg");

    EXPECT_FALSE(result.delivered);
    EXPECT_EQ(result.failure, FailureKind::DEVICE_UNREACHABLE);
}

TEST(ContentNegotiatorTests, SingleShotRejectionOnKnownDeviceIsUnsupportedContent) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.FailAlways(kDevice, BusAction::PLAY_MEDIA, "Unsupported media type");
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.playSingleShot(kDevice, kUrl, "audio/mpeg");

    EXPECT_FALSE(result.delivered);
    EXPECT_EQ(result.failure, FailureKind::UNSUPPORTED_CONTENT);
}

TEST(ContentNegotiatorTests, BusySignaturesMatchCaseInsensitively) {
    FakeCommandBus bus;
    ContentNegotiator negotiator(bus, AnnounceConfig());

    EXPECT_TRUE(negotiator.isBusyError("Device BUSY"));
    EXPECT_TRUE(negotiator.isBusyError("UPnP Error 701"));
    EXPECT_TRUE(negotiator.isBusyError("Transition in progress"));
    EXPECT_TRUE(negotiator.isBusyError("conflicting transport state: Conflict"));
    EXPECT_FALSE(negotiator.isBusyError("Unsupported media type"));
    EXPECT_FALSE(negotiator.isBusyError(""));
}

TEST(ContentNegotiatorTests, PlayCarriesUrlAndContentType) {
    MockCommandBus bus;
    RecordingNegotiator negotiator(bus, TestConfig());

    DeviceState playing;
    playing.state = "playing";
    playing.playingRef = kUrl;

    EXPECT_CALL(bus, call("media_player", "play_media",
                          AllOf(Contains(Pair("entity_id", kDevice)),
                                Contains(Pair("media_content_id", kUrl)),
                                Contains(Pair("media_content_type", "audio/mpeg")))))
        .WillOnce(Return(CommandResult::success()));
    EXPECT_CALL(bus, getState(kDevice, _))
        .WillOnce(DoAll(SetArgReferee<1>(playing), Return(true)));

    auto result = negotiator.negotiate(kDevice, kUrl, {"audio/mpeg", "music"});
    EXPECT_TRUE(result.delivered);
}

TEST(ContentNegotiatorTests, RewrittenSchemeStillConfirmsPlayback) {
    MockCommandBus bus;
    RecordingNegotiator negotiator(bus, TestConfig());

    DeviceState playing;
    playing.state = "playing";
    playing.playingRef = "x-rincon-mp3radio://ha.local:8123/local/replay_1.mp3";

    EXPECT_CALL(bus, call(_, _, _)).WillOnce(Return(CommandResult::success()));
    EXPECT_CALL(bus, getState(kDevice, _))
        .WillOnce(DoAll(SetArgReferee<1>(playing), Return(true)));

    EXPECT_TRUE(negotiator.negotiate(kDevice, kUrl, {"audio/mpeg"}).delivered);
}

TEST(ContentNegotiatorTests, SingleShotTreatsAcceptedPlayAsDelivered) {
    FakeCommandBus bus;
    bus.AddDevice(kDevice, 0.3f);
    bus.IgnorePlays(kDevice);
    RecordingNegotiator negotiator(bus, TestConfig());

    auto result = negotiator.playSingleShot(kDevice, kUrl, "audio/mpeg");

    EXPECT_TRUE(result.delivered);
    EXPECT_EQ(result.playAttempts, 1);
    EXPECT_TRUE(negotiator.waits.empty());
}
