#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ProcessCommandBus.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

// Shell script standing in for the host platform helper
class HelperScript {
public:
    explicit HelperScript(const std::string& body) {
        char name[] = "/tmp/replay2player_bus_XXXXXX";
        int fd = mkstemp(name);
        path_ = name;
        if (fd >= 0) close(fd);
        std::ofstream out(path_);
        out << "#!/bin/sh\n" << body << "\n";
        out.close();
        chmod(path_.c_str(), 0755);
    }
    ~HelperScript() { unlink(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST(ProcessCommandBusTests, CallArgumentsCarryDomainActionAndParams) {
    ProcessCommandBus bus("/usr/local/bin/ha-bus");

    auto args = bus.buildCallArgs("media_player", "play_media", {
        {"entity_id", "media_player.kitchen"},
        {"media_content_id", "http://ha/local/a.mp3"},
        {"media_content_type", "music"}
    });

    EXPECT_THAT(args, ElementsAre("/usr/local/bin/ha-bus", "call", "media_player", "play_media",
                                  "entity_id=media_player.kitchen",
                                  "media_content_id=http://ha/local/a.mp3",
                                  "media_content_type=music"));
}

TEST(ProcessCommandBusTests, ParsesStateOutput) {
    DeviceState state;
    ASSERT_TRUE(ProcessCommandBus::parseState(
        "# media_player.kitchen\n"
        "state=playing\n"
        "volume_level=0.35\n"
        "media_content_id = http://ha/local/a.mp3\n"
        "friendly_name=Kitchen Sonos\n"
        "\n"
        "garbage line\n", state));

    EXPECT_EQ(state.state, "playing");
    EXPECT_TRUE(state.hasVolume);
    EXPECT_FLOAT_EQ(state.volume, 0.35f);
    EXPECT_EQ(state.playingRef, "http://ha/local/a.mp3");
    EXPECT_EQ(state.attribute("friendly_name"), "Kitchen Sonos");
    EXPECT_FALSE(state.hasAttribute("garbage line"));
}

TEST(ProcessCommandBusTests, UnparsableVolumeIsAbsent) {
    DeviceState state;
    ASSERT_TRUE(ProcessCommandBus::parseState("state=idle\nvolume_level=unknown\n", state));
    EXPECT_FALSE(state.hasVolume);
}

TEST(ProcessCommandBusTests, OutputWithoutStateIsUnresolved) {
    DeviceState state;
    EXPECT_FALSE(ProcessCommandBus::parseState("volume_level=0.3\n", state));
    EXPECT_FALSE(ProcessCommandBus::parseState("", state));
}

TEST(ProcessCommandBusTests, HelperExitStatusDecidesResult) {
    HelperScript helper(
        "if [ \"$1\" = call ] && [ \"$3\" = play_media ]; then echo 'UPnP Error 701'; exit 1; fi\n"
        "if [ \"$1\" = state ] && [ \"$2\" = media_player.kitchen ]; then\n"
        "  echo state=idle; echo volume_level=0.4; exit 0\n"
        "fi\n"
        "if [ \"$1\" = state ]; then exit 2; fi\n"
        "exit 0");
    ProcessCommandBus bus(helper.path());

    CommandResult ok = bus.call("media_player", "volume_set", {{"entity_id", "media_player.kitchen"}});
    EXPECT_TRUE(ok.ok);

    CommandResult busy = bus.call("media_player", "play_media", {{"entity_id", "media_player.kitchen"}});
    EXPECT_FALSE(busy.ok);
    EXPECT_EQ(busy.error, "UPnP Error 701");

    DeviceState state;
    ASSERT_TRUE(bus.getState("media_player.kitchen", state));
    EXPECT_FLOAT_EQ(state.volume, 0.4f);
    EXPECT_FALSE(bus.getState("media_player.nowhere", state));
}

TEST(ProcessCommandBusTests, MissingHelperIsAnError) {
    ProcessCommandBus bus("/nonexistent/ha-bus");

    CommandResult result = bus.call("media_player", "media_stop", {});
    EXPECT_FALSE(result.ok);
    EXPECT_THAT(result.error, HasSubstr("not executable"));

    DeviceState state;
    EXPECT_FALSE(bus.getState("media_player.kitchen", state));
}
