#include <gtest/gtest.h>

#include <CommandInbox.hpp>

namespace {

ControlCommand make(uint8_t channel, bool on, CommandIssuer issuer) {
    ControlCommand cmd;
    cmd.channel = channel;
    cmd.relayOn = on;
    cmd.issuer  = issuer;
    return cmd;
}

} // namespace

TEST(CommandInbox, RejectsInvalidCommands) {
    CommandInbox inbox;
    EXPECT_FALSE(inbox.submit(make(0, true, CommandIssuer::Manual)));
    EXPECT_FALSE(inbox.submit(make(3, true, CommandIssuer::Manual)));
    EXPECT_FALSE(inbox.submit(make(1, true, CommandIssuer::Auto)));
    EXPECT_FALSE(inbox.submit(make(1, true, CommandIssuer::Safety)));
    EXPECT_FALSE(inbox.hasPending());
}

TEST(CommandInbox, SlotsAreTakenOnce) {
    CommandInbox inbox;
    ASSERT_TRUE(inbox.submit(make(2, true, CommandIssuer::Manual)));
    ASSERT_TRUE(inbox.submit(make(2, false, CommandIssuer::Safety)));
    EXPECT_TRUE(inbox.hasPending());

    ControlCommand out;
    EXPECT_FALSE(inbox.takeManual(1, out));
    ASSERT_TRUE(inbox.takeManual(2, out));
    EXPECT_TRUE(out.relayOn);
    EXPECT_FALSE(inbox.takeManual(2, out));

    ASSERT_TRUE(inbox.takeSafety(2, out));
    EXPECT_EQ(out.issuer, CommandIssuer::Safety);
    EXPECT_FALSE(inbox.hasPending());
}

TEST(CommandInbox, LatestModeRequestWins) {
    CommandInbox inbox;
    inbox.requestMode(OperatingMode::Manual);
    inbox.requestMode(OperatingMode::Auto);

    OperatingMode mode = OperatingMode::Manual;
    ASSERT_TRUE(inbox.takeMode(mode));
    EXPECT_EQ(mode, OperatingMode::Auto);
    EXPECT_FALSE(inbox.takeMode(mode));
    EXPECT_EQ(inbox.overwritten(), 1u);
}

TEST(CommandInbox, ClearDropsEverything) {
    CommandInbox inbox;
    ASSERT_TRUE(inbox.submit(make(1, true, CommandIssuer::Manual)));
    inbox.requestMode(OperatingMode::Manual);
    inbox.clear();
    EXPECT_FALSE(inbox.hasPending());
}
