// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <gtest/gtest.h>

#include "presence_checker.hpp"
#include "fake_usb_transport.hpp"

static const DeviceID hub{0x1d6b, 0x0002};
static const DeviceID ethernet{0x0bda, 0x8153};
static const DeviceID board{0x06cb, 0x00b1};

TEST(PresenceCheckerTest, FindsMatchingDevice)
{
    DeviceSnapshot snapshot{hub, board};
    std::optional<DeviceID> present = CheckPresence(snapshot, {board});
    ASSERT_TRUE(present);
    EXPECT_EQ(*present, board);
}

TEST(PresenceCheckerTest, NoMatch)
{
    DeviceSnapshot snapshot{hub, ethernet};
    EXPECT_FALSE(CheckPresence(snapshot, {board}));
}

TEST(PresenceCheckerTest, EmptyInputs)
{
    EXPECT_FALSE(CheckPresence(DeviceSnapshot{hub}, {}));
    EXPECT_FALSE(CheckPresence(DeviceSnapshot{}, {hub}));
}

TEST(PresenceCheckerTest, FirstSnapshotEntryWins)
{
    DeviceSnapshot snapshot{hub, ethernet, board};

    EXPECT_EQ(*CheckPresence(snapshot, {board, ethernet}), ethernet);
    EXPECT_EQ(*CheckPresence(snapshot, {ethernet, board}), ethernet);
}

TEST(PresenceCheckerTest, DuplicateTargetsAreHarmless)
{
    DeviceSnapshot snapshot{board};
    EXPECT_EQ(*CheckPresence(snapshot, {board, board}), board);
}

TEST(PresenceCheckerTest, SkipsUnreadableDescriptors)
{
    DeviceSnapshot snapshot{std::nullopt, hub, std::nullopt, board};
    EXPECT_EQ(*CheckPresence(snapshot, {board}), board);
}

TEST(PresenceCheckerTest, DoesNotModifyInputs)
{
    const DeviceSnapshot snapshot{hub, board};
    const std::vector<DeviceID> targets{board};
    DeviceSnapshot snapshotCopy = snapshot;
    std::vector<DeviceID> targetsCopy = targets;

    CheckPresence(snapshot, targets);

    EXPECT_EQ(snapshot, snapshotCopy);
    EXPECT_EQ(targets, targetsCopy);
}

TEST(PresenceCheckerTest, EnumeratesSource)
{
    FakeUSBTransport transport;
    transport.m_devices = {hub, board};

    EXPECT_EQ(*CheckPresence(transport, {board}), board);
    EXPECT_EQ(transport.m_getDevicesCount, 1);
}

TEST(PresenceCheckerTest, EnumerationFailureReadsAsAbsent)
{
    FakeUSBTransport transport;
    transport.m_devices = {board};
    transport.m_enumerateError = LIBUSB_ERROR_NO_MEM;

    EXPECT_FALSE(CheckPresence(transport, {board}));
}
