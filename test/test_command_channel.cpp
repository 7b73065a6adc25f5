/*
 * Unit tests for the GPIB command channel
 * Open and probe, send/query failure reporting, SRQ handling
 */

#include <gtest/gtest.h>
#include <memory>
#include "CommandChannel.h"
#include "FakeGpibDevice.h"

using WaitResult = InterruptSynchronizer::WaitResult;

class CommandChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus = std::make_shared<FakeBus>();
        auto owned = std::make_unique<FakeGpibDevice>(bus);
        device = owned.get();
        channel = std::make_unique<CommandChannel>(std::move(owned), 0);
        QObject::connect(channel.get(), &CommandChannel::errorOccurred,
                         [this](const QString &msg) { errors << msg; });
    }

    std::shared_ptr<FakeBus> bus;
    QStringList errors;
    FakeGpibDevice *device = nullptr;
    std::unique_ptr<CommandChannel> channel;
};

// ============================================================================
// Test Suite: CommandChannelOpen
// ============================================================================

TEST_F(CommandChannelTest, OpenSendsProbeAndConnects) {
    RigResult result = channel->open(14, "IP");
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(channel->isConnected());
    EXPECT_EQ(channel->address(), 14);
    EXPECT_EQ(device->lastTimeoutMs, CommandChannel::IO_TIMEOUT_MS);
    EXPECT_EQ(bus->linesFor(14), QStringList({ "IP" }));
}

TEST_F(CommandChannelTest, AbsentDeviceIsConnectionError) {
    bus->absentAddresses.insert(7);
    RigResult result = channel->open(7, "IP");
    EXPECT_EQ(result.error, RigError::ConnectionError);
    EXPECT_FALSE(channel->isConnected());
    EXPECT_FALSE(device->isOpen());
    EXPECT_EQ(errors.size(), 1);
}

TEST_F(CommandChannelTest, RejectedProbeLeavesNothingOpen) {
    bus->failingCommands.insert("IP");
    RigResult result = channel->open(14, "IP");
    EXPECT_EQ(result.error, RigError::ConnectionError);
    EXPECT_FALSE(channel->isConnected());
    EXPECT_FALSE(device->isOpen());
    EXPECT_EQ(bus->openCount, 1);
    EXPECT_EQ(bus->closeCount, 1);
}

TEST_F(CommandChannelTest, ServiceRequestSetupFailureIsConnectionError) {
    bus->failServiceRequestSetup = true;
    RigResult result = channel->open(14, "IP");
    EXPECT_EQ(result.error, RigError::ConnectionError);
    EXPECT_FALSE(device->isOpen());
    EXPECT_TRUE(bus->linesFor(14).isEmpty());
}

TEST_F(CommandChannelTest, CloseIsIdempotent) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    channel->close();
    channel->close();
    EXPECT_FALSE(channel->isConnected());
    EXPECT_EQ(bus->closeCount, 1);
}

// ============================================================================
// Test Suite: CommandChannelIo
// ============================================================================

TEST_F(CommandChannelTest, SendFailureIsReportedNotThrown) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    bus->failingCommands.insert("ZR");
    EXPECT_FALSE(channel->sendCommand("ZR"));
    EXPECT_TRUE(channel->sendCommand("C0"));
    EXPECT_EQ(errors.size(), 1);
    EXPECT_EQ(bus->linesFor(14), QStringList({ "IP", "C0" }));
}

TEST_F(CommandChannelTest, SendOnClosedChannelFails) {
    EXPECT_FALSE(channel->sendCommand("ZR"));
    EXPECT_EQ(errors.size(), 1);
}

TEST_F(CommandChannelTest, QueryReturnsResponseLine) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    bus->responses << "+1.234E-03";
    EXPECT_EQ(channel->query("RD"), QString("+1.234E-03"));
    EXPECT_TRUE(errors.isEmpty());
}

TEST_F(CommandChannelTest, QueryTimeoutReturnsEmpty) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    EXPECT_TRUE(channel->query("RD").isEmpty());
    EXPECT_EQ(errors.size(), 1);
}

// ============================================================================
// Test Suite: CommandChannelServiceRequest
// ============================================================================

TEST_F(CommandChannelTest, ServiceRequestClearsStatusThenReleases) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    device->fireServiceRequest();
    EXPECT_EQ(channel->synchronizer().wait(5000), WaitResult::Signalled);
    device->joinServiceRequests();
    EXPECT_EQ(device->discardCount.load(), 1);
    EXPECT_EQ(bus->linesFor(14), QStringList({ "IP", "*CLS" }));
}

TEST_F(CommandChannelTest, StatusReadFailureDoesNotRelease) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    bus->failStatusRead = true;
    device->fireServiceRequest();
    device->joinServiceRequests();
    EXPECT_EQ(channel->synchronizer().wait(50), WaitResult::TimedOut);
    EXPECT_EQ(errors.size(), 1);
}

TEST_F(CommandChannelTest, ClearCommandFailureStillReleases) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    bus->failingCommands.insert("*CLS");
    device->fireServiceRequest();
    EXPECT_EQ(channel->synchronizer().wait(5000), WaitResult::Signalled);
}

TEST_F(CommandChannelTest, CloseCancelsPendingWait) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    channel->close();
    EXPECT_EQ(channel->synchronizer().wait(1000), WaitResult::Cancelled);
}

TEST_F(CommandChannelTest, CloseRemovesHandlerBeforeClosingSession) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    channel->close();
    EXPECT_EQ(bus->closeCount, 1);
    EXPECT_EQ(bus->closedWithHandler, 0);

    device->fireServiceRequest();
    device->joinServiceRequests();
    EXPECT_EQ(bus->linesFor(14), QStringList({ "IP" }));
}

TEST_F(CommandChannelTest, InFlightServiceRequestAfterCloseIsIgnored) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    channel->close();

    device->fireStaleServiceRequest();
    device->joinServiceRequests();
    EXPECT_TRUE(errors.isEmpty());
    EXPECT_EQ(device->discardCount.load(), 0);
    EXPECT_EQ(bus->linesFor(14), QStringList({ "IP" }));
}

TEST_F(CommandChannelTest, ReopenAcceptsServiceRequestsAgain) {
    ASSERT_TRUE(channel->open(14, "IP").ok());
    channel->close();
    ASSERT_TRUE(channel->open(14, "IP").ok());
    device->fireServiceRequest();
    EXPECT_EQ(channel->synchronizer().wait(5000), WaitResult::Signalled);
}
