/*
 * Unit tests for expected-frequency setup
 * LO offset commands to the 8902A, source commands to the 8673B
 */

#include <gtest/gtest.h>
#include <memory>
#include "FakeGpibDevice.h"
#include "MeasurementSetup.h"
#include "SessionManager.h"

class MeasurementSetupTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus = std::make_shared<FakeBus>();
        sessions = std::make_unique<SessionManager>(config, [this]() {
            return std::make_unique<FakeGpibDevice>(bus);
        });
        setup = std::make_unique<MeasurementSetup>(*sessions);
        QObject::connect(setup.get(), &MeasurementSetup::errorOccurred,
                         [this](const QString &msg) { errors << msg; });
    }

    // Lines written after the connection probe
    QStringList commandsFor(int address) {
        QStringList lines = bus->linesFor(address);
        lines.removeAll(QStringLiteral("IP"));
        return lines;
    }

    SessionConfig config;
    std::shared_ptr<FakeBus> bus;
    QStringList errors;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<MeasurementSetup> setup;
};

// ============================================================================
// Test Suite: MeasurementSetupPreconditions
// ============================================================================

TEST_F(MeasurementSetupTest, RequiresBothInstruments) {
    ASSERT_TRUE(sessions->connectInstrument(InstrumentRole::MeasurementUnit).ok());
    RigResult result = setup->setExpectedFrequency(2.5);
    EXPECT_EQ(result.error, RigError::NotReady);
    EXPECT_TRUE(commandsFor(14).isEmpty());
    EXPECT_EQ(errors.size(), 1);
}

// ============================================================================
// Test Suite: MeasurementSetupCommands
// ============================================================================

TEST_F(MeasurementSetupTest, OffsetFrequencyProgramsBothInstruments) {
    ASSERT_TRUE(sessions->connectAll().ok());
    ASSERT_TRUE(setup->setExpectedFrequency(2.5).ok());
    EXPECT_EQ(commandsFor(14), QStringList({ "27.3SP2620.53MZ" }));
    EXPECT_EQ(commandsFor(19), QStringList({ "FR2.62053GZ", "LE8DM" }));
    EXPECT_TRUE(setup->lastPlan().loEnabled);
}

TEST_F(MeasurementSetupTest, DirectFrequencyParksSourceAtReference) {
    ASSERT_TRUE(sessions->connectAll().ok());
    ASSERT_TRUE(setup->setExpectedFrequency(1.0).ok());
    EXPECT_EQ(commandsFor(14), QStringList({ "27.3SP0MZ" }));
    EXPECT_EQ(commandsFor(19), QStringList({ "FR3GZLE-70DM" }));
    EXPECT_FALSE(setup->lastPlan().loEnabled);
}

TEST_F(MeasurementSetupTest, CustomAddressesAreHonoured) {
    ASSERT_TRUE(sessions->setAddresses(3, 5).ok());
    ASSERT_TRUE(sessions->connectAll().ok());
    ASSERT_TRUE(setup->setExpectedFrequency(2.5).ok());
    EXPECT_EQ(commandsFor(3), QStringList({ "27.3SP2620.53MZ" }));
    EXPECT_EQ(commandsFor(5), QStringList({ "FR2.62053GZ", "LE8DM" }));
}

// ============================================================================
// Test Suite: MeasurementSetupErrors
// ============================================================================

TEST_F(MeasurementSetupTest, UncoveredFrequencySendsNothing) {
    ASSERT_TRUE(sessions->connectAll().ok());
    RigResult result = setup->setExpectedFrequency(1.31);
    EXPECT_EQ(result.error, RigError::InvalidFrequency);
    EXPECT_TRUE(commandsFor(14).isEmpty());
    EXPECT_TRUE(commandsFor(19).isEmpty());
}

TEST_F(MeasurementSetupTest, OutOfRangeFrequencySendsNothing) {
    ASSERT_TRUE(sessions->connectAll().ok());
    EXPECT_EQ(setup->setExpectedFrequency(20.0).error, RigError::InvalidFrequency);
    EXPECT_TRUE(commandsFor(19).isEmpty());
}

TEST_F(MeasurementSetupTest, FailedSourceCommandIsWriteError) {
    ASSERT_TRUE(sessions->connectAll().ok());
    bus->failingCommands.insert("LE8DM");
    RigResult result = setup->setExpectedFrequency(2.5);
    EXPECT_EQ(result.error, RigError::WriteError);
    EXPECT_TRUE(result.message.contains("LE8DM"));
    // The LO offset still reaches the 8902A
    EXPECT_EQ(commandsFor(14), QStringList({ "27.3SP2620.53MZ" }));
}
