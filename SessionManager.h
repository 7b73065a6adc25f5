#pragma once
#include <QObject>
#include <QString>
#include <functional>
#include <memory>
#include "CalibrationTable.h"
#include "CommandChannel.h"
#include "GpibDevice.h"
#include "RigTypes.h"

struct SessionConfig {
    static constexpr int MIN_ADDRESS = 1;
    static constexpr int MAX_ADDRESS = 30;

    int measurementAddress = 14; // 8902A factory default
    int sourceAddress = 19;      // 8673B factory default
    int board = 0;
    QString probeCommand = QStringLiteral("IP");
    int srqTimeoutMs = 60000;    // negative waits forever
    FailurePolicy failurePolicy = FailurePolicy::ContinueOnError;
    QString calibrationTablePath = QString::fromLatin1(CalibrationTable::DEFAULT_FILE_NAME);
};

// Sole owner of the two command channels. At most one live channel per role.
class SessionManager : public QObject {
    Q_OBJECT
public:
    using DeviceFactory = std::function<std::unique_ptr<GpibDevice>()>;

    SessionManager(const SessionConfig &config, DeviceFactory factory, QObject *parent = nullptr);
    ~SessionManager() override;

    static RigResult validateAddresses(int measurementAddress, int sourceAddress);

    const SessionConfig &config() const { return sessionConfig; }
    int address(InstrumentRole role) const;
    RigResult setAddresses(int measurementAddress, int sourceAddress);
    void setFailurePolicy(FailurePolicy policy) { sessionConfig.failurePolicy = policy; }

    // Replaces an existing channel for the role
    RigResult connectInstrument(InstrumentRole role);
    RigResult connectAll();
    void disconnectInstrument(InstrumentRole role);
    void disconnectAll();

    bool isConnected(InstrumentRole role) const;
    bool bothConnected() const;
    bool anyConnected() const;
    // nullptr when the role has no channel
    CommandChannel *channel(InstrumentRole role) const;

signals:
    void errorOccurred(const QString &msg);
    void statusMessage(const QString &msg);
    void connectionChanged(InstrumentRole role, bool connected);

private:
    std::unique_ptr<CommandChannel> &slot(InstrumentRole role);
    const std::unique_ptr<CommandChannel> &slot(InstrumentRole role) const;

    SessionConfig sessionConfig;
    DeviceFactory deviceFactory;
    std::unique_ptr<CommandChannel> measurementChannel;
    std::unique_ptr<CommandChannel> sourceChannel;
};
