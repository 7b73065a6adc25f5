#pragma once
#include <QObject>
#include <QMutex>
#include <QString>
#include <atomic>
#include <memory>
#include "GpibDevice.h"
#include "InterruptSynchronizer.h"
#include "RigTypes.h"

// Synchronous line protocol over one GPIB endpoint. I/O faults are turned
// into bool / empty results here and never travel further up.
class CommandChannel : public QObject {
    Q_OBJECT
public:
    static constexpr int IO_TIMEOUT_MS = 2000;

    CommandChannel(std::unique_ptr<GpibDevice> device, int board, QObject *parent = nullptr);
    ~CommandChannel() override;

    // Opens the endpoint and sends the probe command. The channel counts as
    // connected only if the probe was accepted.
    RigResult open(int address, const QString &probeCommand);
    void close();
    bool isConnected() const { return connected; }
    int address() const { return gpibAddress; }

    bool sendCommand(const QString &command);
    QString query(const QString &command);

    InterruptSynchronizer &synchronizer() { return srqWait; }

signals:
    void errorOccurred(const QString &msg);
    void statusMessage(const QString &msg);

private:
    void handleServiceRequest();
    bool writeLocked(const QString &command);

    std::unique_ptr<GpibDevice> device;
    int board = 0;
    int gpibAddress = 0;
    bool connected = false;
    std::atomic<bool> closing { false };
    QMutex ioMutex;
    InterruptSynchronizer srqWait;
};
