#include "CommandChannel.h"
#include <QDebug>
#include <QMutexLocker>

CommandChannel::CommandChannel(std::unique_ptr<GpibDevice> device, int board, QObject *parent)
    : QObject(parent), device(std::move(device)), board(board) {}

CommandChannel::~CommandChannel() {
    close();
}

RigResult CommandChannel::open(int address, const QString &probeCommand) {
    close();
    gpibAddress = address;

    if (!device->open(board, address, IO_TIMEOUT_MS)) {
        QString msg = tr("Device failed to connect. GPIB Error: %1").arg(device->lastError());
        qWarning() << "[CommandChannel]" << msg;
        emit errorOccurred(msg);
        return RigResult::failure(RigError::ConnectionError, msg);
    }

    closing.store(false);
    if (!device->enableServiceRequests([this]() { handleServiceRequest(); })) {
        QString msg = tr("Device failed to connect. GPIB Error: %1").arg(device->lastError());
        qWarning() << "[CommandChannel]" << msg;
        close();
        emit errorOccurred(msg);
        return RigResult::failure(RigError::ConnectionError, msg);
    }

    srqWait.reset();

    if (!sendCommand(probeCommand)) {
        QString msg = tr("Device failed to connect. Check GPIB address and device state.");
        qWarning() << "[CommandChannel] Probe" << probeCommand << "rejected at address" << address;
        close();
        emit errorOccurred(msg);
        return RigResult::failure(RigError::ConnectionError, msg);
    }

    connected = true;
    qDebug() << "[CommandChannel] Device connected at address" << address;
    emit statusMessage(tr("Device connected: %1").arg(address));
    return RigResult::success();
}

void CommandChannel::close() {
    // Wake anyone still waiting for a service request from this endpoint
    srqWait.cancel();
    closing.store(true);
    // Not under ioMutex: an in-flight handler may be blocked on it
    device->disableServiceRequests();

    QMutexLocker locker(&ioMutex);
    if (device->isOpen()) {
        device->close();
        qDebug() << "[CommandChannel] Closed address" << gpibAddress;
    }
    connected = false;
}

bool CommandChannel::writeLocked(const QString &command) {
    if (!device->isOpen()) {
        QString msg = tr("GPIB Send Error: session is not open (%1)").arg(command);
        qWarning() << "[CommandChannel]" << msg;
        emit errorOccurred(msg);
        return false;
    }
    if (!device->writeLine(command.toLatin1())) {
        QString msg = tr("GPIB Send Error: %1").arg(device->lastError());
        qWarning() << "[CommandChannel]" << msg << "command:" << command;
        emit errorOccurred(msg);
        return false;
    }
    qDebug() << "[CommandChannel]" << gpibAddress << "<<" << command;
    return true;
}

bool CommandChannel::sendCommand(const QString &command) {
    QMutexLocker locker(&ioMutex);
    return writeLocked(command);
}

QString CommandChannel::query(const QString &command) {
    QMutexLocker locker(&ioMutex);
    writeLocked(command);

    QByteArray response;
    if (device->isOpen() && !device->readLine(response)) {
        QString msg = tr("GPIB Read Error: %1").arg(device->lastError());
        qWarning() << "[CommandChannel]" << msg;
        emit errorOccurred(msg);
        response.clear();
    }

    QString text = QString::fromLatin1(response);
    if (text.trimmed().isEmpty()) {
        qWarning() << "[CommandChannel] No response from instrument at address" << gpibAddress;
        emit statusMessage(tr("Warning: No response from instrument."));
    } else {
        qDebug() << "[CommandChannel]" << gpibAddress << ">>" << text;
    }
    return text;
}

// Runs on the driver callback thread. The status byte and queued events are
// cleared before the waiter is released so a later SRQ is never matched to
// this one.
void CommandChannel::handleServiceRequest() {
    {
        QMutexLocker locker(&ioMutex);
        if (closing.load() || !device->isOpen()) {
            qDebug() << "[CommandChannel] Ignoring SRQ on closed address" << gpibAddress;
            return;
        }
        quint16 status = 0;
        if (!device->readStatusByte(status)) {
            QString msg = tr("SRQ Handler Error: %1").arg(device->lastError());
            qWarning() << "[CommandChannel]" << msg;
            emit errorOccurred(msg);
            return;
        }
        qDebug() << "[CommandChannel] SRQ from address" << gpibAddress << "status byte:" << Qt::hex << status;

        if (!device->discardServiceRequests()) {
            QString msg = tr("SRQ Handler Error: %1").arg(device->lastError());
            qWarning() << "[CommandChannel]" << msg;
            emit errorOccurred(msg);
            return;
        }

        writeLocked(QStringLiteral("*CLS"));
    }
    srqWait.release();
}
