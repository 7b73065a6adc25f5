#pragma once
#include <QByteArray>
#include <QString>
#include <functional>

// Raw bus operations for one GPIB endpoint. Every call reports success as a
// bool; the reason for the last failure is available from lastError().
class GpibDevice {
public:
    using ServiceRequestHandler = std::function<void()>;

    virtual ~GpibDevice() = default;

    virtual bool open(int board, int address, int timeoutMs) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual bool writeLine(const QByteArray &line) = 0;
    virtual bool readLine(QByteArray &line) = 0;
    virtual bool readStatusByte(quint16 &status) = 0;
    virtual bool discardServiceRequests() = 0;

    // The handler runs on the driver's callback thread.
    virtual bool enableServiceRequests(ServiceRequestHandler handler) = 0;
    // Removes the handler while leaving the session open. May block until a
    // callback already in progress has returned.
    virtual void disableServiceRequests() = 0;

    virtual QString lastError() const = 0;
};
