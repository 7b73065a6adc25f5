#pragma once
#include "GpibDevice.h"
#include <QMutex>
#include <visa.h>

class VisaGpibDevice : public GpibDevice {
public:
    VisaGpibDevice() = default;
    ~VisaGpibDevice() override;

    VisaGpibDevice(const VisaGpibDevice &) = delete;
    VisaGpibDevice &operator=(const VisaGpibDevice &) = delete;

    bool open(int board, int address, int timeoutMs) override;
    void close() override;
    bool isOpen() const override { return instr != VI_NULL; }

    bool writeLine(const QByteArray &line) override;
    bool readLine(QByteArray &line) override;
    bool readStatusByte(quint16 &status) override;
    bool discardServiceRequests() override;
    bool enableServiceRequests(ServiceRequestHandler handler) override;
    void disableServiceRequests() override;

    QString lastError() const override { return errorText; }

private:
    static ViStatus _VI_FUNCH serviceRequestCallback(ViSession vi, ViEventType eventType,
                                                     ViEvent event, ViAddr userHandle);
    bool check(ViStatus status, const char *operation);

    static constexpr int READ_CHUNK = 256;

    ViSession resourceManager = VI_NULL;
    ViSession instr = VI_NULL;
    bool handlerInstalled = false;
    QMutex handlerMutex;
    ServiceRequestHandler srqHandler;
    QString errorText;
};
