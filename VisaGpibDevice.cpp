#include "VisaGpibDevice.h"
#include <QDebug>
#include <QMutexLocker>

VisaGpibDevice::~VisaGpibDevice() {
    close();
}

bool VisaGpibDevice::check(ViStatus status, const char *operation) {
    if (status >= VI_SUCCESS) {
        return true;
    }
    ViChar description[256] = {};
    viStatusDesc(instr != VI_NULL ? instr : resourceManager, status, description);
    errorText = QStringLiteral("%1 failed: %2 (0x%3)")
                    .arg(QString::fromLatin1(operation))
                    .arg(QString::fromLatin1(description))
                    .arg(static_cast<quint32>(status), 8, 16, QLatin1Char('0'));
    qWarning() << "[VisaGpibDevice]" << errorText;
    return false;
}

bool VisaGpibDevice::open(int board, int address, int timeoutMs) {
    close();
    errorText.clear();

    if (!check(viOpenDefaultRM(&resourceManager), "viOpenDefaultRM")) {
        resourceManager = VI_NULL;
        return false;
    }

    QByteArray resource = QStringLiteral("GPIB%1::%2::INSTR").arg(board).arg(address).toLatin1();
    if (!check(viOpen(resourceManager, resource.data(), VI_NULL, VI_NULL, &instr), "viOpen")) {
        instr = VI_NULL;
        close();
        return false;
    }

    bool configured = check(viSetAttribute(instr, VI_ATTR_TMO_VALUE, static_cast<ViAttrState>(timeoutMs)), "viSetAttribute(TMO)")
        && check(viSetAttribute(instr, VI_ATTR_TERMCHAR, '\n'), "viSetAttribute(TERMCHAR)")
        && check(viSetAttribute(instr, VI_ATTR_TERMCHAR_EN, VI_TRUE), "viSetAttribute(TERMCHAR_EN)")
        && check(viClear(instr), "viClear");
    if (!configured) {
        // Keep the error text, close() must not leave a half-open session behind
        QString reason = errorText;
        close();
        errorText = reason;
        return false;
    }

    qDebug() << "[VisaGpibDevice] Opened" << resource;
    return true;
}

void VisaGpibDevice::close() {
    disableServiceRequests();
    if (instr != VI_NULL) {
        viClose(instr);
        instr = VI_NULL;
    }
    if (resourceManager != VI_NULL) {
        viClose(resourceManager);
        resourceManager = VI_NULL;
    }
}

bool VisaGpibDevice::writeLine(const QByteArray &line) {
    if (!isOpen()) {
        errorText = QStringLiteral("Session is not open");
        return false;
    }
    QByteArray buffer = line;
    buffer.append('\n');
    ViUInt32 written = 0;
    if (!check(viWrite(instr, reinterpret_cast<ViBuf>(buffer.data()), static_cast<ViUInt32>(buffer.size()), &written), "viWrite")) {
        return false;
    }
    if (written != static_cast<ViUInt32>(buffer.size())) {
        errorText = QStringLiteral("Short write: %1 of %2 bytes").arg(written).arg(buffer.size());
        return false;
    }
    return true;
}

bool VisaGpibDevice::readLine(QByteArray &line) {
    line.clear();
    if (!isOpen()) {
        errorText = QStringLiteral("Session is not open");
        return false;
    }
    ViByte chunk[READ_CHUNK];
    ViStatus status = VI_SUCCESS_MAX_CNT;
    while (status == VI_SUCCESS_MAX_CNT) {
        ViUInt32 count = 0;
        status = viRead(instr, chunk, READ_CHUNK, &count);
        if (!check(status, "viRead")) {
            line.clear();
            return false;
        }
        line.append(reinterpret_cast<const char *>(chunk), static_cast<int>(count));
    }
    while (line.endsWith('\n') || line.endsWith('\r')) {
        line.chop(1);
    }
    return true;
}

bool VisaGpibDevice::readStatusByte(quint16 &status) {
    if (!isOpen()) {
        errorText = QStringLiteral("Session is not open");
        return false;
    }
    ViUInt16 stb = 0;
    if (!check(viReadSTB(instr, &stb), "viReadSTB")) {
        return false;
    }
    status = stb;
    return true;
}

bool VisaGpibDevice::discardServiceRequests() {
    if (!isOpen()) {
        errorText = QStringLiteral("Session is not open");
        return false;
    }
    return check(viDiscardEvents(instr, VI_EVENT_SERVICE_REQ, VI_ALL_MECH), "viDiscardEvents");
}

bool VisaGpibDevice::enableServiceRequests(ServiceRequestHandler handler) {
    if (!isOpen()) {
        errorText = QStringLiteral("Session is not open");
        return false;
    }
    {
        QMutexLocker locker(&handlerMutex);
        srqHandler = std::move(handler);
    }
    if (!check(viInstallHandler(instr, VI_EVENT_SERVICE_REQ, &VisaGpibDevice::serviceRequestCallback, this), "viInstallHandler")) {
        QMutexLocker locker(&handlerMutex);
        srqHandler = nullptr;
        return false;
    }
    handlerInstalled = true;
    return check(viEnableEvent(instr, VI_EVENT_SERVICE_REQ, VI_HNDLR, VI_NULL), "viEnableEvent");
}

void VisaGpibDevice::disableServiceRequests() {
    if (instr != VI_NULL && handlerInstalled) {
        // Failures are logged by check(), the session is going away anyway
        check(viDisableEvent(instr, VI_EVENT_SERVICE_REQ, VI_HNDLR), "viDisableEvent");
        check(viUninstallHandler(instr, VI_EVENT_SERVICE_REQ, &VisaGpibDevice::serviceRequestCallback, this),
              "viUninstallHandler");
        handlerInstalled = false;
    }
    QMutexLocker locker(&handlerMutex);
    srqHandler = nullptr;
}

ViStatus _VI_FUNCH VisaGpibDevice::serviceRequestCallback(ViSession, ViEventType eventType,
                                                          ViEvent, ViAddr userHandle) {
    auto *device = static_cast<VisaGpibDevice *>(userHandle);
    if (eventType != VI_EVENT_SERVICE_REQ || !device) {
        return VI_SUCCESS;
    }
    ServiceRequestHandler handler;
    {
        QMutexLocker locker(&device->handlerMutex);
        handler = device->srqHandler;
    }
    if (handler) {
        handler();
    }
    return VI_SUCCESS;
}
