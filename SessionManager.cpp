#include "SessionManager.h"
#include <QDebug>

SessionManager::SessionManager(const SessionConfig &config, DeviceFactory factory, QObject *parent)
    : QObject(parent), sessionConfig(config), deviceFactory(std::move(factory)) {}

SessionManager::~SessionManager() {
    disconnectAll();
}

RigResult SessionManager::validateAddresses(int measurementAddress, int sourceAddress) {
    for (int address : { measurementAddress, sourceAddress }) {
        if (address < SessionConfig::MIN_ADDRESS || address > SessionConfig::MAX_ADDRESS) {
            return RigResult::failure(RigError::InvalidAddress,
                                      tr("Address must be between %1 and %2")
                                          .arg(SessionConfig::MIN_ADDRESS)
                                          .arg(SessionConfig::MAX_ADDRESS));
        }
    }
    if (measurementAddress == sourceAddress) {
        return RigResult::failure(RigError::InvalidAddress,
                                  tr("8902A and 8673B addresses must differ"));
    }
    return RigResult::success();
}

int SessionManager::address(InstrumentRole role) const {
    return role == InstrumentRole::MeasurementUnit ? sessionConfig.measurementAddress
                                                   : sessionConfig.sourceAddress;
}

RigResult SessionManager::setAddresses(int measurementAddress, int sourceAddress) {
    if (anyConnected()) {
        return RigResult::failure(RigError::NotReady,
                                  tr("Disconnect the instruments before changing addresses"));
    }
    RigResult valid = validateAddresses(measurementAddress, sourceAddress);
    if (!valid.ok()) {
        return valid;
    }
    sessionConfig.measurementAddress = measurementAddress;
    sessionConfig.sourceAddress = sourceAddress;
    qDebug() << "[SessionManager] Addresses set: 8902A =" << measurementAddress
             << "8673B =" << sourceAddress;
    emit statusMessage(tr("GPIB Addresses updated."));
    return RigResult::success();
}

std::unique_ptr<CommandChannel> &SessionManager::slot(InstrumentRole role) {
    return role == InstrumentRole::MeasurementUnit ? measurementChannel : sourceChannel;
}

const std::unique_ptr<CommandChannel> &SessionManager::slot(InstrumentRole role) const {
    return role == InstrumentRole::MeasurementUnit ? measurementChannel : sourceChannel;
}

RigResult SessionManager::connectInstrument(InstrumentRole role) {
    std::unique_ptr<CommandChannel> &current = slot(role);
    if (current) {
        qWarning() << "[SessionManager]" << roleName(role) << "already connected, reconnecting";
        emit statusMessage(tr("Warning: Already connected to a device. Disconnecting and reconnecting."));
        disconnectInstrument(role);
    }

    std::unique_ptr<GpibDevice> device = deviceFactory();
    if (!device) {
        return RigResult::failure(RigError::ConnectionError, tr("No GPIB transport available"));
    }

    auto channel = std::make_unique<CommandChannel>(std::move(device), sessionConfig.board);
    QObject::connect(channel.get(), &CommandChannel::errorOccurred, this, &SessionManager::errorOccurred);
    QObject::connect(channel.get(), &CommandChannel::statusMessage, this, &SessionManager::statusMessage);

    RigResult opened = channel->open(address(role), sessionConfig.probeCommand);
    if (!opened.ok()) {
        qWarning() << "[SessionManager]" << roleName(role) << "connect failed:" << opened.message;
        return opened;
    }

    current = std::move(channel);
    qDebug() << "[SessionManager]" << roleName(role) << "connected at" << address(role);
    emit connectionChanged(role, true);
    return RigResult::success();
}

RigResult SessionManager::connectAll() {
    RigResult result = connectInstrument(InstrumentRole::MeasurementUnit);
    if (!result.ok()) {
        return result;
    }
    return connectInstrument(InstrumentRole::Source);
}

void SessionManager::disconnectInstrument(InstrumentRole role) {
    std::unique_ptr<CommandChannel> &current = slot(role);
    if (!current) {
        return;
    }
    current->close();
    current.reset();
    qDebug() << "[SessionManager]" << roleName(role) << "disconnected";
    emit connectionChanged(role, false);
}

void SessionManager::disconnectAll() {
    disconnectInstrument(InstrumentRole::MeasurementUnit);
    disconnectInstrument(InstrumentRole::Source);
}

bool SessionManager::isConnected(InstrumentRole role) const {
    const std::unique_ptr<CommandChannel> &current = slot(role);
    return current && current->isConnected();
}

bool SessionManager::bothConnected() const {
    return isConnected(InstrumentRole::MeasurementUnit) && isConnected(InstrumentRole::Source);
}

bool SessionManager::anyConnected() const {
    return isConnected(InstrumentRole::MeasurementUnit) || isConnected(InstrumentRole::Source);
}

CommandChannel *SessionManager::channel(InstrumentRole role) const {
    return slot(role).get();
}
