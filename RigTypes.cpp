#include "RigTypes.h"

QString roleName(InstrumentRole role) {
    switch (role) {
    case InstrumentRole::MeasurementUnit: return QStringLiteral("HP 8902A");
    case InstrumentRole::Source: return QStringLiteral("HP 8673B");
    }
    return QString();
}

QString errorName(RigError error) {
    switch (error) {
    case RigError::None: return QStringLiteral("None");
    case RigError::ConnectionError: return QStringLiteral("ConnectionError");
    case RigError::WriteError: return QStringLiteral("WriteError");
    case RigError::ReadError: return QStringLiteral("ReadError");
    case RigError::NotReady: return QStringLiteral("NotReady");
    case RigError::Timeout: return QStringLiteral("Timeout");
    case RigError::Aborted: return QStringLiteral("Aborted");
    case RigError::InvalidFrequency: return QStringLiteral("InvalidFrequency");
    case RigError::InvalidAddress: return QStringLiteral("InvalidAddress");
    case RigError::TableError: return QStringLiteral("TableError");
    }
    return QString();
}

QString stateName(CalibrationState state) {
    switch (state) {
    case CalibrationState::Idle: return QStringLiteral("Idle");
    case CalibrationState::LoadingTable: return QStringLiteral("LoadingTable");
    case CalibrationState::AwaitingConfirmation: return QStringLiteral("AwaitingConfirmation");
    case CalibrationState::Zeroing: return QStringLiteral("Zeroing");
    case CalibrationState::WaitingZeroComplete: return QStringLiteral("WaitingZeroComplete");
    case CalibrationState::Calibrating: return QStringLiteral("Calibrating");
    case CalibrationState::WaitingCalComplete: return QStringLiteral("WaitingCalComplete");
    case CalibrationState::Saving: return QStringLiteral("Saving");
    case CalibrationState::Complete: return QStringLiteral("Complete");
    case CalibrationState::Aborted: return QStringLiteral("Aborted");
    }
    return QString();
}
