#pragma once
#include <QString>
#include <QMetaType>

// Logical position of an instrument on the bus.
enum class InstrumentRole {
    MeasurementUnit, // HP 8902A measuring receiver, channel A
    Source           // HP 8673B synthesizer used as external LO, channel B
};

enum class RigError {
    None,
    ConnectionError,
    WriteError,
    ReadError,
    NotReady,
    Timeout,
    Aborted,
    InvalidFrequency,
    InvalidAddress,
    TableError
};

enum class CalibrationState {
    Idle,
    LoadingTable,
    AwaitingConfirmation,
    Zeroing,
    WaitingZeroComplete,
    Calibrating,
    WaitingCalComplete,
    Saving,
    Complete,
    Aborted
};

// What the orchestrator does when an intermediate command fails to send.
enum class FailurePolicy {
    ContinueOnError,
    AbortOnError
};

struct RigResult {
    RigError error = RigError::None;
    QString message;

    bool ok() const { return error == RigError::None; }

    static RigResult success() { return RigResult(); }
    static RigResult failure(RigError error, const QString &message) {
        RigResult result;
        result.error = error;
        result.message = message;
        return result;
    }
};

QString roleName(InstrumentRole role);
QString errorName(RigError error);
QString stateName(CalibrationState state);

Q_DECLARE_METATYPE(InstrumentRole)
Q_DECLARE_METATYPE(CalibrationState)
