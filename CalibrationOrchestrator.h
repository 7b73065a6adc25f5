#pragma once
#include <QObject>
#include <QString>
#include <atomic>
#include <functional>
#include <optional>
#include "CalibrationTable.h"
#include "InterruptSynchronizer.h"
#include "RigTypes.h"

class CommandChannel;
class SessionManager;

// Runs the 8902A sensor calibration: optional table upload, operator
// confirmation, zero, calibrate and save. Channel A is the 8902A; the 8673B
// must be connected but is not driven.
class CalibrationOrchestrator : public QObject {
    Q_OBJECT
public:
    // Asked once per run; returning false aborts the calibration.
    using ConfirmationProvider = std::function<bool(const QString &question)>;

    CalibrationOrchestrator(SessionManager &sessions, ConfirmationProvider confirm, QObject *parent = nullptr);

    // Blocks until the run reaches Complete or Aborted. Without a table the
    // upload step is skipped; an empty table still clears the 8902A table.
    RigResult run(const std::optional<CalibrationFactors> &table = std::nullopt);

    // Safe from any thread; interrupts a pending SRQ wait. A cancel issued
    // before run() makes that run abort, until clearCancel().
    void cancel();
    void clearCancel() { cancelRequested.store(false); }

    CalibrationState state() const { return currentState.load(); }

signals:
    void stateChanged(CalibrationState state);
    void statusMessage(const QString &msg);
    void errorOccurred(const QString &msg);

private:
    void enterState(CalibrationState next);
    bool send(CommandChannel &channel, const QString &command);
    bool sendAll(CommandChannel &channel, const QStringList &commands);
    RigResult waitForServiceRequest(CommandChannel &channel, const char *operation);
    RigResult abortRun(CommandChannel *channel, const RigResult &reason);

    SessionManager &sessions;
    ConfirmationProvider confirm;
    std::atomic<CalibrationState> currentState { CalibrationState::Idle };
    std::atomic<InterruptSynchronizer *> activeWait { nullptr };
    std::atomic<bool> cancelRequested { false };
    RigResult firstSendFailure;
};
