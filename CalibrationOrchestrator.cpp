#include "CalibrationOrchestrator.h"
#include "CommandChannel.h"
#include "SessionManager.h"
#include <QDebug>

CalibrationOrchestrator::CalibrationOrchestrator(SessionManager &sessions, ConfirmationProvider confirm, QObject *parent)
    : QObject(parent), sessions(sessions), confirm(std::move(confirm)) {}

void CalibrationOrchestrator::enterState(CalibrationState next) {
    qDebug() << "[CalibrationOrchestrator]" << stateName(currentState.load()) << "->" << stateName(next);
    currentState.store(next);
    emit stateChanged(next);
}

void CalibrationOrchestrator::cancel() {
    cancelRequested.store(true);
    if (InterruptSynchronizer *wait = activeWait.load()) {
        wait->cancel();
    }
}

bool CalibrationOrchestrator::send(CommandChannel &channel, const QString &command) {
    if (channel.sendCommand(command)) {
        return true;
    }
    if (firstSendFailure.ok()) {
        firstSendFailure = RigResult::failure(RigError::WriteError,
                                              tr("Command %1 could not be sent").arg(command));
    }
    if (sessions.config().failurePolicy == FailurePolicy::AbortOnError) {
        return false;
    }
    qWarning() << "[CalibrationOrchestrator] Continuing after failed command" << command;
    return true;
}

// Returns false only when the failure policy says the run must stop.
bool CalibrationOrchestrator::sendAll(CommandChannel &channel, const QStringList &commands) {
    for (const QString &command : commands) {
        if (!send(channel, command)) {
            return false;
        }
    }
    return true;
}

RigResult CalibrationOrchestrator::waitForServiceRequest(CommandChannel &channel, const char *operation) {
    if (cancelRequested.load()) {
        return RigResult::failure(RigError::Aborted, tr("Calibration aborted by user."));
    }
    const int timeoutMs = sessions.config().srqTimeoutMs;
    switch (channel.synchronizer().wait(timeoutMs)) {
    case InterruptSynchronizer::WaitResult::Signalled:
        return RigResult::success();
    case InterruptSynchronizer::WaitResult::TimedOut:
        return RigResult::failure(RigError::Timeout,
                                  tr("No service request after %1 ms waiting for the %2 to complete")
                                      .arg(timeoutMs)
                                      .arg(QString::fromLatin1(operation)));
    case InterruptSynchronizer::WaitResult::Cancelled:
        break;
    }
    return RigResult::failure(RigError::Aborted,
                              tr("Calibration aborted while waiting for the %1 to complete")
                                  .arg(QString::fromLatin1(operation)));
}

// Leaves the 8902A with the SRQ mask cleared and the calibrator off when an
// operation may have been armed.
RigResult CalibrationOrchestrator::abortRun(CommandChannel *channel, const RigResult &reason) {
    if (channel && channel->isConnected()) {
        channel->sendCommand(QStringLiteral("22.0SP"));
        channel->sendCommand(QStringLiteral("C0"));
    }
    activeWait.store(nullptr);
    enterState(CalibrationState::Aborted);
    qWarning() << "[CalibrationOrchestrator]" << errorName(reason.error) << reason.message;
    emit errorOccurred(reason.message);
    return reason;
}

RigResult CalibrationOrchestrator::run(const std::optional<CalibrationFactors> &table) {
    firstSendFailure = RigResult::success();

    if (!sessions.bothConnected()) {
        QString msg = tr("Error: Both instruments must be connected before calibration can proceed.");
        qWarning() << "[CalibrationOrchestrator]" << msg;
        emit errorOccurred(msg);
        return RigResult::failure(RigError::NotReady, msg);
    }

    CommandChannel &meter = *sessions.channel(InstrumentRole::MeasurementUnit);
    meter.synchronizer().reset();
    activeWait.store(&meter.synchronizer());
    currentState.store(CalibrationState::Idle);
    emit statusMessage(tr("Starting calibration process..."));

    if (table) {
        enterState(CalibrationState::LoadingTable);
        if (!sendAll(meter, CalibrationTable::uploadCommands(*table))) {
            return abortRun(&meter, firstSendFailure);
        }
        emit statusMessage(tr("Calibration factors loaded."));
    }

    enterState(CalibrationState::AwaitingConfirmation);
    const QString question = tr("Sensor must be connected to the RF Power Output to continue. Is it connected?");
    if (cancelRequested.load() || !confirm || !confirm(question)) {
        return abortRun(nullptr, RigResult::failure(RigError::Aborted, tr("Calibration aborted by user.")));
    }

    // Zero
    enterState(CalibrationState::Zeroing);
    emit statusMessage(tr("Zeroing the sensor..."));
    // RF power mode, trigger off (free run); zero; SRQ when the zero has finished
    if (!sendAll(meter, { QStringLiteral("M4T0"), QStringLiteral("ZR"), QStringLiteral("22.3SP") })) {
        return abortRun(&meter, firstSendFailure);
    }

    enterState(CalibrationState::WaitingZeroComplete);
    RigResult waited = waitForServiceRequest(meter, "zero");
    if (!waited.ok()) {
        return abortRun(&meter, waited);
    }
    if (!send(meter, QStringLiteral("22.0SP"))) {
        return abortRun(&meter, firstSendFailure);
    }

    // Calibrate
    enterState(CalibrationState::Calibrating);
    emit statusMessage(tr("Calibrating the sensor..."));
    if (!sendAll(meter, { QStringLiteral("M4T0"), QStringLiteral("C1"), QStringLiteral("22.3SP") })) {
        return abortRun(&meter, firstSendFailure);
    }

    enterState(CalibrationState::WaitingCalComplete);
    waited = waitForServiceRequest(meter, "calibration");
    if (!waited.ok()) {
        return abortRun(&meter, waited);
    }
    if (!send(meter, QStringLiteral("22.0SP"))) {
        return abortRun(&meter, firstSendFailure);
    }

    // Store the calibration, then switch the calibrator off
    enterState(CalibrationState::Saving);
    if (!sendAll(meter, { QStringLiteral("SC"), QStringLiteral("C0") })) {
        return abortRun(&meter, firstSendFailure);
    }

    activeWait.store(nullptr);
    enterState(CalibrationState::Complete);

    RigResult result = RigResult::success();
    if (!firstSendFailure.ok()) {
        result.message = tr("Calibration process completed with command errors: %1").arg(firstSendFailure.message);
        qWarning() << "[CalibrationOrchestrator]" << result.message;
    } else {
        result.message = tr("Calibration process completed.");
    }
    emit statusMessage(result.message);
    return result;
}
