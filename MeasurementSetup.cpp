#include "MeasurementSetup.h"
#include "CommandChannel.h"
#include "SessionManager.h"
#include <QDebug>

MeasurementSetup::MeasurementSetup(SessionManager &sessions, QObject *parent)
    : QObject(parent), sessions(sessions) {}

RigResult MeasurementSetup::setExpectedFrequency(double frequencyGHz) {
    if (!sessions.bothConnected()) {
        QString msg = tr("Error: Both instruments must be connected before setting frequency can proceed.");
        emit errorOccurred(msg);
        return RigResult::failure(RigError::NotReady, msg);
    }

    plan = FrequencyPlanner::plan(frequencyGHz);
    if (!plan.ok()) {
        qWarning() << "[MeasurementSetup]" << plan.message;
        emit errorOccurred(plan.message);
        return RigResult::failure(plan.error, plan.message);
    }

    qDebug() << "[MeasurementSetup] f =" << frequencyGHz << "GHz, LO" << (plan.loEnabled ? "on" : "off")
             << "increment =" << plan.incrementGHz << "source =" << plan.sourceFrequencyGHz << "GHz";

    CommandChannel *meter = sessions.channel(InstrumentRole::MeasurementUnit);
    CommandChannel *source = sessions.channel(InstrumentRole::Source);

    QStringList failed;
    for (const QString &command : plan.measurementCommands) {
        if (!meter->sendCommand(command)) {
            failed << command;
        }
    }
    for (const QString &command : plan.sourceCommands) {
        if (!source->sendCommand(command)) {
            failed << command;
        }
    }

    if (!failed.isEmpty()) {
        QString msg = tr("Failed to send: %1").arg(failed.join(QStringLiteral(", ")));
        emit errorOccurred(msg);
        return RigResult::failure(RigError::WriteError, msg);
    }

    emit statusMessage(tr("Expected frequency set on both instruments."));
    return RigResult::success();
}
