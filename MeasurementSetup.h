#pragma once
#include <QObject>
#include "FrequencyPlanner.h"
#include "RigTypes.h"

class SessionManager;

// Programs the 8902A LO offset and the 8673B for an expected measurement
// frequency.
class MeasurementSetup : public QObject {
    Q_OBJECT
public:
    explicit MeasurementSetup(SessionManager &sessions, QObject *parent = nullptr);

    RigResult setExpectedFrequency(double frequencyGHz);
    const FrequencyPlan &lastPlan() const { return plan; }

signals:
    void statusMessage(const QString &msg);
    void errorOccurred(const QString &msg);

private:
    SessionManager &sessions;
    FrequencyPlan plan;
};
