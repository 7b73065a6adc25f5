#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include "RigTypes.h"

struct FrequencyPlan {
    RigError error = RigError::None;
    QString message;

    bool loEnabled = false;
    double incrementGHz = 0.0;
    double loFrequencyMHz = 0.0;
    double sourceFrequencyGHz = 0.0;
    double sourceLevelDbm = 0.0;

    // Command lines in send order, one list per endpoint
    QStringList measurementCommands;
    QStringList sourceCommands;

    bool ok() const { return error == RigError::None; }
};

// Chooses the 8902A LO offset and the 8673B setting for a measurement
// frequency. No I/O.
class FrequencyPlanner {
public:
    static constexpr double MIN_FREQUENCY_GHZ = 0.00015;
    static constexpr double MAX_FREQUENCY_GHZ = 18.0;
    // At or below this the 8902A measures directly, without the LO path
    static constexpr double DIRECT_LIMIT_GHZ = 1.3;
    // The offset frequency f + inc must end up above this
    static constexpr double LO_FLOOR_GHZ = 2.0;
    static constexpr double REFERENCE_SOURCE_GHZ = 3.0;
    static constexpr double REFERENCE_LEVEL_DBM = -70.0;
    static constexpr double LO_LEVEL_DBM = 8.0;

    static const QVector<double> &increments();
    static bool isInDomain(double frequencyGHz);
    static FrequencyPlan plan(double frequencyGHz);

    // Up to 15 significant digits, trailing zeros dropped (2620.53, 2.62053)
    static QString formatNumber(double value);
};
