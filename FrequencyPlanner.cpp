#include "FrequencyPlanner.h"

const QVector<double> &FrequencyPlanner::increments() {
    static const QVector<double> table = { 0.12053, 0.24053, 0.48053, 0.60053, 0.68053 };
    return table;
}

bool FrequencyPlanner::isInDomain(double frequencyGHz) {
    return frequencyGHz >= MIN_FREQUENCY_GHZ && frequencyGHz <= MAX_FREQUENCY_GHZ;
}

QString FrequencyPlanner::formatNumber(double value) {
    return QString::number(value, 'g', 15);
}

FrequencyPlan FrequencyPlanner::plan(double frequencyGHz) {
    FrequencyPlan result;

    if (!isInDomain(frequencyGHz)) {
        result.error = RigError::InvalidFrequency;
        result.message = QStringLiteral("Frequency must be between %1 and %2 GHz")
                             .arg(formatNumber(MIN_FREQUENCY_GHZ), formatNumber(MAX_FREQUENCY_GHZ));
        return result;
    }

    if (frequencyGHz <= DIRECT_LIMIT_GHZ) {
        result.loEnabled = false;
        result.sourceFrequencyGHz = REFERENCE_SOURCE_GHZ;
        result.sourceLevelDbm = REFERENCE_LEVEL_DBM;
        result.measurementCommands << QStringLiteral("27.3SP0MZ");
        result.sourceCommands << QStringLiteral("FR3GZLE-70DM");
        return result;
    }

    // First increment that lifts the offset frequency above the floor
    bool found = false;
    for (double inc : increments()) {
        if (frequencyGHz + inc > LO_FLOOR_GHZ) {
            result.incrementGHz = inc;
            found = true;
            break;
        }
    }
    if (!found) {
        result.error = RigError::InvalidFrequency;
        result.message = QStringLiteral("No LO increment lifts %1 GHz above %2 GHz")
                             .arg(formatNumber(frequencyGHz), formatNumber(LO_FLOOR_GHZ));
        return result;
    }

    const double offsetGHz = frequencyGHz + result.incrementGHz;
    result.loEnabled = true;
    result.loFrequencyMHz = offsetGHz * 1000;
    result.sourceFrequencyGHz = offsetGHz;
    result.sourceLevelDbm = LO_LEVEL_DBM;
    result.measurementCommands << QStringLiteral("27.3SP%1MZ").arg(formatNumber(result.loFrequencyMHz));
    result.sourceCommands << QStringLiteral("FR%1GZ").arg(formatNumber(offsetGHz))
                          << QStringLiteral("LE8DM");
    return result;
}
