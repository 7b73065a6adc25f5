#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include "RigTypes.h"

struct CalibrationFactor {
    double frequencyGHz = 0.0;
    double calFactorDb = 0.0;

    bool operator==(const CalibrationFactor &other) const {
        return frequencyGHz == other.frequencyGHz && calFactorDb == other.calFactorDb;
    }
};

using CalibrationFactors = QVector<CalibrationFactor>;

// Sensor calibration-factor table kept as a JSON file next to the program.
// Entry order is the order the factors are written into the 8902A.
class CalibrationTable {
public:
    static constexpr const char *DEFAULT_FILE_NAME = "CalFactors92A.json";

    // HP 11792A sensor table
    static CalibrationFactors defaultTable();

    static RigResult load(const QString &path, CalibrationFactors &factors);
    static RigResult save(const QString &path, const CalibrationFactors &factors);
    // Writes the default table first when the file does not exist yet.
    static RigResult loadOrCreate(const QString &path, CalibrationFactors &factors, bool *createdDefault = nullptr);

    static QStringList uploadCommands(const CalibrationFactors &factors);
};
