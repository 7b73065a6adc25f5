#include "CalibrationTable.h"
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace {
const QString FREQUENCY_KEY = QStringLiteral("Frequency");
const QString CAL_FACTOR_KEY = QStringLiteral("CalFactor");
}

CalibrationFactors CalibrationTable::defaultTable() {
    return {
        { 0.05, 100.0 },
        { 2.0, 96.3 },
        { 3.0, 94.8 },
        { 4.0, 93.9 },
        { 5.0, 92.9 },
        { 6.0, 91.9 },
        { 7.0, 91.1 },
        { 8.0, 90.3 },
        { 9.0, 89.3 },
        { 10.0, 88.5 },
        { 11.0, 87.5 },
        { 12.4, 87.0 },
        { 13.0, 86.1 },
        { 14.0, 85.6 },
        { 15.0, 85.4 },
        { 16.0, 84.9 },
        { 17.0, 84.6 },
        { 18.0, 84.1 },
    };
}

RigResult CalibrationTable::load(const QString &path, CalibrationFactors &factors) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[CalibrationTable] Failed to open file for reading:" << path;
        return RigResult::failure(RigError::TableError,
                                  QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return RigResult::failure(RigError::TableError,
                                  QStringLiteral("%1: %2 at offset %3")
                                      .arg(path, parseError.errorString())
                                      .arg(parseError.offset));
    }
    if (!doc.isArray()) {
        return RigResult::failure(RigError::TableError,
                                  QStringLiteral("%1: expected a list of calibration factors").arg(path));
    }

    CalibrationFactors loaded;
    const QJsonArray entries = doc.array();
    for (int i = 0; i < entries.size(); ++i) {
        const QJsonObject entry = entries.at(i).toObject();
        const QJsonValue frequency = entry.value(FREQUENCY_KEY);
        const QJsonValue calFactor = entry.value(CAL_FACTOR_KEY);
        if (!frequency.isDouble() || !calFactor.isDouble()) {
            return RigResult::failure(RigError::TableError,
                                      QStringLiteral("%1: entry %2 needs numeric %3 and %4")
                                          .arg(path)
                                          .arg(i)
                                          .arg(FREQUENCY_KEY, CAL_FACTOR_KEY));
        }
        loaded.append({ frequency.toDouble(), calFactor.toDouble() });
    }

    factors = loaded;
    qDebug() << "[CalibrationTable] Loaded" << factors.size() << "factors from" << path;
    return RigResult::success();
}

RigResult CalibrationTable::save(const QString &path, const CalibrationFactors &factors) {
    QJsonArray entries;
    for (const CalibrationFactor &factor : factors) {
        QJsonObject entry;
        entry.insert(FREQUENCY_KEY, factor.frequencyGHz);
        entry.insert(CAL_FACTOR_KEY, factor.calFactorDb);
        entries.append(entry);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "[CalibrationTable] Failed to open file for writing:" << path;
        return RigResult::failure(RigError::TableError,
                                  QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }
    const QByteArray json = QJsonDocument(entries).toJson(QJsonDocument::Compact);
    if (file.write(json) != json.size()) {
        return RigResult::failure(RigError::TableError,
                                  QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }
    file.close();
    qDebug() << "[CalibrationTable] Saved" << factors.size() << "factors to" << path;
    return RigResult::success();
}

RigResult CalibrationTable::loadOrCreate(const QString &path, CalibrationFactors &factors, bool *createdDefault) {
    if (createdDefault) {
        *createdDefault = false;
    }
    if (!QFile::exists(path)) {
        qWarning() << "[CalibrationTable] Creating default calibration factor file:" << path;
        RigResult created = save(path, defaultTable());
        if (!created.ok()) {
            return created;
        }
        if (createdDefault) {
            *createdDefault = true;
        }
    }
    return load(path, factors);
}

QStringList CalibrationTable::uploadCommands(const CalibrationFactors &factors) {
    QStringList commands;
    // Frequency offset table mode, the down converter is in use
    commands << QStringLiteral("27.1SP");
    // Clear the table
    commands << QStringLiteral("37.9SP");
    for (const CalibrationFactor &factor : factors) {
        commands << QStringLiteral("37.3SP%1MZ%2CF")
                        .arg(QString::number(factor.frequencyGHz * 1000, 'f', 2),
                             QString::number(factor.calFactorDb, 'f', 2));
    }
    return commands;
}
