#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include "MainWindow.h"
#include "SessionManager.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("HP8902Rig");

    qRegisterMetaType<InstrumentRole>();
    qRegisterMetaType<CalibrationState>();

    SessionConfig config;

    QCommandLineParser parser;
    parser.setApplicationDescription("HP 8902A / HP 8673B measurement rig control");
    parser.addHelpOption();
    QCommandLineOption analyzerOption("analyzer-address", "GPIB address of the HP 8902A (default 14).", "address", QString::number(config.measurementAddress));
    QCommandLineOption sourceOption("source-address", "GPIB address of the HP 8673B (default 19).", "address", QString::number(config.sourceAddress));
    QCommandLineOption boardOption("board", "GPIB board index.", "index", QString::number(config.board));
    QCommandLineOption tableOption("cal-table", "Calibration factor file.", "path", config.calibrationTablePath);
    QCommandLineOption srqTimeoutOption("srq-timeout", "Milliseconds to wait for a service request, negative waits forever.", "ms", QString::number(config.srqTimeoutMs));
    QCommandLineOption abortOnErrorOption("abort-on-error", "Abort the calibration when a command cannot be sent.");
    parser.addOptions({ analyzerOption, sourceOption, boardOption, tableOption, srqTimeoutOption, abortOnErrorOption });
    parser.process(app);

    bool ok = true;
    bool allOk = true;
    const int measurementAddress = parser.value(analyzerOption).toInt(&ok);
    allOk = allOk && ok;
    const int sourceAddress = parser.value(sourceOption).toInt(&ok);
    allOk = allOk && ok;
    config.board = parser.value(boardOption).toInt(&ok);
    allOk = allOk && ok && config.board >= 0;
    config.srqTimeoutMs = parser.value(srqTimeoutOption).toInt(&ok);
    allOk = allOk && ok;
    if (!allOk) {
        qCritical() << "Invalid numeric option";
        parser.showHelp(1);
    }

    RigResult addresses = SessionManager::validateAddresses(measurementAddress, sourceAddress);
    if (!addresses.ok()) {
        qCritical().noquote() << addresses.message;
        return 1;
    }
    config.measurementAddress = measurementAddress;
    config.sourceAddress = sourceAddress;
    config.calibrationTablePath = parser.value(tableOption);
    if (parser.isSet(abortOnErrorOption)) {
        config.failurePolicy = FailurePolicy::AbortOnError;
    }

    MainWindow w(config);
    w.show();

    return app.exec();
}
