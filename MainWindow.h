#pragma once
#include <QMainWindow>
#include <QColor>
#include <QPushButton>
#include <QSpinBox>
#include <QDoubleSpinBox>
#include <QCheckBox>
#include <QLabel>
#include <QTextEdit>
#include <QThread>
#include "RigTypes.h"
#include "SessionManager.h"

class CalibrationOrchestrator;
class MeasurementSetup;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const SessionConfig &config, QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    // Instrument addresses and connection
    void onApplyAddressesClicked();
    void onConnectButtonClicked();
    void onDisconnectButtonClicked();
    void handleConnectionChanged(InstrumentRole role, bool connected);

    // Calibration
    void onCalibrateClicked();
    void onAbortClicked();
    void onCalibrationStateChanged(CalibrationState state);
    void onCalibrationFinished(const RigResult &result);

    // Expected frequency
    void onSetFrequencyClicked();

    // Utility
    void onStatusMessage(const QString &msg);
    void onRigError(const QString &msg);

private:
    void setupUi();
    void setupConnections();
    void updateUiState();
    void showStatus(const QString &msg);
    void appendLog(const QString &msg, const QColor &color);
    bool askConfirmation(const QString &question);

    // UI widgets - Addresses
    QSpinBox *measurementAddressSpin = nullptr;
    QSpinBox *sourceAddressSpin = nullptr;
    QPushButton *applyAddressesBtn = nullptr;

    // UI widgets - Connection
    QPushButton *connectButton = nullptr;
    QPushButton *disconnectButton = nullptr;
    QLabel *measurementStatusLabel = nullptr;
    QLabel *sourceStatusLabel = nullptr;

    // UI widgets - Calibration
    QPushButton *calibrateBtn = nullptr;
    QPushButton *abortBtn = nullptr;
    QCheckBox *abortOnErrorCheck = nullptr;
    QLabel *calStateLabel = nullptr;

    // UI widgets - Expected frequency
    QDoubleSpinBox *frequencySpin = nullptr;
    QPushButton *setFrequencyBtn = nullptr;
    QLabel *planLabel = nullptr;

    QTextEdit *logView = nullptr;
    QLabel *statusLabel = nullptr;

    // State variables
    bool calibrationRunning = false;

    // Managers
    SessionManager *sessionManager;
    CalibrationOrchestrator *orchestrator;
    MeasurementSetup *measurementSetup;
    QThread *calibrationThread = nullptr;
};
