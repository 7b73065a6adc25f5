#include "MainWindow.h"
#include "CalibrationOrchestrator.h"
#include "CalibrationTable.h"
#include "FrequencyPlanner.h"
#include "MeasurementSetup.h"
#include "VisaGpibDevice.h"
#include <QDateTime>
#include <QDebug>
#include <QGroupBox>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QStatusBar>
#include <QVBoxLayout>

MainWindow::MainWindow(const SessionConfig &config, QWidget *parent)
    : QMainWindow(parent),
      sessionManager(new SessionManager(config, []() { return std::make_unique<VisaGpibDevice>(); }, this)),
      orchestrator(nullptr),
      measurementSetup(new MeasurementSetup(*sessionManager, this))
{
    orchestrator = new CalibrationOrchestrator(*sessionManager,
                                               [this](const QString &question) { return askConfirmation(question); },
                                               this);

    setupUi();
    setupConnections();
    updateUiState();
    showStatus("Disconnected");
}

MainWindow::~MainWindow()
{
    if (calibrationThread) {
        orchestrator->cancel();
        calibrationThread->wait();
        delete calibrationThread;
        calibrationThread = nullptr;
    }
    QObject::disconnect(sessionManager, nullptr, this, nullptr);
    sessionManager->disconnectAll();
}

void MainWindow::setupUi()
{
    setWindowTitle("HP8902A Measurements");
    QWidget *central = new QWidget(this);
    QVBoxLayout *mainLayout = new QVBoxLayout(central);

    // --- Addresses ---
    QGroupBox *addressGroup = new QGroupBox("GPIB Addresses");
    QGridLayout *addressLayout = new QGridLayout(addressGroup);
    measurementAddressSpin = new QSpinBox();
    measurementAddressSpin->setRange(SessionConfig::MIN_ADDRESS, SessionConfig::MAX_ADDRESS);
    measurementAddressSpin->setValue(sessionManager->config().measurementAddress);
    sourceAddressSpin = new QSpinBox();
    sourceAddressSpin->setRange(SessionConfig::MIN_ADDRESS, SessionConfig::MAX_ADDRESS);
    sourceAddressSpin->setValue(sessionManager->config().sourceAddress);
    applyAddressesBtn = new QPushButton("Set GPIB Addresses");
    addressLayout->addWidget(new QLabel("HP 8902A:"), 0, 0);
    addressLayout->addWidget(measurementAddressSpin, 0, 1);
    addressLayout->addWidget(new QLabel("HP 8673B:"), 1, 0);
    addressLayout->addWidget(sourceAddressSpin, 1, 1);
    addressLayout->addWidget(applyAddressesBtn, 2, 0, 1, 2);

    // --- Connection ---
    QGroupBox *connectionGroup = new QGroupBox("Instruments");
    QGridLayout *connectionLayout = new QGridLayout(connectionGroup);
    connectButton = new QPushButton("Connect to instruments");
    disconnectButton = new QPushButton("Disconnect");
    measurementStatusLabel = new QLabel("HP 8902A: disconnected");
    sourceStatusLabel = new QLabel("HP 8673B: disconnected");
    connectionLayout->addWidget(measurementStatusLabel, 0, 0, 1, 2);
    connectionLayout->addWidget(sourceStatusLabel, 1, 0, 1, 2);
    connectionLayout->addWidget(connectButton, 2, 0);
    connectionLayout->addWidget(disconnectButton, 2, 1);

    QHBoxLayout *topLayout = new QHBoxLayout();
    topLayout->addWidget(addressGroup);
    topLayout->addWidget(connectionGroup);
    mainLayout->addLayout(topLayout);

    // --- Calibration ---
    QGroupBox *calGroup = new QGroupBox("Sensor Calibration");
    QHBoxLayout *calLayout = new QHBoxLayout(calGroup);
    calibrateBtn = new QPushButton("Calibrate Sensor");
    abortBtn = new QPushButton("Abort");
    abortOnErrorCheck = new QCheckBox("Abort on command error");
    abortOnErrorCheck->setChecked(sessionManager->config().failurePolicy == FailurePolicy::AbortOnError);
    abortOnErrorCheck->setToolTip("Stop the calibration as soon as a command cannot be sent.");
    calStateLabel = new QLabel(stateName(CalibrationState::Idle));
    calLayout->addWidget(calibrateBtn);
    calLayout->addWidget(abortBtn);
    calLayout->addWidget(abortOnErrorCheck);
    calLayout->addStretch();
    calLayout->addWidget(new QLabel("State:"));
    calLayout->addWidget(calStateLabel);
    mainLayout->addWidget(calGroup);

    // --- Expected frequency ---
    QGroupBox *freqGroup = new QGroupBox("Expected Frequency");
    QHBoxLayout *freqLayout = new QHBoxLayout(freqGroup);
    frequencySpin = new QDoubleSpinBox();
    frequencySpin->setDecimals(5);
    frequencySpin->setRange(FrequencyPlanner::MIN_FREQUENCY_GHZ, FrequencyPlanner::MAX_FREQUENCY_GHZ);
    frequencySpin->setSingleStep(0.1);
    frequencySpin->setValue(1.0);
    frequencySpin->setSuffix(" GHz");
    setFrequencyBtn = new QPushButton("Set expected frequency");
    planLabel = new QLabel();
    freqLayout->addWidget(frequencySpin);
    freqLayout->addWidget(setFrequencyBtn);
    freqLayout->addWidget(planLabel, 1);
    mainLayout->addWidget(freqGroup);

    // --- Log ---
    logView = new QTextEdit();
    logView->setReadOnly(true);
    mainLayout->addWidget(logView, 1);

    setCentralWidget(central);

    statusLabel = new QLabel();
    statusBar()->addPermanentWidget(statusLabel);
    resize(720, 520);
}

void MainWindow::setupConnections()
{
    connect(applyAddressesBtn, &QPushButton::clicked, this, &MainWindow::onApplyAddressesClicked);
    connect(connectButton, &QPushButton::clicked, this, &MainWindow::onConnectButtonClicked);
    connect(disconnectButton, &QPushButton::clicked, this, &MainWindow::onDisconnectButtonClicked);
    connect(calibrateBtn, &QPushButton::clicked, this, &MainWindow::onCalibrateClicked);
    connect(abortBtn, &QPushButton::clicked, this, &MainWindow::onAbortClicked);
    connect(setFrequencyBtn, &QPushButton::clicked, this, &MainWindow::onSetFrequencyClicked);
    connect(abortOnErrorCheck, &QCheckBox::toggled, this, [this](bool checked) {
        sessionManager->setFailurePolicy(checked ? FailurePolicy::AbortOnError : FailurePolicy::ContinueOnError);
    });

    connect(sessionManager, &SessionManager::connectionChanged, this, &MainWindow::handleConnectionChanged);
    connect(sessionManager, &SessionManager::statusMessage, this, &MainWindow::onStatusMessage);
    connect(sessionManager, &SessionManager::errorOccurred, this, &MainWindow::onRigError);

    // The orchestrator emits from the calibration thread, these are queued
    connect(orchestrator, &CalibrationOrchestrator::stateChanged, this, &MainWindow::onCalibrationStateChanged);
    connect(orchestrator, &CalibrationOrchestrator::statusMessage, this, &MainWindow::onStatusMessage);
    connect(orchestrator, &CalibrationOrchestrator::errorOccurred, this, &MainWindow::onRigError);

    connect(measurementSetup, &MeasurementSetup::statusMessage, this, &MainWindow::onStatusMessage);
    connect(measurementSetup, &MeasurementSetup::errorOccurred, this, &MainWindow::onRigError);
}

void MainWindow::updateUiState()
{
    const bool anyConnected = sessionManager->anyConnected();
    const bool bothConnected = sessionManager->bothConnected();

    measurementAddressSpin->setEnabled(!anyConnected && !calibrationRunning);
    sourceAddressSpin->setEnabled(!anyConnected && !calibrationRunning);
    applyAddressesBtn->setEnabled(!anyConnected && !calibrationRunning);
    connectButton->setEnabled(!calibrationRunning);
    disconnectButton->setEnabled(anyConnected && !calibrationRunning);
    calibrateBtn->setEnabled(bothConnected && !calibrationRunning);
    abortBtn->setEnabled(calibrationRunning);
    abortOnErrorCheck->setEnabled(!calibrationRunning);
    setFrequencyBtn->setEnabled(bothConnected && !calibrationRunning);

    statusLabel->setText(QString("HP 8902A GPIB Address: %1   HP 8673B GPIB Address: %2")
                             .arg(sessionManager->config().measurementAddress)
                             .arg(sessionManager->config().sourceAddress));
}

void MainWindow::showStatus(const QString &msg)
{
    statusBar()->showMessage(msg, 3000);
}

void MainWindow::appendLog(const QString &msg, const QColor &color)
{
    logView->setTextColor(color);
    logView->append(QDateTime::currentDateTime().toString("hh:mm:ss ") + msg);
}

bool MainWindow::askConfirmation(const QString &question)
{
    // Called from the calibration thread, the dialog has to live on the GUI thread
    bool confirmed = false;
    QMetaObject::invokeMethod(this, [this, &question]() {
        return QMessageBox::question(this, "Calibrate Sensor", question) == QMessageBox::Yes;
    }, Qt::BlockingQueuedConnection, &confirmed);
    return confirmed;
}

// --- SLOT IMPLEMENTATIONS ---

void MainWindow::onApplyAddressesClicked()
{
    RigResult result = sessionManager->setAddresses(measurementAddressSpin->value(), sourceAddressSpin->value());
    if (!result.ok()) {
        QMessageBox::warning(this, "GPIB Addresses", result.message);
        measurementAddressSpin->setValue(sessionManager->config().measurementAddress);
        sourceAddressSpin->setValue(sessionManager->config().sourceAddress);
    }
    updateUiState();
}

void MainWindow::onConnectButtonClicked()
{
    showStatus("Connecting...");
    RigResult result = sessionManager->connectAll();
    if (!result.ok()) {
        QMessageBox::warning(this, "Connection Error", result.message);
        showStatus("Connection failed");
    } else {
        showStatus("Connected");
    }
    updateUiState();
}

void MainWindow::onDisconnectButtonClicked()
{
    sessionManager->disconnectAll();
    showStatus("Disconnected");
    updateUiState();
}

void MainWindow::handleConnectionChanged(InstrumentRole role, bool connected)
{
    QLabel *label = role == InstrumentRole::MeasurementUnit ? measurementStatusLabel : sourceStatusLabel;
    label->setText(QString("%1: %2").arg(roleName(role),
                                         connected ? QString("connected at %1").arg(sessionManager->address(role))
                                                   : QString("disconnected")));
    updateUiState();
}

void MainWindow::onCalibrateClicked()
{
    if (calibrationRunning) return;
    if (!sessionManager->bothConnected()) {
        QMessageBox::warning(this, "Calibrate Sensor", "Both instruments must be connected before calibration can proceed.");
        return;
    }

    CalibrationFactors table;
    bool createdDefault = false;
    RigResult loaded = CalibrationTable::loadOrCreate(sessionManager->config().calibrationTablePath, table, &createdDefault);
    if (createdDefault) {
        appendLog("Warning: Loading default calibration factor file.", Qt::darkYellow);
    }
    if (!loaded.ok()) {
        QMessageBox::critical(this, "Calibration Factors", loaded.message);
        return;
    }

    orchestrator->clearCancel();
    calibrationRunning = true;
    updateUiState();
    qDebug() << "[MainWindow] Starting calibration with" << table.size() << "factors";

    calibrationThread = QThread::create([this, table]() {
        RigResult result = orchestrator->run(table);
        QMetaObject::invokeMethod(this, [this, result]() { onCalibrationFinished(result); }, Qt::QueuedConnection);
    });
    calibrationThread->start();
}

void MainWindow::onAbortClicked()
{
    if (!calibrationRunning) return;
    appendLog("Abort requested.", Qt::darkYellow);
    orchestrator->cancel();
}

void MainWindow::onCalibrationStateChanged(CalibrationState state)
{
    calStateLabel->setText(stateName(state));
}

void MainWindow::onCalibrationFinished(const RigResult &result)
{
    if (calibrationThread) {
        calibrationThread->wait();
        calibrationThread->deleteLater();
        calibrationThread = nullptr;
    }
    calibrationRunning = false;
    updateUiState();
    if (result.ok()) {
        showStatus("Calibration complete");
    } else {
        showStatus(QString("Calibration stopped: %1").arg(errorName(result.error)));
    }
}

void MainWindow::onSetFrequencyClicked()
{
    const double frequencyGHz = frequencySpin->value();
    RigResult result = measurementSetup->setExpectedFrequency(frequencyGHz);
    const FrequencyPlan &plan = measurementSetup->lastPlan();
    if (result.ok()) {
        planLabel->setText(plan.loEnabled
                               ? QString("LO %1 MHz, 8673B %2 GHz at +8 dBm")
                                     .arg(FrequencyPlanner::formatNumber(plan.loFrequencyMHz),
                                          FrequencyPlanner::formatNumber(plan.sourceFrequencyGHz))
                               : QString("LO off, 8673B 3 GHz at -70 dBm"));
    } else {
        planLabel->setText(errorName(result.error));
        if (result.error == RigError::InvalidFrequency) {
            QMessageBox::warning(this, "Expected Frequency", result.message);
        }
    }
}

void MainWindow::onStatusMessage(const QString &msg)
{
    appendLog(msg, msg.startsWith("Warning") ? Qt::darkYellow : Qt::darkGreen);
    showStatus(msg);
}

void MainWindow::onRigError(const QString &msg)
{
    appendLog(msg, Qt::red);
}
