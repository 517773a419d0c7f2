#include "main_window.h"
#include "log_widget.h"
#include "memory_watch_widget.h"
#include "settings_dialog.h"

#include <QApplication>
#include <QCloseEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QMenuBar>
#include <QMessageBox>
#include <QSplitter>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>
#include <chrono>

using SimShell::ControlCommand;
using SimShell::SimulationState;
using SimShell::StateMachine;

MainWindow::MainWindow(SimShell::AsyncBridge *bridge, QSettings *settings, QWidget *parent)
    : QMainWindow(parent)
    , m_bridge(bridge)
    , m_settings(settings)
    , m_loadAction(nullptr)
    , m_startAction(nullptr)
    , m_pauseAction(nullptr)
    , m_resetAction(nullptr)
    , m_watchWidget(nullptr)
    , m_tabs(nullptr)
    , m_appLog(nullptr)
    , m_monitorLog(nullptr)
    , m_settingsDialog(nullptr)
    , m_stateLabel(nullptr)
    , m_engineLabel(nullptr)
    , m_busyIndicator(nullptr)
{
    setWindowTitle("SimShell");
    setMinimumSize(800, 600);
    resize(1024, 768);

    setupMenuBar();
    setupToolBar();
    setupStatusBar();
    setupCentralWidget();

    // Connect bridge signals
    connect(m_bridge, &SimShell::AsyncBridge::stateChanged,
            this, &MainWindow::onStateChanged);
    connect(m_bridge, &SimShell::AsyncBridge::controlPendingChanged,
            this, &MainWindow::onControlPendingChanged);
    connect(m_bridge, &SimShell::AsyncBridge::logAppended,
            this, &MainWindow::onLogAppended);

    // Entries logged before the window existed
    for (const auto &entry : m_bridge->appLog()) {
        m_appLog->addEntry(entry);
    }
    for (const auto &entry : m_bridge->monitorLog()) {
        m_monitorLog->addEntry(entry);
    }

    onStateChanged(m_bridge->state(), m_bridge->lastError());
}

MainWindow::~MainWindow()
{
}

void MainWindow::setupMenuBar()
{
    // File menu
    QMenu *fileMenu = menuBar()->addMenu("&File");

    m_loadAction = fileMenu->addAction("&Load Script...");
    m_loadAction->setShortcut(QKeySequence::Open);
    connect(m_loadAction, &QAction::triggered, this, &MainWindow::loadScript);

    fileMenu->addSeparator();

    QAction *exitAction = fileMenu->addAction("E&xit");
    exitAction->setShortcut(QKeySequence::Quit);
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    // Simulation menu
    QMenu *simulationMenu = menuBar()->addMenu("&Simulation");

    m_startAction = simulationMenu->addAction("&Start");
    m_startAction->setShortcut(Qt::Key_F5);
    connect(m_startAction, &QAction::triggered, this, &MainWindow::startSimulation);

    m_pauseAction = simulationMenu->addAction("&Pause");
    m_pauseAction->setShortcut(Qt::Key_F6);
    connect(m_pauseAction, &QAction::triggered, this, &MainWindow::pauseSimulation);

    m_resetAction = simulationMenu->addAction("&Reset");
    m_resetAction->setShortcut(Qt::Key_F7);
    connect(m_resetAction, &QAction::triggered, this, &MainWindow::resetSimulation);

    // Settings menu
    QMenu *settingsMenu = menuBar()->addMenu("S&ettings");

    QAction *settingsAction = settingsMenu->addAction("&Configure...");
    connect(settingsAction, &QAction::triggered, this, &MainWindow::showSettings);

    // Help menu
    QMenu *helpMenu = menuBar()->addMenu("&Help");

    QAction *aboutAction = helpMenu->addAction("&About SimShell...");
    connect(aboutAction, &QAction::triggered, this, &MainWindow::showAbout);
}

void MainWindow::setupToolBar()
{
    QToolBar *mainToolBar = addToolBar("Main");
    mainToolBar->addAction(m_loadAction);
    mainToolBar->addSeparator();
    mainToolBar->addAction(m_startAction);
    mainToolBar->addAction(m_pauseAction);
    mainToolBar->addAction(m_resetAction);
}

void MainWindow::setupStatusBar()
{
    m_stateLabel = new QLabel("Status: Idle");
    m_engineLabel = new QLabel(QString("Engine: %1").arg(m_bridge->engineName()));
    m_busyIndicator = new QProgressBar();
    m_busyIndicator->setRange(0, 0);
    m_busyIndicator->setMaximumWidth(120);
    m_busyIndicator->setVisible(false);

    statusBar()->addWidget(m_stateLabel);
    statusBar()->addPermanentWidget(m_busyIndicator);
    statusBar()->addPermanentWidget(m_engineLabel);
}

void MainWindow::setupCentralWidget()
{
    QSplitter *splitter = new QSplitter(Qt::Vertical);

    m_watchWidget = new MemoryWatchWidget(m_bridge);
    splitter->addWidget(m_watchWidget);

    m_tabs = new QTabWidget;
    m_appLog = new LogWidget("simshell_app_log");
    m_tabs->addTab(m_appLog, "App Logs");

    m_monitorLog = new LogWidget("simshell_monitor_log");
    m_monitorLog->setCommandInputEnabled(true);
    connect(m_monitorLog, &LogWidget::commandEntered, this, &MainWindow::onMonitorCommand);
    m_tabs->addTab(m_monitorLog, "Monitor");

    splitter->addWidget(m_tabs);
    setCentralWidget(splitter);
}

void MainWindow::loadScript()
{
    QString fileName = QFileDialog::getOpenFileName(
        this,
        "Open Script",
        m_settings->value("paths/lastScriptDir").toString(),
        "Renode Scripts (*.resc);;All Files (*)"
    );

    if (fileName.isEmpty()) {
        return;
    }
    m_settings->setValue("paths/lastScriptDir", QFileInfo(fileName).absolutePath());

    auto result = m_bridge->requestLoadScript(fileName);
    if (result.accepted()) {
        m_currentScript = fileName;
    }
    report(result);
}

void MainWindow::startSimulation()
{
    report(m_bridge->requestStart());
}

void MainWindow::pauseSimulation()
{
    report(m_bridge->requestPause());
}

void MainWindow::resetSimulation()
{
    report(m_bridge->requestReset());
}

void MainWindow::report(const SimShell::RequestResult &result)
{
    if (!result.accepted()) {
        statusBar()->showMessage(result.message, 5000);
    }
}

void MainWindow::onMonitorCommand(const QString &command)
{
    report(m_bridge->requestMonitorCommand(command));
}

void MainWindow::showSettings()
{
    if (!m_settingsDialog) {
        m_settingsDialog = new SettingsDialog(m_settings, this);
        connect(m_settingsDialog, &SettingsDialog::settingsApplied,
                this, &MainWindow::onSettingsApplied);
    }
    m_settingsDialog->exec();
}

void MainWindow::onSettingsApplied(const SimShell::Settings &settings)
{
    m_bridge->setPollInterval(std::chrono::milliseconds(settings.poll_interval_ms));
    SimShell::log::set_level(settings.log_level);
    statusBar()->showMessage("Settings saved. Engine and worker changes apply after a restart.", 5000);
}

void MainWindow::showAbout()
{
    QMessageBox::about(this, "About SimShell",
        "SimShell\n\n"
        "Desktop front-end for hardware simulation engines.\n"
        "Load scripts, control execution, send monitor commands\n"
        "and watch memory while the simulation runs.");
}

void MainWindow::onStateChanged(SimulationState state, const QString &error)
{
    QString text = QString("Status: %1").arg(SimShell::to_string(state));
    if (state == SimulationState::Loaded && !m_currentScript.isEmpty()) {
        text += QString(" (%1)").arg(QFileInfo(m_currentScript).fileName());
    }
    m_stateLabel->setText(text);

    if (state == SimulationState::Error && !error.isEmpty()) {
        QMessageBox::critical(this, "Engine Error", error);
    }
    updateActions();
}

void MainWindow::onControlPendingChanged(bool pending)
{
    m_busyIndicator->setVisible(pending);
    updateActions();
}

void MainWindow::onLogAppended(const SimShell::LogEntry &entry)
{
    if (entry.source == SimShell::LogSource::Monitor) {
        m_monitorLog->addEntry(entry);
    } else {
        m_appLog->addEntry(entry);
    }
}

void MainWindow::updateActions()
{
    const SimulationState state = m_bridge->state();
    const bool idle = !m_bridge->isControlPending();

    m_loadAction->setEnabled(idle && StateMachine::target(ControlCommand::LoadScript, state).has_value());
    m_startAction->setEnabled(idle && StateMachine::target(ControlCommand::Start, state).has_value());
    m_pauseAction->setEnabled(idle && StateMachine::target(ControlCommand::Pause, state).has_value());
    m_resetAction->setEnabled(idle);
    m_monitorLog->setCommandInputActive(state != SimulationState::Idle);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    m_bridge->shutdown();
    event->accept();
}
