#pragma once

#include "bridge/async_bridge.h"
#include "core/settings.h"

#include <QMainWindow>
#include <QLabel>
#include <QProgressBar>
#include <QSettings>
#include <QTabWidget>

class QAction;
class LogWidget;
class MemoryWatchWidget;
class SettingsDialog;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(SimShell::AsyncBridge *bridge, QSettings *settings, QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    void loadScript();
    void startSimulation();
    void pauseSimulation();
    void resetSimulation();
    void showSettings();
    void showAbout();

    void onStateChanged(SimShell::SimulationState state, const QString &error);
    void onControlPendingChanged(bool pending);
    void onLogAppended(const SimShell::LogEntry &entry);
    void onMonitorCommand(const QString &command);
    void onSettingsApplied(const SimShell::Settings &settings);

private:
    void setupMenuBar();
    void setupToolBar();
    void setupStatusBar();
    void setupCentralWidget();
    void updateActions();
    void report(const SimShell::RequestResult &result);
    void closeEvent(QCloseEvent *event) override;

    SimShell::AsyncBridge *m_bridge;
    QSettings *m_settings;

    // Actions
    QAction *m_loadAction;
    QAction *m_startAction;
    QAction *m_pauseAction;
    QAction *m_resetAction;

    // GUI components
    MemoryWatchWidget *m_watchWidget;
    QTabWidget *m_tabs;
    LogWidget *m_appLog;
    LogWidget *m_monitorLog;
    SettingsDialog *m_settingsDialog;

    // Status bar widgets
    QLabel *m_stateLabel;
    QLabel *m_engineLabel;
    QProgressBar *m_busyIndicator;

    QString m_currentScript;
};
