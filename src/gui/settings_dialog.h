#pragma once

#include "core/settings.h"

#include <QDialog>
#include <QTabWidget>
#include <QSettings>

class QComboBox;
class QSpinBox;
class QLineEdit;

class SettingsDialog : public QDialog
{
    Q_OBJECT

public:
    explicit SettingsDialog(QSettings *store, QWidget *parent = nullptr);

    SimShell::Settings settings() const { return m_values; }

signals:
    void settingsApplied(const SimShell::Settings &settings);

private slots:
    void applySettings();
    void resetToDefaults();
    void accept() override;

private:
    void setupUI();
    QWidget* createEngineTab();
    QWidget* createPollingTab();
    void loadSettings();
    void saveSettings();

    QTabWidget *m_tabWidget;
    QSettings *m_store;
    SimShell::Settings m_values;

    // Engine settings
    QComboBox *m_backend;
    QLineEdit *m_host;
    QSpinBox *m_port;
    QSpinBox *m_workers;
    QSpinBox *m_ioTimeout;

    // Polling settings
    QSpinBox *m_pollInterval;
    QSpinBox *m_callTimeout;
    QComboBox *m_logLevel;
};
