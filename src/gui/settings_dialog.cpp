#include "settings_dialog.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QLabel>
#include <QLineEdit>
#include <QSpinBox>
#include <QComboBox>
#include <QPushButton>
#include <QMessageBox>

using SimShell::Settings;

SettingsDialog::SettingsDialog(QSettings *store, QWidget *parent)
    : QDialog(parent)
    , m_store(store)
{
    setWindowTitle("SimShell Settings");
    setModal(true);
    resize(480, 360);

    setupUI();
    loadSettings();
}

void SettingsDialog::setupUI()
{
    QVBoxLayout *mainLayout = new QVBoxLayout(this);

    m_tabWidget = new QTabWidget;
    m_tabWidget->addTab(createEngineTab(), "Engine");
    m_tabWidget->addTab(createPollingTab(), "Polling");
    mainLayout->addWidget(m_tabWidget);

    // Button box
    QHBoxLayout *buttonLayout = new QHBoxLayout;

    QPushButton *okButton = new QPushButton("OK");
    QPushButton *cancelButton = new QPushButton("Cancel");
    QPushButton *applyButton = new QPushButton("Apply");
    QPushButton *resetButton = new QPushButton("Reset to Defaults");

    connect(okButton, &QPushButton::clicked, this, &SettingsDialog::accept);
    connect(cancelButton, &QPushButton::clicked, this, &SettingsDialog::reject);
    connect(applyButton, &QPushButton::clicked, this, &SettingsDialog::applySettings);
    connect(resetButton, &QPushButton::clicked, this, &SettingsDialog::resetToDefaults);

    buttonLayout->addWidget(resetButton);
    buttonLayout->addStretch();
    buttonLayout->addWidget(okButton);
    buttonLayout->addWidget(cancelButton);
    buttonLayout->addWidget(applyButton);

    mainLayout->addLayout(buttonLayout);
}

QWidget* SettingsDialog::createEngineTab()
{
    QWidget *widget = new QWidget;
    QVBoxLayout *layout = new QVBoxLayout(widget);

    QGroupBox *backendGroup = new QGroupBox("Backend");
    QFormLayout *backendLayout = new QFormLayout(backendGroup);

    m_backend = new QComboBox;
    m_backend->addItems({"mock", "renode"});
    backendLayout->addRow("Engine:", m_backend);
    backendLayout->addRow(new QLabel("Backend changes take effect after a restart."));

    layout->addWidget(backendGroup);

    QGroupBox *monitorGroup = new QGroupBox("Renode Monitor");
    QFormLayout *monitorLayout = new QFormLayout(monitorGroup);

    m_host = new QLineEdit;
    monitorLayout->addRow("Host:", m_host);

    m_port = new QSpinBox;
    m_port->setRange(1, 65535);
    monitorLayout->addRow("Port:", m_port);

    m_ioTimeout = new QSpinBox;
    m_ioTimeout->setRange(100, 120000);
    m_ioTimeout->setSuffix(" ms");
    monitorLayout->addRow("Socket Timeout:", m_ioTimeout);

    layout->addWidget(monitorGroup);

    QGroupBox *workerGroup = new QGroupBox("Workers");
    QFormLayout *workerLayout = new QFormLayout(workerGroup);

    m_workers = new QSpinBox;
    m_workers->setRange(1, 16);
    workerLayout->addRow("Engine Threads:", m_workers);
    workerLayout->addRow(new QLabel("Use 1 if the engine cannot take concurrent calls."));

    layout->addWidget(workerGroup);
    layout->addStretch();

    return widget;
}

QWidget* SettingsDialog::createPollingTab()
{
    QWidget *widget = new QWidget;
    QVBoxLayout *layout = new QVBoxLayout(widget);

    QGroupBox *pollGroup = new QGroupBox("Memory Watches");
    QFormLayout *pollLayout = new QFormLayout(pollGroup);

    m_pollInterval = new QSpinBox;
    m_pollInterval->setRange(50, 10000);
    m_pollInterval->setSingleStep(50);
    m_pollInterval->setSuffix(" ms");
    pollLayout->addRow("Poll Interval:", m_pollInterval);

    m_callTimeout = new QSpinBox;
    m_callTimeout->setRange(0, 600000);
    m_callTimeout->setSingleStep(500);
    m_callTimeout->setSuffix(" ms");
    m_callTimeout->setSpecialValueText("None");
    pollLayout->addRow("Engine Call Timeout:", m_callTimeout);

    layout->addWidget(pollGroup);

    QGroupBox *logGroup = new QGroupBox("Logging");
    QFormLayout *logLayout = new QFormLayout(logGroup);

    m_logLevel = new QComboBox;
    m_logLevel->addItems({"trace", "debug", "info", "warn", "error"});
    logLayout->addRow("Console Log Level:", m_logLevel);

    layout->addWidget(logGroup);
    layout->addStretch();

    return widget;
}

void SettingsDialog::loadSettings()
{
    m_values = Settings();
    m_values.load(*m_store);

    m_backend->setCurrentText(SimShell::to_string(m_values.backend));
    m_host->setText(QString::fromStdString(m_values.host));
    m_port->setValue(m_values.port);
    m_workers->setValue(m_values.workers);
    m_ioTimeout->setValue(m_values.io_timeout_ms);
    m_pollInterval->setValue(m_values.poll_interval_ms);
    m_callTimeout->setValue(m_values.call_timeout_ms);
    m_logLevel->setCurrentText(SimShell::log::level_name(m_values.log_level));
}

void SettingsDialog::saveSettings()
{
    Settings::Backend backend = m_values.backend;
    if (SimShell::parse_backend(m_backend->currentText(), backend)) {
        m_values.backend = backend;
    }
    m_values.host = m_host->text().trimmed().toStdString();
    m_values.port = static_cast<uint16_t>(m_port->value());
    m_values.workers = m_workers->value();
    m_values.io_timeout_ms = m_ioTimeout->value();
    m_values.poll_interval_ms = m_pollInterval->value();
    m_values.call_timeout_ms = m_callTimeout->value();
    if (auto level = SimShell::log::parse_level(m_logLevel->currentText().toStdString())) {
        m_values.log_level = *level;
    }
    m_values.clamp();

    m_values.save(*m_store);
    m_store->sync();
}

void SettingsDialog::applySettings()
{
    saveSettings();
    emit settingsApplied(m_values);
}

void SettingsDialog::resetToDefaults()
{
    int ret = QMessageBox::question(this, "Reset Settings",
        "Are you sure you want to reset all settings to their default values?",
        QMessageBox::Yes | QMessageBox::No);

    if (ret == QMessageBox::Yes) {
        m_store->clear();
        loadSettings();
    }
}

void SettingsDialog::accept()
{
    applySettings();
    QDialog::accept();
}
