#include "log_widget.h"
#include <QFile>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QScrollBar>
#include <QTextStream>
#include <QVBoxLayout>
#include <iterator>

using SimShell::log::Level;

namespace {
// Filter choices, index-aligned with the combo box.
const Level kFilterLevels[] = {Level::Debug, Level::Info, Level::Warn, Level::Error};
}

LogWidget::LogWidget(const QString &saveName, QWidget *parent)
    : QWidget(parent)
    , m_saveName(saveName)
    , m_logDisplay(nullptr)
    , m_levelFilter(nullptr)
    , m_clearButton(nullptr)
    , m_saveButton(nullptr)
    , m_autoScroll(nullptr)
    , m_inputRow(nullptr)
    , m_commandInput(nullptr)
    , m_sendButton(nullptr)
    , m_currentLevel(Level::Info)
    , m_autoScrollEnabled(true)
{
    setupUI();
}

void LogWidget::setupUI()
{
    QVBoxLayout *mainLayout = new QVBoxLayout(this);

    // Control bar
    QHBoxLayout *controlLayout = new QHBoxLayout;

    m_levelFilter = new QComboBox;
    m_levelFilter->addItems({"Debug", "Info", "Warning", "Error"});
    m_levelFilter->setCurrentIndex(1);
    connect(m_levelFilter, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &LogWidget::onLevelFilterChanged);

    m_clearButton = new QPushButton("Clear");
    connect(m_clearButton, &QPushButton::clicked, this, &LogWidget::onClearClicked);

    m_saveButton = new QPushButton("Save Log...");
    connect(m_saveButton, &QPushButton::clicked, this, &LogWidget::onSaveClicked);

    m_autoScroll = new QCheckBox("Auto-scroll");
    m_autoScroll->setChecked(m_autoScrollEnabled);
    connect(m_autoScroll, &QCheckBox::toggled, this, &LogWidget::onAutoScrollToggled);

    controlLayout->addWidget(new QLabel("Level:"));
    controlLayout->addWidget(m_levelFilter);
    controlLayout->addStretch();
    controlLayout->addWidget(m_autoScroll);
    controlLayout->addWidget(m_clearButton);
    controlLayout->addWidget(m_saveButton);

    // Log display
    m_logDisplay = new QTextEdit;
    m_logDisplay->setReadOnly(true);
    m_logDisplay->setFont(QFont("Monospace", 9));

    // Command input, hidden unless requested
    m_inputRow = new QWidget;
    QHBoxLayout *inputLayout = new QHBoxLayout(m_inputRow);
    inputLayout->setContentsMargins(0, 0, 0, 0);
    m_commandInput = new QLineEdit;
    m_commandInput->setPlaceholderText("Enter monitor command...");
    connect(m_commandInput, &QLineEdit::returnPressed, this, &LogWidget::onCommandSubmitted);
    m_sendButton = new QPushButton("Send");
    connect(m_sendButton, &QPushButton::clicked, this, &LogWidget::onCommandSubmitted);
    inputLayout->addWidget(m_commandInput);
    inputLayout->addWidget(m_sendButton);
    m_inputRow->setVisible(false);

    mainLayout->addLayout(controlLayout);
    mainLayout->addWidget(m_logDisplay);
    mainLayout->addWidget(m_inputRow);
}

void LogWidget::addEntry(const SimShell::LogEntry &entry)
{
    if (entry.level < m_currentLevel) {
        return; // Filter out messages below current level
    }

    m_logDisplay->setTextColor(getLevelColor(entry.level));
    m_logDisplay->append(formatEntry(entry));

    if (m_autoScrollEnabled) {
        QScrollBar *scrollBar = m_logDisplay->verticalScrollBar();
        scrollBar->setValue(scrollBar->maximum());
    }
}

void LogWidget::clear()
{
    m_logDisplay->clear();
}

void LogWidget::setLogLevel(Level level)
{
    m_currentLevel = level;
    for (int i = 0; i < static_cast<int>(std::size(kFilterLevels)); ++i) {
        if (kFilterLevels[i] == level) {
            m_levelFilter->setCurrentIndex(i);
        }
    }
}

void LogWidget::setCommandInputEnabled(bool enabled)
{
    m_inputRow->setVisible(enabled);
}

void LogWidget::setCommandInputActive(bool active)
{
    m_commandInput->setEnabled(active);
    m_sendButton->setEnabled(active);
}

void LogWidget::onLevelFilterChanged()
{
    int index = m_levelFilter->currentIndex();
    if (index >= 0 && index < static_cast<int>(std::size(kFilterLevels))) {
        m_currentLevel = kFilterLevels[index];
    }
}

void LogWidget::onClearClicked()
{
    clear();
}

void LogWidget::onSaveClicked()
{
    QString fileName = QFileDialog::getSaveFileName(
        this,
        "Save Log File",
        QString("%1_%2.txt").arg(m_saveName, QDateTime::currentDateTime().toString("yyyyMMdd_hhmmss")),
        "Text Files (*.txt);;All Files (*)"
    );

    if (!fileName.isEmpty()) {
        QFile file(fileName);
        if (file.open(QIODevice::WriteOnly | QIODevice::Text)) {
            QTextStream stream(&file);
            stream << m_logDisplay->toPlainText();
            QMessageBox::information(this, "Log Saved", "Log file saved successfully.");
        } else {
            QMessageBox::warning(this, "Save Error", "Failed to save log file.");
        }
    }
}

void LogWidget::onAutoScrollToggled(bool enabled)
{
    m_autoScrollEnabled = enabled;
}

void LogWidget::onCommandSubmitted()
{
    QString command = m_commandInput->text().trimmed();
    if (command.isEmpty()) {
        return;
    }
    m_commandInput->clear();
    emit commandEntered(command);
}

QString LogWidget::formatEntry(const SimShell::LogEntry &entry) const
{
    QString levelStr;
    switch (entry.level) {
    case Level::Trace:  levelStr = "TRACE"; break;
    case Level::Debug:  levelStr = "DEBUG"; break;
    case Level::Info:   levelStr = "INFO"; break;
    case Level::Warn:   levelStr = "WARN"; break;
    case Level::Error:  levelStr = "ERROR"; break;
    case Level::Fatal:  levelStr = "FATAL"; break;
    }

    QString timestamp = entry.timestamp.toString("hh:mm:ss.zzz");
    if (entry.source == SimShell::LogSource::Monitor) {
        return QString("[%1] %2").arg(timestamp, entry.text);
    }
    return QString("[%1] [%2] %3").arg(timestamp, levelStr, entry.text);
}

QColor LogWidget::getLevelColor(Level level) const
{
    switch (level) {
    case Level::Trace:
    case Level::Debug:  return QColor(128, 128, 128); // Gray
    case Level::Info:   return QColor(0, 0, 0);       // Black
    case Level::Warn:   return QColor(255, 140, 0);   // Orange
    case Level::Error:  return QColor(255, 0, 0);     // Red
    case Level::Fatal:  return QColor(139, 0, 0);     // Dark Red
    }
    return QColor(0, 0, 0);
}
