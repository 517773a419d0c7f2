#pragma once

#include "bridge/async_bridge.h"

#include <QWidget>
#include <QTextEdit>
#include <QComboBox>
#include <QPushButton>
#include <QCheckBox>
#include <QLineEdit>

class LogWidget : public QWidget
{
    Q_OBJECT

public:
    explicit LogWidget(const QString &saveName, QWidget *parent = nullptr);

    void addEntry(const SimShell::LogEntry &entry);
    void clear();
    void setLogLevel(SimShell::log::Level level);

    // Shows an input line under the log; submitted text is emitted, not logged.
    void setCommandInputEnabled(bool enabled);
    void setCommandInputActive(bool active);

signals:
    void commandEntered(const QString &command);

private slots:
    void onLevelFilterChanged();
    void onClearClicked();
    void onSaveClicked();
    void onAutoScrollToggled(bool enabled);
    void onCommandSubmitted();

private:
    void setupUI();
    QString formatEntry(const SimShell::LogEntry &entry) const;
    QColor getLevelColor(SimShell::log::Level level) const;

    QString m_saveName;
    QTextEdit *m_logDisplay;
    QComboBox *m_levelFilter;
    QPushButton *m_clearButton;
    QPushButton *m_saveButton;
    QCheckBox *m_autoScroll;
    QWidget *m_inputRow;
    QLineEdit *m_commandInput;
    QPushButton *m_sendButton;

    SimShell::log::Level m_currentLevel;
    bool m_autoScrollEnabled;
};
