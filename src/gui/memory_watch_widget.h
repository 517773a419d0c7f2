#pragma once

#include <QWidget>

class QPushButton;
class QTableWidget;

namespace SimShell {
class AsyncBridge;
}

// Table view of the bridge's watch registry.
class MemoryWatchWidget : public QWidget
{
    Q_OBJECT

public:
    explicit MemoryWatchWidget(SimShell::AsyncBridge *bridge, QWidget *parent = nullptr);

private slots:
    void addWatch();
    void removeWatch();
    void onWatchAdded(const QString &name);
    void onWatchRemoved(const QString &name);
    void onWatchUpdated(const QString &name);

private:
    int rowFor(const QString &name) const;
    void refreshRow(int row, const QString &name);

    SimShell::AsyncBridge *m_bridge;
    QTableWidget *m_table;
    QPushButton *m_addButton;
    QPushButton *m_removeButton;
};
