#include "memory_watch_widget.h"
#include "add_watch_dialog.h"
#include "bridge/async_bridge.h"

#include <QHBoxLayout>
#include <QHeaderView>
#include <QMessageBox>
#include <QPushButton>
#include <QTableWidget>
#include <QVBoxLayout>

namespace {
enum Column { AddressColumn, NameColumn, TypeColumn, ValueColumn, StatusColumn, ColumnCount };
}

MemoryWatchWidget::MemoryWatchWidget(SimShell::AsyncBridge *bridge, QWidget *parent)
    : QWidget(parent)
    , m_bridge(bridge)
    , m_table(new QTableWidget)
    , m_addButton(new QPushButton("Add Watch"))
    , m_removeButton(new QPushButton("Remove Watch"))
{
    QVBoxLayout *layout = new QVBoxLayout(this);

    m_table->setColumnCount(ColumnCount);
    m_table->setHorizontalHeaderLabels({"Address", "Name", "Type", "Value", "Status"});
    m_table->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    m_table->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_table->setEditTriggers(QAbstractItemView::NoEditTriggers);
    layout->addWidget(m_table);

    QHBoxLayout *buttons = new QHBoxLayout;
    buttons->addWidget(m_addButton);
    buttons->addWidget(m_removeButton);
    layout->addLayout(buttons);

    connect(m_addButton, &QPushButton::clicked, this, &MemoryWatchWidget::addWatch);
    connect(m_removeButton, &QPushButton::clicked, this, &MemoryWatchWidget::removeWatch);
    connect(m_bridge, &SimShell::AsyncBridge::watchAdded, this, &MemoryWatchWidget::onWatchAdded);
    connect(m_bridge, &SimShell::AsyncBridge::watchRemoved, this, &MemoryWatchWidget::onWatchRemoved);
    connect(m_bridge, &SimShell::AsyncBridge::watchUpdated, this, &MemoryWatchWidget::onWatchUpdated);

    for (const auto &watch : m_bridge->watches().entries()) {
        onWatchAdded(QString::fromStdString(watch.name));
    }
}

void MemoryWatchWidget::addWatch()
{
    AddWatchDialog dialog(this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    auto result = m_bridge->addWatch(dialog.address(), dialog.name(), dialog.dataType());
    if (!result.accepted()) {
        QMessageBox::warning(this, "Add Watch", result.message);
    }
}

void MemoryWatchWidget::removeWatch()
{
    int row = m_table->currentRow();
    if (row < 0) {
        return;
    }
    QTableWidgetItem *item = m_table->item(row, NameColumn);
    if (item) {
        m_bridge->removeWatch(item->text());
    }
}

void MemoryWatchWidget::onWatchAdded(const QString &name)
{
    int row = m_table->rowCount();
    m_table->insertRow(row);
    for (int col = 0; col < ColumnCount; ++col) {
        m_table->setItem(row, col, new QTableWidgetItem);
    }
    refreshRow(row, name);
}

void MemoryWatchWidget::onWatchRemoved(const QString &name)
{
    int row = rowFor(name);
    if (row >= 0) {
        m_table->removeRow(row);
    }
}

void MemoryWatchWidget::onWatchUpdated(const QString &name)
{
    int row = rowFor(name);
    if (row >= 0) {
        refreshRow(row, name);
    }
}

int MemoryWatchWidget::rowFor(const QString &name) const
{
    for (int row = 0; row < m_table->rowCount(); ++row) {
        QTableWidgetItem *item = m_table->item(row, NameColumn);
        if (item && item->text() == name) {
            return row;
        }
    }
    return -1;
}

void MemoryWatchWidget::refreshRow(int row, const QString &name)
{
    const SimShell::MemoryWatch *watch = m_bridge->watches().find(name.toStdString());
    if (!watch) {
        return;
    }
    m_table->item(row, AddressColumn)->setText(QString::fromStdString(SimShell::format_address(watch->address)));
    m_table->item(row, NameColumn)->setText(name);
    m_table->item(row, TypeColumn)->setText(SimShell::data_type_name(watch->type));
    m_table->item(row, ValueColumn)->setText(QString::fromStdString(watch->display_value()));

    // Stale values stay visible; the status column carries the error.
    QTableWidgetItem *status = m_table->item(row, StatusColumn);
    if (watch->last_error) {
        status->setText(QString::fromStdString(*watch->last_error));
        status->setForeground(QColor(255, 0, 0));
    } else {
        status->setText(watch->last_value ? "ok" : "");
        status->setForeground(QColor(0, 0, 0));
    }
}
