#include "add_watch_dialog.h"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QVBoxLayout>

using SimShell::DataType;

namespace {
const DataType kTypes[] = {
    DataType::UInt32, DataType::UInt8, DataType::UInt16, DataType::UInt64,
    DataType::Int8, DataType::Int16, DataType::Int32, DataType::Int64,
    DataType::Float32, DataType::Float64,
};
}

AddWatchDialog::AddWatchDialog(QWidget *parent)
    : QDialog(parent)
    , m_addressInput(new QLineEdit)
    , m_nameInput(new QLineEdit)
    , m_typeInput(new QComboBox)
    , m_errorLabel(new QLabel)
{
    setWindowTitle("Add Memory Watch");

    QVBoxLayout *layout = new QVBoxLayout(this);
    QFormLayout *form = new QFormLayout;

    m_addressInput->setPlaceholderText("0x80001000");
    for (DataType type : kTypes) {
        m_typeInput->addItem(SimShell::data_type_name(type), static_cast<int>(type));
    }

    form->addRow("Address (Hex):", m_addressInput);
    form->addRow("Name:", m_nameInput);
    form->addRow("Type:", m_typeInput);
    layout->addLayout(form);

    m_errorLabel->setStyleSheet("color: #c00000;");
    layout->addWidget(m_errorLabel);

    QDialogButtonBox *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &AddWatchDialog::validate);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttons);
}

QString AddWatchDialog::address() const
{
    return m_addressInput->text().trimmed();
}

QString AddWatchDialog::name() const
{
    return m_nameInput->text().trimmed();
}

DataType AddWatchDialog::dataType() const
{
    return static_cast<DataType>(m_typeInput->currentData().toInt());
}

void AddWatchDialog::validate()
{
    if (!SimShell::parse_address(address().toStdString())) {
        m_errorLabel->setText("Address must be hexadecimal with a 0x prefix.");
        return;
    }
    if (name().isEmpty()) {
        m_errorLabel->setText("Name must not be empty.");
        return;
    }
    accept();
}
