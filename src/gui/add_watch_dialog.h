#pragma once

#include "engine/data_type.h"

#include <QDialog>

class QComboBox;
class QLabel;
class QLineEdit;

class AddWatchDialog : public QDialog
{
    Q_OBJECT

public:
    explicit AddWatchDialog(QWidget *parent = nullptr);

    QString address() const;
    QString name() const;
    SimShell::DataType dataType() const;

private slots:
    void validate();

private:
    QLineEdit *m_addressInput;
    QLineEdit *m_nameInput;
    QComboBox *m_typeInput;
    QLabel *m_errorLabel;
};
