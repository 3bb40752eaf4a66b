// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef SPINBOX_H
#define SPINBOX_H

#include <QtWidgets/QSpinBox>

// Port entry that submits the connect form on Return like a line edit.
class SpinBox : public QSpinBox
{
    Q_OBJECT
public:
    explicit SpinBox(QWidget *parent = nullptr);

signals:
    void returnPressed();

protected:
    void focusInEvent(QFocusEvent *event) override;
};

#endif // SPINBOX_H
