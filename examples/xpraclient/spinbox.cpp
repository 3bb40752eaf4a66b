// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "spinbox.h"
#include <QtCore/QTimer>
#include <QtWidgets/QLineEdit>

SpinBox::SpinBox(QWidget *parent)
    : QSpinBox(parent)
{
    setKeyboardTracking(false);
    setButtonSymbols(QAbstractSpinBox::NoButtons);
    connect(lineEdit(), &QLineEdit::returnPressed, this, [this]() {
        interpretText();
        emit returnPressed();
    });
}

void SpinBox::focusInEvent(QFocusEvent *event)
{
    QSpinBox::focusInEvent(event);
    // the line edit places the cursor after this handler returns
    QTimer::singleShot(0, this, &QSpinBox::selectAll);
}
