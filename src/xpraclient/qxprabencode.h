// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRABENCODE_H
#define QXPRABENCODE_H

#include "qtxpraclientglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QVariant>

QT_BEGIN_NAMESPACE

class QXpraBencode
{
public:
    static QByteArray encode(const QVariant &value, bool *ok = nullptr, QString *errorString = nullptr);
    static QVariant decode(const QByteArray &data, int *consumed = nullptr, QString *errorString = nullptr);
};

QT_END_NAMESPACE

#endif // QXPRABENCODE_H
