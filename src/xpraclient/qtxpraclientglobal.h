// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QTXPRACLIENTGLOBAL_H
#define QTXPRACLIENTGLOBAL_H

#include <QtCore/qstring.h>
#include <QtCore/qglobal.h>
#include <QtCore/qdebug.h>
#include <QtCore/qloggingcategory.h>

QT_BEGIN_NAMESPACE

using namespace Qt::Literals::StringLiterals;

Q_DECLARE_LOGGING_CATEGORY(lcXpraClient)
Q_DECLARE_LOGGING_CATEGORY(lcXpraProtocol)
Q_DECLARE_LOGGING_CATEGORY(lcXpraConnection)
Q_DECLARE_LOGGING_CATEGORY(lcXpraAuth)
Q_DECLARE_LOGGING_CATEGORY(lcXpraPaint)

QT_END_NAMESPACE

#endif // QTXPRACLIENTGLOBAL_H
