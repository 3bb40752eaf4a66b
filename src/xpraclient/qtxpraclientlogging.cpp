// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qtxpraclientglobal.h"

QT_BEGIN_NAMESPACE

// Define the logging categories
Q_LOGGING_CATEGORY(lcXpraClient, "qt.xpraclient")
Q_LOGGING_CATEGORY(lcXpraProtocol, "qt.xpraclient.protocol")
Q_LOGGING_CATEGORY(lcXpraConnection, "qt.xpraclient.connection")
Q_LOGGING_CATEGORY(lcXpraAuth, "qt.xpraclient.auth")
Q_LOGGING_CATEGORY(lcXpraPaint, "qt.xpraclient.paint")

QT_END_NAMESPACE
