// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRADIGEST_H
#define QXPRADIGEST_H

#include "qtxpraclientglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QByteArrayList>

QT_BEGIN_NAMESPACE

class QXpraDigest
{
public:
    static QByteArrayList supportedDigests();
    static bool isSupported(const QByteArray &digest);
    static bool isXor(const QByteArray &digest) { return digest == "xor"; }

    static QByteArray gendigest(const QByteArray &digest, const QByteArray &password,
                                const QByteArray &salt, QString *errorString = nullptr);
    static QByteArray xorBytes(const QByteArray &a, const QByteArray &b);

    static int clientSaltSize(const QByteArray &saltDigest, int serverSaltSize, QString *errorString = nullptr);
    static QByteArray generateSalt(int size);
};

QT_END_NAMESPACE

#endif // QXPRADIGEST_H
