// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRACLIENTSETTINGS_H
#define QXPRACLIENTSETTINGS_H

#include "qtxpraclientglobal.h"
#include <QtCore/QByteArrayList>
#include <QtCore/QUrl>

QT_BEGIN_NAMESPACE

class QSettings;

struct QXpraClientSettings
{
    static constexpr quint16 DefaultPort = 14500;

    QUrl url = QUrl(u"tcp://localhost:14500"_s);

    QString username = defaultUserName();
    QString password;
    bool insecure = false;

    // an empty cipher disables packet encryption
    QByteArray encryptionCipher;
    QString encryptionKey;
    int encryptionIterations = 1000;

    // outbound packets go out uncompressed unless lz4 or zlib is requested
    QByteArray compression = "none";
    int compressionLevel = 1;

    int helloTimeout = 30000;
    int pingInterval = 5000;
    int pingGrace = 2000;
    int pingTimeout = 15000;
    bool reconnect = true;
    int reconnectCount = 5;
    int reconnectDelay = 1000;
    bool threadedProtocol = false;

    int staleThreshold = 2000;
    bool clipboard = true;
    QByteArrayList encodings = defaultEncodings();

    bool isEncrypted() const { return !encryptionCipher.isEmpty(); }

    void load(QSettings &settings);
    void save(QSettings &settings) const;

    static QString defaultUserName();
    static QByteArrayList defaultEncodings();
    static QUrl normalizedUrl(const QString &text);
};

QT_END_NAMESPACE

#endif // QXPRACLIENTSETTINGS_H
