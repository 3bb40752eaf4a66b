// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpraclientsettings.h"

#include <QtCore/QSettings>

QT_BEGIN_NAMESPACE

/*!
    \class QXpraClientSettings
    \inmodule QtXpraClient

    \brief The QXpraClientSettings struct holds everything a QXpraClient needs
    to know before it connects.

    Default constructed values are the documented defaults. load() only
    overrides the keys present in the QSettings store, so a partially filled
    configuration file keeps the defaults for the rest.
*/

QString QXpraClientSettings::defaultUserName()
{
    QString name = qEnvironmentVariable("USER");
    if (name.isEmpty())
        name = qEnvironmentVariable("USERNAME");
    return name;
}

QByteArrayList QXpraClientSettings::defaultEncodings()
{
    return { "rgb32", "rgb24", "png", "jpeg", "webp", "scroll" };
}

/*!
    Turns a user supplied server address into a connection URL. A bare
    \c host or \c host:port becomes a \c tcp URL and a missing port
    defaults to DefaultPort.
*/
QUrl QXpraClientSettings::normalizedUrl(const QString &text)
{
    const QString trimmed = text.trimmed();
    QUrl url(trimmed.contains("://"_L1) ? trimmed : u"tcp://"_s + trimmed);
    if (url.port() < 0)
        url.setPort(DefaultPort);
    return url;
}

void QXpraClientSettings::load(QSettings &settings)
{
    url = normalizedUrl(settings.value("server/url", url.toString()).toString());

    username = settings.value("auth/username", username).toString();
    password = settings.value("auth/password", password).toString();
    insecure = settings.value("auth/insecure", insecure).toBool();

    encryptionCipher = settings.value("encryption/cipher", QString::fromLatin1(encryptionCipher)).toString().toLatin1();
    encryptionKey = settings.value("encryption/key", encryptionKey).toString();
    encryptionIterations = settings.value("encryption/iterations", encryptionIterations).toInt();

    compression = settings.value("compression/algorithm", QString::fromLatin1(compression)).toString().toLatin1();
    compressionLevel = settings.value("compression/level", compressionLevel).toInt();

    settings.beginGroup("connection");
    helloTimeout = settings.value("helloTimeout", helloTimeout).toInt();
    pingInterval = settings.value("pingInterval", pingInterval).toInt();
    pingGrace = settings.value("pingGrace", pingGrace).toInt();
    pingTimeout = settings.value("pingTimeout", pingTimeout).toInt();
    reconnect = settings.value("reconnect", reconnect).toBool();
    reconnectCount = settings.value("reconnectCount", reconnectCount).toInt();
    reconnectDelay = settings.value("reconnectDelay", reconnectDelay).toInt();
    threadedProtocol = settings.value("threadedProtocol", threadedProtocol).toBool();
    settings.endGroup();

    staleThreshold = settings.value("paint/staleThreshold", staleThreshold).toInt();
    clipboard = settings.value("clipboard/enabled", clipboard).toBool();

    if (settings.contains("encodings")) {
        encodings.clear();
        const QStringList names = settings.value("encodings").toStringList();
        for (const QString &name : names)
            encodings << name.toLatin1();
    }
}

void QXpraClientSettings::save(QSettings &settings) const
{
    settings.setValue("server/url", url.toString());

    settings.setValue("auth/username", username);
    // the password is only kept for the session
    settings.setValue("auth/insecure", insecure);

    settings.setValue("encryption/cipher", QString::fromLatin1(encryptionCipher));
    settings.setValue("encryption/iterations", encryptionIterations);

    settings.setValue("compression/algorithm", QString::fromLatin1(compression));
    settings.setValue("compression/level", compressionLevel);

    settings.beginGroup("connection");
    settings.setValue("helloTimeout", helloTimeout);
    settings.setValue("pingInterval", pingInterval);
    settings.setValue("pingGrace", pingGrace);
    settings.setValue("pingTimeout", pingTimeout);
    settings.setValue("reconnect", reconnect);
    settings.setValue("reconnectCount", reconnectCount);
    settings.setValue("reconnectDelay", reconnectDelay);
    settings.setValue("threadedProtocol", threadedProtocol);
    settings.endGroup();

    settings.setValue("paint/staleThreshold", staleThreshold);
    settings.setValue("clipboard/enabled", clipboard);

    QStringList names;
    for (const QByteArray &encoding : encodings)
        names << QString::fromLatin1(encoding);
    settings.setValue("encodings", names);
}

QT_END_NAMESPACE
