// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRACONNECTION_H
#define QXPRACONNECTION_H

#include "qtxpraclientglobal.h"
#include "qxpraclientsettings.h"
#include <QtCore/QObject>
#include <QtCore/QScopedPointer>
#include <QtCore/QVariantList>

QT_BEGIN_NAMESPACE

class QXpraAbstractProtocol;

class QXpraCredentialProvider
{
public:
    virtual ~QXpraCredentialProvider() = default;

    virtual QString password() = 0;
    virtual QString encryptionKey() = 0;
};

class QXpraConnection : public QObject
{
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)
    Q_PROPERTY(bool serverResponding READ isServerResponding NOTIFY serverRespondingChanged)
public:
    enum State {
        Idle,
        Connecting,
        WaitingHello,
        Authenticating,
        Established,
        Reconnecting,
        Closed,
    };
    Q_ENUM(State)

    static constexpr int MinimumMajorVersion = 0;
    static constexpr int MinimumMinorVersion = 10;

    explicit QXpraConnection(QObject *parent = nullptr);
    ~QXpraConnection() override;

    QXpraClientSettings settings() const;
    void setSettings(const QXpraClientSettings &settings);

    void setCredentialProvider(QXpraCredentialProvider *provider);
    QXpraCredentialProvider *credentialProvider() const;

    void setProtocol(QXpraAbstractProtocol *protocol);
    QXpraAbstractProtocol *protocol() const;

    void setHelloCapabilities(const QVariantMap &capabilities);
    QVariantMap sentCapabilities() const;
    QVariantMap serverCapabilities() const;
    QByteArray serverVersion() const;

    State state() const;
    int reconnectAttempts() const;
    quint64 epoch() const;
    QString closeReason() const;

    bool isServerResponding() const;
    qint64 lastPingEchoedTime() const;
    QList<qint64> latencySamples() const;

    static QByteArray clientVersion();
    static bool parseVersion(const QByteArray &version, QList<int> *numbers);
    static bool isSupportedVersion(const QByteArray &version, QString *errorString = nullptr);

public slots:
    void connectToServer();
    void close();
    void send(const QVariantList &packet);

signals:
    void stateChanged(QXpraConnection::State state);
    void established(const QVariantMap &serverCapabilities);
    void packetReceived(const QVariantList &packet);
    void serverRespondingChanged(bool responding);
    void sessionReset();
    void reconnecting(int attempt, int limit);
    void connectionClosed(const QString &reason);
    void errorOccurred(const QString &errorString);

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QXPRACONNECTION_H
