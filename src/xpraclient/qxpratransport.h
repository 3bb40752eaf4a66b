// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRATRANSPORT_H
#define QXPRATRANSPORT_H

#include "qtxpraclientglobal.h"
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QUrl>
#include <QtNetwork/QTcpSocket>

QT_BEGIN_NAMESPACE

class QWebSocket;

class QXpraTransport : public QObject
{
    Q_OBJECT
public:
    explicit QXpraTransport(QObject *parent = nullptr);

    virtual void open(const QUrl &url) = 0;
    virtual void send(const QByteArray &data) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    // true when the channel itself is encrypted (ssl, wss)
    virtual bool isSecure() const { return false; }
    QString peerHost() const { return host; }

    static bool isSupported(const QUrl &url);
    static QXpraTransport *create(const QUrl &url, QObject *parent = nullptr);

signals:
    void opened();
    void dataReceived(const QByteArray &data);
    void errorOccurred(const QString &errorString);
    void closed();

protected:
    QString host;
};

class QXpraTcpTransport : public QXpraTransport
{
    Q_OBJECT
public:
    explicit QXpraTcpTransport(QObject *parent = nullptr);
    ~QXpraTcpTransport() override;

    void open(const QUrl &url) override;
    void send(const QByteArray &data) override;
    void close() override;
    bool isOpen() const override;
    bool isSecure() const override;

    QTcpSocket *socket() const;

private:
    void setSocket(QTcpSocket *socket);

    QPointer<QTcpSocket> tcpSocket;
    bool secure = false;
};

class QXpraWebSocketTransport : public QXpraTransport
{
    Q_OBJECT
public:
    explicit QXpraWebSocketTransport(QObject *parent = nullptr);
    ~QXpraWebSocketTransport() override;

    void open(const QUrl &url) override;
    void send(const QByteArray &data) override;
    void close() override;
    bool isOpen() const override;
    bool isSecure() const override;

private:
    QWebSocket *webSocket = nullptr;
    bool secure = false;
};

QT_END_NAMESPACE

#endif // QXPRATRANSPORT_H
