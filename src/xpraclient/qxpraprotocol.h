// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRAPROTOCOL_H
#define QXPRAPROTOCOL_H

#include "qtxpraclientglobal.h"
#include "qxpracipher.h"
#include <QtCore/QObject>
#include <QtCore/QScopedPointer>
#include <QtCore/QUrl>
#include <QtCore/QVariantList>

QT_BEGIN_NAMESPACE

class QXpraTransport;

class QXpraAbstractProtocol : public QObject
{
    Q_OBJECT
public:
    enum Error {
        RemoteClosedError,
        TransportError,
        FrameError,
        CipherError,
    };
    Q_ENUM(Error)

    explicit QXpraAbstractProtocol(QObject *parent = nullptr);

    QUrl url() const { return endpoint; }
    QString peerHost() const { return endpoint.host(); }
    // ssl and wss encrypt the channel itself
    bool isSecureTransport() const;

public slots:
    virtual void open(const QUrl &url) = 0;
    virtual void send(const QVariantList &packet) = 0;
    virtual void close() = 0;
    virtual void setCipherIn(const QXpraCipherParameters &parameters, const QByteArray &secret) = 0;
    virtual void setCipherOut(const QXpraCipherParameters &parameters, const QByteArray &secret) = 0;
    virtual void setCompressor(const QByteArray &name, int level) = 0;

signals:
    void opened();
    void packetReceived(const QVariantList &packet);
    void errorOccurred(const QString &errorString);
    void closed(QXpraAbstractProtocol::Error error, const QString &reason);

protected:
    void setUrl(const QUrl &url) { endpoint = url; }

private:
    QUrl endpoint;
};

class QXpraProtocol : public QXpraAbstractProtocol
{
    Q_OBJECT
public:
    explicit QXpraProtocol(QObject *parent = nullptr);
    ~QXpraProtocol() override;

    void setTransport(QXpraTransport *transport);
    QXpraTransport *transport() const;

    bool isOpen() const;
    int pendingRawPackets() const;

public slots:
    void open(const QUrl &url) override;
    void send(const QVariantList &packet) override;
    void close() override;
    void setCipherIn(const QXpraCipherParameters &parameters, const QByteArray &secret) override;
    void setCipherOut(const QXpraCipherParameters &parameters, const QByteArray &secret) override;
    void setCompressor(const QByteArray &name, int level) override;

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QXPRAPROTOCOL_H
