// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpratransport.h"

#include <QtNetwork/QNetworkRequest>
#include <QtNetwork/QSslSocket>
#include <QtNetwork/QTcpSocket>
#include <QtWebSockets/QWebSocket>
#include <QtWebSockets/QWebSocketHandshakeOptions>

QT_BEGIN_NAMESPACE

namespace {
constexpr quint16 DefaultPort = 14500;
}

QXpraTransport::QXpraTransport(QObject *parent)
    : QObject(parent)
{
}

bool QXpraTransport::isSupported(const QUrl &url)
{
    const QString scheme = url.scheme();
    return scheme == "tcp"_L1 || scheme == "ssl"_L1 || scheme == "ws"_L1 || scheme == "wss"_L1;
}

/*!
    Creates the transport matching the scheme of \a url: tcp and ssl use a
    plain or TLS socket, ws and wss use a binary WebSocket. Returns \nullptr
    for other schemes.
*/
QXpraTransport *QXpraTransport::create(const QUrl &url, QObject *parent)
{
    const QString scheme = url.scheme();
    if (scheme == "tcp"_L1 || scheme == "ssl"_L1)
        return new QXpraTcpTransport(parent);
    if (scheme == "ws"_L1 || scheme == "wss"_L1)
        return new QXpraWebSocketTransport(parent);
    qCWarning(lcXpraProtocol) << "Unsupported transport scheme:" << scheme;
    return nullptr;
}

QXpraTcpTransport::QXpraTcpTransport(QObject *parent)
    : QXpraTransport(parent)
{
}

QXpraTcpTransport::~QXpraTcpTransport()
{
    if (tcpSocket)
        tcpSocket->disconnect(this);
}

void QXpraTcpTransport::setSocket(QTcpSocket *socket)
{
    if (tcpSocket) {
        tcpSocket->disconnect(this);
        tcpSocket->abort();
        tcpSocket->deleteLater();
    }
    tcpSocket = socket;
    if (!socket)
        return;

    socket->setSocketOption(QAbstractSocket::LowDelayOption, 1);
    connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
        const QByteArray data = socket->readAll();
        if (!data.isEmpty())
            emit dataReceived(data);
    });
    connect(socket, &QTcpSocket::disconnected, this, [this]() {
        qCInfo(lcXpraProtocol) << "Disconnected from" << host;
        emit closed();
    });
    connect(socket, &QTcpSocket::errorOccurred, this, [this, socket](QAbstractSocket::SocketError error) {
        // a remote close also reports an error; disconnected() covers it
        if (error == QAbstractSocket::RemoteHostClosedError)
            return;
        emit errorOccurred(socket->errorString());
    });
}

void QXpraTcpTransport::open(const QUrl &url)
{
    host = url.host();
    const quint16 port = quint16(url.port(DefaultPort));
    secure = url.scheme() == "ssl"_L1;
    if (secure) {
        auto socket = new QSslSocket(this);
        setSocket(socket);
        connect(socket, &QSslSocket::encrypted, this, &QXpraTransport::opened);
        connect(socket, &QSslSocket::sslErrors, this, [this](const QList<QSslError> &errors) {
            for (const QSslError &error : errors)
                qCWarning(lcXpraProtocol) << "TLS error:" << error.errorString();
        });
        qCDebug(lcXpraProtocol) << "Connecting with TLS to" << host << port;
        socket->connectToHostEncrypted(host, port);
    } else {
        auto socket = new QTcpSocket(this);
        setSocket(socket);
        connect(socket, &QTcpSocket::connected, this, &QXpraTransport::opened);
        qCDebug(lcXpraProtocol) << "Connecting to" << host << port;
        socket->connectToHost(host, port);
    }
}

void QXpraTcpTransport::send(const QByteArray &data)
{
    if (!isOpen()) {
        qCWarning(lcXpraProtocol) << "Dropping" << data.size() << "bytes, transport is not open";
        return;
    }
    if (tcpSocket->write(data) != data.size())
        emit errorOccurred(tcpSocket->errorString());
}

void QXpraTcpTransport::close()
{
    if (!tcpSocket)
        return;
    // no closed() signal for a close we asked for
    tcpSocket->disconnect(this);
    tcpSocket->disconnectFromHost();
    tcpSocket->deleteLater();
    tcpSocket = nullptr;
}

bool QXpraTcpTransport::isOpen() const
{
    return tcpSocket && tcpSocket->state() == QAbstractSocket::ConnectedState;
}

bool QXpraTcpTransport::isSecure() const
{
    return secure;
}

QTcpSocket *QXpraTcpTransport::socket() const
{
    return tcpSocket;
}

QXpraWebSocketTransport::QXpraWebSocketTransport(QObject *parent)
    : QXpraTransport(parent)
{
}

QXpraWebSocketTransport::~QXpraWebSocketTransport()
{
    if (webSocket)
        webSocket->disconnect(this);
}

void QXpraWebSocketTransport::open(const QUrl &url)
{
    if (webSocket) {
        webSocket->disconnect(this);
        webSocket->abort();
        webSocket->deleteLater();
    }
    host = url.host();
    secure = url.scheme() == "wss"_L1;
    webSocket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);

    connect(webSocket, &QWebSocket::connected, this, &QXpraTransport::opened);
    connect(webSocket, &QWebSocket::binaryMessageReceived, this, &QXpraTransport::dataReceived);
    connect(webSocket, &QWebSocket::disconnected, this, [this]() {
        qCInfo(lcXpraProtocol) << "WebSocket closed:" << webSocket->closeReason();
        emit closed();
    });
    connect(webSocket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError error) {
        if (error == QAbstractSocket::RemoteHostClosedError)
            return;
        emit errorOccurred(webSocket->errorString());
    });

    QUrl target = url;
    if (target.port() < 0)
        target.setPort(DefaultPort);
    QWebSocketHandshakeOptions options;
    options.setSubprotocols({ u"binary"_s });
    qCDebug(lcXpraProtocol) << "Opening WebSocket" << target.toDisplayString();
    webSocket->open(QNetworkRequest(target), options);
}

void QXpraWebSocketTransport::send(const QByteArray &data)
{
    if (!isOpen()) {
        qCWarning(lcXpraProtocol) << "Dropping" << data.size() << "bytes, transport is not open";
        return;
    }
    webSocket->sendBinaryMessage(data);
}

void QXpraWebSocketTransport::close()
{
    if (!webSocket)
        return;
    webSocket->disconnect(this);
    webSocket->close();
    webSocket->deleteLater();
    webSocket = nullptr;
}

bool QXpraWebSocketTransport::isOpen() const
{
    return webSocket && webSocket->state() == QAbstractSocket::ConnectedState;
}

bool QXpraWebSocketTransport::isSecure() const
{
    return secure;
}

QT_END_NAMESPACE
