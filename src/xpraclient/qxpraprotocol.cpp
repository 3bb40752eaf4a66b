// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpraprotocol.h"
#include "qxprabencode.h"
#include "qxpracompression.h"
#include "qxpraframecodec.h"
#include "qxprapackets.h"
#include "qxpratransport.h"

#include <QtCore/QMap>
#include <QtCore/QPointer>
#include <QtCore/QQueue>

#include <utility>

QT_BEGIN_NAMESPACE

/*!
    \internal
    \class QXpraProtocol::Private
    \brief Glues the frame codec, ciphers, compression and serializer together.

    Inbound frames are decrypted, then decompressed. Frames with a non-zero
    index are raw subpackets and wait in a side table until the main packet
    (index 0) arrives; they are then spliced into it by position and the
    table is emptied.
*/
class QXpraProtocol::Private
{
public:
    Private(QXpraProtocol *parent);

    void attach(QXpraTransport *transport);
    void receive(const QByteArray &data);
    bool processFrame(const QXpraFrame &frame);
    void dispatch(const QByteArray &data);
    void scheduleFlush();
    void flush();
    void reset();
    void abort(QXpraAbstractProtocol::Error error, const QString &reason);

private:
    QXpraProtocol *q;

public:
    QPointer<QXpraTransport> transport;
    bool ownsTransport = false;
    bool active = false;
    bool flushScheduled = false;
    QXpraFrameCodec codec;
    QXpraCipher cipherIn;
    QXpraCipher cipherOut;
    QMap<int, QByteArray> rawPackets;
    QQueue<QVariantList> sendQueue;
    QSharedPointer<QXpraCompressor> compressor;
};

QXpraProtocol::Private::Private(QXpraProtocol *parent)
    : q(parent)
    , compressor(new QXpraNullCompressor)
{
}

void QXpraProtocol::Private::attach(QXpraTransport *transport)
{
    if (this->transport) {
        this->transport->disconnect(q);
        this->transport->close();
        if (ownsTransport)
            this->transport->deleteLater();
    }
    this->transport = transport;
    if (!transport)
        return;

    connect(transport, &QXpraTransport::opened, q, [this]() {
        qCInfo(lcXpraProtocol) << "Connected to" << q->peerHost();
        emit q->opened();
        flush();
    });
    connect(transport, &QXpraTransport::dataReceived, q, [this](const QByteArray &data) {
        receive(data);
    });
    connect(transport, &QXpraTransport::errorOccurred, q, [this](const QString &errorString) {
        abort(QXpraAbstractProtocol::TransportError, errorString);
    });
    connect(transport, &QXpraTransport::closed, q, [this]() {
        abort(QXpraAbstractProtocol::RemoteClosedError, u"connection closed by peer"_s);
    });
}

void QXpraProtocol::Private::receive(const QByteArray &data)
{
    if (!active)
        return;
    const QList<QXpraFrame> frames = codec.feed(data);
    for (const QXpraFrame &frame : frames) {
        if (!processFrame(frame))
            return;
    }
    if (codec.hasError())
        abort(QXpraAbstractProtocol::FrameError, codec.errorString());
}

/*!
    \internal
    Handles one complete frame. Returns false if the connection was closed as
    a result.
*/
bool QXpraProtocol::Private::processFrame(const QXpraFrame &frame)
{
    QByteArray data = frame.payload;
    if (frame.header.isEncrypted()) {
        if (!cipherIn.isActive()) {
            abort(QXpraAbstractProtocol::CipherError, u"received an encrypted packet without a cipher"_s);
            return false;
        }
        bool ok = false;
        data = cipherIn.decrypt(frame.payload, frame.padding, &ok);
        if (!ok) {
            abort(QXpraAbstractProtocol::CipherError, u"decryption failed: %1"_s.arg(cipherIn.errorString()));
            return false;
        }
    }

    if (frame.header.compressionLevel != 0) {
        bool ok = false;
        QString errorString;
        data = QXpraCompression::decompress(frame.header.compressionLevel, data, &ok, &errorString);
        if (!ok) {
            qCWarning(lcXpraProtocol) << "Dropping packet with index" << frame.header.index << ":" << errorString;
            rawPackets.clear();
            return true;
        }
    }

    if (frame.header.index > 0) {
        rawPackets.insert(frame.header.index, data);
        return true;
    }
    dispatch(data);
    return active;
}

void QXpraProtocol::Private::dispatch(const QByteArray &data)
{
    // the side table never outlives one main packet
    const QMap<int, QByteArray> raw = std::exchange(rawPackets, {});

    QString errorString;
    const QVariant decoded = QXpraBencode::decode(data, nullptr, &errorString);
    if (!decoded.isValid()) {
        qCWarning(lcXpraProtocol) << "Dropping malformed packet:" << errorString;
        return;
    }
    if (decoded.typeId() != QMetaType::QVariantList) {
        qCWarning(lcXpraProtocol) << "Dropping packet that is not a list:" << decoded.typeName();
        return;
    }
    QVariantList packet = decoded.toList();
    if (QXpraPacket::type(packet).isEmpty()) {
        qCWarning(lcXpraProtocol) << "Dropping packet without a type";
        return;
    }
    for (auto it = raw.cbegin(); it != raw.cend(); ++it) {
        if (it.key() >= packet.size()) {
            qCWarning(lcXpraProtocol) << "Raw packet index" << it.key() << "out of range for"
                                      << QXpraPacket::type(packet);
            continue;
        }
        packet[it.key()] = it.value();
    }
    qCDebug(lcXpraProtocol) << "Received" << QXpraPacket::type(packet) << "with" << packet.size() << "fields";
    emit q->packetReceived(packet);
}

void QXpraProtocol::Private::scheduleFlush()
{
    if (flushScheduled)
        return;
    flushScheduled = true;
    QMetaObject::invokeMethod(q, [this]() {
        flushScheduled = false;
        flush();
    }, Qt::QueuedConnection);
}

void QXpraProtocol::Private::flush()
{
    if (!active || !transport || !transport->isOpen())
        return;
    while (!sendQueue.isEmpty()) {
        const QVariantList packet = sendQueue.dequeue();
        bool ok = false;
        QString errorString;
        const QByteArray encoded = QXpraBencode::encode(packet, &ok, &errorString);
        if (!ok) {
            qCWarning(lcXpraProtocol) << "Cannot encode" << QXpraPacket::type(packet) << "packet:" << errorString;
            continue;
        }
        const QXpraCompressed compressed = compressor->compress(encoded);

        QXpraFrameHeader header;
        header.compressionLevel = compressed.level;
        // the declared size excludes the cipher padding
        header.payloadSize = quint32(compressed.data.size());
        QByteArray payload = compressed.data;
        if (cipherOut.isActive()) {
            header.protocolFlags |= QXpraFrameHeader::CipherFlag;
            payload = cipherOut.encrypt(compressed.data, &ok);
            if (!ok) {
                abort(QXpraAbstractProtocol::CipherError, u"encryption failed: %1"_s.arg(cipherOut.errorString()));
                return;
            }
        }
        qCDebug(lcXpraProtocol) << "Sending" << QXpraPacket::type(packet) << header;
        transport->send(header.encode() + payload);
    }
}

void QXpraProtocol::Private::reset()
{
    codec.reset();
    codec.setInboundBlockSize(0);
    cipherIn.reset();
    cipherOut.reset();
    rawPackets.clear();
    sendQueue.clear();
}

void QXpraProtocol::Private::abort(QXpraAbstractProtocol::Error error, const QString &reason)
{
    if (!active)
        return;
    active = false;
    qCWarning(lcXpraProtocol) << "Connection closed:" << error << reason;
    if (transport)
        transport->close();
    reset();
    if (error != QXpraAbstractProtocol::RemoteClosedError)
        emit q->errorOccurred(reason);
    emit q->closed(error, reason);
}

QXpraAbstractProtocol::QXpraAbstractProtocol(QObject *parent)
    : QObject(parent)
{
}

bool QXpraAbstractProtocol::isSecureTransport() const
{
    const QString scheme = endpoint.scheme();
    return scheme == "ssl"_L1 || scheme == "wss"_L1;
}

/*!
    \class QXpraProtocol
    \inmodule QtXpraClient

    \brief The QXpraProtocol class runs an xpra packet session over a transport.

    send() queues packets and writes them on the next event loop iteration in
    the order they were queued. Received packets are delivered through
    packetReceived() with any raw subpackets already in place.
*/
QXpraProtocol::QXpraProtocol(QObject *parent)
    : QXpraAbstractProtocol(parent)
    , d(new Private(this))
{
}

QXpraProtocol::~QXpraProtocol()
{
    if (d->transport)
        d->transport->disconnect(this);
}

/*!
    Uses \a transport for the next open() instead of creating one from the
    URL scheme. The protocol does not take ownership.
*/
void QXpraProtocol::setTransport(QXpraTransport *transport)
{
    d->ownsTransport = false;
    d->attach(transport);
}

QXpraTransport *QXpraProtocol::transport() const
{
    return d->transport;
}

bool QXpraProtocol::isOpen() const
{
    return d->active && d->transport && d->transport->isOpen();
}

int QXpraProtocol::pendingRawPackets() const
{
    return d->rawPackets.size();
}

void QXpraProtocol::open(const QUrl &url)
{
    if (d->active)
        close();
    setUrl(url);
    d->reset();

    if (!d->transport || d->ownsTransport) {
        QXpraTransport *transport = QXpraTransport::create(url, this);
        if (!transport) {
            const QString reason = u"unsupported url: %1"_s.arg(url.toDisplayString());
            emit errorOccurred(reason);
            emit closed(TransportError, reason);
            return;
        }
        d->attach(transport);
        d->ownsTransport = true;
    }
    d->active = true;
    qCDebug(lcXpraProtocol) << "Opening" << url.toDisplayString();
    d->transport->open(url);
}

void QXpraProtocol::send(const QVariantList &packet)
{
    if (!d->active) {
        qCWarning(lcXpraProtocol) << "Not connected, dropping" << QXpraPacket::type(packet) << "packet";
        return;
    }
    d->sendQueue.enqueue(packet);
    d->scheduleFlush();
}

void QXpraProtocol::close()
{
    if (!d->active)
        return;
    d->active = false;
    qCDebug(lcXpraProtocol) << "Closing connection to" << peerHost();
    if (d->transport)
        d->transport->close();
    d->reset();
}

/*!
    Configures decryption of inbound packets with the key derived from
    \a secret. The inbound cipher can only be set once per connection.
*/
void QXpraProtocol::setCipherIn(const QXpraCipherParameters &parameters, const QByteArray &secret)
{
    if (d->cipherIn.isActive()) {
        qCWarning(lcXpraProtocol) << "Inbound cipher already configured, ignoring";
        return;
    }
    if (!d->cipherIn.setup(QXpraCipher::Decrypt, parameters, secret)) {
        const QString reason = u"cannot configure inbound cipher: %1"_s.arg(d->cipherIn.errorString());
        if (d->active)
            d->abort(CipherError, reason);
        else
            emit errorOccurred(reason);
        return;
    }
    d->codec.setInboundBlockSize(d->cipherIn.blockSize());
    qCDebug(lcXpraProtocol) << "Inbound cipher" << parameters.cipher << parameters.mode << "enabled";
}

void QXpraProtocol::setCipherOut(const QXpraCipherParameters &parameters, const QByteArray &secret)
{
    if (d->cipherOut.isActive()) {
        qCWarning(lcXpraProtocol) << "Outbound cipher already configured, ignoring";
        return;
    }
    if (!d->cipherOut.setup(QXpraCipher::Encrypt, parameters, secret)) {
        const QString reason = u"cannot configure outbound cipher: %1"_s.arg(d->cipherOut.errorString());
        if (d->active)
            d->abort(CipherError, reason);
        else
            emit errorOccurred(reason);
        return;
    }
    qCDebug(lcXpraProtocol) << "Outbound cipher" << parameters.cipher << parameters.mode << "enabled";
}

void QXpraProtocol::setCompressor(const QByteArray &name, int level)
{
    d->compressor = qXpraCreateCompressor(name, level);
}

QT_END_NAMESPACE
