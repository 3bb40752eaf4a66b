// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpraframecodec.h"
#include "qxpracipher.h"

#include <QtCore/QDebugStateSaver>

#include <cstring>

QT_BEGIN_NAMESPACE

namespace {

/*!
    \internal
    \struct WireHeader
    \brief Byte layout of the 8 byte packet header (struct format "!BBBBL").
*/
struct WireHeader {
    quint8 magic;           ///< Always 'P'
    quint8 protocolFlags;   ///< Cipher and flush bits
    quint8 compression;     ///< Compression level and algorithm bits
    quint8 index;           ///< Raw subpacket index, 0 for the main packet
    quint32_be size;        ///< Payload size before cipher padding
};
static_assert(sizeof(WireHeader) == QXpraFrameHeader::Size, "unexpected header size");

constexpr quint8 KnownProtocolFlags = QXpraFrameHeader::CipherFlag | QXpraFrameHeader::FlushFlag;

}

QByteArray QXpraFrameHeader::encode() const
{
    WireHeader wire;
    wire.magic = magic;
    wire.protocolFlags = protocolFlags;
    wire.compression = compressionLevel;
    wire.index = index;
    wire.size = payloadSize;
    return QByteArray(reinterpret_cast<const char *>(&wire), sizeof(wire));
}

QXpraFrameHeader QXpraFrameHeader::decode(const QByteArray &data)
{
    QXpraFrameHeader header;
    if (data.size() < Size)
        return header;
    WireHeader wire;
    std::memcpy(&wire, data.constData(), sizeof(wire));
    header.magic = wire.magic;
    header.protocolFlags = wire.protocolFlags;
    header.compressionLevel = wire.compression;
    header.index = wire.index;
    header.payloadSize = wire.size;
    return header;
}

bool QXpraFrameHeader::operator==(const QXpraFrameHeader &other) const
{
    return magic == other.magic
            && protocolFlags == other.protocolFlags
            && compressionLevel == other.compressionLevel
            && index == other.index
            && payloadSize == other.payloadSize;
}

bool QXpraFrame::operator==(const QXpraFrame &other) const
{
    return header == other.header && payload == other.payload && padding == other.padding;
}

QXpraFrameCodec::QXpraFrameCodec()
{
    header.reserve(QXpraFrameHeader::Size);
}

/*!
    Appends \a chunk to the receive buffer and returns every frame that is now
    complete, in arrival order. Partial headers and payloads are kept for the
    next call.

    Returns an empty list once a fatal framing error has been detected; check
    hasError() after each call.
*/
QList<QXpraFrame> QXpraFrameCodec::feed(const QByteArray &chunk)
{
    QList<QXpraFrame> frames;
    if (hasError())
        return frames;
    buffer.append(chunk);

    qsizetype offset = 0;
    for (;;) {
        if (expectedSize < 0) {
            const qsizetype needed = QXpraFrameHeader::Size - header.size();
            const qsizetype n = qMin(needed, buffer.size() - offset);
            header.append(buffer.constData() + offset, n);
            offset += n;
            if (header.size() < QXpraFrameHeader::Size)
                break;
            if (!parseHeader())
                break;
        }
        if (buffer.size() - offset < expectedSize)
            break;

        QXpraFrame frame;
        frame.header = current;
        frame.payload = buffer.mid(offset, expectedSize);
        frame.padding = padding;
        offset += expectedSize;
        frames.append(frame);

        // the next frame needs a new header
        header.clear();
        expectedSize = -1;
        padding = 0;
    }
    buffer.remove(0, offset);
    return frames;
}

bool QXpraFrameCodec::parseHeader()
{
    current = QXpraFrameHeader::decode(header);
    if (current.magic != QXpraFrameHeader::Magic) {
        setError(u"invalid packet header format: 0x%1 (%2)"_s
                         .arg(int(current.magic), 2, 16, QLatin1Char('0'))
                         .arg(QString::fromLatin1(header.toHex())));
        return false;
    }
    if (current.protocolFlags & ~KnownProtocolFlags) {
        setError(u"unsupported protocol flags: 0x%1"_s.arg(int(current.protocolFlags), 2, 16, QLatin1Char('0')));
        return false;
    }
    if (current.compressionLevel & QXpraFrameHeader::LzoFlag) {
        setError(u"lzo compression is not supported"_s);
        return false;
    }
    if (current.index >= QXpraFrameHeader::MaxIndex) {
        setError(u"invalid packet index: %1"_s.arg(int(current.index)));
        return false;
    }

    if (qsizetype(current.payloadSize) > maxSize) {
        setError(u"packet size %1 exceeds the limit of %2 bytes"_s.arg(current.payloadSize).arg(maxSize));
        return false;
    }

    expectedSize = current.payloadSize;
    padding = 0;
    if (current.isEncrypted()) {
        if (blockSize <= 0) {
            setError(u"received an encrypted packet but no cipher is configured"_s);
            return false;
        }
        padding = QXpraCipher::paddingSize(current.payloadSize, blockSize);
        expectedSize += padding;
    }
    return true;
}

void QXpraFrameCodec::reset()
{
    header.clear();
    buffer.clear();
    current = QXpraFrameHeader();
    expectedSize = -1;
    padding = 0;
    error.clear();
}

int QXpraFrameCodec::inboundBlockSize() const
{
    return blockSize;
}

void QXpraFrameCodec::setInboundBlockSize(int blockSize)
{
    this->blockSize = blockSize;
}

qsizetype QXpraFrameCodec::maxPayloadSize() const
{
    return maxSize;
}

/*!
    Frames declaring a payload larger than \a size bytes are a fatal framing
    error. The limit survives reset().
*/
void QXpraFrameCodec::setMaxPayloadSize(qsizetype size)
{
    maxSize = size;
}

bool QXpraFrameCodec::hasError() const
{
    return !error.isEmpty();
}

QString QXpraFrameCodec::errorString() const
{
    return error;
}

qsizetype QXpraFrameCodec::bufferedBytes() const
{
    return header.size() + buffer.size();
}

void QXpraFrameCodec::setError(const QString &errorString)
{
    qCWarning(lcXpraProtocol) << "Frame error:" << errorString;
    error = errorString;
    header.clear();
    buffer.clear();
    expectedSize = -1;
}

QDebug operator<<(QDebug debug, const QXpraFrameHeader &header)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "QXpraFrameHeader(flags=" << Qt::hex << int(header.protocolFlags)
                    << ", level=" << int(header.compressionLevel)
                    << Qt::dec << ", index=" << int(header.index)
                    << ", size=" << header.payloadSize << ')';
    return debug;
}

QT_END_NAMESPACE
