// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRAFRAMECODEC_H
#define QXPRAFRAMECODEC_H

#include "qtxpraclientglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <QtCore/QtEndian>

QT_BEGIN_NAMESPACE

struct QXpraFrameHeader
{
    enum ProtocolFlag : quint8 {
        CipherFlag = 0x02,
        FlushFlag = 0x08,
    };

    enum CompressionFlag : quint8 {
        Lz4Flag = 0x10,
        LzoFlag = 0x20,
        BrotliFlag = 0x40,
    };

    static constexpr int Size = 8;
    static constexpr quint8 Magic = 'P';
    static constexpr int MaxIndex = 20;

    quint8 magic = Magic;
    quint8 protocolFlags = 0;
    quint8 compressionLevel = 0;
    quint8 index = 0;
    quint32 payloadSize = 0;

    bool isEncrypted() const { return protocolFlags & CipherFlag; }

    QByteArray encode() const;
    static QXpraFrameHeader decode(const QByteArray &data);

    bool operator==(const QXpraFrameHeader &other) const;
    bool operator!=(const QXpraFrameHeader &other) const { return !(*this == other); }
};

struct QXpraFrame
{
    QXpraFrameHeader header;
    QByteArray payload;     ///< Payload as received, including any cipher padding
    int padding = 0;        ///< Number of cipher padding bytes at the end of payload

    bool operator==(const QXpraFrame &other) const;
};

class QXpraFrameCodec
{
public:
    static constexpr qsizetype DefaultMaxPayloadSize = 256 * 1024 * 1024;

    QXpraFrameCodec();

    QList<QXpraFrame> feed(const QByteArray &chunk);
    void reset();

    int inboundBlockSize() const;
    void setInboundBlockSize(int blockSize);

    qsizetype maxPayloadSize() const;
    void setMaxPayloadSize(qsizetype size);

    bool hasError() const;
    QString errorString() const;

    qsizetype bufferedBytes() const;

private:
    bool parseHeader();
    void setError(const QString &errorString);

    QByteArray header;
    QByteArray buffer;
    QXpraFrameHeader current;
    qsizetype expectedSize = -1;
    int padding = 0;
    int blockSize = 0;
    qsizetype maxSize = DefaultMaxPayloadSize;
    QString error;
};

QDebug operator<<(QDebug debug, const QXpraFrameHeader &header);

QT_END_NAMESPACE

#endif // QXPRAFRAMECODEC_H
