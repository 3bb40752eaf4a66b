// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpracompression.h"
#include "qxpraframecodec.h"

#include <QtCore/QtEndian>

#include <zlib.h>
#include <lz4.h>
#include <brotli/decode.h>

QT_BEGIN_NAMESPACE

namespace {

// python-lz4 stores the uncompressed size in front of the block
constexpr int Lz4SizePrefix = 4;
// refuse absurd size prefixes from a corrupted stream
constexpr quint32 MaxDecompressedSize = 256 * 1024 * 1024;

void setResult(bool *ok, QString *errorString, bool result, const QString &error = QString())
{
    if (ok)
        *ok = result;
    if (errorString)
        *errorString = error;
}

}

/*!
    Returns the algorithm selected by the compression \a level byte of a
    packet header. Zero means uncompressed; the high bits select lz4, lzo or
    brotli; any other non-zero value is a zlib level.
*/
QXpraCompression::Algorithm QXpraCompression::algorithm(quint8 level)
{
    if (level == 0)
        return None;
    if (level & QXpraFrameHeader::Lz4Flag)
        return Lz4;
    if (level & QXpraFrameHeader::LzoFlag)
        return Lzo;
    if (level & QXpraFrameHeader::BrotliFlag)
        return Brotli;
    return Zlib;
}

QByteArray QXpraCompression::decompress(quint8 level, const QByteArray &data, bool *ok, QString *errorString)
{
    switch (algorithm(level)) {
    case None:
        setResult(ok, errorString, true);
        return data;
    case Zlib:
        return inflate(data, ok, errorString);
    case Lz4:
        return lz4Decompress(data, ok, errorString);
    case Brotli:
        return brotliDecompress(data, ok, errorString);
    case Lzo:
        break;
    }
    setResult(ok, errorString, false, u"lzo compression is not supported"_s);
    return QByteArray();
}

/*!
    Inflates a complete zlib stream (deflate with the zlib wrapper).
*/
QByteArray QXpraCompression::inflate(const QByteArray &data, bool *ok, QString *errorString)
{
    z_stream stream = {};
    if (inflateInit(&stream) != Z_OK) {
        setResult(ok, errorString, false, u"failed to initialize zlib stream"_s);
        return QByteArray();
    }
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.constData()));
    stream.avail_in = uInt(data.size());

    QByteArray out;
    char chunk[16384];
    int result = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef *>(chunk);
        stream.avail_out = sizeof(chunk);
        result = ::inflate(&stream, Z_NO_FLUSH);
        if (result != Z_OK && result != Z_STREAM_END) {
            const QString message = stream.msg ? QString::fromLatin1(stream.msg) : QString::number(result);
            inflateEnd(&stream);
            setResult(ok, errorString, false, u"zlib inflation failed: %1"_s.arg(message));
            return QByteArray();
        }
        out.append(chunk, int(sizeof(chunk) - stream.avail_out));
        if (result == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            setResult(ok, errorString, false, u"truncated zlib stream"_s);
            return QByteArray();
        }
    } while (result != Z_STREAM_END);
    inflateEnd(&stream);

    setResult(ok, errorString, true);
    return out;
}

QByteArray QXpraCompression::deflate(const QByteArray &data, int level)
{
    uLongf size = compressBound(uLong(data.size()));
    QByteArray out(int(size), Qt::Uninitialized);
    const int result = compress2(reinterpret_cast<Bytef *>(out.data()), &size,
                                 reinterpret_cast<const Bytef *>(data.constData()), uLong(data.size()),
                                 qBound(1, level, 9));
    if (result != Z_OK) {
        qCWarning(lcXpraProtocol) << "Zlib compression failed with error code:" << result;
        return QByteArray();
    }
    out.resize(int(size));
    return out;
}

/*!
    Decodes an lz4 block prefixed with its uncompressed size as a 4 byte
    little endian integer.

    A non-positive result equal to minus the compressed size marks the end of
    the block and is accepted.
*/
QByteArray QXpraCompression::lz4Decompress(const QByteArray &data, bool *ok, QString *errorString)
{
    if (data.size() < Lz4SizePrefix) {
        setResult(ok, errorString, false, u"lz4 data too short: %1 bytes"_s.arg(data.size()));
        return QByteArray();
    }
    const quint32 length = qFromLittleEndian<quint32>(data.constData());
    if (length > MaxDecompressedSize) {
        setResult(ok, errorString, false, u"lz4 uncompressed size too large: %1"_s.arg(length));
        return QByteArray();
    }
    if (length == 0) {
        setResult(ok, errorString, true);
        return QByteArray();
    }

    // zero filled: the end of block sentinel leaves the tail unwritten
    QByteArray out(int(length), '\0');
    const int compressedSize = int(data.size() - Lz4SizePrefix);
    const int result = LZ4_decompress_safe(data.constData() + Lz4SizePrefix, out.data(),
                                           compressedSize, int(length));
    if (result <= 0 && compressedSize + result != 0) {
        setResult(ok, errorString, false, u"failed to decompress lz4 data, error code: %1"_s.arg(result));
        return QByteArray();
    }
    if (result > 0)
        out.resize(result);
    setResult(ok, errorString, true);
    return out;
}

QByteArray QXpraCompression::lz4Compress(const QByteArray &data)
{
    const int bound = LZ4_compressBound(int(data.size()));
    QByteArray out(Lz4SizePrefix + bound, Qt::Uninitialized);
    qToLittleEndian<quint32>(quint32(data.size()), out.data());
    const int written = LZ4_compress_default(data.constData(), out.data() + Lz4SizePrefix,
                                             int(data.size()), bound);
    if (written <= 0) {
        qCWarning(lcXpraProtocol) << "LZ4 compression failed for" << data.size() << "bytes";
        return QByteArray();
    }
    out.resize(Lz4SizePrefix + written);
    return out;
}

QByteArray QXpraCompression::brotliDecompress(const QByteArray &data, bool *ok, QString *errorString)
{
    BrotliDecoderState *state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (!state) {
        setResult(ok, errorString, false, u"failed to create brotli decoder"_s);
        return QByteArray();
    }

    size_t availableIn = size_t(data.size());
    const uint8_t *nextIn = reinterpret_cast<const uint8_t *>(data.constData());
    QByteArray out;
    uint8_t chunk[16384];
    BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
    while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
        size_t availableOut = sizeof(chunk);
        uint8_t *nextOut = chunk;
        result = BrotliDecoderDecompressStream(state, &availableIn, &nextIn,
                                               &availableOut, &nextOut, nullptr);
        out.append(reinterpret_cast<const char *>(chunk), int(sizeof(chunk) - availableOut));
        if (out.size() > qsizetype(MaxDecompressedSize))
            break;
    }

    QString error;
    if (result == BROTLI_DECODER_RESULT_ERROR)
        error = u"brotli decompression failed: %1"_s
                .arg(QString::fromLatin1(BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state))));
    else if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT)
        error = u"truncated brotli stream"_s;
    else if (result != BROTLI_DECODER_RESULT_SUCCESS)
        error = u"brotli output too large"_s;
    BrotliDecoderDestroyInstance(state);

    if (!error.isEmpty()) {
        setResult(ok, errorString, false, error);
        return QByteArray();
    }
    setResult(ok, errorString, true);
    return out;
}

QXpraCompressed QXpraNullCompressor::compress(const QByteArray &data) const
{
    return { 0, data };
}

QXpraZlibCompressor::QXpraZlibCompressor(int level)
    : level(qBound(1, level, 9))
{
}

QXpraCompressed QXpraZlibCompressor::compress(const QByteArray &data) const
{
    const QByteArray compressed = QXpraCompression::deflate(data, level);
    if (compressed.isEmpty())
        return { 0, data };
    return { quint8(level), compressed };
}

QXpraCompressed QXpraLz4Compressor::compress(const QByteArray &data) const
{
    const QByteArray compressed = QXpraCompression::lz4Compress(data);
    if (compressed.isEmpty())
        return { 0, data };
    return { quint8(QXpraFrameHeader::Lz4Flag | 1), compressed };
}

/*!
    Returns the compressor registered under \a name, or a null compressor for
    "none" and unknown names.
*/
QSharedPointer<QXpraCompressor> qXpraCreateCompressor(const QByteArray &name, int level)
{
    if (name == "zlib")
        return QSharedPointer<QXpraCompressor>(new QXpraZlibCompressor(level));
    if (name == "lz4")
        return QSharedPointer<QXpraCompressor>(new QXpraLz4Compressor);
    if (name != "none" && !name.isEmpty())
        qCWarning(lcXpraProtocol) << "Unknown compressor" << name << "- sending uncompressed";
    return QSharedPointer<QXpraCompressor>(new QXpraNullCompressor);
}

QT_END_NAMESPACE
