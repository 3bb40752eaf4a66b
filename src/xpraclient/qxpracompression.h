// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRACOMPRESSION_H
#define QXPRACOMPRESSION_H

#include "qtxpraclientglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QSharedPointer>

QT_BEGIN_NAMESPACE

class QXpraCompression
{
public:
    enum Algorithm {
        None,
        Zlib,
        Lz4,
        Lzo,
        Brotli,
    };

    static Algorithm algorithm(quint8 level);
    static QByteArray decompress(quint8 level, const QByteArray &data,
                                 bool *ok = nullptr, QString *errorString = nullptr);

    static QByteArray inflate(const QByteArray &data, bool *ok = nullptr, QString *errorString = nullptr);
    static QByteArray deflate(const QByteArray &data, int level);
    static QByteArray lz4Decompress(const QByteArray &data, bool *ok = nullptr, QString *errorString = nullptr);
    static QByteArray lz4Compress(const QByteArray &data);
    static QByteArray brotliDecompress(const QByteArray &data, bool *ok = nullptr, QString *errorString = nullptr);
};

struct QXpraCompressed
{
    quint8 level = 0;
    QByteArray data;
};

class QXpraCompressor
{
public:
    virtual ~QXpraCompressor() = default;
    virtual QByteArray name() const = 0;
    virtual QXpraCompressed compress(const QByteArray &data) const = 0;
};

class QXpraNullCompressor : public QXpraCompressor
{
public:
    QByteArray name() const override { return "none"; }
    QXpraCompressed compress(const QByteArray &data) const override;
};

class QXpraZlibCompressor : public QXpraCompressor
{
public:
    explicit QXpraZlibCompressor(int level = 1);
    QByteArray name() const override { return "zlib"; }
    QXpraCompressed compress(const QByteArray &data) const override;

private:
    int level;
};

class QXpraLz4Compressor : public QXpraCompressor
{
public:
    QByteArray name() const override { return "lz4"; }
    QXpraCompressed compress(const QByteArray &data) const override;
};

QSharedPointer<QXpraCompressor> qXpraCreateCompressor(const QByteArray &name, int level = 1);

QT_END_NAMESPACE

#endif // QXPRACOMPRESSION_H
