// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRAVIDEODECODER_H
#define QXPRAVIDEODECODER_H

#include "qtxpraclientglobal.h"
#include <QtCore/QByteArrayList>
#include <QtCore/QVariantMap>
#include <QtGui/QImage>

QT_BEGIN_NAMESPACE

// Stateful decoder for one window's video stream. Calls for one instance are
// serialized but may arrive on any thread pool thread.
class QXpraVideoDecoder
{
public:
    virtual ~QXpraVideoDecoder() = default;

    virtual bool initialize(const QByteArray &coding, const QSize &size,
                            const QVariantMap &options, QString *errorString) = 0;
    virtual QImage decode(const QByteArray &data, const QVariantMap &options, QString *errorString) = 0;
};

class QXpraVideoDecoderFactory
{
public:
    virtual ~QXpraVideoDecoderFactory() = default;

    virtual QByteArrayList codings() const = 0;
    virtual QXpraVideoDecoder *create(const QByteArray &coding) = 0;
};

QT_END_NAMESPACE

#endif // QXPRAVIDEODECODER_H
