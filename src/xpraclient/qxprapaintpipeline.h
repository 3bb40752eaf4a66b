// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRAPAINTPIPELINE_H
#define QXPRAPAINTPIPELINE_H

#include "qtxpraclientglobal.h"
#include "qxprapackets.h"
#include <QtCore/QObject>
#include <QtCore/QScopedPointer>
#include <QtCore/QSharedPointer>
#include <QtGui/QImage>

QT_BEGIN_NAMESPACE

class QXpraVideoDecoderFactory;

class QXpraPaintPipeline : public QObject
{
    Q_OBJECT
    Q_PROPERTY(int staleThreshold READ staleThreshold WRITE setStaleThreshold)
public:
    static constexpr int DefaultStaleThreshold = 2000;

    explicit QXpraPaintPipeline(QObject *parent = nullptr);
    ~QXpraPaintPipeline() override;

    int staleThreshold() const;
    void setStaleThreshold(int msecs);

    void registerVideoDecoderFactory(const QSharedPointer<QXpraVideoDecoderFactory> &factory);
    QByteArrayList supportedEncodings() const;
    static QByteArrayList rgbFormats();

    void createWindow(qint64 wid, const QSize &size);
    void resizeWindow(qint64 wid, const QSize &size);
    void removeWindow(qint64 wid);
    void reset();

    bool hasWindow(qint64 wid) const;
    QImage image(qint64 wid) const;
    int pendingPaints(qint64 wid) const;
    bool isPainting(qint64 wid) const;

public slots:
    void paint(const QXpraDrawPacket &packet);
    void endOfStream(qint64 wid);

signals:
    void painted(qint64 wid, const QRect &rect, const QImage &image);
    void damageSequence(qint64 sequence, qint64 wid, int width, int height,
                        qint64 decodeTime, const QString &message);
    void redrawRequested(qint64 wid);

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QXPRAPAINTPIPELINE_H
