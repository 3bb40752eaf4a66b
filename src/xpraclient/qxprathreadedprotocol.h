// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRATHREADEDPROTOCOL_H
#define QXPRATHREADEDPROTOCOL_H

#include "qxpraprotocol.h"
#include <QtCore/QThread>

QT_BEGIN_NAMESPACE

class QXpraThreadedProtocol : public QXpraAbstractProtocol
{
    Q_OBJECT
public:
    explicit QXpraThreadedProtocol(QObject *parent = nullptr);
    ~QXpraThreadedProtocol() override;

    QThread *workerThread() const;

public slots:
    void open(const QUrl &url) override;
    void send(const QVariantList &packet) override;
    void close() override;
    void setCipherIn(const QXpraCipherParameters &parameters, const QByteArray &secret) override;
    void setCipherOut(const QXpraCipherParameters &parameters, const QByteArray &secret) override;
    void setCompressor(const QByteArray &name, int level) override;

signals:
    // commands for the worker, delivered as queued messages
    void openRequested(const QUrl &url, QPrivateSignal);
    void sendRequested(const QVariantList &packet, QPrivateSignal);
    void closeRequested(QPrivateSignal);
    void cipherInRequested(const QXpraCipherParameters &parameters, const QByteArray &secret, QPrivateSignal);
    void cipherOutRequested(const QXpraCipherParameters &parameters, const QByteArray &secret, QPrivateSignal);
    void compressorRequested(const QByteArray &name, int level, QPrivateSignal);

private:
    QThread thread;
    QXpraProtocol *worker = nullptr;
};

QT_END_NAMESPACE

#endif // QXPRATHREADEDPROTOCOL_H
