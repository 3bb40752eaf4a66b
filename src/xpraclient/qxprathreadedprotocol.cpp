// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxprathreadedprotocol.h"

QT_BEGIN_NAMESPACE

/*!
    \class QXpraThreadedProtocol
    \inmodule QtXpraClient

    \brief The QXpraThreadedProtocol class runs a QXpraProtocol on its own thread.

    The worker is reached only through queued signals carrying one of a fixed
    set of commands (open, send, close, inbound and outbound cipher setup,
    compressor selection); its events come back the same way. The public
    interface is the one of QXpraAbstractProtocol, so callers cannot tell the
    two implementations apart.
*/
QXpraThreadedProtocol::QXpraThreadedProtocol(QObject *parent)
    : QXpraAbstractProtocol(parent)
    , worker(new QXpraProtocol)
{
    qRegisterMetaType<QXpraCipherParameters>();
    qRegisterMetaType<QXpraAbstractProtocol::Error>();

    thread.setObjectName(u"QXpraProtocol"_s);
    worker->moveToThread(&thread);
    connect(&thread, &QThread::finished, worker, &QObject::deleteLater);

    connect(this, &QXpraThreadedProtocol::openRequested, worker, &QXpraProtocol::open);
    connect(this, &QXpraThreadedProtocol::sendRequested, worker, &QXpraProtocol::send);
    connect(this, &QXpraThreadedProtocol::closeRequested, worker, &QXpraProtocol::close);
    connect(this, &QXpraThreadedProtocol::cipherInRequested, worker, &QXpraProtocol::setCipherIn);
    connect(this, &QXpraThreadedProtocol::cipherOutRequested, worker, &QXpraProtocol::setCipherOut);
    connect(this, &QXpraThreadedProtocol::compressorRequested, worker, &QXpraProtocol::setCompressor);

    connect(worker, &QXpraProtocol::opened, this, &QXpraAbstractProtocol::opened);
    connect(worker, &QXpraProtocol::packetReceived, this, &QXpraAbstractProtocol::packetReceived);
    connect(worker, &QXpraProtocol::errorOccurred, this, &QXpraAbstractProtocol::errorOccurred);
    connect(worker, &QXpraProtocol::closed, this, &QXpraAbstractProtocol::closed);

    thread.start();
}

QXpraThreadedProtocol::~QXpraThreadedProtocol()
{
    worker->disconnect(this);
    QMetaObject::invokeMethod(worker, &QXpraProtocol::close, Qt::BlockingQueuedConnection);
    thread.quit();
    thread.wait();
}

QThread *QXpraThreadedProtocol::workerThread() const
{
    return const_cast<QThread *>(&thread);
}

void QXpraThreadedProtocol::open(const QUrl &url)
{
    setUrl(url);
    emit openRequested(url, QPrivateSignal());
}

void QXpraThreadedProtocol::send(const QVariantList &packet)
{
    emit sendRequested(packet, QPrivateSignal());
}

void QXpraThreadedProtocol::close()
{
    emit closeRequested(QPrivateSignal());
}

void QXpraThreadedProtocol::setCipherIn(const QXpraCipherParameters &parameters, const QByteArray &secret)
{
    emit cipherInRequested(parameters, secret, QPrivateSignal());
}

void QXpraThreadedProtocol::setCipherOut(const QXpraCipherParameters &parameters, const QByteArray &secret)
{
    emit cipherOutRequested(parameters, secret, QPrivateSignal());
}

void QXpraThreadedProtocol::setCompressor(const QByteArray &name, int level)
{
    emit compressorRequested(name, level, QPrivateSignal());
}

QT_END_NAMESPACE
