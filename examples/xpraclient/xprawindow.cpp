// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "xprawindow.h"

#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>
#include <QtGui/QPaintEvent>
#include <QtGui/QWheelEvent>

class XpraWindow::Private
{
public:
    Private(XpraWindow *parent, QXpraClient *client, qint64 wid);

    void paint(const QRect &rect);

private:
    XpraWindow *q;

public:
    QXpraClient *client;
    qint64 wid;
    QImage image;
    bool responding = true;
};

XpraWindow::Private::Private(XpraWindow *parent, QXpraClient *client, qint64 wid)
    : q(parent)
    , client(client)
    , wid(wid)
{
    q->setMouseTracking(true);
    q->setFocusPolicy(Qt::StrongFocus);
    q->setAttribute(Qt::WA_OpaquePaintEvent);
}

void XpraWindow::Private::paint(const QRect &rect)
{
    QPainter p(q);
    if (image.isNull()) {
        p.fillRect(rect, Qt::black);
        return;
    }
    p.drawImage(rect, image, rect);
    if (!responding) {
        p.setOpacity(0.5);
        p.fillRect(rect, Qt::lightGray);
    }
}

XpraWindow::XpraWindow(QXpraClient *client, qint64 wid, QWidget *parent)
    : QWidget(parent)
    , d(new Private(this, client, wid))
{
}

XpraWindow::~XpraWindow() = default;

qint64 XpraWindow::wid() const
{
    return d->wid;
}

QImage XpraWindow::image() const
{
    return d->image;
}

void XpraWindow::resizeContents(const QSize &size)
{
    if (d->image.size() != size) {
        QImage resized(size, QImage::Format_ARGB32_Premultiplied);
        resized.fill(Qt::black);
        if (!d->image.isNull()) {
            QPainter p(&resized);
            p.drawImage(0, 0, d->image);
        }
        d->image = resized;
    }
    setFixedSize(size);
    update();
}

void XpraWindow::paintImage(const QRect &rect, const QImage &image)
{
    if (d->image.isNull())
        resizeContents(size());
    QPainter p(&d->image);
    p.setCompositionMode(QPainter::CompositionMode_Source);
    p.drawImage(rect.topLeft(), image);
    p.end();
    update(rect);
}

void XpraWindow::setServerResponding(bool responding)
{
    if (d->responding == responding)
        return;
    d->responding = responding;
    update();
}

void XpraWindow::keyPressEvent(QKeyEvent *e)
{
    d->client->handleKeyEvent(d->wid, e);
}

void XpraWindow::keyReleaseEvent(QKeyEvent *e)
{
    d->client->handleKeyEvent(d->wid, e);
}

void XpraWindow::mousePressEvent(QMouseEvent *e)
{
    d->client->handlePointerEvent(d->wid, e);
}

void XpraWindow::mouseMoveEvent(QMouseEvent *e)
{
    d->client->handlePointerEvent(d->wid, e);
}

void XpraWindow::mouseReleaseEvent(QMouseEvent *e)
{
    d->client->handlePointerEvent(d->wid, e);
}

void XpraWindow::mouseDoubleClickEvent(QMouseEvent *e)
{
    d->client->handlePointerEvent(d->wid, e);
}

void XpraWindow::wheelEvent(QWheelEvent *e)
{
    d->client->handleWheelEvent(d->wid, e);
}

void XpraWindow::focusInEvent(QFocusEvent *e)
{
    QWidget::focusInEvent(e);
    d->client->focusWindow(d->wid);
}

void XpraWindow::paintEvent(QPaintEvent *e)
{
    d->paint(e->rect());
}
