// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef XPRAWINDOW_H
#define XPRAWINDOW_H

#include <QtWidgets/QWidget>
#include <QtXpraClient/QXpraClient>

class QKeyEvent;
class QMouseEvent;
class QPaintEvent;
class QWheelEvent;

class XpraWindow : public QWidget
{
    Q_OBJECT
public:
    XpraWindow(QXpraClient *client, qint64 wid, QWidget *parent = nullptr);
    ~XpraWindow() override;

    qint64 wid() const;
    QImage image() const;

    void resizeContents(const QSize &size);
    void paintImage(const QRect &rect, const QImage &image);
    void setServerResponding(bool responding);

protected:
    void keyPressEvent(QKeyEvent *e) override;
    void keyReleaseEvent(QKeyEvent *e) override;
    void mousePressEvent(QMouseEvent *e) override;
    void mouseMoveEvent(QMouseEvent *e) override;
    void mouseReleaseEvent(QMouseEvent *e) override;
    void mouseDoubleClickEvent(QMouseEvent *e) override;
    void wheelEvent(QWheelEvent *e) override;
    void focusInEvent(QFocusEvent *e) override;
    void paintEvent(QPaintEvent *e) override;

private:
    class Private;
    QScopedPointer<Private> d;
};

#endif // XPRAWINDOW_H
