// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRACLIENT_H
#define QXPRACLIENT_H

#include "qtxpraclientglobal.h"
#include "qxpraclientsettings.h"
#include "qxpraconnection.h"
#include <QtCore/QObject>
#include <QtCore/QRect>
#include <QtCore/QScopedPointer>
#include <QtCore/QSharedPointer>
#include <QtGui/QImage>

QT_BEGIN_NAMESPACE

class QKeyEvent;
class QMouseEvent;
class QWheelEvent;
class QXpraAbstractProtocol;
class QXpraPaintPipeline;
class QXpraVideoDecoderFactory;

class QXpraWindowSink
{
public:
    virtual ~QXpraWindowSink() = default;

    virtual void createWindow(qint64 wid, const QRect &geometry, const QVariantMap &metadata,
                              bool overrideRedirect) = 0;
    virtual void updateMetadata(qint64 wid, const QVariantMap &metadata) = 0;
    virtual void paint(qint64 wid, const QRect &rect, const QImage &image) = 0;
    virtual void moveResize(qint64 wid, const QRect &geometry) = 0;
    virtual void destroyWindow(qint64 wid) = 0;
    virtual void raiseWindow(qint64 wid) = 0;
    virtual void setServerResponding(bool responding) = 0;

    virtual void setIcon(qint64 wid, const QImage &icon) { Q_UNUSED(wid); Q_UNUSED(icon); }
    // the window should show what it has painted so far
    virtual void flush(qint64 wid) { Q_UNUSED(wid); }
};

class QXpraClient : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QXpraConnection::State state READ state NOTIFY stateChanged)
    Q_PROPERTY(QSize desktopSize READ desktopSize WRITE setDesktopSize)
public:
    explicit QXpraClient(QObject *parent = nullptr);
    ~QXpraClient() override;

    QXpraClientSettings settings() const;
    void setSettings(const QXpraClientSettings &settings);

    void setWindowSink(QXpraWindowSink *sink);
    QXpraWindowSink *windowSink() const;
    void setCredentialProvider(QXpraCredentialProvider *provider);
    void setProtocol(QXpraAbstractProtocol *protocol);
    void registerVideoDecoderFactory(const QSharedPointer<QXpraVideoDecoderFactory> &factory);

    QXpraConnection *connection() const;
    QXpraPaintPipeline *paintPipeline() const;
    QXpraConnection::State state() const;

    QSize desktopSize() const;
    void setDesktopSize(const QSize &size);

    QList<qint64> windowIds() const;
    bool hasWindow(qint64 wid) const;
    QRect windowGeometry(qint64 wid) const;
    QVariantMap windowMetadata(qint64 wid) const;
    bool isOverrideRedirect(qint64 wid) const;
    qint64 focusedWindow() const;

    bool isClipboardEnabled() const;
    QString clipboardText() const;
    void setClipboardText(const QString &text);

    QVariantMap helloCapabilities() const;

public slots:
    void connectToServer();
    void disconnectFromServer();

    void mapWindow(qint64 wid, const QRect &geometry, const QVariantMap &properties = QVariantMap());
    void configureWindow(qint64 wid, const QRect &geometry, const QVariantMap &properties = QVariantMap());
    void closeWindow(qint64 wid);
    void focusWindow(qint64 wid);
    void handleKeyEvent(qint64 wid, QKeyEvent *event);
    void handlePointerEvent(qint64 wid, QMouseEvent *event);
    void handleWheelEvent(qint64 wid, QWheelEvent *event);

signals:
    void stateChanged(QXpraConnection::State state);
    void connected();
    void disconnected(const QString &reason);
    void errorOccurred(const QString &errorString);
    void serverRespondingChanged(bool responding);
    void startupComplete();
    void bell(qint64 wid, int percent, int pitch, int duration);
    void cursorChanged(const QImage &cursor, const QPoint &hotspot);
    void notificationShown(qint64 id, const QString &summary, const QString &body, int timeout);
    void notificationClosed(qint64 id);
    void clipboardChanged(const QString &text);

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QXPRACLIENT_H
