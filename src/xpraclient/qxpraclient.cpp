// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpraclient.h"
#include "qxprapackets.h"
#include "qxprapaintpipeline.h"
#include "qxpravideodecoder.h"

#include <QtCore/QHash>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QWheelEvent>

#include <utility>

QT_BEGIN_NAMESPACE

namespace {

struct KeyName
{
    int key;
    quint32 keysym;
    const char *name;
};

// Qt keys without a printable text, with their X keysym
const KeyName keyNames[] = {
    { Qt::Key_Backspace, 0xff08, "BackSpace" },
    { Qt::Key_Tab, 0xff09, "Tab" },
    { Qt::Key_Backtab, 0xfe20, "ISO_Left_Tab" },
    { Qt::Key_Return, 0xff0d, "Return" },
    { Qt::Key_Enter, 0xff8d, "KP_Enter" },
    { Qt::Key_Escape, 0xff1b, "Escape" },
    { Qt::Key_Insert, 0xff63, "Insert" },
    { Qt::Key_Delete, 0xffff, "Delete" },
    { Qt::Key_Pause, 0xff13, "Pause" },
    { Qt::Key_Print, 0xff61, "Print" },
    { Qt::Key_Home, 0xff50, "Home" },
    { Qt::Key_End, 0xff57, "End" },
    { Qt::Key_PageUp, 0xff55, "Prior" },
    { Qt::Key_PageDown, 0xff56, "Next" },
    { Qt::Key_Left, 0xff51, "Left" },
    { Qt::Key_Up, 0xff52, "Up" },
    { Qt::Key_Right, 0xff53, "Right" },
    { Qt::Key_Down, 0xff54, "Down" },
    { Qt::Key_F1, 0xffbe, "F1" },
    { Qt::Key_F2, 0xffbf, "F2" },
    { Qt::Key_F3, 0xffc0, "F3" },
    { Qt::Key_F4, 0xffc1, "F4" },
    { Qt::Key_F5, 0xffc2, "F5" },
    { Qt::Key_F6, 0xffc3, "F6" },
    { Qt::Key_F7, 0xffc4, "F7" },
    { Qt::Key_F8, 0xffc5, "F8" },
    { Qt::Key_F9, 0xffc6, "F9" },
    { Qt::Key_F10, 0xffc7, "F10" },
    { Qt::Key_F11, 0xffc8, "F11" },
    { Qt::Key_F12, 0xffc9, "F12" },
    { Qt::Key_Shift, 0xffe1, "Shift_L" },
    { Qt::Key_Control, 0xffe3, "Control_L" },
    { Qt::Key_Meta, 0xffe7, "Meta_L" },
    { Qt::Key_Alt, 0xffe9, "Alt_L" },
    { Qt::Key_AltGr, 0xfe03, "ISO_Level3_Shift" },
    { Qt::Key_CapsLock, 0xffe5, "Caps_Lock" },
    { Qt::Key_NumLock, 0xff7f, "Num_Lock" },
    { Qt::Key_ScrollLock, 0xff14, "Scroll_Lock" },
    { Qt::Key_Super_L, 0xffeb, "Super_L" },
    { Qt::Key_Super_R, 0xffec, "Super_R" },
    { Qt::Key_Menu, 0xff67, "Menu" },
    { Qt::Key_Space, 0x0020, "space" },
};

constexpr int WheelStep = 120;

QVariantList point(const QPoint &p)
{
    return { p.x(), p.y() };
}

}

/*!
    \internal
    \class QXpraClient::Private
*/
class QXpraClient::Private
{
public:
    struct Window
    {
        QRect geometry;
        QVariantMap metadata;
        QVariantMap clientProperties;
        bool overrideRedirect = false;
        QPoint wheelDelta;
    };

    Private(QXpraClient *parent);

    void route(const QVariantList &packet);
    void newWindow(const QVariantList &packet);
    void lostWindow(const QVariantList &packet);
    void windowMetadata(const QVariantList &packet);
    void windowGeometry(const QVariantList &packet);
    void windowIcon(const QVariantList &packet);
    void draw(const QVariantList &packet);
    void cursor(const QVariantList &packet);
    void clipboardToken(const QVariantList &packet);
    void clipboardRequest(const QVariantList &packet);
    void onEstablished(const QVariantMap &capabilities);
    void resetWindows();

    void send(const QVariantList &packet);
    void sendDamageSequence(const QXpraDamageSequencePacket &ack);
    QVariantMap makeHelloCapabilities() const;
    QVariantList screenSizes() const;
    QVariantMap clientProperties(const Window &window) const;
    QVariantList modifiers(Qt::KeyboardModifiers modifiers) const;
    QVariantList buttons(Qt::MouseButtons buttons) const;
    static int buttonNumber(Qt::MouseButton button);
    void sendButton(qint64 wid, int button, bool pressed, const QPoint &position,
                    Qt::KeyboardModifiers modifiers, Qt::MouseButtons buttons);

private:
    QXpraClient *q;

public:
    QXpraConnection connection;
    QXpraPaintPipeline pipeline;
    QXpraWindowSink *sink = nullptr;
    QSize desktopSize = QSize(1024, 768);
    int dpi = 96;

    QHash<qint64, Window> windows;
    qint64 focused = 0;

    QByteArray altModifier = "mod1";
    QByteArray metaModifier = "mod4";

    bool clipboardEnabled = true;
    QString clipboardText;
};

QXpraClient::Private::Private(QXpraClient *parent)
    : q(parent)
    , connection(parent)
    , pipeline(parent)
{
    connect(&connection, &QXpraConnection::packetReceived, q, [this](const QVariantList &packet) {
        route(packet);
    });
    connect(&connection, &QXpraConnection::stateChanged, q, &QXpraClient::stateChanged);
    connect(&connection, &QXpraConnection::errorOccurred, q, &QXpraClient::errorOccurred);
    connect(&connection, &QXpraConnection::connectionClosed, q, &QXpraClient::disconnected);
    connect(&connection, &QXpraConnection::established, q, [this](const QVariantMap &capabilities) {
        onEstablished(capabilities);
    });
    connect(&connection, &QXpraConnection::sessionReset, q, [this]() {
        resetWindows();
    });
    connect(&connection, &QXpraConnection::serverRespondingChanged, q, [this](bool responding) {
        if (sink)
            sink->setServerResponding(responding);
        emit q->serverRespondingChanged(responding);
    });

    connect(&pipeline, &QXpraPaintPipeline::painted, q, [this](qint64 wid, const QRect &rect, const QImage &image) {
        if (sink && windows.contains(wid))
            sink->paint(wid, rect, image);
    });
    connect(&pipeline, &QXpraPaintPipeline::damageSequence, q,
            [this](qint64 sequence, qint64 wid, int width, int height, qint64 decodeTime, const QString &message) {
        QXpraDamageSequencePacket ack;
        ack.sequence = sequence;
        ack.wid = wid;
        ack.width = width;
        ack.height = height;
        ack.decodeTime = decodeTime;
        ack.message = message;
        sendDamageSequence(ack);
    });
    connect(&pipeline, &QXpraPaintPipeline::redrawRequested, q, [this](qint64 wid) {
        if (sink && windows.contains(wid))
            sink->flush(wid);
    });
}

/*!
    \internal
    Handles every packet the connection layer passes up.
*/
void QXpraClient::Private::route(const QVariantList &packet)
{
    const QByteArray type = QXpraPacket::type(packet);
    QString errorString;

    if (type == QXpraPacket::Draw) {
        draw(packet);
    } else if (type == QXpraPacket::Eos) {
        QXpraEosPacket eos;
        if (eos.fromPacket(packet, &errorString))
            pipeline.endOfStream(eos.wid);
    } else if (type == QXpraPacket::NewWindow || type == QXpraPacket::NewOverrideRedirect) {
        newWindow(packet);
    } else if (type == QXpraPacket::LostWindow) {
        lostWindow(packet);
    } else if (type == QXpraPacket::WindowMetadata) {
        windowMetadata(packet);
    } else if (type == QXpraPacket::RaiseWindow) {
        QXpraWindowPacket raise;
        if (raise.fromPacket(packet, &errorString) && sink && windows.contains(raise.wid))
            sink->raiseWindow(raise.wid);
    } else if (type == QXpraPacket::WindowResized || type == QXpraPacket::WindowMoveResize
               || type == QXpraPacket::ConfigureOverrideRedirect) {
        windowGeometry(packet);
    } else if (type == QXpraPacket::WindowIcon) {
        windowIcon(packet);
    } else if (type == QXpraPacket::Cursor) {
        cursor(packet);
    } else if (type == QXpraPacket::Bell) {
        QXpraBellPacket bell;
        if (bell.fromPacket(packet, &errorString))
            emit q->bell(bell.wid, bell.percent, bell.pitch, bell.duration);
    } else if (type == QXpraPacket::NotifyShow) {
        QXpraNotifyShowPacket notify;
        if (notify.fromPacket(packet, &errorString))
            emit q->notificationShown(notify.id, notify.summary, notify.body, notify.expireTimeout);
    } else if (type == QXpraPacket::NotifyClose) {
        QXpraNotifyClosePacket notify;
        if (notify.fromPacket(packet, &errorString))
            emit q->notificationClosed(notify.id);
    } else if (type == QXpraPacket::ClipboardToken) {
        clipboardToken(packet);
    } else if (type == QXpraPacket::ClipboardRequest) {
        clipboardRequest(packet);
    } else if (type == QXpraPacket::SetClipboardEnabled) {
        QXpraSetClipboardEnabledPacket enabled;
        if (enabled.fromPacket(packet, &errorString)) {
            qCInfo(lcXpraClient) << "Server set clipboard state to" << enabled.enabled
                                 << "reason:" << enabled.reason;
            clipboardEnabled = enabled.enabled;
        }
    } else if (type == QXpraPacket::StartupComplete) {
        qCInfo(lcXpraClient) << "Startup complete";
        emit q->startupComplete();
    } else {
        qCDebug(lcXpraClient) << "Unhandled packet" << type;
    }

    if (!errorString.isEmpty())
        qCWarning(lcXpraClient) << "Dropping" << type << "packet:" << errorString;
}

void QXpraClient::Private::newWindow(const QVariantList &packet)
{
    QXpraNewWindowPacket created;
    QString errorString;
    if (!created.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping" << QXpraPacket::type(packet) << "packet:" << errorString;
        return;
    }
    if (windows.contains(created.wid)) {
        qCWarning(lcXpraClient) << "Window" << created.wid << "already exists";
        return;
    }
    Window window;
    window.geometry = created.geometry;
    window.metadata = created.metadata;
    window.clientProperties = created.clientProperties;
    window.overrideRedirect = created.overrideRedirect;
    windows.insert(created.wid, window);
    pipeline.createWindow(created.wid, created.geometry.size());
    qCDebug(lcXpraClient) << "New window" << created.wid << created.geometry
                          << (created.overrideRedirect ? "override-redirect" : "");

    if (sink)
        sink->createWindow(created.wid, created.geometry, created.metadata, created.overrideRedirect);
    if (!created.overrideRedirect) {
        q->mapWindow(created.wid, created.geometry);
        q->focusWindow(created.wid);
    }
}

void QXpraClient::Private::lostWindow(const QVariantList &packet)
{
    QXpraWindowPacket lost;
    QString errorString;
    if (!lost.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping lost-window packet:" << errorString;
        return;
    }
    if (!windows.remove(lost.wid))
        return;
    pipeline.removeWindow(lost.wid);
    if (focused == lost.wid)
        focused = 0;
    if (sink)
        sink->destroyWindow(lost.wid);
}

void QXpraClient::Private::windowMetadata(const QVariantList &packet)
{
    QXpraWindowMetadataPacket update;
    QString errorString;
    if (!update.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping window-metadata packet:" << errorString;
        return;
    }
    auto it = windows.find(update.wid);
    if (it == windows.end())
        return;
    for (auto m = update.metadata.cbegin(); m != update.metadata.cend(); ++m)
        it->metadata.insert(m.key(), m.value());
    if (sink)
        sink->updateMetadata(update.wid, update.metadata);
}

void QXpraClient::Private::windowGeometry(const QVariantList &packet)
{
    QXpraWindowGeometryPacket update;
    QString errorString;
    if (!update.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping" << QXpraPacket::type(packet) << "packet:" << errorString;
        return;
    }
    auto it = windows.find(update.wid);
    if (it == windows.end())
        return;
    QRect geometry = update.geometry;
    if (!update.hasPosition)
        geometry.moveTopLeft(it->geometry.topLeft());
    it->geometry = geometry;
    pipeline.resizeWindow(update.wid, geometry.size());
    if (sink)
        sink->moveResize(update.wid, geometry);
}

void QXpraClient::Private::windowIcon(const QVariantList &packet)
{
    QXpraWindowIconPacket icon;
    QString errorString;
    if (!icon.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping window-icon packet:" << errorString;
        return;
    }
    if (!windows.contains(icon.wid) || !sink)
        return;
    QImage image;
    if (icon.coding != "png" || !image.loadFromData(icon.data, "PNG")) {
        qCWarning(lcXpraClient) << "Cannot decode" << icon.coding << "icon for window" << icon.wid;
        return;
    }
    sink->setIcon(icon.wid, image);
}

void QXpraClient::Private::draw(const QVariantList &packet)
{
    QXpraDrawPacket draw;
    QString errorString;
    if (!draw.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping draw packet:" << errorString;
        return;
    }
    if (!windows.contains(draw.wid)) {
        QXpraDamageSequencePacket ack;
        ack.sequence = draw.sequence;
        ack.wid = draw.wid;
        ack.width = draw.rect.width();
        ack.height = draw.rect.height();
        ack.decodeTime = -1;
        ack.message = u"window %1 not found"_s.arg(draw.wid);
        sendDamageSequence(ack);
        return;
    }
    pipeline.paint(draw);
}

void QXpraClient::Private::cursor(const QVariantList &packet)
{
    QXpraCursorPacket cursor;
    QString errorString;
    if (!cursor.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping cursor packet:" << errorString;
        return;
    }
    if (cursor.reset) {
        emit q->cursorChanged(QImage(), QPoint());
        return;
    }
    QImage image;
    if (cursor.coding == "png") {
        image.loadFromData(cursor.data, "PNG");
    } else if (cursor.coding == "raw" && cursor.data.size() >= qint64(cursor.size.width()) * cursor.size.height() * 4) {
        image = QImage(reinterpret_cast<const uchar *>(cursor.data.constData()), cursor.size.width(),
                       cursor.size.height(), cursor.size.width() * 4, QImage::Format_ARGB32).copy();
    }
    if (image.isNull()) {
        qCWarning(lcXpraClient) << "Cannot decode" << cursor.coding << "cursor";
        return;
    }
    emit q->cursorChanged(image, cursor.hotspot);
}

void QXpraClient::Private::clipboardToken(const QVariantList &packet)
{
    QXpraClipboardTokenPacket token;
    QString errorString;
    if (!token.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping clipboard-token packet:" << errorString;
        return;
    }
    if (!clipboardEnabled)
        return;
    static const QByteArrayList textTargets { "UTF8_STRING", "TEXT", "STRING", "text/plain" };
    if (!textTargets.contains(token.target) || token.data.isEmpty())
        return;
    clipboardText = QString::fromUtf8(token.data);
    emit q->clipboardChanged(clipboardText);
}

void QXpraClient::Private::clipboardRequest(const QVariantList &packet)
{
    QXpraClipboardRequestPacket request;
    QString errorString;
    if (!request.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraClient) << "Dropping clipboard-request packet:" << errorString;
        return;
    }
    QXpraClipboardContentsPacket contents;
    contents.requestId = request.requestId;
    contents.selection = request.selection;
    if (clipboardEnabled)
        contents.data = clipboardText.toUtf8();
    send(contents.toPacket());
}

/*!
    \internal
    Picks up the modifier names the server uses for Alt and Meta.
*/
void QXpraClient::Private::onEstablished(const QVariantMap &capabilities)
{
    const QVariantMap modifierKeycodes = capabilities.value(u"modifier_keycodes"_s).toMap();
    for (auto it = modifierKeycodes.cbegin(); it != modifierKeycodes.cend(); ++it) {
        const QVariantList keys = it.value().toList();
        for (const QVariant &key : keys) {
            // entries are [keycode, keyname] pairs or plain names
            const QVariantList parts = key.typeId() == QMetaType::QVariantList ? key.toList() : QVariantList { key };
            for (const QVariant &part : parts) {
                const QByteArray name = part.toByteArray();
                if (name == "Alt_L")
                    altModifier = it.key().toLatin1();
                else if (name == "Meta_L")
                    metaModifier = it.key().toLatin1();
            }
        }
    }
    if (capabilities.contains(u"clipboard"_s))
        clipboardEnabled = clipboardEnabled && capabilities.value(u"clipboard"_s).toBool();
    emit q->connected();
}

void QXpraClient::Private::resetWindows()
{
    const QList<qint64> ids = windows.keys();
    windows.clear();
    focused = 0;
    pipeline.reset();
    if (!sink)
        return;
    for (qint64 wid : ids)
        sink->destroyWindow(wid);
}

void QXpraClient::Private::send(const QVariantList &packet)
{
    connection.send(packet);
}

void QXpraClient::Private::sendDamageSequence(const QXpraDamageSequencePacket &ack)
{
    send(ack.toPacket());
}

QVariantMap QXpraClient::Private::makeHelloCapabilities() const
{
    const QByteArrayList supported = pipeline.supportedEncodings();
    const QXpraClientSettings settings = connection.settings();
    // codings of registered video decoders are always offered
    static const QByteArrayList builtin { "rgb32", "rgb24", "png", "png/P", "png/L", "jpeg", "webp", "scroll" };
    QByteArrayList encodings;
    for (const QByteArray &encoding : supported) {
        if (settings.encodings.isEmpty() || settings.encodings.contains(encoding) || !builtin.contains(encoding))
            encodings << encoding;
    }
    QVariantMap caps;
    caps.insert(u"encodings"_s, QVariant::fromValue(encodings));
    caps.insert(u"encodings.core"_s, QVariant::fromValue(encodings));
    caps.insert(u"encodings.rgb_formats"_s, QVariant::fromValue(QXpraPaintPipeline::rgbFormats()));
    caps.insert(u"encodings.window-icon"_s, QVariant::fromValue(QByteArrayList { "png" }));
    caps.insert(u"encodings.cursor"_s, QVariant::fromValue(QByteArrayList { "png", "raw" }));
    caps.insert(u"encoding.generic"_s, true);
    caps.insert(u"encoding.transparency"_s, true);
    caps.insert(u"encoding.client_options"_s, true);
    caps.insert(u"encoding.rgb24zlib"_s, true);
    caps.insert(u"encoding.rgb_zlib"_s, true);
    caps.insert(u"encoding.video_reinit"_s, false);
    caps.insert(u"encoding.video_scaling"_s, false);
    caps.insert(u"generic-rgb-encodings"_s, true);

    caps.insert(u"share"_s, false);
    caps.insert(u"windows"_s, true);
    caps.insert(u"window.raise"_s, true);
    caps.insert(u"server-window-resize"_s, true);
    caps.insert(u"notify-startup-complete"_s, true);
    caps.insert(u"randr_notify"_s, true);
    caps.insert(u"raw_window_icons"_s, true);

    caps.insert(u"keyboard"_s, true);
    caps.insert(u"xkbmap_layout"_s, QByteArray("us"));
    caps.insert(u"desktop_size"_s, point(QPoint(desktopSize.width(), desktopSize.height())));
    caps.insert(u"screen_sizes"_s, screenSizes());
    caps.insert(u"dpi"_s, dpi);

    caps.insert(u"clipboard"_s, settings.clipboard);
    caps.insert(u"clipboard_enabled"_s, settings.clipboard);
    caps.insert(u"clipboard.want_targets"_s, true);
    caps.insert(u"clipboard.selections"_s, QVariant::fromValue(QByteArrayList { "CLIPBOARD" }));
    caps.insert(u"notifications"_s, true);
    caps.insert(u"cursors"_s, true);
    caps.insert(u"bell"_s, true);
    caps.insert(u"system_tray"_s, false);
    caps.insert(u"named_cursors"_s, false);
    return caps;
}

QVariantList QXpraClient::Private::screenSizes() const
{
    const int width = desktopSize.width();
    const int height = desktopSize.height();
    const int wmm = qRound(width * 25.4 / dpi);
    const int hmm = qRound(height * 25.4 / dpi);
    const QVariantList monitor { QByteArray("Qt"), 0, 0, width, height, wmm, hmm };
    const QVariantList screen { QByteArray("Qt"), width, height, wmm, hmm, QVariantList { QVariant(monitor) },
                                0, 0, width, height };
    return { QVariant(screen) };
}

QVariantMap QXpraClient::Private::clientProperties(const Window &window) const
{
    QVariantMap properties = window.clientProperties;
    properties.insert(u"encodings.rgb_formats"_s, QVariant::fromValue(QXpraPaintPipeline::rgbFormats()));
    return properties;
}

QVariantList QXpraClient::Private::modifiers(Qt::KeyboardModifiers modifiers) const
{
    QVariantList names;
    if (modifiers & Qt::ShiftModifier)
        names << QByteArray("shift");
    if (modifiers & Qt::ControlModifier)
        names << QByteArray("control");
    if (modifiers & Qt::AltModifier)
        names << altModifier;
    if (modifiers & Qt::MetaModifier)
        names << metaModifier;
    return names;
}

QVariantList QXpraClient::Private::buttons(Qt::MouseButtons buttons) const
{
    QVariantList numbers;
    for (Qt::MouseButton button : { Qt::LeftButton, Qt::MiddleButton, Qt::RightButton,
                                    Qt::BackButton, Qt::ForwardButton }) {
        if (buttons & button)
            numbers << buttonNumber(button);
    }
    return numbers;
}

int QXpraClient::Private::buttonNumber(Qt::MouseButton button)
{
    switch (button) {
    case Qt::LeftButton: return 1;
    case Qt::MiddleButton: return 2;
    case Qt::RightButton: return 3;
    case Qt::BackButton: return 8;
    case Qt::ForwardButton: return 9;
    default: return 0;
    }
}

void QXpraClient::Private::sendButton(qint64 wid, int button, bool pressed, const QPoint &position,
                                      Qt::KeyboardModifiers modifiers, Qt::MouseButtons buttons)
{
    send({ QByteArray(QXpraPacket::ButtonAction), wid, button, pressed, point(position),
           this->modifiers(modifiers), this->buttons(buttons) });
}

/*!
    \class QXpraClient
    \inmodule QtXpraClient

    \brief The QXpraClient class connects to an xpra server and presents its
    windows through a QXpraWindowSink.

    QXpraClient ties a QXpraConnection to a QXpraPaintPipeline. Window
    lifecycle packets are turned into calls on the window sink, draw packets
    are decoded by the pipeline and the results handed to the sink, and the
    input methods translate Qt events into xpra input packets.

    \sa QXpraConnection, QXpraPaintPipeline
*/
QXpraClient::QXpraClient(QObject *parent)
    : QObject(parent)
    , d(new Private(this))
{
    d->connection.setHelloCapabilities(d->makeHelloCapabilities());
}

QXpraClient::~QXpraClient() = default;

QXpraClientSettings QXpraClient::settings() const
{
    return d->connection.settings();
}

void QXpraClient::setSettings(const QXpraClientSettings &settings)
{
    d->connection.setSettings(settings);
    d->pipeline.setStaleThreshold(settings.staleThreshold);
    d->clipboardEnabled = settings.clipboard;
}

void QXpraClient::setWindowSink(QXpraWindowSink *sink)
{
    d->sink = sink;
}

QXpraWindowSink *QXpraClient::windowSink() const
{
    return d->sink;
}

void QXpraClient::setCredentialProvider(QXpraCredentialProvider *provider)
{
    d->connection.setCredentialProvider(provider);
}

void QXpraClient::setProtocol(QXpraAbstractProtocol *protocol)
{
    d->connection.setProtocol(protocol);
}

void QXpraClient::registerVideoDecoderFactory(const QSharedPointer<QXpraVideoDecoderFactory> &factory)
{
    d->pipeline.registerVideoDecoderFactory(factory);
}

QXpraConnection *QXpraClient::connection() const
{
    return &d->connection;
}

QXpraPaintPipeline *QXpraClient::paintPipeline() const
{
    return &d->pipeline;
}

QXpraConnection::State QXpraClient::state() const
{
    return d->connection.state();
}

QSize QXpraClient::desktopSize() const
{
    return d->desktopSize;
}

/*!
    Sets the size of the local desktop the server may place windows on.
    While connected the server is told about the change.
*/
void QXpraClient::setDesktopSize(const QSize &size)
{
    if (d->desktopSize == size)
        return;
    d->desktopSize = size;
    if (d->connection.state() == QXpraConnection::Established)
        d->send({ QByteArray(QXpraPacket::DesktopSize), size.width(), size.height(), d->screenSizes() });
}

QList<qint64> QXpraClient::windowIds() const
{
    return d->windows.keys();
}

bool QXpraClient::hasWindow(qint64 wid) const
{
    return d->windows.contains(wid);
}

QRect QXpraClient::windowGeometry(qint64 wid) const
{
    return d->windows.value(wid).geometry;
}

QVariantMap QXpraClient::windowMetadata(qint64 wid) const
{
    return d->windows.value(wid).metadata;
}

bool QXpraClient::isOverrideRedirect(qint64 wid) const
{
    return d->windows.value(wid).overrideRedirect;
}

qint64 QXpraClient::focusedWindow() const
{
    return d->focused;
}

bool QXpraClient::isClipboardEnabled() const
{
    return d->clipboardEnabled;
}

QString QXpraClient::clipboardText() const
{
    return d->clipboardText;
}

/*!
    Makes \a text the local clipboard contents and tells the server that the
    clipboard owner changed. The server asks for the data when it needs it.
*/
void QXpraClient::setClipboardText(const QString &text)
{
    d->clipboardText = text;
    if (!d->clipboardEnabled)
        return;
    d->send({ QByteArray(QXpraPacket::ClipboardToken), QByteArray("CLIPBOARD") });
}

QVariantMap QXpraClient::helloCapabilities() const
{
    return d->makeHelloCapabilities();
}

void QXpraClient::connectToServer()
{
    d->connection.setHelloCapabilities(d->makeHelloCapabilities());
    d->connection.connectToServer();
}

void QXpraClient::disconnectFromServer()
{
    d->connection.close();
}

void QXpraClient::mapWindow(qint64 wid, const QRect &geometry, const QVariantMap &properties)
{
    auto it = d->windows.find(wid);
    if (it == d->windows.end())
        return;
    it->geometry = geometry;
    for (auto p = properties.cbegin(); p != properties.cend(); ++p)
        it->clientProperties.insert(p.key(), p.value());
    d->send({ QByteArray(QXpraPacket::MapWindow), wid, geometry.x(), geometry.y(),
              geometry.width(), geometry.height(), d->clientProperties(*it) });
}

void QXpraClient::configureWindow(qint64 wid, const QRect &geometry, const QVariantMap &properties)
{
    auto it = d->windows.find(wid);
    if (it == d->windows.end())
        return;
    it->geometry = geometry;
    for (auto p = properties.cbegin(); p != properties.cend(); ++p)
        it->clientProperties.insert(p.key(), p.value());
    const bool overrideRedirect = it->overrideRedirect;
    const QVariantMap clientProperties = d->clientProperties(*it);
    d->pipeline.resizeWindow(wid, geometry.size());
    if (!overrideRedirect)
        focusWindow(wid);
    d->send({ QByteArray(QXpraPacket::ConfigureWindow), wid, geometry.x(), geometry.y(),
              geometry.width(), geometry.height(), clientProperties });
}

void QXpraClient::closeWindow(qint64 wid)
{
    if (!d->windows.contains(wid))
        return;
    d->send({ QByteArray(QXpraPacket::CloseWindow), wid });
}

/*!
    Gives the input focus to \a wid. Override-redirect windows never take
    focus.
*/
void QXpraClient::focusWindow(qint64 wid)
{
    const auto it = d->windows.constFind(wid);
    if (it == d->windows.cend() || it->overrideRedirect || d->focused == wid)
        return;
    d->focused = wid;
    d->send({ QByteArray(QXpraPacket::Focus), wid, QVariantList() });
}

void QXpraClient::handleKeyEvent(qint64 wid, QKeyEvent *event)
{
    if (!d->windows.contains(wid))
        return;
    const bool pressed = event->type() == QEvent::KeyPress;
    const int key = event->key();

    QByteArray keyname;
    quint32 keyval = 0;
    for (const KeyName &entry : keyNames) {
        if (entry.key == key) {
            keyname = entry.name;
            keyval = entry.keysym;
            break;
        }
    }
    const QString text = event->text();
    if (keyname.isEmpty() && !text.isEmpty()) {
        keyname = text.toUtf8();
        keyval = text.at(0).unicode();
    }
    if (keyname.isEmpty()) {
        qCDebug(lcXpraClient) << "Ignoring unmapped key" << key;
        return;
    }
    qCDebug(lcXpraClient) << "Key event:" << event->type() << keyname << keyval;
    d->send({ QByteArray(QXpraPacket::KeyAction), wid, keyname, pressed, d->modifiers(event->modifiers()),
              qint64(keyval), text.toUtf8(), qint64(event->nativeScanCode()), 0 });
}

void QXpraClient::handlePointerEvent(qint64 wid, QMouseEvent *event)
{
    const auto it = d->windows.constFind(wid);
    if (it == d->windows.cend())
        return;
    const QPoint position = it->geometry.topLeft() + event->position().toPoint();

    switch (event->type()) {
    case QEvent::MouseMove:
        d->send({ QByteArray(QXpraPacket::PointerPosition), wid, point(position),
                  d->modifiers(event->modifiers()), d->buttons(event->buttons()) });
        break;
    case QEvent::MouseButtonPress:
    case QEvent::MouseButtonDblClick:
    case QEvent::MouseButtonRelease: {
        const int button = Private::buttonNumber(event->button());
        if (button == 0)
            return;
        const bool pressed = event->type() != QEvent::MouseButtonRelease;
        if (pressed && !it->overrideRedirect)
            focusWindow(wid);
        d->sendButton(wid, button, pressed, position, event->modifiers(), event->buttons());
        break;
    }
    default:
        break;
    }
}

/*!
    Turns wheel rotation into clicks of the X scroll buttons 4 to 7. Partial
    steps are accumulated per window until they add up to a full notch.
*/
void QXpraClient::handleWheelEvent(qint64 wid, QWheelEvent *event)
{
    auto it = d->windows.find(wid);
    if (it == d->windows.end())
        return;
    const QPoint position = it->geometry.topLeft() + event->position().toPoint();
    it->wheelDelta += event->angleDelta();

    QList<int> clicks;
    while (qAbs(it->wheelDelta.y()) >= WheelStep) {
        const bool up = it->wheelDelta.y() > 0;
        clicks << (up ? 4 : 5);
        it->wheelDelta.ry() += up ? -WheelStep : WheelStep;
    }
    while (qAbs(it->wheelDelta.x()) >= WheelStep) {
        const bool left = it->wheelDelta.x() > 0;
        clicks << (left ? 6 : 7);
        it->wheelDelta.rx() += left ? -WheelStep : WheelStep;
    }
    for (int button : std::as_const(clicks)) {
        d->sendButton(wid, button, true, position, event->modifiers(), event->buttons());
        d->sendButton(wid, button, false, position, event->modifiers(), event->buttons());
    }
}

QT_END_NAMESPACE
