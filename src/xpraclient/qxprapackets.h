// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRAPACKETS_H
#define QXPRAPACKETS_H

#include "qtxpraclientglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QByteArrayList>
#include <QtCore/QRect>
#include <QtCore/QVariant>

QT_BEGIN_NAMESPACE

namespace QXpraPacket {

// packet type tags
inline constexpr char Hello[] = "hello";
inline constexpr char Challenge[] = "challenge";
inline constexpr char Disconnect[] = "disconnect";
inline constexpr char Ping[] = "ping";
inline constexpr char PingEcho[] = "ping_echo";
inline constexpr char StartupComplete[] = "startup-complete";
inline constexpr char Draw[] = "draw";
inline constexpr char Eos[] = "eos";
inline constexpr char DamageSequence[] = "damage-sequence";
inline constexpr char NewWindow[] = "new-window";
inline constexpr char NewOverrideRedirect[] = "new-override-redirect";
inline constexpr char LostWindow[] = "lost-window";
inline constexpr char WindowMetadata[] = "window-metadata";
inline constexpr char RaiseWindow[] = "raise-window";
inline constexpr char WindowResized[] = "window-resized";
inline constexpr char WindowMoveResize[] = "window-move-resize";
inline constexpr char ConfigureOverrideRedirect[] = "configure-override-redirect";
inline constexpr char WindowIcon[] = "window-icon";
inline constexpr char Cursor[] = "cursor";
inline constexpr char Bell[] = "bell";
inline constexpr char NotifyShow[] = "notify_show";
inline constexpr char NotifyClose[] = "notify_close";
inline constexpr char ClipboardToken[] = "clipboard-token";
inline constexpr char ClipboardRequest[] = "clipboard-request";
inline constexpr char ClipboardContents[] = "clipboard-contents";
inline constexpr char ClipboardContentsNone[] = "clipboard-contents-none";
inline constexpr char SetClipboardEnabled[] = "set-clipboard-enabled";
inline constexpr char MapWindow[] = "map-window";
inline constexpr char ConfigureWindow[] = "configure-window";
inline constexpr char CloseWindow[] = "close-window";
inline constexpr char Focus[] = "focus";
inline constexpr char PointerPosition[] = "pointer-position";
inline constexpr char ButtonAction[] = "button-action";
inline constexpr char KeyAction[] = "key-action";
inline constexpr char DesktopSize[] = "desktop_size";

QByteArray type(const QVariantList &packet);

}

struct QXpraHelloPacket
{
    QVariantMap capabilities;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
    QVariantList toPacket() const;
};

struct QXpraChallengePacket
{
    QByteArray serverSalt;
    QVariantMap cipherCapabilities;
    QByteArray digest = "hmac";
    QByteArray saltDigest = "xor";
    QByteArray prompt = "password";

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraDisconnectPacket
{
    QByteArray reason;
    QByteArrayList details;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraPingPacket
{
    qint64 time = 0;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
    QVariantList toPacket() const;
};

struct QXpraPingEchoPacket
{
    qint64 echoTime = 0;
    qint64 load[3] = { 0, 0, 0 };
    qint64 latency = 0;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
    QVariantList toPacket() const;
};

struct QXpraDrawPacket
{
    qint64 wid = 0;
    QRect rect;
    QByteArray coding;
    QVariant data;          ///< pixel bytes, or the scroll list for "scroll"
    qint64 sequence = 0;
    int rowstride = 0;
    QVariantMap options;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraEosPacket
{
    qint64 wid = 0;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraDamageSequencePacket
{
    qint64 sequence = 0;
    qint64 wid = 0;
    int width = 0;
    int height = 0;
    qint64 decodeTime = -1;
    QString message;

    QVariantList toPacket() const;
};

struct QXpraNewWindowPacket
{
    qint64 wid = 0;
    QRect geometry;
    QVariantMap metadata;
    QVariantMap clientProperties;
    bool overrideRedirect = false;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraWindowPacket
{
    qint64 wid = 0;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraWindowMetadataPacket
{
    qint64 wid = 0;
    QVariantMap metadata;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraWindowGeometryPacket
{
    qint64 wid = 0;
    QRect geometry;         ///< position is unchanged for "window-resized"
    bool hasPosition = true;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraWindowIconPacket
{
    qint64 wid = 0;
    QSize size;
    QByteArray coding;
    QByteArray data;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraCursorPacket
{
    bool reset = true;
    QByteArray coding;
    QSize size;
    QPoint hotspot;
    QByteArray data;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraBellPacket
{
    qint64 wid = 0;
    int percent = 0;
    int pitch = 0;
    int duration = 0;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraNotifyShowPacket
{
    qint64 id = 0;
    QString appName;
    qint64 replacesId = 0;
    QString summary;
    QString body;
    int expireTimeout = -1;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraNotifyClosePacket
{
    qint64 id = 0;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraClipboardTokenPacket
{
    QByteArray selection = "CLIPBOARD";
    QByteArrayList targets;
    QByteArray target;
    QByteArray dataType;
    int dataFormat = 8;
    QByteArray encoding;
    QByteArray data;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
    QVariantList toPacket() const;
};

struct QXpraClipboardRequestPacket
{
    qint64 requestId = 0;
    QByteArray selection;
    QByteArray target;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

struct QXpraClipboardContentsPacket
{
    qint64 requestId = 0;
    QByteArray selection;
    QByteArray dataType = "UTF8_STRING";
    QByteArray data;    ///< empty sends clipboard-contents-none

    QVariantList toPacket() const;
};

struct QXpraSetClipboardEnabledPacket
{
    bool enabled = false;
    QByteArray reason;

    bool fromPacket(const QVariantList &packet, QString *errorString = nullptr);
};

QT_END_NAMESPACE

#endif // QXPRAPACKETS_H
