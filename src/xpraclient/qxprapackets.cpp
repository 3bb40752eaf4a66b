// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxprapackets.h"

QT_BEGIN_NAMESPACE

namespace {

bool isInteger(const QVariant &value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::ULong:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Short:
    case QMetaType::UShort:
        return true;
    default:
        return false;
    }
}

bool isString(const QVariant &value)
{
    return value.typeId() == QMetaType::QByteArray || value.typeId() == QMetaType::QString;
}

/*!
    \internal
    \class FieldReader
    \brief Positional, type checked access to the fields of a decoded packet.

    Fields past the end of the packet yield the supplied fallback; a field
    present with the wrong type marks the packet as invalid.
*/
class FieldReader
{
public:
    FieldReader(const QVariantList &packet, QString *errorString)
        : packet(packet), errorString(errorString)
    {}

    bool require(int count) {
        if (packet.size() < count)
            return fail(u"%1 packet too short: %2 fields, expected at least %3"_s
                                .arg(QString::fromLatin1(QXpraPacket::type(packet)))
                                .arg(packet.size()).arg(count));
        return true;
    }

    bool has(int index) const { return index < packet.size(); }

    qint64 integer(int index, qint64 fallback = 0) {
        if (!has(index))
            return fallback;
        const QVariant &value = packet.at(index);
        if (!isInteger(value)) {
            fail(u"field %1 is not an integer"_s.arg(index));
            return fallback;
        }
        return value.toLongLong();
    }

    QByteArray bytes(int index, const QByteArray &fallback = QByteArray()) {
        if (!has(index))
            return fallback;
        const QVariant &value = packet.at(index);
        if (!isString(value)) {
            fail(u"field %1 is not a string"_s.arg(index));
            return fallback;
        }
        return value.toByteArray();
    }

    QString string(int index) {
        return QString::fromUtf8(bytes(index));
    }

    QVariantMap map(int index) {
        if (!has(index))
            return QVariantMap();
        const QVariant &value = packet.at(index);
        if (value.typeId() != QMetaType::QVariantMap) {
            fail(u"field %1 is not a dictionary"_s.arg(index));
            return QVariantMap();
        }
        return value.toMap();
    }

    QVariantList list(int index) {
        if (!has(index))
            return QVariantList();
        const QVariant &value = packet.at(index);
        if (value.typeId() != QMetaType::QVariantList) {
            fail(u"field %1 is not a list"_s.arg(index));
            return QVariantList();
        }
        return value.toList();
    }

    QRect rect(int index) {
        const int x = int(integer(index));
        const int y = int(integer(index + 1));
        const int w = int(integer(index + 2));
        const int h = int(integer(index + 3));
        return QRect(x, y, w, h);
    }

    bool ok() const { return valid; }

private:
    bool fail(const QString &message) {
        if (valid && errorString)
            *errorString = message;
        valid = false;
        return false;
    }

    const QVariantList &packet;
    QString *errorString;
    bool valid = true;
};

}

QByteArray QXpraPacket::type(const QVariantList &packet)
{
    if (packet.isEmpty() || !isString(packet.constFirst()))
        return QByteArray();
    return packet.constFirst().toByteArray();
}

bool QXpraHelloPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    capabilities = reader.map(1);
    return reader.ok();
}

QVariantList QXpraHelloPacket::toPacket() const
{
    return { QByteArray(QXpraPacket::Hello), capabilities };
}

bool QXpraChallengePacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    serverSalt = reader.bytes(1);
    cipherCapabilities = reader.map(2);
    digest = reader.bytes(3, "hmac");
    saltDigest = reader.bytes(4, "xor");
    prompt = reader.bytes(5, "password");
    return reader.ok();
}

bool QXpraDisconnectPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    reason = reader.bytes(1);
    details.clear();
    for (int i = 2; reader.has(i); ++i)
        details.append(reader.bytes(i));
    return reader.ok();
}

bool QXpraPingPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    time = reader.integer(1);
    return reader.ok();
}

QVariantList QXpraPingPacket::toPacket() const
{
    return { QByteArray(QXpraPacket::Ping), time };
}

bool QXpraPingEchoPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    echoTime = reader.integer(1);
    for (int i = 0; i < 3; ++i)
        load[i] = reader.integer(2 + i);
    latency = reader.integer(5);
    return reader.ok();
}

QVariantList QXpraPingEchoPacket::toPacket() const
{
    return { QByteArray(QXpraPacket::PingEcho), echoTime, load[0], load[1], load[2], latency };
}

bool QXpraDrawPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(10))
        return false;
    wid = reader.integer(1);
    rect = reader.rect(2);
    coding = reader.bytes(6);
    data = packet.at(7);
    sequence = reader.integer(8);
    rowstride = int(reader.integer(9));
    options = reader.map(10);
    if (!reader.ok())
        return false;
    if (rect.width() < 0 || rect.height() < 0) {
        if (errorString)
            *errorString = u"invalid draw geometry: %1x%2"_s.arg(rect.width()).arg(rect.height());
        return false;
    }
    return true;
}

bool QXpraEosPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    wid = reader.integer(1);
    return reader.ok();
}

QVariantList QXpraDamageSequencePacket::toPacket() const
{
    return { QByteArray(QXpraPacket::DamageSequence), sequence, wid, width, height, decodeTime, message };
}

bool QXpraNewWindowPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(7))
        return false;
    wid = reader.integer(1);
    geometry = reader.rect(2);
    metadata = reader.map(6);
    clientProperties = reader.map(7);
    overrideRedirect = QXpraPacket::type(packet) == QXpraPacket::NewOverrideRedirect;
    return reader.ok();
}

bool QXpraWindowPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    wid = reader.integer(1);
    return reader.ok();
}

bool QXpraWindowMetadataPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(3))
        return false;
    wid = reader.integer(1);
    metadata = reader.map(2);
    return reader.ok();
}

bool QXpraWindowGeometryPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    hasPosition = QXpraPacket::type(packet) != QXpraPacket::WindowResized;
    if (!reader.require(hasPosition ? 6 : 4))
        return false;
    wid = reader.integer(1);
    if (hasPosition)
        geometry = reader.rect(2);
    else
        geometry = QRect(0, 0, int(reader.integer(2)), int(reader.integer(3)));
    return reader.ok();
}

bool QXpraWindowIconPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(6))
        return false;
    wid = reader.integer(1);
    size = QSize(int(reader.integer(2)), int(reader.integer(3)));
    coding = reader.bytes(4);
    data = reader.bytes(5);
    return reader.ok();
}

/*!
    A cursor packet with fewer than nine fields resets the cursor to the
    default; otherwise it carries an encoded image.
*/
bool QXpraCursorPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(1))
        return false;
    reset = packet.size() < 9;
    if (reset)
        return true;
    coding = reader.bytes(1);
    size = QSize(int(reader.integer(4)), int(reader.integer(5)));
    hotspot = QPoint(int(reader.integer(6)), int(reader.integer(7)));
    data = reader.bytes(9);
    return reader.ok();
}

bool QXpraBellPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(6))
        return false;
    wid = reader.integer(1);
    percent = int(reader.integer(3));
    pitch = int(reader.integer(4));
    duration = int(reader.integer(5));
    return reader.ok();
}

bool QXpraNotifyShowPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(8))
        return false;
    id = reader.integer(2);
    appName = reader.string(3);
    replacesId = reader.integer(4);
    summary = reader.string(6);
    body = reader.string(7);
    expireTimeout = int(reader.integer(8, -1));
    return reader.ok();
}

bool QXpraNotifyClosePacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    id = reader.integer(1);
    return reader.ok();
}

bool QXpraClipboardTokenPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    selection = reader.bytes(1);
    targets.clear();
    const QVariantList list = reader.list(2);
    for (const QVariant &target : list)
        targets.append(target.toByteArray());
    target = reader.bytes(3);
    dataType = reader.bytes(4);
    dataFormat = int(reader.integer(5, 8));
    encoding = reader.bytes(6);
    data = reader.bytes(7);
    return reader.ok();
}

QVariantList QXpraClipboardTokenPacket::toPacket() const
{
    QVariantList list;
    for (const QByteArray &t : targets)
        list.append(t);
    QVariantList packet { QByteArray(QXpraPacket::ClipboardToken), selection, list };
    if (!data.isEmpty())
        packet << target << dataType << dataFormat << QByteArray("bytes") << data;
    return packet;
}

bool QXpraClipboardRequestPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(4))
        return false;
    requestId = reader.integer(1);
    selection = reader.bytes(2);
    target = reader.bytes(3);
    return reader.ok();
}

QVariantList QXpraClipboardContentsPacket::toPacket() const
{
    if (data.isEmpty())
        return { QByteArray(QXpraPacket::ClipboardContentsNone), requestId, selection };
    return { QByteArray(QXpraPacket::ClipboardContents), requestId, selection,
             dataType, 8, QByteArray("bytes"), data };
}

bool QXpraSetClipboardEnabledPacket::fromPacket(const QVariantList &packet, QString *errorString)
{
    FieldReader reader(packet, errorString);
    if (!reader.require(2))
        return false;
    enabled = reader.integer(1) != 0;
    reason = reader.bytes(2);
    return reader.ok();
}

QT_END_NAMESPACE
