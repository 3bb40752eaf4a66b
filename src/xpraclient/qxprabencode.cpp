// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxprabencode.h"

#include <QtCore/QStringList>

#include <algorithm>
#include <limits>
#include <utility>

QT_BEGIN_NAMESPACE

namespace {

// nesting deeper than this is treated as hostile input
constexpr int MaxDepth = 64;

class Encoder
{
public:
    bool write(const QVariant &value, int depth);

    QByteArray out;
    QString error;

private:
    void writeString(const QByteArray &bytes) {
        out.append(QByteArray::number(bytes.size()));
        out.append(':');
        out.append(bytes);
    }
    void writeInteger(qint64 value) {
        out.append('i');
        out.append(QByteArray::number(value));
        out.append('e');
    }
    bool writeMap(const QList<QPair<QByteArray, QVariant>> &items, int depth);
};

bool Encoder::write(const QVariant &value, int depth)
{
    if (depth > MaxDepth) {
        error = u"structure nested too deeply"_s;
        return false;
    }

    switch (value.typeId()) {
    case QMetaType::Bool:
        writeInteger(value.toBool() ? 1 : 0);
        return true;
    case QMetaType::Char:
    case QMetaType::SChar:
    case QMetaType::UChar:
    case QMetaType::Short:
    case QMetaType::UShort:
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::LongLong:
        writeInteger(value.toLongLong());
        return true;
    case QMetaType::ULong:
    case QMetaType::ULongLong: {
        const qulonglong v = value.toULongLong();
        if (v > qulonglong(std::numeric_limits<qint64>::max())) {
            error = u"integer out of range: %1"_s.arg(v);
            return false;
        }
        writeInteger(qint64(v));
        return true;
    }
    case QMetaType::QByteArray:
        writeString(value.toByteArray());
        return true;
    case QMetaType::QString:
        writeString(value.toString().toUtf8());
        return true;
    case QMetaType::QStringList: {
        out.append('l');
        const QStringList list = value.toStringList();
        for (const QString &s : list)
            writeString(s.toUtf8());
        out.append('e');
        return true;
    }
    case QMetaType::QByteArrayList: {
        out.append('l');
        const QByteArrayList list = value.value<QByteArrayList>();
        for (const QByteArray &s : list)
            writeString(s);
        out.append('e');
        return true;
    }
    case QMetaType::QVariantList: {
        out.append('l');
        const QVariantList list = value.toList();
        for (const QVariant &item : list) {
            if (!write(item, depth + 1))
                return false;
        }
        out.append('e');
        return true;
    }
    case QMetaType::QVariantMap: {
        const QVariantMap map = value.toMap();
        QList<QPair<QByteArray, QVariant>> items;
        items.reserve(map.size());
        for (auto it = map.cbegin(); it != map.cend(); ++it)
            items.append({ it.key().toUtf8(), it.value() });
        return writeMap(items, depth);
    }
    case QMetaType::QVariantHash: {
        const QVariantHash hash = value.toHash();
        QList<QPair<QByteArray, QVariant>> items;
        items.reserve(hash.size());
        for (auto it = hash.cbegin(); it != hash.cend(); ++it)
            items.append({ it.key().toUtf8(), it.value() });
        return writeMap(items, depth);
    }
    default:
        break;
    }
    error = u"cannot encode value of type %1"_s
            .arg(QString::fromLatin1(value.metaType().isValid() ? value.metaType().name() : "null"));
    return false;
}

bool Encoder::writeMap(const QList<QPair<QByteArray, QVariant>> &items, int depth)
{
    // keys go out in raw byte order
    QList<QPair<QByteArray, QVariant>> sorted = items;
    std::sort(sorted.begin(), sorted.end(), [](const auto &a, const auto &b) {
        return a.first < b.first;
    });
    out.append('d');
    for (const auto &item : std::as_const(sorted)) {
        writeString(item.first);
        if (!write(item.second, depth + 1))
            return false;
    }
    out.append('e');
    return true;
}

class Decoder
{
public:
    explicit Decoder(const QByteArray &data) : data(data) {}

    QVariant read(int depth);

    const QByteArray &data;
    qsizetype position = 0;
    QString error;

private:
    bool atEnd() const { return position >= data.size(); }
    char peek() const { return data.at(position); }
    QVariant fail(const QString &message) {
        if (error.isEmpty())
            error = u"%1 at offset %2"_s.arg(message).arg(position);
        return QVariant();
    }
    bool readInteger(qint64 *value);
    bool readString(QByteArray *value);
};

bool Decoder::readInteger(qint64 *value)
{
    // position is just past the 'i'
    const qsizetype end = data.indexOf('e', position);
    if (end < 0) {
        fail(u"unterminated integer"_s);
        return false;
    }
    const QByteArray digits = data.mid(position, end - position);
    const bool negative = digits.startsWith('-');
    const QByteArray magnitude = negative ? digits.mid(1) : digits;
    bool valid = !magnitude.isEmpty()
            && std::all_of(magnitude.cbegin(), magnitude.cend(), [](char c) { return c >= '0' && c <= '9'; })
            && !(magnitude.size() > 1 && magnitude.startsWith('0'))
            && !(negative && magnitude == "0");
    bool converted = false;
    if (valid)
        *value = digits.toLongLong(&converted);
    if (!valid || !converted) {
        fail(u"invalid integer '%1'"_s.arg(QString::fromLatin1(digits)));
        return false;
    }
    position = end + 1;
    return true;
}

bool Decoder::readString(QByteArray *value)
{
    const qsizetype colon = data.indexOf(':', position);
    if (colon < 0) {
        fail(u"missing string length separator"_s);
        return false;
    }
    const QByteArray digits = data.mid(position, colon - position);
    bool valid = !digits.isEmpty()
            && std::all_of(digits.cbegin(), digits.cend(), [](char c) { return c >= '0' && c <= '9'; })
            && !(digits.size() > 1 && digits.startsWith('0'));
    bool converted = false;
    const qint64 length = valid ? digits.toLongLong(&converted) : -1;
    if (!valid || !converted) {
        fail(u"invalid string length '%1'"_s.arg(QString::fromLatin1(digits)));
        return false;
    }
    if (length > data.size() - colon - 1) {
        fail(u"string length %1 exceeds available data"_s.arg(length));
        return false;
    }
    *value = data.mid(colon + 1, length);
    position = colon + 1 + length;
    return true;
}

QVariant Decoder::read(int depth)
{
    if (depth > MaxDepth)
        return fail(u"structure nested too deeply"_s);
    if (atEnd())
        return fail(u"unexpected end of data"_s);

    const char c = peek();
    if (c == 'i') {
        ++position;
        qint64 value = 0;
        if (!readInteger(&value))
            return QVariant();
        return QVariant(value);
    }
    if (c >= '0' && c <= '9') {
        QByteArray value;
        if (!readString(&value))
            return QVariant();
        return QVariant(value);
    }
    if (c == 'l') {
        ++position;
        QVariantList list;
        while (!atEnd() && peek() != 'e') {
            const QVariant item = read(depth + 1);
            if (!item.isValid())
                return QVariant();
            list.append(item);
        }
        if (atEnd())
            return fail(u"unterminated list"_s);
        ++position;
        return list;
    }
    if (c == 'd') {
        ++position;
        QVariantMap map;
        while (!atEnd() && peek() != 'e') {
            QString key;
            if (peek() == 'i') {
                // some peers send integer keys
                ++position;
                qint64 value = 0;
                if (!readInteger(&value))
                    return QVariant();
                key = QString::number(value);
            } else if (peek() >= '0' && peek() <= '9') {
                QByteArray value;
                if (!readString(&value))
                    return QVariant();
                key = QString::fromUtf8(value);
            } else {
                return fail(u"invalid dictionary key"_s);
            }
            if (map.contains(key))
                return fail(u"duplicate dictionary key '%1'"_s.arg(key));
            const QVariant item = read(depth + 1);
            if (!item.isValid())
                return QVariant();
            map.insert(key, item);
        }
        if (atEnd())
            return fail(u"unterminated dictionary"_s);
        ++position;
        return map;
    }
    return fail(u"unexpected character '%1'"_s.arg(QLatin1Char(c)));
}

}

/*!
    Serializes \a value. Booleans become integers, QString values become
    UTF-8 byte strings and map keys are written in sorted byte order.

    Returns an empty byte array and sets \a ok to false for values that have
    no encoding, such as floating point numbers or null variants.
*/
QByteArray QXpraBencode::encode(const QVariant &value, bool *ok, QString *errorString)
{
    Encoder encoder;
    const bool result = encoder.write(value, 0);
    if (ok)
        *ok = result;
    if (errorString)
        *errorString = encoder.error;
    return result ? encoder.out : QByteArray();
}

/*!
    Parses one value from the start of \a data. Byte strings are returned as
    QByteArray, integers as qint64, lists as QVariantList and dictionaries as
    QVariantMap.

    Bytes after the value are left alone; \a consumed receives the number of
    bytes parsed. Returns an invalid QVariant on malformed input.
*/
QVariant QXpraBencode::decode(const QByteArray &data, int *consumed, QString *errorString)
{
    Decoder decoder(data);
    const QVariant value = decoder.read(0);
    if (consumed)
        *consumed = value.isValid() ? int(decoder.position) : 0;
    if (errorString)
        *errorString = decoder.error;
    return value;
}

QT_END_NAMESPACE
