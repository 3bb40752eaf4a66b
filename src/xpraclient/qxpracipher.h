// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QXPRACIPHER_H
#define QXPRACIPHER_H

#include "qtxpraclientglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QCryptographicHash>
#include <QtCore/QMetaType>
#include <QtCore/QScopedPointer>
#include <QtCore/QVariantMap>

QT_BEGIN_NAMESPACE

struct QXpraCipherParameters
{
    QByteArray cipher = "AES";
    QByteArray mode = "CBC";
    QByteArray iv;
    QByteArray keySalt;
    QByteArray keyHash = "sha1";
    int iterations = 1000;
    int keySize = 32;

    bool isValid() const;

    static QXpraCipherParameters fromCapabilities(const QVariantMap &capabilities);
    QVariantMap toCapabilities() const;
};

class QXpraCipher
{
public:
    enum Direction {
        Encrypt,
        Decrypt,
    };

    // Padding block size used by the peer, a multiple of the AES block size
    static constexpr int DefaultBlockSize = 32;

    QXpraCipher();
    ~QXpraCipher();

    static QByteArray deriveKey(const QByteArray &password, const QByteArray &salt,
                                int iterations, int keySize,
                                QCryptographicHash::Algorithm hash = QCryptographicHash::Sha1);
    static bool hashAlgorithm(const QByteArray &name, QCryptographicHash::Algorithm *algorithm);

    static int paddingSize(qint64 size, int blockSize);
    static QByteArray pad(const QByteArray &data, int blockSize);

    bool start(Direction direction, const QByteArray &key, const QByteArray &iv);
    bool setup(Direction direction, const QXpraCipherParameters &parameters, const QByteArray &secret);
    void reset();

    bool isActive() const;
    Direction direction() const;
    int blockSize() const;
    QString errorString() const;

    QByteArray update(const QByteArray &data, bool *ok = nullptr);
    QByteArray encrypt(const QByteArray &plainText, bool *ok = nullptr);
    QByteArray decrypt(const QByteArray &cipherText, int padding, bool *ok = nullptr);

private:
    Q_DISABLE_COPY(QXpraCipher)
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

Q_DECLARE_METATYPE(QXpraCipherParameters)

#endif // QXPRACIPHER_H
