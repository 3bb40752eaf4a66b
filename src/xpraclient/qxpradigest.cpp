// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpradigest.h"

#include <QtCore/QCryptographicHash>
#include <QtCore/QMessageAuthenticationCode>
#include <QtCore/QRandomGenerator>

QT_BEGIN_NAMESPACE

namespace {

constexpr int MaxXorSaltSize = 256;
constexpr int DefaultSaltSize = 32;

bool hmacAlgorithm(const QByteArray &digest, QCryptographicHash::Algorithm *algorithm)
{
    // "hmac" alone is the legacy md5 variant
    if (digest == "hmac") {
        *algorithm = QCryptographicHash::Md5;
        return true;
    }
    if (!digest.startsWith("hmac+"))
        return false;
    const QByteArray hash = digest.mid(5);
    if (hash == "md5")
        *algorithm = QCryptographicHash::Md5;
    else if (hash == "sha1")
        *algorithm = QCryptographicHash::Sha1;
    else if (hash == "sha224")
        *algorithm = QCryptographicHash::Sha224;
    else if (hash == "sha256")
        *algorithm = QCryptographicHash::Sha256;
    else if (hash == "sha384")
        *algorithm = QCryptographicHash::Sha384;
    else if (hash == "sha512")
        *algorithm = QCryptographicHash::Sha512;
    else
        return false;
    return true;
}

}

QByteArrayList QXpraDigest::supportedDigests()
{
    return { "hmac+sha512", "hmac+sha384", "hmac+sha256", "hmac+sha224", "hmac+sha1", "hmac", "xor" };
}

bool QXpraDigest::isSupported(const QByteArray &digest)
{
    QCryptographicHash::Algorithm algorithm;
    return isXor(digest) || hmacAlgorithm(digest, &algorithm);
}

/*!
    XORs \a a and \a b byte by byte; the result has the length of the shorter
    input.
*/
QByteArray QXpraDigest::xorBytes(const QByteArray &a, const QByteArray &b)
{
    const qsizetype size = qMin(a.size(), b.size());
    QByteArray out(size, Qt::Uninitialized);
    for (qsizetype i = 0; i < size; ++i)
        out[i] = char(a.at(i) ^ b.at(i));
    return out;
}

/*!
    Computes \a digest over \a password and \a salt.

    "xor" returns \a password XORed with \a salt, the salt being zero padded or
    truncated to the length of the password. The HMAC variants ("hmac" for
    md5, "hmac+<hash>") return the lowercase hex digest with \a password as
    the key. Anything after a ':' in \a digest is ignored.

    Returns an empty byte array if the digest is not supported.
*/
QByteArray QXpraDigest::gendigest(const QByteArray &digest, const QByteArray &password,
                                  const QByteArray &salt, QString *errorString)
{
    const QByteArray name = digest.split(':').constFirst();
    if (isXor(name)) {
        QByteArray trimmed = salt.left(password.size());
        if (trimmed.size() < password.size())
            trimmed.append(password.size() - trimmed.size(), '\0');
        return xorBytes(password, trimmed);
    }
    QCryptographicHash::Algorithm algorithm;
    if (!hmacAlgorithm(name, &algorithm)) {
        if (errorString)
            *errorString = u"unsupported digest: %1"_s.arg(QString::fromLatin1(name));
        return QByteArray();
    }
    return QMessageAuthenticationCode::hash(salt, password, algorithm).toHex();
}

/*!
    Returns the size of the salt the client must generate to mix with a
    server salt of \a serverSaltSize bytes, or -1 if the combination is not
    acceptable. With "xor" both salts must have the same size.
*/
int QXpraDigest::clientSaltSize(const QByteArray &saltDigest, int serverSaltSize, QString *errorString)
{
    if (!isXor(saltDigest))
        return DefaultSaltSize;
    if (serverSaltSize <= 0 || serverSaltSize > MaxXorSaltSize) {
        if (errorString)
            *errorString = u"invalid server salt size for xor: %1 bytes"_s.arg(serverSaltSize);
        return -1;
    }
    return serverSaltSize;
}

QByteArray QXpraDigest::generateSalt(int size)
{
    // printable salts, like the ones the server sends
    static const char digits[] = "0123456789abcdef";
    QByteArray salt(size, Qt::Uninitialized);
    QRandomGenerator *generator = QRandomGenerator::system();
    for (int i = 0; i < size; ++i)
        salt[i] = digits[generator->bounded(16)];
    return salt;
}

QT_END_NAMESPACE
