// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpracipher.h"

#include <QtNetwork/QPasswordDigestor>

#include <openssl/err.h>
#include <openssl/evp.h>

QT_BEGIN_NAMESPACE

/*!
    \internal
    \class QXpraCipher::Private
    \brief Holds the OpenSSL cipher context for one direction of the connection.

    The context is created once per connection; CBC chaining carries over from
    one update() call to the next, so every packet continues the stream
    started by the previous one.
*/
class QXpraCipher::Private
{
public:
    ~Private() { clear(); }

    void clear() {
        if (context) {
            EVP_CIPHER_CTX_free(context);
            context = nullptr;
        }
    }

    void setOpenSslError(const QString &what) {
        char buffer[256] = {};
        const unsigned long code = ERR_get_error();
        if (code)
            ERR_error_string_n(code, buffer, sizeof(buffer));
        error = code ? u"%1: %2"_s.arg(what, QString::fromLatin1(buffer)) : what;
        ERR_clear_error();
    }

    EVP_CIPHER_CTX *context = nullptr;
    Direction direction = Encrypt;
    int blockSize = QXpraCipher::DefaultBlockSize;
    QString error;
};

/*!
    Returns true if the parameters name a supported cipher and carry the
    material needed to derive a key.
*/
bool QXpraCipherParameters::isValid() const
{
    const QByteArray name = cipher.toUpper();
    if (name != "AES" && name != "AES-CBC")
        return false;
    if (!mode.isEmpty() && mode.toUpper() != "CBC")
        return false;
    QCryptographicHash::Algorithm algorithm;
    if (!QXpraCipher::hashAlgorithm(keyHash, &algorithm))
        return false;
    return iv.size() == 16 && !keySalt.isEmpty() && iterations > 0
            && (keySize == 16 || keySize == 24 || keySize == 32);
}

QXpraCipherParameters QXpraCipherParameters::fromCapabilities(const QVariantMap &capabilities)
{
    QXpraCipherParameters parameters;
    parameters.cipher = capabilities.value(u"cipher"_s).toByteArray();
    parameters.mode = capabilities.value(u"cipher.mode"_s, QByteArray("CBC")).toByteArray();
    parameters.iv = capabilities.value(u"cipher.iv"_s).toByteArray();
    parameters.keySalt = capabilities.value(u"cipher.key_salt"_s).toByteArray();
    parameters.keyHash = capabilities.value(u"cipher.key_hash"_s, QByteArray("sha1")).toByteArray();
    parameters.iterations = capabilities.value(u"cipher.key_stretch_iterations"_s).toInt();
    parameters.keySize = capabilities.value(u"cipher.key_size"_s, 32).toInt();
    return parameters;
}

QVariantMap QXpraCipherParameters::toCapabilities() const
{
    QVariantMap capabilities;
    capabilities.insert(u"cipher"_s, cipher);
    capabilities.insert(u"cipher.mode"_s, mode);
    capabilities.insert(u"cipher.iv"_s, iv);
    capabilities.insert(u"cipher.key_salt"_s, keySalt);
    capabilities.insert(u"cipher.key_hash"_s, keyHash);
    capabilities.insert(u"cipher.key_size"_s, keySize);
    capabilities.insert(u"cipher.key_stretch_iterations"_s, iterations);
    capabilities.insert(u"cipher.padding.options"_s, QVariantList { QByteArray("PKCS#7") });
    return capabilities;
}

QXpraCipher::QXpraCipher()
    : d(new Private)
{
}

QXpraCipher::~QXpraCipher() = default;

/*!
    Stretches \a password into a \a keySize byte key with PBKDF2 over \a salt,
    iterated \a iterations times using the HMAC variant of \a hash.
*/
QByteArray QXpraCipher::deriveKey(const QByteArray &password, const QByteArray &salt,
                                  int iterations, int keySize,
                                  QCryptographicHash::Algorithm hash)
{
    if (password.isEmpty() || iterations <= 0 || keySize <= 0)
        return QByteArray();
    return QPasswordDigestor::deriveKeyPbkdf2(hash, password, salt, iterations, quint64(keySize));
}

bool QXpraCipher::hashAlgorithm(const QByteArray &name, QCryptographicHash::Algorithm *algorithm)
{
    const QByteArray lower = name.toLower();
    if (lower == "sha1")
        *algorithm = QCryptographicHash::Sha1;
    else if (lower == "sha224")
        *algorithm = QCryptographicHash::Sha224;
    else if (lower == "sha256")
        *algorithm = QCryptographicHash::Sha256;
    else if (lower == "sha384")
        *algorithm = QCryptographicHash::Sha384;
    else if (lower == "sha512")
        *algorithm = QCryptographicHash::Sha512;
    else
        return false;
    return true;
}

/*!
    Returns the number of padding bytes added to a payload of \a size bytes.
    An already aligned payload still gets one full block.
*/
int QXpraCipher::paddingSize(qint64 size, int blockSize)
{
    return blockSize - int(size % blockSize);
}

QByteArray QXpraCipher::pad(const QByteArray &data, int blockSize)
{
    const int padding = paddingSize(data.size(), blockSize);
    QByteArray padded = data;
    padded.append(padding, char(padding));
    return padded;
}

/*!
    Starts an AES-CBC context for \a direction with \a key and \a iv.
    The AES variant follows the key length (16, 24 or 32 bytes).
*/
bool QXpraCipher::start(Direction direction, const QByteArray &key, const QByteArray &iv)
{
    d->clear();
    d->error.clear();
    d->direction = direction;

    const EVP_CIPHER *cipher = nullptr;
    switch (key.size()) {
    case 16:
        cipher = EVP_aes_128_cbc();
        break;
    case 24:
        cipher = EVP_aes_192_cbc();
        break;
    case 32:
        cipher = EVP_aes_256_cbc();
        break;
    default:
        d->error = u"invalid AES key size: %1"_s.arg(key.size());
        return false;
    }
    if (iv.size() != EVP_CIPHER_iv_length(cipher)) {
        d->error = u"invalid initialization vector size: %1"_s.arg(iv.size());
        return false;
    }

    d->context = EVP_CIPHER_CTX_new();
    if (!d->context) {
        d->setOpenSslError(u"failed to allocate cipher context"_s);
        return false;
    }
    const int enc = direction == Encrypt ? 1 : 0;
    if (EVP_CipherInit_ex(d->context, cipher, nullptr,
                          reinterpret_cast<const unsigned char *>(key.constData()),
                          reinterpret_cast<const unsigned char *>(iv.constData()), enc) != 1) {
        d->setOpenSslError(u"failed to initialize cipher"_s);
        d->clear();
        return false;
    }
    // we pad ourselves
    EVP_CIPHER_CTX_set_padding(d->context, 0);
    return true;
}

/*!
    Derives the key from \a secret using \a parameters and starts the cipher.
*/
bool QXpraCipher::setup(Direction direction, const QXpraCipherParameters &parameters, const QByteArray &secret)
{
    if (!parameters.isValid()) {
        d->error = u"unsupported cipher parameters: %1-%2"_s
                .arg(QString::fromLatin1(parameters.cipher), QString::fromLatin1(parameters.mode));
        return false;
    }
    QCryptographicHash::Algorithm hash = QCryptographicHash::Sha1;
    hashAlgorithm(parameters.keyHash, &hash);
    const QByteArray key = deriveKey(secret, parameters.keySalt, parameters.iterations,
                                     parameters.keySize, hash);
    if (key.size() != parameters.keySize) {
        d->error = u"key derivation failed"_s;
        return false;
    }
    return start(direction, key, parameters.iv);
}

void QXpraCipher::reset()
{
    d->clear();
    d->error.clear();
}

bool QXpraCipher::isActive() const
{
    return d->context != nullptr;
}

QXpraCipher::Direction QXpraCipher::direction() const
{
    return d->direction;
}

int QXpraCipher::blockSize() const
{
    return d->blockSize;
}

QString QXpraCipher::errorString() const
{
    return d->error;
}

/*!
    Runs \a data through the cipher. The size of \a data must be a multiple of
    the AES block size.
*/
QByteArray QXpraCipher::update(const QByteArray &data, bool *ok)
{
    if (ok)
        *ok = false;
    if (!d->context) {
        d->error = u"cipher not started"_s;
        return QByteArray();
    }
    QByteArray out;
    out.resize(data.size() + EVP_MAX_BLOCK_LENGTH);
    int outLength = 0;
    if (EVP_CipherUpdate(d->context,
                         reinterpret_cast<unsigned char *>(out.data()), &outLength,
                         reinterpret_cast<const unsigned char *>(data.constData()), int(data.size())) != 1) {
        d->setOpenSslError(d->direction == Encrypt ? u"encryption failed"_s : u"decryption failed"_s);
        return QByteArray();
    }
    out.resize(outLength);
    if (outLength != data.size()) {
        d->error = u"cipher output size mismatch: %1 != %2"_s.arg(outLength).arg(data.size());
        return QByteArray();
    }
    if (ok)
        *ok = true;
    return out;
}

QByteArray QXpraCipher::encrypt(const QByteArray &plainText, bool *ok)
{
    return update(pad(plainText, d->blockSize), ok);
}

/*!
    Decrypts \a cipherText and strips the \a padding trailing bytes that were
    computed from the declared payload size.
*/
QByteArray QXpraCipher::decrypt(const QByteArray &cipherText, int padding, bool *ok)
{
    bool decrypted = false;
    QByteArray plain = update(cipherText, &decrypted);
    if (!decrypted || padding > plain.size()) {
        if (decrypted)
            d->error = u"padding larger than payload"_s;
        if (ok)
            *ok = false;
        return QByteArray();
    }
    plain.chop(padding);
    if (ok)
        *ok = true;
    return plain;
}

QT_END_NAMESPACE
