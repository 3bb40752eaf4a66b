// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtTest/QtTest>
#include <QtXpraClient/QXpraCipher>

class tst_qxpracipher : public QObject
{
    Q_OBJECT

private slots:
    void pbkdf2Vector();
    void aesCbcVector();
    void chainingAcrossPackets();
    void padding();
    void roundTrip_data();
    void roundTrip();
    void parametersFromCapabilities();
    void invalidParameters();
    void setupDerivesKey();
    void notStarted();
};

void tst_qxpracipher::pbkdf2Vector()
{
    // RFC 6070, first PBKDF2-HMAC-SHA1 vector
    const QByteArray key = QXpraCipher::deriveKey("password", "salt", 1, 20);
    QCOMPARE(key.toHex(), QByteArray("0c60c80f961f0e71f3a9b524af6012062fe037a6"));

    QVERIFY(QXpraCipher::deriveKey(QByteArray(), "salt", 1, 20).isEmpty());
}

void tst_qxpracipher::aesCbcVector()
{
    // NIST SP 800-38A F.2.1, CBC-AES128, first two blocks
    const QByteArray key = QByteArray::fromHex("2b7e151628aed2a6abf7158809cf4f3c");
    const QByteArray iv = QByteArray::fromHex("000102030405060708090a0b0c0d0e0f");
    const QByteArray plain = QByteArray::fromHex("6bc1bee22e409f96e93d7e117393172a"
                                                 "ae2d8a571e03ac9c9eb76fac45af8e51");
    const QByteArray expected = QByteArray::fromHex("7649abac8119b246cee98e9b12e9197d"
                                                    "5086cb9b507219ee95db113a917678b2");
    QXpraCipher encryptor;
    QVERIFY(encryptor.start(QXpraCipher::Encrypt, key, iv));
    bool ok = false;
    QCOMPARE(encryptor.update(plain, &ok), expected);
    QVERIFY(ok);

    QXpraCipher decryptor;
    QVERIFY(decryptor.start(QXpraCipher::Decrypt, key, iv));
    QCOMPARE(decryptor.update(expected, &ok), plain);
    QVERIFY(ok);
}

void tst_qxpracipher::chainingAcrossPackets()
{
    const QByteArray key(32, 'k');
    const QByteArray iv(16, 'i');
    QXpraCipher encryptor;
    QXpraCipher decryptor;
    QVERIFY(encryptor.start(QXpraCipher::Encrypt, key, iv));
    QVERIFY(decryptor.start(QXpraCipher::Decrypt, key, iv));

    const QByteArrayList packets { "l5:helloe", QByteArray(32, 'p'), "l4:pingi1ee" };
    for (const QByteArray &packet : packets) {
        bool ok = false;
        const QByteArray encrypted = encryptor.encrypt(packet, &ok);
        QVERIFY(ok);
        QCOMPARE(encrypted.size() % QXpraCipher::DefaultBlockSize, 0);
        const int padding = QXpraCipher::paddingSize(packet.size(), QXpraCipher::DefaultBlockSize);
        QCOMPARE(decryptor.decrypt(encrypted, padding, &ok), packet);
        QVERIFY(ok);
    }
}

void tst_qxpracipher::padding()
{
    QCOMPARE(QXpraCipher::paddingSize(10, 32), 22);
    QCOMPARE(QXpraCipher::paddingSize(32, 32), 32);
    const QByteArray padded = QXpraCipher::pad("abc", 16);
    QCOMPARE(padded.size(), 16);
    QCOMPARE(padded.right(13), QByteArray(13, char(13)));
}

void tst_qxpracipher::roundTrip_data()
{
    QTest::addColumn<int>("keySize");
    QTest::addColumn<int>("size");

    constexpr int bs = QXpraCipher::DefaultBlockSize;
    for (int keySize : { 16, 24, 32 }) {
        for (int size : { 0, 1, bs - 1, bs, bs + 1 })
            QTest::addRow("aes%d-%d", keySize * 8, size) << keySize << size;
    }
}

void tst_qxpracipher::roundTrip()
{
    QFETCH(int, keySize);
    QFETCH(int, size);

    const QByteArray key = QXpraCipher::deriveKey("secret", "0123456789abcdef", 10, keySize);
    QCOMPARE(key.size(), keySize);
    const QByteArray iv("fedcba9876543210");
    QByteArray plain(size, Qt::Uninitialized);
    for (int i = 0; i < size; ++i)
        plain[i] = char(i * 7 + 1);

    QXpraCipher encryptor;
    QVERIFY2(encryptor.start(QXpraCipher::Encrypt, key, iv), qPrintable(encryptor.errorString()));
    const int padding = QXpraCipher::paddingSize(size, encryptor.blockSize());
    QVERIFY(padding >= 1 && padding <= encryptor.blockSize());

    bool ok = false;
    const QByteArray encrypted = encryptor.encrypt(plain, &ok);
    QVERIFY(ok);
    QCOMPARE(encrypted.size(), size + padding);
    QCOMPARE(encrypted.size() % encryptor.blockSize(), 0);

    QXpraCipher decryptor;
    QVERIFY(decryptor.start(QXpraCipher::Decrypt, key, iv));
    const QByteArray padded = decryptor.update(encrypted, &ok);
    QVERIFY(ok);
    QCOMPARE(padded.left(size), plain);
    QCOMPARE(padded.mid(size), QByteArray(padding, char(padding)));

    QXpraCipher stripping;
    QVERIFY(stripping.start(QXpraCipher::Decrypt, key, iv));
    QCOMPARE(stripping.decrypt(encrypted, padding, &ok), plain);
    QVERIFY(ok);
}

void tst_qxpracipher::parametersFromCapabilities()
{
    QXpraCipherParameters parameters;
    parameters.iv = "0123456789abcdef";
    parameters.keySalt = QByteArray(64, 'a');
    parameters.iterations = 1000;
    QVERIFY(parameters.isValid());

    const QVariantMap caps = parameters.toCapabilities();
    QCOMPARE(caps.value(u"cipher"_s).toByteArray(), QByteArray("AES"));
    QCOMPARE(caps.value(u"cipher.key_stretch_iterations"_s).toInt(), 1000);

    const QXpraCipherParameters parsed = QXpraCipherParameters::fromCapabilities(caps);
    QVERIFY(parsed.isValid());
    QCOMPARE(parsed.iv, parameters.iv);
    QCOMPARE(parsed.keySalt, parameters.keySalt);
    QCOMPARE(parsed.keyHash, QByteArray("sha1"));
    QCOMPARE(parsed.keySize, 32);
}

void tst_qxpracipher::invalidParameters()
{
    QXpraCipherParameters parameters;
    parameters.iv = "0123456789abcdef";
    parameters.keySalt = "salt";
    parameters.cipher = "Blowfish";
    QVERIFY(!parameters.isValid());

    parameters.cipher = "AES";
    parameters.mode = "GCM";
    QVERIFY(!parameters.isValid());

    parameters.mode = "CBC";
    parameters.iv = "short";
    QVERIFY(!parameters.isValid());

    QXpraCipher cipher;
    QVERIFY(!cipher.setup(QXpraCipher::Encrypt, parameters, "secret"));
    QVERIFY(!cipher.errorString().isEmpty());
    QVERIFY(!cipher.isActive());
}

void tst_qxpracipher::setupDerivesKey()
{
    QXpraCipherParameters parameters;
    parameters.iv = "fedcba9876543210";
    parameters.keySalt = "0123456789abcdef0123456789abcdef";
    parameters.iterations = 10;
    parameters.keyHash = "sha256";

    QXpraCipher encryptor;
    QVERIFY(encryptor.setup(QXpraCipher::Encrypt, parameters, "secret"));
    QVERIFY(encryptor.isActive());

    // same key material by hand
    const QByteArray key = QXpraCipher::deriveKey("secret", parameters.keySalt, 10, 32,
                                                  QCryptographicHash::Sha256);
    QXpraCipher decryptor;
    QVERIFY(decryptor.start(QXpraCipher::Decrypt, key, parameters.iv));

    bool ok = false;
    const QByteArray encrypted = encryptor.encrypt("hello", &ok);
    QVERIFY(ok);
    QCOMPARE(decryptor.decrypt(encrypted, QXpraCipher::paddingSize(5, encryptor.blockSize()), &ok),
             QByteArray("hello"));
    QVERIFY(ok);
}

void tst_qxpracipher::notStarted()
{
    QXpraCipher cipher;
    bool ok = true;
    QVERIFY(cipher.update(QByteArray(16, 'x'), &ok).isEmpty());
    QVERIFY(!ok);
    QVERIFY(!cipher.start(QXpraCipher::Encrypt, QByteArray(20, 'k'), QByteArray(16, 'i')));
}

QTEST_GUILESS_MAIN(tst_qxpracipher)
#include "tst_qxpracipher.moc"
