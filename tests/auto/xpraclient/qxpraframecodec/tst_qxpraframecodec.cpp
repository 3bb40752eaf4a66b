// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtTest/QtTest>
#include <QtXpraClient/QXpraFrameCodec>
#include <QtXpraClient/QXpraCipher>

class tst_qxpraframecodec : public QObject
{
    Q_OBJECT

private slots:
    void headerLayout();
    void headerDecode();
    void splitAcrossChunks();
    void severalFramesInOneChunk();
    void everySplitPoint();
    void encryptedPadding();
    void badMagic();
    void unknownFlags();
    void lzoRejected();
    void indexOutOfRange();
    void encryptedWithoutCipher();
    void oversizedPayload();
    void resetClearsError();

private:
    static QByteArray frame(quint8 flags, quint8 level, quint8 index, const QByteArray &payload);
};

QByteArray tst_qxpraframecodec::frame(quint8 flags, quint8 level, quint8 index, const QByteArray &payload)
{
    QXpraFrameHeader header;
    header.protocolFlags = flags;
    header.compressionLevel = level;
    header.index = index;
    header.payloadSize = quint32(payload.size());
    return header.encode() + payload;
}

void tst_qxpraframecodec::headerLayout()
{
    QXpraFrameHeader header;
    header.protocolFlags = QXpraFrameHeader::FlushFlag;
    header.compressionLevel = QXpraFrameHeader::Lz4Flag | 1;
    header.index = 3;
    header.payloadSize = 0x01020304;
    QCOMPARE(header.encode(), QByteArray::fromHex("5008110301020304"));
}

void tst_qxpraframecodec::headerDecode()
{
    const QXpraFrameHeader header = QXpraFrameHeader::decode(QByteArray::fromHex("50020000000000ff"));
    QCOMPARE(header.magic, quint8('P'));
    QVERIFY(header.isEncrypted());
    QCOMPARE(header.compressionLevel, quint8(0));
    QCOMPARE(header.payloadSize, quint32(255));
}

void tst_qxpraframecodec::splitAcrossChunks()
{
    const QByteArray data = frame(0, 0, 0, "l5:helloe");
    QXpraFrameCodec codec;
    QList<QXpraFrame> frames;
    for (char c : data)
        frames += codec.feed(QByteArray(1, c));
    QVERIFY(!codec.hasError());
    QCOMPARE(frames.size(), 1);
    QCOMPARE(frames.first().payload, QByteArray("l5:helloe"));
    QCOMPARE(frames.first().padding, 0);
    QCOMPARE(codec.bufferedBytes(), 0);
}

void tst_qxpraframecodec::severalFramesInOneChunk()
{
    const QByteArray data = frame(0, 0, 1, "raw") + frame(0, 0, 0, "l4:drawe") + frame(0, 0, 0, "le").left(5);
    QXpraFrameCodec codec;
    const QList<QXpraFrame> frames = codec.feed(data);
    QCOMPARE(frames.size(), 2);
    QCOMPARE(frames.at(0).header.index, quint8(1));
    QCOMPARE(frames.at(0).payload, QByteArray("raw"));
    QCOMPARE(frames.at(1).payload, QByteArray("l4:drawe"));
    QCOMPARE(codec.bufferedBytes(), 5);

    const QList<QXpraFrame> rest = codec.feed(frame(0, 0, 0, "le").mid(5));
    QCOMPARE(rest.size(), 1);
    QCOMPARE(rest.first().payload, QByteArray("le"));
}

void tst_qxpraframecodec::everySplitPoint()
{
    QXpraFrameHeader encrypted;
    encrypted.protocolFlags = QXpraFrameHeader::CipherFlag;
    encrypted.payloadSize = 10;
    const QByteArray stream = frame(0, 0, 2, "PIXELS")
            + frame(0, 0, 1, "X")
            + frame(0, 0, 0, "l4:drawi0ei0ee")
            + encrypted.encode() + QByteArray(32, 'c')
            + frame(QXpraFrameHeader::FlushFlag, 3, 0, QByteArray())
            + frame(0, 0, 0, "l4:pingi3ee");

    QXpraFrameCodec whole;
    whole.setInboundBlockSize(QXpraCipher::DefaultBlockSize);
    const QList<QXpraFrame> expected = whole.feed(stream);
    QCOMPARE(expected.size(), 6);
    QCOMPARE(expected.at(3).padding, 22);

    for (qsizetype first = 0; first <= stream.size(); ++first) {
        for (qsizetype second : { first, (first + stream.size()) / 2 }) {
            QXpraFrameCodec codec;
            codec.setInboundBlockSize(QXpraCipher::DefaultBlockSize);
            QList<QXpraFrame> frames = codec.feed(stream.left(first));
            frames += codec.feed(stream.mid(first, second - first));
            frames += codec.feed(stream.mid(second));
            QVERIFY(!codec.hasError());
            QCOMPARE(codec.bufferedBytes(), 0);
            if (frames != expected)
                QFAIL(qPrintable(u"frames differ when split at %1 and %2"_s.arg(first).arg(second)));
        }
    }
}

void tst_qxpraframecodec::encryptedPadding()
{
    // 10 payload bytes are padded up to the 32 byte block
    QXpraFrameHeader header;
    header.protocolFlags = QXpraFrameHeader::CipherFlag;
    header.payloadSize = 10;
    const QByteArray body(32, 'x');

    QXpraFrameCodec codec;
    codec.setInboundBlockSize(QXpraCipher::DefaultBlockSize);
    QVERIFY(codec.feed(header.encode() + body.left(31)).isEmpty());
    const QList<QXpraFrame> frames = codec.feed(body.right(1));
    QCOMPARE(frames.size(), 1);
    QCOMPARE(frames.first().payload.size(), 32);
    QCOMPARE(frames.first().padding, 22);

    // an exact multiple still gets a full block of padding
    QCOMPARE(QXpraCipher::paddingSize(32, 32), 32);
}

void tst_qxpraframecodec::badMagic()
{
    QXpraFrameCodec codec;
    QByteArray data = frame(0, 0, 0, "le");
    data[0] = 'Q';
    QVERIFY(codec.feed(data).isEmpty());
    QVERIFY(codec.hasError());
    QVERIFY(codec.errorString().contains("invalid packet header"_L1));

    // nothing is parsed after a fatal error
    QVERIFY(codec.feed(frame(0, 0, 0, "le")).isEmpty());
}

void tst_qxpraframecodec::unknownFlags()
{
    QXpraFrameCodec codec;
    QVERIFY(codec.feed(frame(0x01, 0, 0, "le")).isEmpty());
    QVERIFY(codec.hasError());
}

void tst_qxpraframecodec::lzoRejected()
{
    QXpraFrameCodec codec;
    QVERIFY(codec.feed(frame(0, QXpraFrameHeader::LzoFlag | 1, 0, "le")).isEmpty());
    QVERIFY(codec.hasError());
    QVERIFY(codec.errorString().contains("lzo"_L1));
}

void tst_qxpraframecodec::indexOutOfRange()
{
    QXpraFrameCodec codec;
    QCOMPARE(codec.feed(frame(0, 0, 19, "x")).size(), 1);
    QVERIFY(codec.feed(frame(0, 0, 20, "x")).isEmpty());
    QVERIFY(codec.hasError());
}

void tst_qxpraframecodec::encryptedWithoutCipher()
{
    QXpraFrameCodec codec;
    QVERIFY(codec.feed(frame(QXpraFrameHeader::CipherFlag, 0, 0, QByteArray(32, 'x'))).isEmpty());
    QVERIFY(codec.hasError());
}

void tst_qxpraframecodec::oversizedPayload()
{
    QXpraFrameCodec codec;
    QCOMPARE(codec.maxPayloadSize(), QXpraFrameCodec::DefaultMaxPayloadSize);

    // only the header is needed to refuse a frame
    QXpraFrameHeader header;
    header.payloadSize = 0xffffffff;
    QVERIFY(codec.feed(header.encode()).isEmpty());
    QVERIFY(codec.hasError());
    QVERIFY(codec.errorString().contains("exceeds the limit"_L1));
    QCOMPARE(codec.bufferedBytes(), 0);

    codec.reset();
    codec.setMaxPayloadSize(4);
    QCOMPARE(codec.feed(frame(0, 0, 0, "le") + frame(0, 0, 1, "abcd")).size(), 2);
    QVERIFY(codec.feed(frame(0, 0, 0, "abcde")).isEmpty());
    QVERIFY(codec.hasError());
    QCOMPARE(codec.maxPayloadSize(), qsizetype(4));
}

void tst_qxpraframecodec::resetClearsError()
{
    QXpraFrameCodec codec;
    codec.feed(QByteArray(8, 'z'));
    QVERIFY(codec.hasError());
    codec.reset();
    QVERIFY(!codec.hasError());
    QCOMPARE(codec.feed(frame(0, 0, 0, "le")).size(), 1);
}

QTEST_GUILESS_MAIN(tst_qxpraframecodec)
#include "tst_qxpraframecodec.moc"
