// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QWheelEvent>
#include <QtXpraClient/QXpraClient>
#include <QtXpraClient/QXpraPackets>
#include <QtXpraClient/QXpraPaintPipeline>
#include <QtXpraClient/QXpraProtocol>
#include <QtXpraClient/QXpraVideoDecoder>

class FakeProtocol : public QXpraAbstractProtocol
{
    Q_OBJECT
public:
    void open(const QUrl &url) override
    {
        setUrl(url);
        QMetaObject::invokeMethod(this, &QXpraAbstractProtocol::opened, Qt::QueuedConnection);
    }
    void send(const QVariantList &packet) override { sent.append(packet); }
    void close() override {}
    void setCipherIn(const QXpraCipherParameters &, const QByteArray &) override {}
    void setCipherOut(const QXpraCipherParameters &, const QByteArray &) override {}
    void setCompressor(const QByteArray &, int) override {}

    void receive(const QVariantList &packet) { emit packetReceived(packet); }
    void drop() { emit closed(TransportError, u"connection reset"_s); }

    QList<QVariantList> ofType(const QByteArray &type) const
    {
        QList<QVariantList> packets;
        for (const QVariantList &packet : sent) {
            if (QXpraPacket::type(packet) == type)
                packets.append(packet);
        }
        return packets;
    }

    QList<QVariantList> sent;
};

class RecordingSink : public QXpraWindowSink
{
public:
    void createWindow(qint64 wid, const QRect &geometry, const QVariantMap &metadata,
                      bool overrideRedirect) override
    {
        created.append(wid);
        geometries.insert(wid, geometry);
        titles.insert(wid, metadata.value(u"title"_s).toString());
        overrideRedirects.insert(wid, overrideRedirect);
    }
    void updateMetadata(qint64 wid, const QVariantMap &metadata) override
    {
        titles.insert(wid, metadata.value(u"title"_s).toString());
    }
    void paint(qint64 wid, const QRect &rect, const QImage &image) override
    {
        Q_UNUSED(image);
        painted.append(qMakePair(wid, rect));
    }
    void moveResize(qint64 wid, const QRect &geometry) override { geometries.insert(wid, geometry); }
    void destroyWindow(qint64 wid) override { destroyed.append(wid); }
    void raiseWindow(qint64 wid) override { raised.append(wid); }
    void setServerResponding(bool responding) override { this->responding = responding; }
    void setIcon(qint64 wid, const QImage &icon) override { icons.insert(wid, icon.size()); }

    QList<qint64> created;
    QList<qint64> destroyed;
    QList<qint64> raised;
    QHash<qint64, QRect> geometries;
    QHash<qint64, QString> titles;
    QHash<qint64, bool> overrideRedirects;
    QHash<qint64, QSize> icons;
    QList<QPair<qint64, QRect>> painted;
    bool responding = true;
};

class NullDecoderFactory : public QXpraVideoDecoderFactory
{
public:
    QByteArrayList codings() const override { return { "vp8" }; }
    QXpraVideoDecoder *create(const QByteArray &) override { return nullptr; }
};

class tst_qxpraclient : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void helloCapabilities();
    void encodingsFilter();
    void connectedSignal();
    void newWindowIsMappedAndFocused();
    void overrideRedirectIsNotMapped();
    void drawForUnknownWindow();
    void drawReachesSink();
    void metadataIsMerged();
    void geometryUpdates();
    void lostWindow();
    void raiseAndIcon();
    void keyEvents();
    void pointerEvents();
    void wheelEvents();
    void clipboardFromServer();
    void clipboardRequest();
    void clipboardDisabledByServer();
    void localClipboardToken();
    void cursor();
    void bellAndNotifications();
    void windowRequests();
    void desktopSize();
    void sessionResetDestroysWindows();

private:
    void establish(const QVariantMap &extra = QVariantMap());
    void newWindow(qint64 wid, const QRect &geometry, bool overrideRedirect = false);

    FakeProtocol *protocol = nullptr;
    RecordingSink *sink = nullptr;
    QXpraClient *client = nullptr;
};

void tst_qxpraclient::init()
{
    protocol = new FakeProtocol;
    sink = new RecordingSink;
    client = new QXpraClient;
    QXpraClientSettings settings;
    settings.url = QUrl(u"tcp://localhost:14500"_s);
    settings.password.clear();
    settings.reconnectDelay = 10;
    client->setSettings(settings);
    client->setProtocol(protocol);
    client->setWindowSink(sink);
}

void tst_qxpraclient::cleanup()
{
    delete client;
    client = nullptr;
    delete protocol;
    protocol = nullptr;
    delete sink;
    sink = nullptr;
}

void tst_qxpraclient::establish(const QVariantMap &extra)
{
    client->connectToServer();
    QTRY_COMPARE(client->state(), QXpraConnection::WaitingHello);
    QVariantMap caps = extra;
    caps.insert(u"version"_s, QByteArray("6.0"));
    protocol->receive({ QByteArray("hello"), caps });
    QCOMPARE(client->state(), QXpraConnection::Established);
    protocol->sent.clear();
}

void tst_qxpraclient::newWindow(qint64 wid, const QRect &geometry, bool overrideRedirect)
{
    protocol->receive({ QByteArray(overrideRedirect ? "new-override-redirect" : "new-window"), wid,
                        geometry.x(), geometry.y(), geometry.width(), geometry.height(),
                        QVariantMap { { u"title"_s, QByteArray("window") }, { u"class"_s, QByteArray("term") } },
                        QVariantMap() });
}

void tst_qxpraclient::helloCapabilities()
{
    const QVariantMap caps = client->helloCapabilities();
    const QByteArrayList encodings = caps.value(u"encodings"_s).value<QByteArrayList>();
    QVERIFY(encodings.contains("rgb24"));
    QVERIFY(encodings.contains("png"));
    QVERIFY(encodings.contains("scroll"));
    QCOMPARE(caps.value(u"encodings.rgb_formats"_s).value<QByteArrayList>(), QXpraPaintPipeline::rgbFormats());
    QVERIFY(caps.value(u"windows"_s).toBool());
    QCOMPARE(caps.value(u"desktop_size"_s).toList(), (QVariantList { 1024, 768 }));
    QCOMPARE(caps.value(u"dpi"_s).toInt(), 96);

    const QVariantList screens = caps.value(u"screen_sizes"_s).toList();
    QCOMPARE(screens.size(), 1);
    const QVariantList screen = screens.first().toList();
    QCOMPARE(screen.size(), 10);
    QCOMPARE(screen.at(1).toInt(), 1024);
    QCOMPARE(screen.at(3).toInt(), 271);
    QCOMPARE(screen.at(4).toInt(), 203);
    const QVariantList monitors = screen.at(5).toList();
    QCOMPARE(monitors.size(), 1);
    QCOMPARE(monitors.first().toList().size(), 7);

    // the full hello carries the client capabilities
    establish();
    QVERIFY(client->connection()->sentCapabilities().value(u"windows"_s).toBool());
    QVERIFY(client->connection()->sentCapabilities().contains(u"screen_sizes"_s));
}

void tst_qxpraclient::encodingsFilter()
{
    client->registerVideoDecoderFactory(QSharedPointer<QXpraVideoDecoderFactory>(new NullDecoderFactory));
    QXpraClientSettings settings = client->settings();
    settings.encodings = { "png", "jpeg" };
    client->setSettings(settings);

    const QByteArrayList encodings = client->helloCapabilities().value(u"encodings"_s).value<QByteArrayList>();
    QVERIFY(encodings.contains("png"));
    QVERIFY(encodings.contains("jpeg"));
    QVERIFY(encodings.contains("vp8"));
    QVERIFY(!encodings.contains("rgb24"));
    QVERIFY(!encodings.contains("scroll"));
}

void tst_qxpraclient::connectedSignal()
{
    QSignalSpy connected(client, &QXpraClient::connected);
    QSignalSpy states(client, &QXpraClient::stateChanged);
    establish({ { u"clipboard"_s, false } });
    QCOMPARE(connected.size(), 1);
    QCOMPARE(states.last().first().value<QXpraConnection::State>(), QXpraConnection::Established);
    QVERIFY(!client->isClipboardEnabled());
}

void tst_qxpraclient::newWindowIsMappedAndFocused()
{
    establish();
    newWindow(7, QRect(10, 20, 300, 200));

    QCOMPARE(sink->created, QList<qint64> { 7 });
    QCOMPARE(sink->geometries.value(7), QRect(10, 20, 300, 200));
    QCOMPARE(sink->titles.value(7), u"window"_s);
    QVERIFY(client->hasWindow(7));
    QVERIFY(client->paintPipeline()->hasWindow(7));

    const QList<QVariantList> maps = protocol->ofType("map-window");
    QCOMPARE(maps.size(), 1);
    const QVariantList map = maps.first();
    QCOMPARE(map.size(), 7);
    QCOMPARE(map.at(1).toLongLong(), 7);
    QCOMPARE(map.at(2).toInt(), 10);
    QCOMPARE(map.at(3).toInt(), 20);
    QCOMPARE(map.at(4).toInt(), 300);
    QCOMPARE(map.at(5).toInt(), 200);
    QVERIFY(map.at(6).toMap().contains(u"encodings.rgb_formats"_s));

    const QList<QVariantList> focus = protocol->ofType("focus");
    QCOMPARE(focus.size(), 1);
    QCOMPARE(focus.first().at(1).toLongLong(), 7);
    QCOMPARE(client->focusedWindow(), 7);

    // a second announcement of the same window is ignored
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("already exists"));
    newWindow(7, QRect(0, 0, 10, 10));
    QCOMPARE(sink->created.size(), 1);
}

void tst_qxpraclient::overrideRedirectIsNotMapped()
{
    establish();
    newWindow(3, QRect(5, 5, 50, 20), true);
    QVERIFY(client->isOverrideRedirect(3));
    QVERIFY(sink->overrideRedirects.value(3));
    QVERIFY(protocol->ofType("map-window").isEmpty());
    QVERIFY(protocol->ofType("focus").isEmpty());

    client->focusWindow(3);
    QVERIFY(protocol->ofType("focus").isEmpty());
    QCOMPARE(client->focusedWindow(), 0);
}

void tst_qxpraclient::drawForUnknownWindow()
{
    establish();
    protocol->receive({ QByteArray("draw"), 99, 0, 0, 16, 8, QByteArray("png"), QByteArray("data"), 42, 0 });

    const QList<QVariantList> acks = protocol->ofType("damage-sequence");
    QCOMPARE(acks.size(), 1);
    QXpraDamageSequencePacket expected;
    expected.sequence = 42;
    expected.wid = 99;
    expected.width = 16;
    expected.height = 8;
    expected.decodeTime = -1;
    expected.message = u"window 99 not found"_s;
    QCOMPARE(acks.first(), expected.toPacket());
}

void tst_qxpraclient::drawReachesSink()
{
    establish();
    newWindow(1, QRect(0, 0, 4, 4));
    protocol->sent.clear();

    const QByteArray pixels = QByteArray::fromHex("ff0000ff0000ff0000ff0000");
    protocol->receive({ QByteArray("draw"), 1, 1, 1, 2, 2, QByteArray("rgb24"), pixels, 5, 6, QVariantMap() });

    QTRY_COMPARE(protocol->ofType("damage-sequence").size(), 1);
    const QVariantList ack = protocol->ofType("damage-sequence").first();
    QCOMPARE(ack.at(1).toLongLong(), 5);
    QCOMPARE(ack.at(2).toLongLong(), 1);
    QVERIFY(ack.at(5).toLongLong() >= 0);
    QVERIFY(ack.at(6).toString().isEmpty());
    QCOMPARE(sink->painted.size(), 1);
    QCOMPARE(sink->painted.first().second, QRect(1, 1, 2, 2));
}

void tst_qxpraclient::metadataIsMerged()
{
    establish();
    newWindow(4, QRect(0, 0, 100, 100));
    protocol->receive({ QByteArray("window-metadata"), 4, QVariantMap { { u"title"_s, QByteArray("vim") } } });

    const QVariantMap metadata = client->windowMetadata(4);
    QCOMPARE(metadata.value(u"title"_s).toByteArray(), QByteArray("vim"));
    QCOMPARE(metadata.value(u"class"_s).toByteArray(), QByteArray("term"));
    QCOMPARE(sink->titles.value(4), u"vim"_s);

    // updates for unknown windows are dropped
    protocol->receive({ QByteArray("window-metadata"), 5, QVariantMap { { u"title"_s, QByteArray("x") } } });
    QVERIFY(!sink->titles.contains(5));
}

void tst_qxpraclient::geometryUpdates()
{
    establish();
    newWindow(2, QRect(10, 10, 100, 100));

    protocol->receive({ QByteArray("window-move-resize"), 2, 5, 6, 120, 80 });
    QCOMPARE(client->windowGeometry(2), QRect(5, 6, 120, 80));
    QCOMPARE(sink->geometries.value(2), QRect(5, 6, 120, 80));

    protocol->receive({ QByteArray("window-resized"), 2, 40, 30 });
    QCOMPARE(client->windowGeometry(2), QRect(5, 6, 40, 30));
    QCOMPARE(client->paintPipeline()->image(2).size(), QSize(40, 30));
}

void tst_qxpraclient::lostWindow()
{
    establish();
    newWindow(6, QRect(0, 0, 10, 10));
    QCOMPARE(client->focusedWindow(), 6);

    protocol->receive({ QByteArray("lost-window"), 6 });
    QCOMPARE(sink->destroyed, QList<qint64> { 6 });
    QVERIFY(!client->hasWindow(6));
    QVERIFY(!client->paintPipeline()->hasWindow(6));
    QCOMPARE(client->focusedWindow(), 0);

    protocol->receive({ QByteArray("lost-window"), 6 });
    QCOMPARE(sink->destroyed.size(), 1);
}

void tst_qxpraclient::raiseAndIcon()
{
    establish();
    newWindow(8, QRect(0, 0, 10, 10));
    protocol->receive({ QByteArray("raise-window"), 8 });
    QCOMPARE(sink->raised, QList<qint64> { 8 });

    QImage icon(16, 16, QImage::Format_ARGB32);
    icon.fill(Qt::red);
    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    QVERIFY(icon.save(&buffer, "PNG"));
    protocol->receive({ QByteArray("window-icon"), 8, 16, 16, QByteArray("png"), png });
    QCOMPARE(sink->icons.value(8), QSize(16, 16));
}

void tst_qxpraclient::keyEvents()
{
    const QVariantMap keycodes {
        { u"mod2"_s, QVariantList { QVariant(QVariantList { 64, QByteArray("Alt_L") }) } },
        { u"mod3"_s, QVariantList { QByteArray("Meta_L") } },
    };
    establish({ { u"modifier_keycodes"_s, keycodes } });
    newWindow(1, QRect(0, 0, 10, 10));
    protocol->sent.clear();

    QKeyEvent press(QEvent::KeyPress, Qt::Key_A, Qt::ShiftModifier, u"A"_s);
    client->handleKeyEvent(1, &press);
    QKeyEvent alt(QEvent::KeyRelease, Qt::Key_Alt, Qt::AltModifier | Qt::MetaModifier);
    client->handleKeyEvent(1, &alt);
    QKeyEvent enter(QEvent::KeyPress, Qt::Key_Return, Qt::NoModifier, u"\r"_s);
    client->handleKeyEvent(1, &enter);
    QKeyEvent unknown(QEvent::KeyPress, Qt::Key_unknown, Qt::NoModifier);
    client->handleKeyEvent(1, &unknown);
    client->handleKeyEvent(42, &press);

    const QList<QVariantList> keys = protocol->ofType("key-action");
    QCOMPARE(keys.size(), 3);

    const QVariantList a = keys.at(0);
    QCOMPARE(a.size(), 9);
    QCOMPARE(a.at(1).toLongLong(), 1);
    QCOMPARE(a.at(2).toByteArray(), QByteArray("A"));
    QCOMPARE(a.at(3).toBool(), true);
    QCOMPARE(a.at(4).toList(), (QVariantList { QByteArray("shift") }));
    QCOMPARE(a.at(5).toLongLong(), 65);
    QCOMPARE(a.at(6).toByteArray(), QByteArray("A"));

    const QVariantList released = keys.at(1);
    QCOMPARE(released.at(2).toByteArray(), QByteArray("Alt_L"));
    QCOMPARE(released.at(3).toBool(), false);
    QCOMPARE(released.at(4).toList(), (QVariantList { QByteArray("mod2"), QByteArray("mod3") }));
    QCOMPARE(released.at(5).toLongLong(), 0xffe9);

    QCOMPARE(keys.at(2).at(2).toByteArray(), QByteArray("Return"));
    QCOMPARE(keys.at(2).at(5).toLongLong(), 0xff0d);
}

void tst_qxpraclient::pointerEvents()
{
    establish();
    newWindow(1, QRect(100, 50, 200, 200));
    newWindow(2, QRect(0, 0, 50, 50));
    QCOMPARE(client->focusedWindow(), 2);
    protocol->sent.clear();

    QMouseEvent move(QEvent::MouseMove, QPointF(3, 4), QPointF(103, 54), Qt::NoButton, Qt::LeftButton,
                     Qt::ControlModifier);
    client->handlePointerEvent(1, &move);
    const QList<QVariantList> moves = protocol->ofType("pointer-position");
    QCOMPARE(moves.size(), 1);
    QCOMPARE(moves.first().at(1).toLongLong(), 1);
    QCOMPARE(moves.first().at(2).toList(), (QVariantList { 103, 54 }));
    QCOMPARE(moves.first().at(3).toList(), (QVariantList { QByteArray("control") }));
    QCOMPARE(moves.first().at(4).toList(), (QVariantList { 1 }));

    QMouseEvent press(QEvent::MouseButtonPress, QPointF(3, 4), QPointF(103, 54), Qt::RightButton,
                      Qt::RightButton, Qt::NoModifier);
    client->handlePointerEvent(1, &press);
    QMouseEvent release(QEvent::MouseButtonRelease, QPointF(3, 4), QPointF(103, 54), Qt::RightButton,
                        Qt::NoButton, Qt::NoModifier);
    client->handlePointerEvent(1, &release);

    // pressing in an unfocused window focuses it first
    QCOMPARE(QXpraPacket::type(protocol->sent.at(1)), QByteArray("focus"));
    QCOMPARE(client->focusedWindow(), 1);

    const QList<QVariantList> buttons = protocol->ofType("button-action");
    QCOMPARE(buttons.size(), 2);
    QCOMPARE(buttons.at(0).at(2).toInt(), 3);
    QCOMPARE(buttons.at(0).at(3).toBool(), true);
    QCOMPARE(buttons.at(0).at(4).toList(), (QVariantList { 103, 54 }));
    QCOMPARE(buttons.at(1).at(3).toBool(), false);
    QVERIFY(buttons.at(1).at(6).toList().isEmpty());
}

void tst_qxpraclient::wheelEvents()
{
    establish();
    newWindow(1, QRect(0, 0, 100, 100));
    protocol->sent.clear();

    auto wheel = [this](const QPoint &angle) {
        QWheelEvent event(QPointF(10, 10), QPointF(10, 10), QPoint(), angle, Qt::NoButton,
                          Qt::NoModifier, Qt::NoScrollPhase, false);
        client->handleWheelEvent(1, &event);
    };

    wheel(QPoint(0, 60));
    QVERIFY(protocol->ofType("button-action").isEmpty());
    wheel(QPoint(0, 60));
    QList<QVariantList> clicks = protocol->ofType("button-action");
    QCOMPARE(clicks.size(), 2);
    QCOMPARE(clicks.at(0).at(2).toInt(), 4);
    QCOMPARE(clicks.at(0).at(3).toBool(), true);
    QCOMPARE(clicks.at(1).at(2).toInt(), 4);
    QCOMPARE(clicks.at(1).at(3).toBool(), false);

    protocol->sent.clear();
    wheel(QPoint(-120, -240));
    clicks = protocol->ofType("button-action");
    QCOMPARE(clicks.size(), 6);
    QCOMPARE(clicks.at(0).at(2).toInt(), 5);
    QCOMPARE(clicks.at(2).at(2).toInt(), 5);
    QCOMPARE(clicks.at(4).at(2).toInt(), 7);
}

void tst_qxpraclient::clipboardFromServer()
{
    QSignalSpy changed(client, &QXpraClient::clipboardChanged);
    establish();
    protocol->receive({ QByteArray("clipboard-token"), QByteArray("CLIPBOARD"),
                        QVariantList { QByteArray("UTF8_STRING"), QByteArray("TARGETS") },
                        QByteArray("UTF8_STRING"), QByteArray("UTF8_STRING"), 8, QByteArray("bytes"),
                        QByteArray("h\xc3\xa9llo") });
    QCOMPARE(changed.size(), 1);
    QCOMPARE(client->clipboardText(), QString::fromUtf8("h\xc3\xa9llo"));

    // images and empty tokens leave the text alone
    protocol->receive({ QByteArray("clipboard-token"), QByteArray("CLIPBOARD"), QVariantList(),
                        QByteArray("image/png"), QByteArray("image/png"), 8, QByteArray("bytes"),
                        QByteArray("\x89PNG") });
    protocol->receive({ QByteArray("clipboard-token"), QByteArray("CLIPBOARD") });
    QCOMPARE(changed.size(), 1);
}

void tst_qxpraclient::clipboardRequest()
{
    establish();
    client->setClipboardText(u"local text"_s);
    protocol->receive({ QByteArray("clipboard-request"), 3, QByteArray("CLIPBOARD"), QByteArray("UTF8_STRING") });

    const QList<QVariantList> contents = protocol->ofType("clipboard-contents");
    QCOMPARE(contents.size(), 1);
    QXpraClipboardContentsPacket expected;
    expected.requestId = 3;
    expected.selection = "CLIPBOARD";
    expected.data = "local text";
    QCOMPARE(contents.first(), expected.toPacket());
}

void tst_qxpraclient::clipboardDisabledByServer()
{
    QSignalSpy changed(client, &QXpraClient::clipboardChanged);
    establish();
    client->setClipboardText(u"secret"_s);
    protocol->receive({ QByteArray("set-clipboard-enabled"), 0, QByteArray("policy") });
    QVERIFY(!client->isClipboardEnabled());

    protocol->receive({ QByteArray("clipboard-request"), 4, QByteArray("CLIPBOARD"), QByteArray("UTF8_STRING") });
    QVERIFY(protocol->ofType("clipboard-contents").isEmpty());
    QCOMPARE(protocol->ofType("clipboard-contents-none").size(), 1);

    protocol->receive({ QByteArray("clipboard-token"), QByteArray("CLIPBOARD"), QVariantList(),
                        QByteArray("UTF8_STRING"), QByteArray("UTF8_STRING"), 8, QByteArray("bytes"),
                        QByteArray("ignored") });
    QCOMPARE(changed.size(), 0);
}

void tst_qxpraclient::localClipboardToken()
{
    establish();
    client->setClipboardText(u"copied"_s);
    const QList<QVariantList> tokens = protocol->ofType("clipboard-token");
    QCOMPARE(tokens.size(), 1);
    QCOMPARE(tokens.first(), (QVariantList { QByteArray("clipboard-token"), QByteArray("CLIPBOARD") }));
    QCOMPARE(client->clipboardText(), u"copied"_s);
}

void tst_qxpraclient::cursor()
{
    QSignalSpy cursors(client, &QXpraClient::cursorChanged);
    establish();

    // one opaque blue ARGB32 pixel in native byte order
    QImage pixel(1, 1, QImage::Format_ARGB32);
    pixel.fill(QColor(0, 0, 255));
    const QByteArray raw(reinterpret_cast<const char *>(pixel.constBits()), 4);
    protocol->receive({ QByteArray("cursor"), QByteArray("raw"), 0, 0, 1, 1, 0, 0, 0, raw });
    QCOMPARE(cursors.size(), 1);
    const QImage image = cursors.first().at(0).value<QImage>();
    QCOMPARE(image.size(), QSize(1, 1));
    QCOMPARE(image.pixel(0, 0), qRgb(0, 0, 255));
    QCOMPARE(cursors.first().at(1).toPoint(), QPoint(0, 0));

    protocol->receive({ QByteArray("cursor"), QByteArray("") });
    QCOMPARE(cursors.size(), 2);
    QVERIFY(cursors.last().at(0).value<QImage>().isNull());
}

void tst_qxpraclient::bellAndNotifications()
{
    QSignalSpy bells(client, &QXpraClient::bell);
    QSignalSpy shown(client, &QXpraClient::notificationShown);
    QSignalSpy closed(client, &QXpraClient::notificationClosed);
    QSignalSpy startup(client, &QXpraClient::startupComplete);
    establish();

    protocol->receive({ QByteArray("bell"), 1, 0, 50, 440, 100, QByteArray(""), QByteArray("bell") });
    QCOMPARE(bells.size(), 1);
    QCOMPARE(bells.first().at(1).toInt(), 50);
    QCOMPARE(bells.first().at(2).toInt(), 440);
    QCOMPARE(bells.first().at(3).toInt(), 100);

    protocol->receive({ QByteArray("notify_show"), QByteArray("dbus"), 12, QByteArray("app"), 0,
                        QByteArray(""), QByteArray("Build done"), QByteArray("all green"), 5000 });
    QCOMPARE(shown.size(), 1);
    QCOMPARE(shown.first().at(0).toLongLong(), 12);
    QCOMPARE(shown.first().at(1).toString(), u"Build done"_s);
    QCOMPARE(shown.first().at(2).toString(), u"all green"_s);
    QCOMPARE(shown.first().at(3).toInt(), 5000);

    protocol->receive({ QByteArray("notify_close"), 12 });
    QCOMPARE(closed.size(), 1);

    protocol->receive({ QByteArray("startup-complete") });
    QCOMPARE(startup.size(), 1);
}

void tst_qxpraclient::windowRequests()
{
    establish();
    newWindow(1, QRect(0, 0, 10, 10));
    newWindow(2, QRect(0, 0, 10, 10));
    protocol->sent.clear();

    client->configureWindow(1, QRect(20, 30, 64, 48), { { u"maximized"_s, true } });
    QCOMPARE(QXpraPacket::type(protocol->sent.at(0)), QByteArray("focus"));
    const QVariantList configure = protocol->ofType("configure-window").first();
    QCOMPARE(configure.at(2).toInt(), 20);
    QCOMPARE(configure.at(5).toInt(), 48);
    QVERIFY(configure.at(6).toMap().value(u"maximized"_s).toBool());
    QCOMPARE(client->windowGeometry(1), QRect(20, 30, 64, 48));
    QCOMPARE(client->paintPipeline()->image(1).size(), QSize(64, 48));

    client->closeWindow(1);
    client->closeWindow(77);
    const QList<QVariantList> closes = protocol->ofType("close-window");
    QCOMPARE(closes.size(), 1);
    QCOMPARE(closes.first().at(1).toLongLong(), 1);
    // the window stays until the server reports it lost
    QVERIFY(client->hasWindow(1));
}

void tst_qxpraclient::desktopSize()
{
    client->setDesktopSize(QSize(800, 600));
    QVERIFY(protocol->sent.isEmpty());

    establish();
    client->setDesktopSize(QSize(1920, 1080));
    client->setDesktopSize(QSize(1920, 1080));
    const QList<QVariantList> sizes = protocol->ofType("desktop_size");
    QCOMPARE(sizes.size(), 1);
    QCOMPARE(sizes.first().at(1).toInt(), 1920);
    QCOMPARE(sizes.first().at(2).toInt(), 1080);
    QCOMPARE(sizes.first().at(3).toList().size(), 1);
}

void tst_qxpraclient::sessionResetDestroysWindows()
{
    QSignalSpy disconnected(client, &QXpraClient::disconnected);
    establish();
    newWindow(1, QRect(0, 0, 10, 10));
    newWindow(2, QRect(0, 0, 10, 10));

    protocol->drop();
    QCOMPARE(client->state(), QXpraConnection::Reconnecting);
    QCOMPARE(sink->destroyed.size(), 2);
    QVERIFY(client->windowIds().isEmpty());
    QVERIFY(!client->paintPipeline()->hasWindow(1));
    QCOMPARE(client->focusedWindow(), 0);

    QTRY_COMPARE(client->state(), QXpraConnection::WaitingHello);
    client->disconnectFromServer();
    QCOMPARE(disconnected.size(), 1);
}

QTEST_MAIN(tst_qxpraclient)
#include "tst_qxpraclient.moc"
