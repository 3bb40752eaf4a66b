// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qxpraconnection.h"
#include "qxpracipher.h"
#include "qxpradigest.h"
#include "qxprapackets.h"
#include "qxpraprotocol.h"
#include "qxprathreadedprotocol.h"

#include <QtCore/QDateTime>
#include <QtCore/QPointer>
#include <QtCore/QRandomGenerator>
#include <QtCore/QSysInfo>
#include <QtCore/QTimer>
#include <QtCore/QUuid>
#include <QtNetwork/QHostAddress>

#include <cstdlib>

QT_BEGIN_NAMESPACE

namespace {

constexpr int MaxLatencySamples = 32;

bool isLocalHost(const QString &host)
{
    if (host.compare("localhost"_L1, Qt::CaseInsensitive) == 0)
        return true;
    const QHostAddress address(host);
    return !address.isNull() && address.isLoopback();
}

// \a size hex digits from the system random source
QByteArray randomHex(int size)
{
    QByteArray bytes((size + 1) / 2, Qt::Uninitialized);
    for (char &c : bytes)
        c = char(QRandomGenerator::system()->bounded(256));
    return bytes.toHex().left(size);
}

// Load averages scaled by 1000, zeros where the platform has none.
void loadAverages(qint64 load[3])
{
    load[0] = load[1] = load[2] = 0;
#ifdef Q_OS_UNIX
    double averages[3];
    if (::getloadavg(averages, 3) == 3) {
        for (int i = 0; i < 3; ++i)
            load[i] = qint64(averages[i] * 1000);
    }
#endif
}

}

/*!
    \internal
    \class QXpraConnection::Private

    Every timer is a single shot tagged with the session epoch it was armed
    in. Tearing down a session bumps the epoch, so a timer left over from a
    previous session fires into onTimer() and is ignored there.
*/
class QXpraConnection::Private
{
public:
    enum TimerEvent {
        HelloTimeout,
        PingTick,
        PingGrace,
        PingTimeout,
        ReconnectDue,
    };

    Private(QXpraConnection *parent);

    void attachProtocol(QXpraAbstractProtocol *protocol);
    void ensureProtocol();
    void setState(QXpraConnection::State state);
    void setServerResponding(bool responding);

    void startSession();
    void teardown();
    void closeSession(const QString &reason, bool error);
    void fail(const QString &reason, bool retry);

    void armTimer(TimerEvent event, int msecs, qint64 argument = 0);
    void onTimer(TimerEvent event, quint64 epoch, qint64 argument);

    void onOpened();
    void onProtocolClosed(QXpraAbstractProtocol::Error error, const QString &reason);
    void dispatch(const QVariantList &packet);

    void sendHello(const QByteArray &challengeResponse = QByteArray(),
                   const QByteArray &clientSalt = QByteArray());
    QVariantMap baseCapabilities() const;
    void handleHello(const QVariantList &packet);
    void handleChallenge(const QVariantList &packet);
    void handleDisconnect(const QVariantList &packet);
    void handlePing(const QVariantList &packet);
    void handlePingEcho(const QVariantList &packet);
    void sendPing();
    bool configureCipherOut(const QVariantMap &capabilities);
    void selectCompressor();

    QString password() const;
    QString encryptionKey() const;
    bool isChannelSecure() const;

private:
    QXpraConnection *q;

public:
    QXpraClientSettings settings;
    QXpraCredentialProvider *provider = nullptr;
    QPointer<QXpraAbstractProtocol> protocol;
    bool ownsProtocol = false;

    QXpraConnection::State state = QXpraConnection::Idle;
    quint64 epoch = 0;
    int attempts = 0;
    QString closeReason;

    QVariantMap helloCapabilities;
    QVariantMap sentCapabilities;
    QVariantMap serverCapabilities;
    QByteArray serverVersion;
    QByteArray uuid;

    QXpraCipherParameters cipherIn;
    bool cipherOutConfigured = false;

    bool serverResponding = true;
    qint64 lastPingEchoedTime = 0;
    QList<qint64> latencies;
};

QXpraConnection::Private::Private(QXpraConnection *parent)
    : q(parent)
    , uuid(QUuid::createUuid().toByteArray(QUuid::Id128))
{
}

void QXpraConnection::Private::attachProtocol(QXpraAbstractProtocol *protocol)
{
    if (this->protocol) {
        this->protocol->disconnect(q);
        this->protocol->close();
        if (ownsProtocol)
            this->protocol->deleteLater();
    }
    this->protocol = protocol;
    ownsProtocol = false;
    if (!protocol)
        return;

    connect(protocol, &QXpraAbstractProtocol::opened, q, [this]() {
        onOpened();
    });
    connect(protocol, &QXpraAbstractProtocol::packetReceived, q, [this](const QVariantList &packet) {
        dispatch(packet);
    });
    connect(protocol, &QXpraAbstractProtocol::errorOccurred, q, [](const QString &errorString) {
        qCDebug(lcXpraConnection) << "Protocol error:" << errorString;
    });
    connect(protocol, &QXpraAbstractProtocol::closed, q,
            [this](QXpraAbstractProtocol::Error error, const QString &reason) {
        onProtocolClosed(error, reason);
    });
}

void QXpraConnection::Private::ensureProtocol()
{
    if (protocol)
        return;
    QXpraAbstractProtocol *created = nullptr;
    if (settings.threadedProtocol)
        created = new QXpraThreadedProtocol(q);
    else
        created = new QXpraProtocol(q);
    attachProtocol(created);
    ownsProtocol = true;
}

void QXpraConnection::Private::setState(QXpraConnection::State state)
{
    if (this->state == state)
        return;
    qCDebug(lcXpraConnection) << this->state << "->" << state;
    this->state = state;
    emit q->stateChanged(state);
}

void QXpraConnection::Private::setServerResponding(bool responding)
{
    if (serverResponding == responding)
        return;
    serverResponding = responding;
    if (responding)
        qCInfo(lcXpraConnection) << "Server connection is OK";
    else
        qCWarning(lcXpraConnection) << "Server connection is not responding";
    emit q->serverRespondingChanged(responding);
}

void QXpraConnection::Private::startSession()
{
    ++epoch;
    ensureProtocol();
    cipherOutConfigured = false;
    serverCapabilities.clear();
    serverVersion.clear();
    lastPingEchoedTime = 0;
    setState(QXpraConnection::Connecting);
    qCInfo(lcXpraConnection) << "Connecting to" << settings.url.toDisplayString()
                             << "attempt" << attempts;
    protocol->open(settings.url);
}

/*!
    \internal
    Ends the current session: outstanding timers become inert, the protocol
    is closed and everything that belonged to the session is dropped.
*/
void QXpraConnection::Private::teardown()
{
    ++epoch;
    if (protocol)
        protocol->close();
    cipherOutConfigured = false;
    serverCapabilities.clear();
    setServerResponding(true);
    emit q->sessionReset();
}

void QXpraConnection::Private::closeSession(const QString &reason, bool error)
{
    teardown();
    closeReason = reason;
    setState(QXpraConnection::Closed);
    if (error) {
        qCWarning(lcXpraConnection) << "Connection closed:" << reason;
        emit q->errorOccurred(reason);
    } else {
        qCInfo(lcXpraConnection) << "Connection closed:" << reason;
    }
    emit q->connectionClosed(reason);
}

/*!
    \internal
    Handles a failure of the current session. Failures that may be transient
    (\a retry) go through the reconnect policy, everything else closes the
    connection for good.
*/
void QXpraConnection::Private::fail(const QString &reason, bool retry)
{
    if (state == QXpraConnection::Idle || state == QXpraConnection::Closed)
        return;
    if (!retry || !settings.reconnect) {
        closeSession(reason, true);
        return;
    }
    if (attempts >= settings.reconnectCount) {
        closeSession(u"gave up after %1 attempts: %2"_s.arg(attempts).arg(reason), true);
        return;
    }
    ++attempts;
    qCWarning(lcXpraConnection) << "Connection lost:" << reason << "- reconnecting in"
                                << settings.reconnectDelay << "ms, attempt" << attempts
                                << "of" << settings.reconnectCount;
    teardown();
    setState(QXpraConnection::Reconnecting);
    emit q->reconnecting(attempts, settings.reconnectCount);
    armTimer(ReconnectDue, settings.reconnectDelay);
}

void QXpraConnection::Private::armTimer(TimerEvent event, int msecs, qint64 argument)
{
    const quint64 armed = epoch;
    QTimer::singleShot(qMax(0, msecs), q, [this, event, armed, argument]() {
        onTimer(event, armed, argument);
    });
}

void QXpraConnection::Private::onTimer(TimerEvent event, quint64 epoch, qint64 argument)
{
    if (epoch != this->epoch)
        return;

    switch (event) {
    case HelloTimeout:
        if (state == QXpraConnection::WaitingHello || state == QXpraConnection::Authenticating)
            fail(u"did not receive hello before timeout reached"_s, true);
        break;
    case PingTick:
        if (state == QXpraConnection::Established) {
            sendPing();
            armTimer(PingTick, settings.pingInterval);
        }
        break;
    case PingGrace:
        setServerResponding(lastPingEchoedTime >= argument);
        break;
    case PingTimeout:
        if (state == QXpraConnection::Established && lastPingEchoedTime < argument) {
            fail(u"server ping timeout, waited %1ms without a response"_s.arg(settings.pingTimeout), true);
        }
        break;
    case ReconnectDue:
        if (state == QXpraConnection::Reconnecting)
            startSession();
        break;
    }
}

void QXpraConnection::Private::onOpened()
{
    if (state != QXpraConnection::Connecting)
        return;
    setState(QXpraConnection::WaitingHello);

    if (settings.isEncrypted()) {
        const QString key = encryptionKey();
        if (key.isEmpty()) {
            closeSession(u"no encryption key specified"_s, true);
            return;
        }
        cipherIn = QXpraCipherParameters();
        cipherIn.cipher = settings.encryptionCipher;
        cipherIn.iv = randomHex(16);
        cipherIn.keySalt = randomHex(64);
        cipherIn.iterations = settings.encryptionIterations;
        protocol->setCipherIn(cipherIn, key.toUtf8());
    }
    sendHello();
    armTimer(HelloTimeout, settings.helloTimeout);
}

void QXpraConnection::Private::onProtocolClosed(QXpraAbstractProtocol::Error error, const QString &reason)
{
    switch (state) {
    case QXpraConnection::Idle:
    case QXpraConnection::Closed:
    case QXpraConnection::Reconnecting:
        return;
    default:
        break;
    }
    switch (error) {
    case QXpraAbstractProtocol::FrameError:
    case QXpraAbstractProtocol::CipherError:
        closeSession(reason, true);
        break;
    case QXpraAbstractProtocol::RemoteClosedError:
    case QXpraAbstractProtocol::TransportError:
        fail(reason, true);
        break;
    }
}

/*!
    \internal
    Single entry point for every packet of the session. Packets that are not
    about the connection itself are forwarded once the session is
    established.
*/
void QXpraConnection::Private::dispatch(const QVariantList &packet)
{
    switch (state) {
    case QXpraConnection::WaitingHello:
    case QXpraConnection::Authenticating:
    case QXpraConnection::Established:
        break;
    default:
        qCDebug(lcXpraConnection) << "Ignoring" << QXpraPacket::type(packet) << "in state" << state;
        return;
    }

    const QByteArray type = QXpraPacket::type(packet);
    if (type == QXpraPacket::Hello) {
        handleHello(packet);
    } else if (type == QXpraPacket::Challenge) {
        handleChallenge(packet);
    } else if (type == QXpraPacket::Disconnect) {
        handleDisconnect(packet);
    } else if (type == QXpraPacket::Ping) {
        handlePing(packet);
    } else if (type == QXpraPacket::PingEcho) {
        handlePingEcho(packet);
    } else if (state == QXpraConnection::Established) {
        emit q->packetReceived(packet);
    } else {
        qCWarning(lcXpraConnection) << "Ignoring" << type << "packet before hello";
    }
}

QVariantMap QXpraConnection::Private::baseCapabilities() const
{
    QVariantMap caps;
    caps.insert(u"version"_s, clientVersion());
    caps.insert(u"platform"_s, QSysInfo::kernelType());
    caps.insert(u"platform.name"_s, QSysInfo::prettyProductName());
    caps.insert(u"platform.processor"_s, QSysInfo::currentCpuArchitecture());
    caps.insert(u"namespace"_s, true);
    caps.insert(u"client_type"_s, QByteArray("Qt"));
    caps.insert(u"username"_s, settings.username);
    caps.insert(u"uuid"_s, uuid);
    caps.insert(u"digest"_s, QVariant::fromValue(QXpraDigest::supportedDigests()));
    caps.insert(u"salt-digest"_s, QVariant::fromValue(QXpraDigest::supportedDigests()));

    caps.insert(u"zlib"_s, true);
    caps.insert(u"lz4"_s, true);
    caps.insert(u"brotli"_s, true);
    caps.insert(u"lzo"_s, false);
    caps.insert(u"compression_level"_s, settings.compressionLevel);
    caps.insert(u"encoding.rgb_lz4"_s, true);
    caps.insert(u"bencode"_s, true);
    caps.insert(u"rencode"_s, false);
    caps.insert(u"yaml"_s, false);

    if (settings.isEncrypted()) {
        const QVariantMap cipherCaps = cipherIn.toCapabilities();
        for (auto it = cipherCaps.cbegin(); it != cipherCaps.cend(); ++it)
            caps.insert(it.key(), it.value());
    }
    return caps;
}

/*!
    \internal
    Sends the capability record. With a password configured and no response
    yet this is a partial hello announcing that a challenge is expected.
*/
void QXpraConnection::Private::sendHello(const QByteArray &challengeResponse, const QByteArray &clientSalt)
{
    QVariantMap caps = baseCapabilities();
    if (challengeResponse.isEmpty() && !password().isEmpty()) {
        caps.insert(u"challenge"_s, true);
        qCDebug(lcXpraConnection) << "Sending partial hello";
    } else {
        for (auto it = helloCapabilities.cbegin(); it != helloCapabilities.cend(); ++it)
            caps.insert(it.key(), it.value());
        qCDebug(lcXpraConnection) << "Sending hello";
    }
    if (!challengeResponse.isEmpty()) {
        caps.insert(u"challenge_response"_s, challengeResponse);
        if (!clientSalt.isEmpty())
            caps.insert(u"challenge_client_salt"_s, clientSalt);
    }
    sentCapabilities = caps;
    QXpraHelloPacket hello;
    hello.capabilities = caps;
    protocol->send(hello.toPacket());
}

void QXpraConnection::Private::handleHello(const QVariantList &packet)
{
    QXpraHelloPacket hello;
    QString errorString;
    if (!hello.fromPacket(packet, &errorString)) {
        closeSession(u"invalid hello packet: %1"_s.arg(errorString), true);
        return;
    }
    const QByteArray version = hello.capabilities.value(u"version"_s).toByteArray();
    if (!isSupportedVersion(version, &errorString)) {
        closeSession(errorString, true);
        return;
    }
    if (settings.isEncrypted() && !cipherOutConfigured && !configureCipherOut(hello.capabilities))
        return;

    serverCapabilities = hello.capabilities;
    serverVersion = version;
    attempts = 0;
    selectCompressor();
    qCInfo(lcXpraConnection) << "Server version" << version << "accepted the connection";
    setState(QXpraConnection::Established);
    emit q->established(serverCapabilities);

    // a receiver of established() may have closed the connection
    if (state != QXpraConnection::Established)
        return;
    sendPing();
    armTimer(PingTick, settings.pingInterval);
}

void QXpraConnection::Private::handleChallenge(const QVariantList &packet)
{
    if (state != QXpraConnection::WaitingHello) {
        closeSession(u"unexpected authentication challenge"_s, true);
        return;
    }
    const QByteArray secret = password().toUtf8();
    if (secret.isEmpty()) {
        closeSession(u"no password specified for authentication challenge"_s, true);
        return;
    }
    QXpraChallengePacket challenge;
    QString errorString;
    if (!challenge.fromPacket(packet, &errorString)) {
        closeSession(u"invalid challenge packet: %1"_s.arg(errorString), true);
        return;
    }
    setState(QXpraConnection::Authenticating);
    qCInfo(lcXpraAuth) << "Authentication challenge" << challenge.digest << "with salt digest"
                       << challenge.saltDigest;

    if (settings.isEncrypted()) {
        if (challenge.cipherCapabilities.isEmpty()) {
            closeSession(u"challenge does not contain encryption details to use for the response"_s, true);
            return;
        }
        if (!configureCipherOut(challenge.cipherCapabilities))
            return;
    }

    const QByteArray digest = challenge.digest.split(':').constFirst();
    const QByteArray saltDigest = challenge.saltDigest.split(':').constFirst();
    for (const QByteArray &name : { digest, saltDigest }) {
        if (!QXpraDigest::isSupported(name)) {
            closeSession(u"server requested an unsupported digest: %1"_s.arg(QString::fromLatin1(name)), true);
            return;
        }
        if (QXpraDigest::isXor(name) && !isChannelSecure()) {
            closeSession(u"server requested digest xor, refusing to use it without encryption with %1"_s
                                 .arg(protocol->peerHost()), true);
            return;
        }
    }

    const int saltSize = QXpraDigest::clientSaltSize(saltDigest, int(challenge.serverSalt.size()), &errorString);
    if (saltSize < 0) {
        closeSession(errorString, true);
        return;
    }
    const QByteArray clientSalt = QXpraDigest::generateSalt(saltSize);
    const QByteArray salt = QXpraDigest::gendigest(saltDigest, clientSalt, challenge.serverSalt, &errorString);
    const QByteArray response = salt.isEmpty() ? QByteArray()
                                               : QXpraDigest::gendigest(digest, secret, salt, &errorString);
    if (response.isEmpty()) {
        closeSession(u"cannot compute challenge response: %1"_s.arg(errorString), true);
        return;
    }
    qCDebug(lcXpraAuth) << "Sending challenge response with a" << clientSalt.size() << "byte client salt";
    sendHello(response, clientSalt);
}

void QXpraConnection::Private::handleDisconnect(const QVariantList &packet)
{
    QXpraDisconnectPacket disconnect;
    QString errorString;
    if (!disconnect.fromPacket(packet, &errorString))
        qCWarning(lcXpraConnection) << "Malformed disconnect packet:" << errorString;
    QString reason = QString::fromUtf8(disconnect.reason);
    if (!disconnect.details.isEmpty())
        reason += u" ("_s + QString::fromUtf8(disconnect.details.join(", ")) + u")"_s;
    if (reason.isEmpty())
        reason = u"disconnected by server"_s;
    closeSession(reason, false);
}

void QXpraConnection::Private::handlePing(const QVariantList &packet)
{
    QXpraPingPacket ping;
    QString errorString;
    if (!ping.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraConnection) << "Dropping ping:" << errorString;
        return;
    }
    QXpraPingEchoPacket echo;
    echo.echoTime = ping.time;
    loadAverages(echo.load);
    echo.latency = latencies.isEmpty() ? 0 : latencies.constLast();
    protocol->send(echo.toPacket());
}

void QXpraConnection::Private::handlePingEcho(const QVariantList &packet)
{
    QXpraPingEchoPacket echo;
    QString errorString;
    if (!echo.fromPacket(packet, &errorString)) {
        qCWarning(lcXpraConnection) << "Dropping ping echo:" << errorString;
        return;
    }
    lastPingEchoedTime = echo.echoTime;
    const qint64 latency = QDateTime::currentMSecsSinceEpoch() - echo.echoTime;
    latencies.append(latency);
    while (latencies.size() > MaxLatencySamples)
        latencies.removeFirst();
    qCDebug(lcXpraConnection) << "Ping echo, latency" << latency << "ms";
    setServerResponding(true);
}

void QXpraConnection::Private::sendPing()
{
    QXpraPingPacket ping;
    ping.time = QDateTime::currentMSecsSinceEpoch();
    protocol->send(ping.toPacket());
    armTimer(PingGrace, settings.pingGrace, ping.time);
    armTimer(PingTimeout, settings.pingTimeout, ping.time);
}

bool QXpraConnection::Private::configureCipherOut(const QVariantMap &capabilities)
{
    const QXpraCipherParameters parameters = QXpraCipherParameters::fromCapabilities(capabilities);
    if (!parameters.isValid()) {
        closeSession(u"server did not provide usable encryption details (cipher %1)"_s
                             .arg(QString::fromLatin1(parameters.cipher)), true);
        return false;
    }
    protocol->setCipherOut(parameters, encryptionKey().toUtf8());
    cipherOutConfigured = true;
    return true;
}

void QXpraConnection::Private::selectCompressor()
{
    QByteArray name = "none";
    const QByteArray preferred = settings.compression;
    if (preferred == "lz4" && serverCapabilities.value(u"lz4"_s).toBool())
        name = "lz4";
    else if ((preferred == "lz4" || preferred == "zlib") && serverCapabilities.value(u"zlib"_s, true).toBool())
        name = "zlib";
    qCDebug(lcXpraConnection) << "Compressing with" << name;
    protocol->setCompressor(name, name == "none" ? 0 : settings.compressionLevel);
}

QString QXpraConnection::Private::password() const
{
    return provider ? provider->password() : settings.password;
}

QString QXpraConnection::Private::encryptionKey() const
{
    return provider ? provider->encryptionKey() : settings.encryptionKey;
}

bool QXpraConnection::Private::isChannelSecure() const
{
    return cipherOutConfigured || protocol->isSecureTransport() || isLocalHost(protocol->peerHost())
            || settings.insecure;
}

/*!
    \class QXpraConnection
    \inmodule QtXpraClient

    \brief The QXpraConnection class drives the handshake, keepalive and
    reconnect policy of an xpra session.

    The connection moves through Idle, Connecting, WaitingHello, an optional
    Authenticating step, and Established. Transport failures and ping
    timeouts are retried up to the configured number of attempts; the
    attempt counter only goes back to zero once a session is established
    again. Handshake, frame and cipher errors close the connection without
    retrying.

    Packets that do not belong to the connection layer are re-emitted
    through packetReceived() once the session is established.
*/
QXpraConnection::QXpraConnection(QObject *parent)
    : QObject(parent)
    , d(new Private(this))
{
}

QXpraConnection::~QXpraConnection()
{
    if (d->protocol)
        d->protocol->disconnect(this);
}

QXpraClientSettings QXpraConnection::settings() const
{
    return d->settings;
}

void QXpraConnection::setSettings(const QXpraClientSettings &settings)
{
    d->settings = settings;
}

void QXpraConnection::setCredentialProvider(QXpraCredentialProvider *provider)
{
    d->provider = provider;
}

QXpraCredentialProvider *QXpraConnection::credentialProvider() const
{
    return d->provider;
}

/*!
    Uses \a protocol for all following sessions instead of creating one from
    the settings. The connection does not take ownership.
*/
void QXpraConnection::setProtocol(QXpraAbstractProtocol *protocol)
{
    d->attachProtocol(protocol);
}

QXpraAbstractProtocol *QXpraConnection::protocol() const
{
    return d->protocol;
}

/*!
    Sets the capabilities added to the full hello on top of the connection
    level ones (version, digests, compression, cipher).
*/
void QXpraConnection::setHelloCapabilities(const QVariantMap &capabilities)
{
    d->helloCapabilities = capabilities;
}

QVariantMap QXpraConnection::sentCapabilities() const
{
    return d->sentCapabilities;
}

QVariantMap QXpraConnection::serverCapabilities() const
{
    return d->serverCapabilities;
}

QByteArray QXpraConnection::serverVersion() const
{
    return d->serverVersion;
}

QXpraConnection::State QXpraConnection::state() const
{
    return d->state;
}

int QXpraConnection::reconnectAttempts() const
{
    return d->attempts;
}

quint64 QXpraConnection::epoch() const
{
    return d->epoch;
}

QString QXpraConnection::closeReason() const
{
    return d->closeReason;
}

bool QXpraConnection::isServerResponding() const
{
    return d->serverResponding;
}

qint64 QXpraConnection::lastPingEchoedTime() const
{
    return d->lastPingEchoedTime;
}

QList<qint64> QXpraConnection::latencySamples() const
{
    return d->latencies;
}

QByteArray QXpraConnection::clientVersion()
{
    return "4.4";
}

/*!
    Parses \a version as a dot separated list of numbers into \a numbers.
    Trailing text after the digits of a component ("6.0-r1234") is ignored;
    a component that does not start with a digit makes the whole version
    unparsable.
*/
bool QXpraConnection::parseVersion(const QByteArray &version, QList<int> *numbers)
{
    numbers->clear();
    if (version.isEmpty())
        return false;
    const QList<QByteArray> parts = version.split('.');
    for (const QByteArray &part : parts) {
        qsizetype digits = 0;
        while (digits < part.size() && part.at(digits) >= '0' && part.at(digits) <= '9')
            ++digits;
        bool ok = false;
        const int number = part.left(digits).toInt(&ok);
        if (!ok)
            return false;
        numbers->append(number);
    }
    return true;
}

bool QXpraConnection::isSupportedVersion(const QByteArray &version, QString *errorString)
{
    QList<int> numbers;
    if (!parseVersion(version, &numbers)) {
        if (errorString)
            *errorString = u"error parsing version number '%1'"_s.arg(QString::fromLatin1(version));
        return false;
    }
    const int major = numbers.value(0);
    const int minor = numbers.value(1);
    if (major < MinimumMajorVersion || (major == MinimumMajorVersion && minor < MinimumMinorVersion)) {
        if (errorString)
            *errorString = u"unsupported version: %1"_s.arg(QString::fromLatin1(version));
        return false;
    }
    return true;
}

void QXpraConnection::connectToServer()
{
    if (d->state != Idle && d->state != Closed) {
        qCWarning(lcXpraConnection) << "Already connecting or connected";
        return;
    }
    d->attempts = 0;
    d->closeReason.clear();
    d->latencies.clear();
    d->startSession();
}

/*!
    Closes the connection. No reconnect is attempted afterwards.
*/
void QXpraConnection::close()
{
    if (d->state == Idle || d->state == Closed)
        return;
    d->closeSession(u"connection closed by client"_s, false);
}

void QXpraConnection::send(const QVariantList &packet)
{
    if (d->state != Established || !d->protocol) {
        qCDebug(lcXpraConnection) << "Not established, dropping" << QXpraPacket::type(packet);
        return;
    }
    d->protocol->send(packet);
}

QT_END_NAMESPACE
