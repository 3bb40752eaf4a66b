// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QLoggingCategory>
#include <QtCore/QSettings>
#include <QtWidgets/QApplication>
#include "mainwindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Signal Slot Inc."));
    app.setOrganizationDomain("signal-slot.co.jp");
    app.setApplicationName("QtXpra Client");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Connects to an xpra server and shows its windows.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("server", "Server address, e.g. tcp://host:14500 or ws://host:14500.", "[server]");
    const QCommandLineOption usernameOption("username", "User name sent to the server.", "name");
    const QCommandLineOption passwordOption("password", "Password for the server challenge.", "password");
    const QCommandLineOption cipherOption("encryption", "Packet encryption cipher, e.g. AES-CBC.", "cipher");
    const QCommandLineOption keyOption("encryption-key", "Packet encryption key.", "key");
    const QCommandLineOption compressionOption("compression", "Preferred packet compressor (lz4, zlib, none).", "name");
    const QCommandLineOption insecureOption("insecure", "Allow the xor digest on unencrypted connections.");
    const QCommandLineOption noReconnectOption("no-reconnect", "Do not reconnect after a connection loss.");
    const QCommandLineOption threadedOption("threaded", "Run the packet codec on a worker thread.");
    const QCommandLineOption logRulesOption("log-rules", "Logging filter rules, e.g. \"qt.xpraclient.*.debug=true\".", "rules");
    parser.addOptions({ usernameOption, passwordOption, cipherOption, keyOption, compressionOption,
                        insecureOption, noReconnectOption, threadedOption, logRulesOption });
    parser.process(app);

    if (parser.isSet(logRulesOption))
        QLoggingCategory::setFilterRules(parser.value(logRulesOption).replace(u';', u'\n'));

    QXpraClientSettings settings;
    {
        QSettings store;
        settings.load(store);
    }
    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty())
        settings.url = QXpraClientSettings::normalizedUrl(positional.first());
    if (parser.isSet(usernameOption))
        settings.username = parser.value(usernameOption);
    if (parser.isSet(passwordOption))
        settings.password = parser.value(passwordOption);
    if (parser.isSet(cipherOption))
        settings.encryptionCipher = parser.value(cipherOption).toLatin1();
    if (parser.isSet(keyOption))
        settings.encryptionKey = parser.value(keyOption);
    if (parser.isSet(compressionOption))
        settings.compression = parser.value(compressionOption).toLatin1();
    if (parser.isSet(insecureOption))
        settings.insecure = true;
    if (parser.isSet(noReconnectOption))
        settings.reconnect = false;
    if (parser.isSet(threadedOption))
        settings.threadedProtocol = true;

    MainWindow window(settings, !positional.isEmpty());
    window.show();

    return app.exec();
}
