// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "mainwindow.h"
#include "ui_mainwindow.h"
#include "xprawindow.h"
#include <QtXpraClient/QXpraClient>

#include <QtCore/QHash>
#include <QtCore/QSettings>
#include <QtGui/QClipboard>
#include <QtGui/QCursor>
#include <QtGui/QGuiApplication>
#include <QtGui/QIcon>
#include <QtGui/QPixmap>
#include <QtGui/QScreen>
#include <QtWidgets/QApplication>
#include <QtWidgets/QInputDialog>
#include <QtWidgets/QMdiSubWindow>
#include <QtWidgets/QPushButton>

#include <utility>

class MainWindow::Private : public Ui::MainWindow, public QXpraWindowSink, public QXpraCredentialProvider
{
public:
    Private(::MainWindow *parent, const QXpraClientSettings &initial);
    ~Private() override;

    void connectToServer();
    void showStatus(const QString &text);
    QRect desktopGeometry(QMdiSubWindow *subWindow) const;

    // QXpraWindowSink
    void createWindow(qint64 wid, const QRect &geometry, const QVariantMap &metadata,
                      bool overrideRedirect) override;
    void updateMetadata(qint64 wid, const QVariantMap &metadata) override;
    void paint(qint64 wid, const QRect &rect, const QImage &image) override;
    void moveResize(qint64 wid, const QRect &geometry) override;
    void destroyWindow(qint64 wid) override;
    void raiseWindow(qint64 wid) override;
    void setServerResponding(bool responding) override;
    void setIcon(qint64 wid, const QImage &icon) override;

    // QXpraCredentialProvider
    QString password() override;
    QString encryptionKey() override;

private:
    ::MainWindow *q;

public:
    QSettings settings;
    QXpraClientSettings clientSettings;
    QXpraClient client;
    QHash<qint64, QMdiSubWindow *> windows;
    bool syncingClipboard = false;
};

MainWindow::Private::Private(::MainWindow *parent, const QXpraClientSettings &initial)
    : q(parent)
    , clientSettings(initial)
    , client(parent)
{
    setupUi(q);

    connect(server, &QLineEdit::returnPressed, q, [this]() {
        connectButton->animateClick();
    });
    connect(port, &SpinBox::returnPressed, q, [this]() {
        connectButton->animateClick();
    });
    connect(connectButton, &QPushButton::clicked, q, [this]() {
        connectToServer();
    });

    const QUrl url = clientSettings.url;
    server->setText(url.host());
    port->setValue(url.port(QXpraClientSettings::DefaultPort));
    transport->setCurrentText(url.scheme());
    passwordEdit->setText(clientSettings.password);
    stackedWidget->setCurrentIndex(0);

    settings.beginGroup("Window");
    q->restoreGeometry(settings.value("small_geometry").toByteArray());
    settings.endGroup();

    client.setWindowSink(this);
    client.setCredentialProvider(this);

    connect(&client, &QXpraClient::stateChanged, q, [this](QXpraConnection::State state) {
        switch (state) {
        case QXpraConnection::Connecting:
            showStatus(::MainWindow::tr("Connecting to %1").arg(clientSettings.url.toString()));
            break;
        case QXpraConnection::Authenticating:
            showStatus(::MainWindow::tr("Authenticating"));
            break;
        case QXpraConnection::Reconnecting:
            showStatus(::MainWindow::tr("Connection lost, reconnecting"));
            break;
        default:
            break;
        }
    });
    connect(&client, &QXpraClient::connected, q, [this]() {
        this->settings.beginGroup("Window");
        this->settings.setValue("small_geometry", q->saveGeometry());
        stackedWidget->setCurrentIndex(1);
        q->restoreGeometry(this->settings.value("large_geometry").toByteArray());
        this->settings.endGroup();
        q->setWindowTitle(clientSettings.url.toString());
        client.setDesktopSize(desktop->viewport()->size());
    });
    connect(&client, &QXpraClient::disconnected, q, [this](const QString &reason) {
        stackedWidget->setCurrentIndex(0);
        connectButton->setEnabled(true);
        showStatus(::MainWindow::tr("Disconnected: %1").arg(reason));
    });
    connect(&client, &QXpraClient::errorOccurred, q, [this](const QString &errorString) {
        qWarning() << errorString;
    });
    connect(&client, &QXpraClient::bell, q, []() {
        QApplication::beep();
    });
    connect(&client, &QXpraClient::cursorChanged, q, [this](const QImage &image, const QPoint &hotspot) {
        if (image.isNull())
            desktop->viewport()->unsetCursor();
        else
            desktop->viewport()->setCursor(QCursor(QPixmap::fromImage(image), hotspot.x(), hotspot.y()));
    });
    connect(&client, &QXpraClient::notificationShown, q,
            [this](qint64, const QString &summary, const QString &body) {
        q->setToolTip(summary + u'\n' + body);
    });

    QClipboard *clipboard = QGuiApplication::clipboard();
    connect(&client, &QXpraClient::clipboardChanged, q, [this, clipboard](const QString &text) {
        syncingClipboard = true;
        clipboard->setText(text);
        syncingClipboard = false;
    });
    connect(clipboard, &QClipboard::dataChanged, q, [this, clipboard]() {
        if (!syncingClipboard && client.state() == QXpraConnection::Established)
            client.setClipboardText(clipboard->text());
    });
}

MainWindow::Private::~Private()
{
    client.setWindowSink(nullptr);
    settings.beginGroup("Window");
    switch (stackedWidget->currentIndex()) {
    case 0:
        settings.setValue("small_geometry", q->saveGeometry());
        break;
    case 1:
        settings.setValue("large_geometry", q->saveGeometry());
        break;
    }
    settings.endGroup();
    clientSettings.save(settings);
}

void MainWindow::Private::connectToServer()
{
    QUrl url;
    url.setScheme(transport->currentText());
    url.setHost(server->text().trimmed());
    url.setPort(port->value());
    clientSettings.url = url;
    clientSettings.password = passwordEdit->text();
    connectButton->setEnabled(false);
    client.setSettings(clientSettings);
    client.connectToServer();
}

void MainWindow::Private::showStatus(const QString &text)
{
    status->setText(text);
}

QRect MainWindow::Private::desktopGeometry(QMdiSubWindow *subWindow) const
{
    QWidget *contents = subWindow->widget();
    return QRect(contents->mapTo(desktop->viewport(), QPoint()), contents->size());
}

void MainWindow::Private::createWindow(qint64 wid, const QRect &geometry, const QVariantMap &metadata,
                                       bool overrideRedirect)
{
    auto *window = new XpraWindow(&client, wid);
    window->resizeContents(geometry.size());

    Qt::WindowFlags flags = Qt::SubWindow;
    if (overrideRedirect)
        flags |= Qt::FramelessWindowHint;
    QMdiSubWindow *subWindow = desktop->addSubWindow(window, flags);
    subWindow->setAttribute(Qt::WA_DeleteOnClose, false);
    subWindow->setProperty("wid", wid);
    subWindow->installEventFilter(q);
    windows.insert(wid, subWindow);

    updateMetadata(wid, metadata);
    subWindow->move(geometry.topLeft());
    subWindow->show();
}

void MainWindow::Private::updateMetadata(qint64 wid, const QVariantMap &metadata)
{
    QMdiSubWindow *subWindow = windows.value(wid);
    if (!subWindow)
        return;
    if (metadata.contains(u"title"_s))
        subWindow->setWindowTitle(QString::fromUtf8(metadata.value(u"title"_s).toByteArray()));
}

void MainWindow::Private::paint(qint64 wid, const QRect &rect, const QImage &image)
{
    if (QMdiSubWindow *subWindow = windows.value(wid))
        static_cast<XpraWindow *>(subWindow->widget())->paintImage(rect, image);
}

void MainWindow::Private::moveResize(qint64 wid, const QRect &geometry)
{
    QMdiSubWindow *subWindow = windows.value(wid);
    if (!subWindow)
        return;
    static_cast<XpraWindow *>(subWindow->widget())->resizeContents(geometry.size());
    subWindow->adjustSize();
    subWindow->move(geometry.topLeft());
}

void MainWindow::Private::destroyWindow(qint64 wid)
{
    QMdiSubWindow *subWindow = windows.take(wid);
    if (!subWindow)
        return;
    subWindow->removeEventFilter(q);
    desktop->removeSubWindow(subWindow);
    subWindow->deleteLater();
}

void MainWindow::Private::raiseWindow(qint64 wid)
{
    if (QMdiSubWindow *subWindow = windows.value(wid))
        desktop->setActiveSubWindow(subWindow);
}

void MainWindow::Private::setServerResponding(bool responding)
{
    for (QMdiSubWindow *subWindow : std::as_const(windows))
        static_cast<XpraWindow *>(subWindow->widget())->setServerResponding(responding);
}

void MainWindow::Private::setIcon(qint64 wid, const QImage &icon)
{
    if (QMdiSubWindow *subWindow = windows.value(wid))
        subWindow->setWindowIcon(QIcon(QPixmap::fromImage(icon)));
}

QString MainWindow::Private::password()
{
    if (!clientSettings.password.isEmpty())
        return clientSettings.password;
    return QInputDialog::getText(q, ::MainWindow::tr("Authentication"),
                                 ::MainWindow::tr("Password for %1:").arg(clientSettings.url.host()),
                                 QLineEdit::Password);
}

QString MainWindow::Private::encryptionKey()
{
    if (!clientSettings.encryptionKey.isEmpty())
        return clientSettings.encryptionKey;
    return QInputDialog::getText(q, ::MainWindow::tr("Encryption"),
                                 ::MainWindow::tr("Encryption key:"), QLineEdit::Password);
}

MainWindow::MainWindow(const QXpraClientSettings &settings, bool connectNow, QWidget *parent)
    : QWidget(parent)
    , d(new Private(this, settings))
{
    if (connectNow)
        d->connectToServer();
}

MainWindow::~MainWindow() = default;

/*!
    Reports moves of the remote windows back to the server and turns the
    close button into a close request.
*/
bool MainWindow::eventFilter(QObject *watched, QEvent *event)
{
    auto *subWindow = qobject_cast<QMdiSubWindow *>(watched);
    if (!subWindow || !subWindow->widget())
        return QWidget::eventFilter(watched, event);

    const qint64 wid = subWindow->property("wid").toLongLong();
    switch (event->type()) {
    case QEvent::Move:
        if (!d->client.isOverrideRedirect(wid))
            d->client.configureWindow(wid, d->desktopGeometry(subWindow));
        break;
    case QEvent::Close:
        event->ignore();
        d->client.closeWindow(wid);
        return true;
    default:
        break;
    }
    return QWidget::eventFilter(watched, event);
}
