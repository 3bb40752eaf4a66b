// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QtWidgets/QWidget>
#include <QtXpraClient/QXpraClientSettings>

class MainWindow : public QWidget
{
    Q_OBJECT
public:
    explicit MainWindow(const QXpraClientSettings &settings, bool connectNow = false, QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    class Private;
    QScopedPointer<Private> d;
};

#endif // MAINWINDOW_H
