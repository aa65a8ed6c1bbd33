// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

#include "PaletteResolver.hpp"

class QWidget;

struct ShellCommand {
    QString program;
    QStringList arguments;
    QString workingDirectory;
};

struct SpawnError {
    QString program;
    QString message;
};

// One child process on a pseudo-terminal plus the surface that displays it.
class TerminalInstance : public QObject {
    Q_OBJECT

  public:
    explicit TerminalInstance(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~TerminalInstance() = default;

    virtual qint64 processId() const = 0;
    virtual bool isRunning() const = 0;
    // May be nullptr for backends without a display.
    virtual QWidget *widget() const = 0;

    virtual void setColors(const TerminalPalette &palette) = 0;
    virtual void setFont(const QString &family, int pointSize) = 0;
    virtual void requestTerminate() = 0;

    // Current directory of the child, empty when unknown.
    virtual QString workingDirectory() const { return QString(); }

  signals:
    void finished(int exitCode, int exitStatus);
    void titleChanged(const QString &title);
};

class TerminalBackend {
  public:
    virtual ~TerminalBackend() = default;

    // Returns nullptr and fills error when the child cannot be started.
    // The caller owns the returned instance.
    virtual TerminalInstance *spawn(const ShellCommand &command, SpawnError *error) = 0;
};
