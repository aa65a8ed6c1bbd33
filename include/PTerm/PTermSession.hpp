// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <QFont>
#include <QObject>
#include <QPointer>
#include <QString>

#include "PaletteResolver.hpp"
#include "TerminalBackend.hpp"

class QWidget;

using SessionId = quint64;

// One tab: owns a TerminalInstance and reports its title changes and its exit.
class PTermSession : public QObject {
    Q_OBJECT

  public:
    // Returns nullptr and fills error if the backend cannot start the child.
    static PTermSession *create(SessionId id, TerminalBackend *backend,
                                const ShellCommand &command, const TerminalPalette &palette,
                                const QFont &font, SpawnError *error, QObject *parent = nullptr);
    ~PTermSession();

    SessionId id() const { return m_id; }
    QString title() const { return m_title; }
    QString program() const { return m_command.program; }
    qint64 processId() const;
    bool isRunning() const { return !m_exited; }
    bool terminateRequested() const { return m_terminateRequested; }
    QWidget *widget() const;
    TerminalInstance *instance() const { return m_instance; }
    QString workingDirectory() const;

    void applyTheme(const TerminalPalette &palette, const QFont &font);
    void terminate();

  signals:
    // Emitted once. requested is true when terminate() asked for the exit.
    void exited(quint64 id, int exitCode, bool requested);
    void titleChanged(quint64 id, const QString &title);

  private slots:
    void onFinished(int exitCode, int exitStatus);
    void onTitleChanged(const QString &title);

  private:
    PTermSession(SessionId id, TerminalInstance *instance, const ShellCommand &command,
                 QObject *parent);

    SessionId m_id;
    QPointer<TerminalInstance> m_instance;
    ShellCommand m_command;
    QString m_title;
    bool m_exited = false;
    bool m_terminateRequested = false;
};
