// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <PTerm/TerminalBackend.hpp>
#include <QList>
#include <QPointer>

// Terminal without a child process. Tests drive its exit and title by hand.
class FakeTerminal : public TerminalInstance {
    Q_OBJECT

  public:
    explicit FakeTerminal(qint64 pid, const QString &workingDirectory)
        : m_pid(pid), m_workingDirectory(workingDirectory) {}

    qint64 processId() const override { return m_pid; }
    bool isRunning() const override { return m_running; }
    QWidget *widget() const override { return nullptr; }

    void setColors(const TerminalPalette &palette) override {
        colors = palette;
        colorChanges++;
    }
    void setFont(const QString &family, int pointSize) override {
        fontFamily = family;
        fontSize = pointSize;
    }
    void requestTerminate() override {
        terminateRequests++;
        if (exitOnTerminate) {
            exit(0);
        }
    }
    QString workingDirectory() const override { return m_workingDirectory; }

    void exit(int code) {
        m_running = false;
        emit finished(code, 0);
    }
    void setTitle(const QString &title) { emit titleChanged(title); }

    TerminalPalette colors;
    int colorChanges = 0;
    QString fontFamily;
    int fontSize = 0;
    int terminateRequests = 0;
    bool exitOnTerminate = false;

  private:
    qint64 m_pid;
    bool m_running = true;
    QString m_workingDirectory;
};

class FakeBackend : public TerminalBackend {
  public:
    TerminalInstance *spawn(const ShellCommand &command, SpawnError *error) override {
        commands.append(command);
        if (failSpawn) {
            if (error) {
                *error = {command.program, QStringLiteral("No such file or directory")};
            }
            return nullptr;
        }
        auto *terminal = new FakeTerminal(m_nextPid++, command.workingDirectory.isEmpty()
                                                           ? QStringLiteral("/home/user")
                                                           : command.workingDirectory);
        terminal->exitOnTerminate = exitOnTerminate;
        terminals.append(terminal);
        return terminal;
    }

    FakeTerminal *last() const { return terminals.isEmpty() ? nullptr : terminals.last().data(); }

    bool failSpawn = false;
    bool exitOnTerminate = false;
    QList<ShellCommand> commands;
    QList<QPointer<FakeTerminal>> terminals;

  private:
    qint64 m_nextPid = 1000;
};
