// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <QPointer>

#include "TerminalBackend.hpp"
#include "VTermView.hpp"

class PtyProcess;

class VTermTerminal : public TerminalInstance {
    Q_OBJECT

  public:
    ~VTermTerminal() override;

    qint64 processId() const override;
    bool isRunning() const override;
    QWidget *widget() const override { return m_view; }

    void setColors(const TerminalPalette &palette) override;
    void setFont(const QString &family, int pointSize) override;
    void requestTerminate() override;
    QString workingDirectory() const override;

  private:
    friend class VTermBackend;
    VTermTerminal(PtyProcess *pty, VTermView *view, QObject *parent = nullptr);

    PtyProcess *m_pty = nullptr;
    QPointer<VTermView> m_view;
};

// Spawns children on a forkpty() pseudo-terminal and shows them in a VTermView.
class VTermBackend : public TerminalBackend {
  public:
    TerminalInstance *spawn(const ShellCommand &command, SpawnError *error) override;
};
