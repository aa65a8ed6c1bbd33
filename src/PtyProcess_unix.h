// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include "PtyProcess.h"
#include <QSocketNotifier>
#include <sys/types.h>

class QTimer;

class PtyProcessUnix : public PtyProcess {
    Q_OBJECT

  public:
    explicit PtyProcessUnix(QObject *parent = nullptr);
    ~PtyProcessUnix() override;

    using PtyProcess::start;
    bool start(const QSize &size) override;
    void write(const QByteArray &data) override;
    void resize(const QSize &size) override;
    void terminate() override;
    void kill() override;

    qint64 processId() const override { return m_pid; }
    bool isRunning() const override { return m_pid > 0; }
    QString currentDirectory() const override;

    static constexpr int KillTimeoutMs = 3000;
    static constexpr int ReapIntervalMs = 50;

  private slots:
    void onReadyRead();
    void reap();

  private:
    QString resolveProgram() const;
    void closeMaster();

    int m_masterFd = -1;
    pid_t m_pid = -1;
    QSocketNotifier *m_notifier = nullptr;
    QTimer *m_killTimer = nullptr;
    QTimer *m_reapTimer = nullptr;
};
