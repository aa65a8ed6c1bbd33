// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PtyProcess_unix.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTimer>
#if defined(__APPLE__) || defined(__FreeBSD__)
#include <util.h>
#else
#include <pty.h>
#endif
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#include <vector>

namespace {

enum ChildStage { StageChdir = 1, StageExec = 2 };

QString errnoString(int err) { return QString::fromLocal8Bit(strerror(err)); }

} // namespace

PtyProcessUnix::PtyProcessUnix(QObject *parent) : PtyProcess(parent) {
    m_killTimer = new QTimer(this);
    m_killTimer->setSingleShot(true);
    m_killTimer->setInterval(KillTimeoutMs);
    connect(m_killTimer, &QTimer::timeout, this, &PtyProcessUnix::kill);

    m_reapTimer = new QTimer(this);
    m_reapTimer->setSingleShot(true);
    m_reapTimer->setInterval(ReapIntervalMs);
    connect(m_reapTimer, &QTimer::timeout, this, &PtyProcessUnix::reap);
}

PtyProcessUnix::~PtyProcessUnix() {
    if (m_pid > 0) {
        if (::kill(-m_pid, SIGKILL) == -1 && ::kill(m_pid, SIGKILL) == -1) {
            qWarning() << "Cannot send SIGKILL to" << m_pid << ":" << errnoString(errno);
        }
        // SIGKILL cannot be caught, so the child is gone almost immediately.
        while (::waitpid(m_pid, nullptr, 0) == -1 && errno == EINTR) {
        }
        m_pid = -1;
    }
    closeMaster();
}

QString PtyProcessUnix::resolveProgram() const {
    if (m_program.contains('/')) {
        QFileInfo fi(m_program);
        return (fi.isFile() && fi.isExecutable()) ? fi.absoluteFilePath() : QString();
    }
    QStringList paths;
    if (m_environment.contains("PATH")) {
        paths = m_environment.value("PATH").split(':', Qt::SkipEmptyParts);
    }
    return QStandardPaths::findExecutable(m_program, paths);
}

bool PtyProcessUnix::start(const QSize &size) {
    m_errorString.clear();
    if (m_pid > 0) {
        m_errorString = tr("A process is already running");
        return false;
    }

    const QString path = resolveProgram();
    if (path.isEmpty()) {
        m_errorString = tr("%1: program not found or not executable").arg(m_program);
        qWarning() << m_errorString;
        return false;
    }

    QString dir = m_workingDirectory;
    if (!dir.isEmpty() && !QFileInfo(dir).isDir()) {
        qWarning() << "Working directory" << dir << "does not exist, using the current one";
        dir.clear();
    }

    // Everything the child needs is built before forking.
    const QByteArray pathBytes = QFile::encodeName(path);
    const QByteArray dirBytes = QFile::encodeName(dir);

    std::vector<QByteArray> argStorage;
    argStorage.push_back(QFile::encodeName(m_program));
    for (const auto &arg : m_arguments) {
        argStorage.push_back(arg.toLocal8Bit());
    }
    std::vector<char *> argv;
    for (auto &arg : argStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    QProcessEnvironment env = m_environment;
    if (!env.contains("TERM")) {
        env.insert("TERM", "xterm-256color");
    }
    if (!env.contains("COLORTERM")) {
        env.insert("COLORTERM", "truecolor");
    }
    std::vector<QByteArray> envStorage;
    for (const auto &entry : env.toStringList()) {
        envStorage.push_back(entry.toLocal8Bit());
    }
    std::vector<char *> envp;
    for (auto &entry : envStorage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    // Closed by a successful exec; otherwise carries {stage, errno} back to us.
    int reportPipe[2];
    if (::pipe2(reportPipe, O_CLOEXEC) == -1) {
        m_errorString = tr("Cannot create pipe: %1").arg(errnoString(errno));
        qWarning() << m_errorString;
        return false;
    }

    struct winsize ws;
    ws.ws_row = (unsigned short)size.height();
    ws.ws_col = (unsigned short)size.width();
    ws.ws_xpixel = 0;
    ws.ws_ypixel = 0;

    int masterFd = -1;
    pid_t pid = forkpty(&masterFd, nullptr, nullptr, &ws);

    if (pid == -1) {
        int err = errno;
        ::close(reportPipe[0]);
        ::close(reportPipe[1]);
        m_errorString = tr("Failed to forkpty: %1").arg(errnoString(err));
        qWarning() << m_errorString;
        return false;
    }

    if (pid == 0) {
        // Child
        ::close(reportPipe[0]);
        ::signal(SIGPIPE, SIG_DFL);
        int report[2] = {StageChdir, 0};
        if (dirBytes.isEmpty() || ::chdir(dirBytes.constData()) == 0) {
            report[0] = StageExec;
            ::execve(pathBytes.constData(), argv.data(), envp.data());
        }
        report[1] = errno;
        [[maybe_unused]] ssize_t written = ::write(reportPipe[1], report, sizeof(report));
        _exit(127);
    }

    // Parent
    ::close(reportPipe[1]);
    int report[2] = {0, 0};
    ssize_t len;
    do {
        len = ::read(reportPipe[0], report, sizeof(report));
    } while (len == -1 && errno == EINTR);
    ::close(reportPipe[0]);

    if (len == (ssize_t)sizeof(report)) {
        while (::waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
        }
        ::close(masterFd);
        if (report[0] == StageChdir) {
            m_errorString = tr("Cannot change to %1: %2").arg(dir, errnoString(report[1]));
        } else {
            m_errorString = tr("Cannot execute %1: %2").arg(path, errnoString(report[1]));
        }
        qWarning() << m_errorString;
        return false;
    }

    m_pid = pid;
    m_masterFd = masterFd;
    int flags = ::fcntl(m_masterFd, F_GETFL);
    if (flags == -1 || ::fcntl(m_masterFd, F_SETFL, flags | O_NONBLOCK) == -1) {
        qWarning() << "Cannot make pty non-blocking:" << errnoString(errno);
    }
    if (::fcntl(m_masterFd, F_SETFD, FD_CLOEXEC) == -1) {
        qWarning() << "Cannot set close-on-exec on pty:" << errnoString(errno);
    }

    m_notifier = new QSocketNotifier(m_masterFd, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &PtyProcessUnix::onReadyRead);
    return true;
}

void PtyProcessUnix::write(const QByteArray &data) {
    if (m_masterFd < 0) {
        return;
    }
    const char *p = data.constData();
    qsizetype remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(m_masterFd, p, remaining);
        if (n > 0) {
            p += n;
            remaining -= n;
        } else if (n == -1 && errno == EINTR) {
            continue;
        } else if (n == -1 && errno == EAGAIN) {
            // The child is not reading; drop the rest rather than block the UI.
            qWarning() << "pty full, dropped" << remaining << "bytes";
            return;
        } else {
            qWarning() << "pty write failed:" << errnoString(errno);
            return;
        }
    }
}

void PtyProcessUnix::resize(const QSize &size) {
    if (m_masterFd >= 0) {
        struct winsize ws;
        ws.ws_row = (unsigned short)size.height();
        ws.ws_col = (unsigned short)size.width();
        ws.ws_xpixel = 0;
        ws.ws_ypixel = 0;
        if (::ioctl(m_masterFd, TIOCSWINSZ, &ws) == -1) {
            qWarning() << "TIOCSWINSZ failed:" << errnoString(errno);
        }
    }
}

void PtyProcessUnix::terminate() {
    if (m_pid <= 0 || m_killTimer->isActive()) {
        return;
    }
    // Interactive shells ignore SIGTERM; a hangup is what a closing terminal sends.
    if (::kill(-m_pid, SIGHUP) == -1 && ::kill(m_pid, SIGHUP) == -1) {
        qWarning() << "Cannot send SIGHUP to" << m_pid << ":" << errnoString(errno);
    }
    m_killTimer->start();
}

void PtyProcessUnix::kill() {
    if (m_pid <= 0) {
        return;
    }
    if (::kill(-m_pid, SIGKILL) == -1 && ::kill(m_pid, SIGKILL) == -1) {
        qWarning() << "Cannot send SIGKILL to" << m_pid << ":" << errnoString(errno);
    }
    reap();
}

QString PtyProcessUnix::currentDirectory() const {
    if (m_pid <= 0) {
        return QString();
    }
    return QFileInfo(QString("/proc/%1/cwd").arg(m_pid)).symLinkTarget();
}

void PtyProcessUnix::onReadyRead() {
    char buffer[4096];
    ssize_t len = ::read(m_masterFd, buffer, sizeof(buffer));

    if (len > 0) {
        emit readyRead(QByteArray(buffer, (int)len));
    } else if (len < 0 && (errno == EAGAIN || errno == EINTR)) {
        return;
    } else {
        // EOF, or EIO once every slave descriptor is closed.
        m_notifier->setEnabled(false);
        reap();
    }
}

void PtyProcessUnix::reap() {
    if (m_pid <= 0) {
        return;
    }
    int status = 0;
    pid_t r = ::waitpid(m_pid, &status, WNOHANG);
    if (r == 0) {
        if (!m_reapTimer->isActive()) {
            m_reapTimer->start();
        }
        return;
    }

    int err = errno;
    m_pid = -1;
    m_killTimer->stop();
    m_reapTimer->stop();
    closeMaster();

    if (r == -1) {
        qWarning() << "waitpid failed:" << errnoString(err);
        emit finished(-1, 1);
    } else if (WIFEXITED(status)) {
        emit finished(WEXITSTATUS(status), 0);
    } else {
        emit finished(WIFSIGNALED(status) ? WTERMSIG(status) : -1, 1);
    }
}

void PtyProcessUnix::closeMaster() {
    if (m_notifier) {
        // May run from inside the notifier's own activated() signal.
        m_notifier->setEnabled(false);
        m_notifier->deleteLater();
        m_notifier = nullptr;
    }
    if (m_masterFd >= 0) {
        ::close(m_masterFd);
        m_masterFd = -1;
    }
}
