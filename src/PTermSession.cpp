// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PTerm/PTermSession.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QWidget>

PTermSession *PTermSession::create(SessionId id, TerminalBackend *backend,
                                   const ShellCommand &command, const TerminalPalette &palette,
                                   const QFont &font, SpawnError *error, QObject *parent) {
    if (!backend) {
        if (error) {
            *error = {command.program, QObject::tr("No terminal backend available")};
        }
        return nullptr;
    }

    SpawnError spawnError;
    TerminalInstance *instance = backend->spawn(command, &spawnError);
    if (!instance) {
        if (spawnError.program.isEmpty()) {
            spawnError.program = command.program;
        }
        if (error) {
            *error = spawnError;
        }
        return nullptr;
    }

    auto *session = new PTermSession(id, instance, command, parent);
    session->applyTheme(palette, font);
    return session;
}

PTermSession::PTermSession(SessionId id, TerminalInstance *instance, const ShellCommand &command,
                           QObject *parent)
    : QObject(parent), m_id(id), m_instance(instance), m_command(command) {
    m_instance->setParent(this);
    m_title = QFileInfo(command.program).fileName();
    if (m_title.isEmpty()) {
        m_title = command.program;
    }

    connect(m_instance, &TerminalInstance::finished, this, &PTermSession::onFinished);
    connect(m_instance, &TerminalInstance::titleChanged, this, &PTermSession::onTitleChanged);
}

PTermSession::~PTermSession() {
    if (m_instance) {
        disconnect(m_instance, nullptr, this, nullptr);
        if (!m_exited) {
            m_instance->requestTerminate();
        }
        delete m_instance;
    }
}

qint64 PTermSession::processId() const { return m_instance ? m_instance->processId() : -1; }

QWidget *PTermSession::widget() const { return m_instance ? m_instance->widget() : nullptr; }

QString PTermSession::workingDirectory() const {
    if (!m_instance || m_exited) {
        return QString();
    }
    return m_instance->workingDirectory();
}

void PTermSession::applyTheme(const TerminalPalette &palette, const QFont &font) {
    if (!m_instance) {
        return;
    }
    m_instance->setColors(palette);
    m_instance->setFont(font.family(), font.pointSize());
}

void PTermSession::terminate() {
    if (m_exited || m_terminateRequested || !m_instance) {
        return;
    }
    m_terminateRequested = true;
    m_instance->requestTerminate();
}

void PTermSession::onFinished(int exitCode, int exitStatus) {
    if (m_exited) {
        return;
    }
    m_exited = true;
    qDebug() << "Session" << m_id << "exited with code" << exitCode << "status" << exitStatus
             << (m_terminateRequested ? "(requested)" : "");
    emit exited(m_id, exitCode, m_terminateRequested);
}

void PTermSession::onTitleChanged(const QString &title) {
    if (m_exited || title == m_title) {
        return;
    }
    m_title = title;
    emit titleChanged(m_id, title);
}
