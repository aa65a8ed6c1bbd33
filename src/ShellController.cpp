// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PTerm/ShellController.hpp"
#include "PTerm/PTermSession.hpp"

#include <QDebug>

ShellController::ShellController(ConfigStore *store, TerminalBackend *backend, QObject *parent)
    : QObject(parent), m_store(store), m_backend(backend) {
    m_config = m_store ? m_store->load() : ConfigStore::defaults();
    m_palette = PaletteResolver::resolve(m_config);
}

ShellController::~ShellController() {
    // Sessions are children; make sure none of them calls back while being destroyed.
    for (PTermSession *s : m_registry.sessions()) {
        disconnect(s, nullptr, this, nullptr);
    }
    for (PTermSession *s : m_closing) {
        disconnect(s, nullptr, this, nullptr);
    }
}

SessionId ShellController::openTab(const QString &workingDirectory) {
    if (m_state == State::ShuttingDown || m_state == State::Closed) {
        return 0;
    }

    QString dir = workingDirectory;
    if (dir.isEmpty() && m_registry.focused()) {
        dir = m_registry.focused()->workingDirectory();
    }

    SpawnError error;
    SessionId id = m_nextId;
    PTermSession *session =
        PTermSession::create(id, m_backend, shellCommand(dir), m_palette, font(), &error, this);
    if (!session) {
        QString message = tr("Could not start %1: %2").arg(error.program, error.message);
        qWarning() << message;
        emit spawnFailed(message);
        return 0;
    }
    m_nextId++;

    connect(session, &PTermSession::exited, this, &ShellController::onSessionExited);
    connect(session, &PTermSession::titleChanged, this, &ShellController::onSessionTitleChanged);

    int index = m_registry.insert(session);
    emit tabOpened(id, index);
    emit focusChanged(id);
    setState(State::Running);
    return id;
}

void ShellController::closeTab(quint64 id) {
    if (m_state != State::Running) {
        return;
    }
    PTermSession *session = m_registry.session(id);
    if (!session) {
        return;
    }

    removeFromRegistry(session, false);
    if (session->isRunning()) {
        m_closing.append(session);
        session->terminate();
    } else {
        discard(session);
    }
    if (m_registry.isEmpty()) {
        setState(State::Empty);
    }
}

void ShellController::closeCurrentTab() {
    if (m_registry.focused()) {
        closeTab(m_registry.focusedId());
    }
}

bool ShellController::focusTab(quint64 id) {
    if (!m_registry.contains(id)) {
        return false;
    }
    if (m_registry.focusedId() == id) {
        return true;
    }
    m_registry.focus(id);
    emit focusChanged(id);
    return true;
}

bool ShellController::focusTabAt(int index) {
    PTermSession *session = m_registry.at(index);
    return session ? focusTab(session->id()) : false;
}

void ShellController::focusNextTab() {
    int count = m_registry.count();
    if (count > 1) {
        focusTabAt((m_registry.focusedIndex() + 1) % count);
    }
}

void ShellController::focusPreviousTab() {
    int count = m_registry.count();
    if (count > 1) {
        focusTabAt((m_registry.focusedIndex() + count - 1) % count);
    }
}

bool ShellController::moveTab(quint64 id, int index) {
    if (m_registry.indexOf(id) == index) {
        return true;
    }
    if (!m_registry.move(id, index)) {
        return false;
    }
    emit tabMoved(id, index);
    return true;
}

void ShellController::reloadConfig() {
    if (m_state == State::ShuttingDown || m_state == State::Closed) {
        return;
    }

    // Resolve everything first, then hand the same palette to every session.
    PTermConfig config = m_store ? m_store->load() : ConfigStore::defaults();
    TerminalPalette palette = PaletteResolver::resolve(config);
    m_config = config;
    m_palette = palette;

    const QFont f = font();
    for (PTermSession *s : m_registry.sessions()) {
        s->applyTheme(m_palette, f);
    }
    emit configApplied();
}

void ShellController::requestWindowClose() {
    if (m_state == State::ShuttingDown || m_state == State::Closed) {
        return;
    }
    setState(State::ShuttingDown);

    const QList<PTermSession *> sessions = m_registry.sessions();
    for (PTermSession *s : sessions) {
        if (s->isRunning()) {
            s->terminate();
        } else if (m_registry.contains(s->id())) {
            removeFromRegistry(s, false);
            discard(s);
        }
    }
    finishShutdownIfDone();
}

void ShellController::onSessionExited(quint64 id, int exitCode, bool requested) {
    if (PTermSession *session = m_registry.session(id)) {
        bool unexpected = m_state == State::Running && !requested;
        if (unexpected) {
            qDebug() << "Tab" << id << "exited on its own with code" << exitCode;
        }
        removeFromRegistry(session, unexpected);
        discard(session);
        if (m_state == State::Running && m_registry.isEmpty()) {
            setState(State::Empty);
        }
    } else {
        for (PTermSession *s : m_closing) {
            if (s->id() == id) {
                discard(s);
                break;
            }
        }
    }
    finishShutdownIfDone();
}

void ShellController::onSessionTitleChanged(quint64 id, const QString &title) {
    if (m_registry.contains(id)) {
        emit tabTitleChanged(id, title);
    }
}

void ShellController::setState(State state) {
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void ShellController::removeFromRegistry(PTermSession *session, bool unexpected) {
    SessionId focusBefore = m_registry.focusedId();
    m_registry.remove(session->id());
    emit tabClosed(session->id(), unexpected);
    if (m_registry.focusedId() != focusBefore) {
        emit focusChanged(m_registry.focusedId());
    }
}

void ShellController::discard(PTermSession *session) {
    m_closing.removeAll(session);
    disconnect(session, nullptr, this, nullptr);
    session->deleteLater();
}

void ShellController::finishShutdownIfDone() {
    if (m_state != State::ShuttingDown || !m_registry.isEmpty() || !m_closing.isEmpty()) {
        return;
    }
    setState(State::Closed);
    emit closed();
}

ShellCommand ShellController::shellCommand(const QString &workingDirectory) const {
    ShellCommand command;
    command.program = ConfigStore::resolveShell(m_config);
    command.workingDirectory = workingDirectory;
    return command;
}
