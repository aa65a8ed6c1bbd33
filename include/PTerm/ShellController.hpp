// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <QFont>
#include <QList>
#include <QObject>

#include "PTermConfig.hpp"
#include "PaletteResolver.hpp"
#include "TabRegistry.hpp"
#include "TerminalBackend.hpp"

class PTermSession;

// Window lifecycle: Empty <-> Running -> ShuttingDown -> Closed.
// All calls and all session notifications are expected on the same thread.
class ShellController : public QObject {
    Q_OBJECT

  public:
    enum class State { Empty, Running, ShuttingDown, Closed };
    Q_ENUM(State)

    ShellController(ConfigStore *store, TerminalBackend *backend, QObject *parent = nullptr);
    ~ShellController();

    State state() const { return m_state; }
    const TabRegistry &registry() const { return m_registry; }
    const PTermConfig &config() const { return m_config; }
    const TerminalPalette &palette() const { return m_palette; }
    QFont font() const { return m_config.font(); }
    PTermSession *session(SessionId id) const { return m_registry.session(id); }
    int pendingExitCount() const { return (int)m_closing.size(); }

  public slots:
    // Returns the id of the new session, or 0 if it could not be started.
    SessionId openTab(const QString &workingDirectory = QString());
    void closeTab(quint64 id);
    void closeCurrentTab();
    bool focusTab(quint64 id);
    bool focusTabAt(int index);
    void focusNextTab();
    void focusPreviousTab();
    bool moveTab(quint64 id, int index);
    void reloadConfig();
    void requestWindowClose();

  signals:
    void stateChanged(ShellController::State state);
    void tabOpened(quint64 id, int index);
    void tabClosed(quint64 id, bool unexpected);
    void tabMoved(quint64 id, int index);
    void tabTitleChanged(quint64 id, const QString &title);
    void focusChanged(quint64 id);
    void configApplied();
    void spawnFailed(const QString &message);
    void closed();

  private slots:
    void onSessionExited(quint64 id, int exitCode, bool requested);
    void onSessionTitleChanged(quint64 id, const QString &title);

  private:
    void setState(State state);
    void removeFromRegistry(PTermSession *session, bool unexpected);
    void discard(PTermSession *session);
    void finishShutdownIfDone();
    ShellCommand shellCommand(const QString &workingDirectory) const;

    ConfigStore *m_store = nullptr;
    TerminalBackend *m_backend = nullptr;
    PTermConfig m_config;
    TerminalPalette m_palette;
    TabRegistry m_registry;
    // Closed tabs whose child has not exited yet.
    QList<PTermSession *> m_closing;
    State m_state = State::Empty;
    SessionId m_nextId = 1;
};
