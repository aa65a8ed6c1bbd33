// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include <PTerm/PTermSession.hpp>
#include <PTerm/ShellController.hpp>
#include <QFile>
#include <QScopedPointer>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include "FakeBackend.h"

using State = ShellController::State;

class ShellControllerTest : public QObject {
    Q_OBJECT

  private:
    QScopedPointer<QTemporaryDir> m_dir;
    QScopedPointer<ConfigStore> m_store;
    QScopedPointer<FakeBackend> m_backend;
    QScopedPointer<ShellController> m_controller;

  private slots:
    void init() {
        m_dir.reset(new QTemporaryDir);
        QVERIFY(m_dir->isValid());
        m_store.reset(new ConfigStore(m_dir->filePath("config.toml")));
        PTermConfig config = ConfigStore::defaults();
        config.shell = QStringLiteral("/bin/sh");
        QVERIFY(m_store->save(config));

        m_backend.reset(new FakeBackend);
        m_controller.reset(new ShellController(m_store.data(), m_backend.data()));
    }

    void cleanup() {
        m_controller.reset();
        m_backend.reset();
        m_store.reset();
        m_dir.reset();
    }

    void startsEmpty() {
        QCOMPARE(m_controller->state(), State::Empty);
        QVERIFY(m_controller->registry().isEmpty());
        QCOMPARE(m_controller->config().shell, QStringLiteral("/bin/sh"));
    }

    void openTabStartsRunning() {
        QSignalSpy opened(m_controller.data(), &ShellController::tabOpened);
        QSignalSpy focus(m_controller.data(), &ShellController::focusChanged);
        QSignalSpy state(m_controller.data(), &ShellController::stateChanged);

        SessionId id = m_controller->openTab();
        QCOMPARE(id, SessionId(1));
        QCOMPARE(m_controller->state(), State::Running);
        QCOMPARE(opened.count(), 1);
        QCOMPARE(opened.at(0).at(0).toULongLong(), id);
        QCOMPARE(opened.at(0).at(1).toInt(), 0);
        QCOMPARE(focus.count(), 1);
        QCOMPARE(state.count(), 1);
        QCOMPARE(m_backend->commands.last().program, QStringLiteral("/bin/sh"));
        QVERIFY(m_backend->last()->colors == m_controller->palette());

        QCOMPARE(m_controller->openTab(), SessionId(2));
        QCOMPARE(m_controller->registry().focusedId(), SessionId(2));
        QCOMPARE(state.count(), 1);
    }

    void spawnFailureWhileEmpty() {
        QSignalSpy failed(m_controller.data(), &ShellController::spawnFailed);
        QSignalSpy state(m_controller.data(), &ShellController::stateChanged);
        m_backend->failSpawn = true;

        QCOMPARE(m_controller->openTab(), SessionId(0));
        QCOMPARE(failed.count(), 1);
        QVERIFY(failed.at(0).at(0).toString().contains(QStringLiteral("/bin/sh")));
        QCOMPARE(m_controller->state(), State::Empty);
        QCOMPARE(state.count(), 0);
    }

    void spawnFailureWhileRunning() {
        SessionId first = m_controller->openTab();
        QSignalSpy failed(m_controller.data(), &ShellController::spawnFailed);
        QSignalSpy opened(m_controller.data(), &ShellController::tabOpened);

        m_backend->failSpawn = true;
        QCOMPARE(m_controller->openTab(), SessionId(0));
        QCOMPARE(failed.count(), 1);
        QCOMPARE(opened.count(), 0);
        QCOMPARE(m_controller->state(), State::Running);
        QCOMPARE(m_controller->registry().count(), 1);
        QCOMPARE(m_controller->registry().focusedId(), first);

        // Failed attempts do not use up ids
        m_backend->failSpawn = false;
        QCOMPARE(m_controller->openTab(), first + 1);
    }

    void closeLastTabGoesEmpty() {
        SessionId id = m_controller->openTab();
        QPointer<FakeTerminal> terminal = m_backend->last();
        QSignalSpy closed(m_controller.data(), &ShellController::tabClosed);
        QSignalSpy focus(m_controller.data(), &ShellController::focusChanged);

        m_controller->closeTab(id);
        QCOMPARE(m_controller->state(), State::Empty);
        QCOMPARE(closed.count(), 1);
        QCOMPARE(closed.at(0).at(1).toBool(), false);
        QCOMPARE(focus.count(), 1);
        QCOMPARE(focus.at(0).at(0).toULongLong(), quint64(0));
        QCOMPARE(terminal->terminateRequests, 1);
        QCOMPARE(m_controller->pendingExitCount(), 1);

        // The exit of a tab already closed is not reported again
        terminal->exit(0);
        QCOMPARE(closed.count(), 1);
        QCOMPARE(m_controller->pendingExitCount(), 0);
        QCOMPARE(m_controller->state(), State::Empty);
    }

    void closeFocusedMovesFocusLeft() {
        SessionId a = m_controller->openTab();
        SessionId b = m_controller->openTab();
        SessionId c = m_controller->openTab();
        QSignalSpy focus(m_controller.data(), &ShellController::focusChanged);

        m_controller->closeTab(c);
        QCOMPARE(m_controller->registry().focusedId(), b);
        QCOMPARE(focus.count(), 1);

        m_controller->focusTab(a);
        m_controller->closeCurrentTab();
        QCOMPARE(m_controller->registry().focusedId(), b);
        QCOMPARE(m_controller->state(), State::Running);

        // Unknown ids are ignored
        m_controller->closeTab(a);
        m_controller->closeTab(1234);
        QCOMPARE(m_controller->registry().count(), 1);
    }

    void unexpectedExit() {
        SessionId a = m_controller->openTab();
        m_controller->openTab();
        QSignalSpy closed(m_controller.data(), &ShellController::tabClosed);

        m_backend->terminals.first()->exit(1);
        QCOMPARE(closed.count(), 1);
        QCOMPARE(closed.at(0).at(0).toULongLong(), a);
        QCOMPARE(closed.at(0).at(1).toBool(), true);
        QCOMPARE(m_controller->registry().count(), 1);
        QCOMPARE(m_controller->state(), State::Running);

        m_backend->terminals.last()->exit(0);
        QCOMPARE(m_controller->state(), State::Empty);
    }

    void duplicateExitIsIgnored() {
        m_controller->openTab();
        SessionId b = m_controller->openTab();
        QSignalSpy closed(m_controller.data(), &ShellController::tabClosed);

        FakeTerminal *terminal = m_backend->last();
        terminal->exit(0);
        terminal->exit(0);
        QCOMPARE(closed.count(), 1);
        QCOMPARE(closed.at(0).at(0).toULongLong(), b);
        QCOMPARE(m_controller->registry().count(), 1);
    }

    void titleChangesAreForwarded() {
        SessionId id = m_controller->openTab();
        QSignalSpy titles(m_controller.data(), &ShellController::tabTitleChanged);

        m_backend->last()->setTitle(QStringLiteral("htop"));
        QCOMPARE(titles.count(), 1);
        QCOMPARE(titles.at(0).at(0).toULongLong(), id);
        QCOMPARE(titles.at(0).at(1).toString(), QStringLiteral("htop"));
        QCOMPARE(m_controller->registry().list().at(0).title, QStringLiteral("htop"));
    }

    void focusNavigationWraps() {
        SessionId a = m_controller->openTab();
        SessionId b = m_controller->openTab();
        SessionId c = m_controller->openTab();

        m_controller->focusNextTab();
        QCOMPARE(m_controller->registry().focusedId(), a);
        m_controller->focusPreviousTab();
        QCOMPARE(m_controller->registry().focusedId(), c);
        m_controller->focusPreviousTab();
        QCOMPARE(m_controller->registry().focusedId(), b);

        QVERIFY(m_controller->focusTabAt(0));
        QCOMPARE(m_controller->registry().focusedId(), a);
        QVERIFY(!m_controller->focusTabAt(3));
        QVERIFY(!m_controller->focusTab(99));
        QCOMPARE(m_controller->registry().focusedId(), a);
    }

    void moveTab() {
        SessionId a = m_controller->openTab();
        m_controller->openTab();
        SessionId c = m_controller->openTab();
        QSignalSpy moved(m_controller.data(), &ShellController::tabMoved);

        QVERIFY(m_controller->moveTab(c, 0));
        QCOMPARE(moved.count(), 1);
        QCOMPARE(m_controller->registry().indexOf(c), 0);
        QCOMPARE(m_controller->registry().indexOf(a), 1);

        QVERIFY(m_controller->moveTab(c, 0));
        QCOMPARE(moved.count(), 1);
        QVERIFY(!m_controller->moveTab(c, 5));
    }

    void newTabInheritsWorkingDirectory() {
        m_controller->openTab(QStringLiteral("/srv/project"));
        QCOMPARE(m_backend->commands.last().workingDirectory, QStringLiteral("/srv/project"));

        m_controller->openTab();
        QCOMPARE(m_backend->commands.last().workingDirectory, QStringLiteral("/srv/project"));

        m_controller->openTab(QStringLiteral("/var/log"));
        QCOMPARE(m_backend->commands.last().workingDirectory, QStringLiteral("/var/log"));
    }

    void reloadAppliesOnePalette() {
        m_controller->openTab();
        m_controller->openTab();
        FakeTerminal *first = m_backend->terminals.at(0);
        FakeTerminal *second = m_backend->terminals.at(1);
        qint64 firstPid = m_controller->registry().at(0)->processId();
        qint64 secondPid = m_controller->registry().at(1)->processId();

        PTermConfig config = m_store->load();
        config.fontSize = 15;
        config.foreground = QStringLiteral("#fafafa");
        config.palette[1] = QStringLiteral("#ff0000");
        QVERIFY(m_store->save(config));

        QSignalSpy applied(m_controller.data(), &ShellController::configApplied);
        m_controller->reloadConfig();
        QCOMPARE(applied.count(), 1);

        TerminalPalette expected = PaletteResolver::resolve(config);
        QVERIFY(m_controller->palette() == expected);
        QVERIFY(first->colors == expected);
        QVERIFY(second->colors == first->colors);
        QCOMPARE(first->fontSize, 15);
        QCOMPARE(second->fontSize, 15);
        QCOMPARE(m_controller->registry().at(0)->processId(), firstPid);
        QCOMPARE(m_controller->registry().at(1)->processId(), secondPid);
        QVERIFY(first->isRunning());
        QVERIFY(second->isRunning());
    }

    void reloadWithBrokenFileKeepsDefaults() {
        m_controller->openTab();
        QFile file(m_store->path());
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write("font_size = \"huge\"\n[colors]\nforeground = 12\n");
        file.close();

        m_controller->reloadConfig();
        QCOMPARE(m_controller->config().fontSize, 11);
        QVERIFY(m_backend->last()->colors == PaletteResolver::defaultPalette());
    }

    void shutdownWaitsForChildren() {
        SessionId a = m_controller->openTab();
        m_controller->openTab();
        QSignalSpy state(m_controller.data(), &ShellController::stateChanged);
        QSignalSpy closed(m_controller.data(), &ShellController::closed);

        m_controller->requestWindowClose();
        QCOMPARE(m_controller->state(), State::ShuttingDown);
        for (const QPointer<FakeTerminal> &terminal : m_backend->terminals) {
            QCOMPARE(terminal->terminateRequests, 1);
        }

        // Requests during shutdown are ignored
        QCOMPARE(m_controller->openTab(), SessionId(0));
        m_controller->closeTab(a);
        m_controller->reloadConfig();
        m_controller->requestWindowClose();
        QCOMPARE(m_controller->registry().count(), 2);
        QCOMPARE(m_backend->commands.size(), 2);

        m_backend->terminals.at(0)->exit(0);
        QCOMPARE(m_controller->state(), State::ShuttingDown);
        QCOMPARE(closed.count(), 0);

        m_backend->terminals.at(1)->exit(0);
        QCOMPARE(m_controller->state(), State::Closed);
        QCOMPARE(closed.count(), 1);
        QCOMPARE(state.count(), 2);
        QCOMPARE(state.at(1).at(0).value<State>(), State::Closed);
    }

    void shutdownWhenChildrenExitAtOnce() {
        m_backend->exitOnTerminate = true;
        m_controller->openTab();
        m_controller->openTab();
        QSignalSpy closed(m_controller.data(), &ShellController::closed);

        m_controller->requestWindowClose();
        QCOMPARE(m_controller->state(), State::Closed);
        QCOMPARE(closed.count(), 1);
        QVERIFY(m_controller->registry().isEmpty());
    }

    void shutdownWaitsForClosingTabs() {
        SessionId id = m_controller->openTab();
        m_controller->closeTab(id);
        QCOMPARE(m_controller->state(), State::Empty);

        m_controller->requestWindowClose();
        QCOMPARE(m_controller->state(), State::ShuttingDown);
        m_backend->last()->exit(0);
        QCOMPARE(m_controller->state(), State::Closed);
    }

    void shutdownFromEmpty() {
        QSignalSpy closed(m_controller.data(), &ShellController::closed);
        m_controller->requestWindowClose();
        QCOMPARE(m_controller->state(), State::Closed);
        QCOMPARE(closed.count(), 1);
        QCOMPARE(m_controller->openTab(), SessionId(0));
    }
};

QTEST_MAIN(ShellControllerTest)
#include "ShellControllerTest.moc"
