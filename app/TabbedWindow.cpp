// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "TabbedWindow.h"

#include <PTerm/PTermSession.hpp>
#include <QAction>
#include <QCloseEvent>
#include <QDebug>
#include <QMessageBox>
#include <QTabBar>
#include <QTabWidget>
#include <QToolButton>

static const int DirectTabCount = 9;

TabbedWindow::TabbedWindow(ShellController *controller, QWidget *parent)
    : QMainWindow(parent), m_controller(controller) {
    m_tabs = new QTabWidget(this);
    m_tabs->setDocumentMode(true);
    m_tabs->setMovable(true);
    m_tabs->setTabBarAutoHide(true);
    m_tabs->setElideMode(Qt::ElideMiddle);
    setCentralWidget(m_tabs);
    setWindowTitle(tr("pterm"));

    // New Tab button (Left corner)
    auto *newTabBtn = new QToolButton(m_tabs);
    newTabBtn->setText("+");
    newTabBtn->setToolTip(tr("New Tab"));
    m_tabs->setCornerWidget(newTabBtn, Qt::TopLeftCorner);
    connect(newTabBtn, &QToolButton::clicked, m_controller, [this]() { m_controller->openTab(); });

    // Close Tab button (Right corner)
    auto *closeTabBtn = new QToolButton(m_tabs);
    closeTabBtn->setText("x");
    closeTabBtn->setToolTip(tr("Close Current Tab"));
    m_tabs->setCornerWidget(closeTabBtn, Qt::TopRightCorner);
    connect(closeTabBtn, &QToolButton::clicked, m_controller, &ShellController::closeCurrentTab);

    m_newTab = new QAction(tr("New Tab"), this);
    m_closeTab = new QAction(tr("Close Tab"), this);
    m_nextTab = new QAction(tr("Next Tab"), this);
    m_previousTab = new QAction(tr("Previous Tab"), this);
    m_reloadConfig = new QAction(tr("Reload Configuration"), this);
    connect(m_newTab, &QAction::triggered, m_controller, [this]() { m_controller->openTab(); });
    connect(m_closeTab, &QAction::triggered, m_controller, &ShellController::closeCurrentTab);
    connect(m_nextTab, &QAction::triggered, m_controller, &ShellController::focusNextTab);
    connect(m_previousTab, &QAction::triggered, m_controller, &ShellController::focusPreviousTab);
    connect(m_reloadConfig, &QAction::triggered, m_controller, &ShellController::reloadConfig);
    addActions({m_newTab, m_closeTab, m_nextTab, m_previousTab, m_reloadConfig});

    // Alt+1 .. Alt+9 jump to a tab by position
    for (int i = 0; i < DirectTabCount; ++i) {
        auto *action = new QAction(this);
        action->setShortcut(QKeySequence(Qt::AltModifier | Qt::Key(Qt::Key_1 + i)));
        connect(action, &QAction::triggered, m_controller,
                [this, i]() { m_controller->focusTabAt(i); });
        addAction(action);
    }
    updateShortcuts();

    connect(m_tabs, &QTabWidget::currentChanged, this, &TabbedWindow::onCurrentChanged);
    connect(m_tabs->tabBar(), &QTabBar::tabMoved, this, &TabbedWindow::onTabBarMoved);

    connect(m_controller, &ShellController::tabOpened, this, &TabbedWindow::onTabOpened);
    connect(m_controller, &ShellController::tabClosed, this, &TabbedWindow::onTabClosed);
    connect(m_controller, &ShellController::tabMoved, this, &TabbedWindow::onTabMoved);
    connect(m_controller, &ShellController::tabTitleChanged, this,
            &TabbedWindow::onTabTitleChanged);
    connect(m_controller, &ShellController::focusChanged, this, &TabbedWindow::onFocusChanged);
    connect(m_controller, &ShellController::stateChanged, this, &TabbedWindow::onStateChanged);
    connect(m_controller, &ShellController::spawnFailed, this, &TabbedWindow::onSpawnFailed);
    connect(m_controller, &ShellController::configApplied, this, &TabbedWindow::updateShortcuts);
    // Queued: closed() may be emitted from inside closeEvent().
    connect(m_controller, &ShellController::closed, this, &QWidget::close, Qt::QueuedConnection);
}

void TabbedWindow::closeEvent(QCloseEvent *event) {
    if (m_controller->state() != ShellController::State::Closed) {
        m_controller->requestWindowClose();
    }
    if (m_controller->state() == ShellController::State::Closed) {
        event->accept();
    } else {
        qDebug() << "Waiting for" << m_controller->pendingExitCount() << "shells to exit";
        event->ignore();
    }
}

void TabbedWindow::onTabOpened(quint64 id, int index) {
    PTermSession *session = m_controller->session(id);
    if (!session || !session->widget()) {
        qWarning() << "Tab" << id << "has no terminal widget";
        return;
    }
    QWidget *page = session->widget();
    m_pages.insert(id, page);

    m_syncing = true;
    m_tabs->insertTab(index, page, session->title());
    m_syncing = false;
    relabelTabs();
}

void TabbedWindow::onTabClosed(quint64 id, bool unexpected) {
    QPointer<QWidget> page = m_pages.take(id);
    if (unexpected) {
        qDebug() << "Tab" << id << "exited on its own";
    }
    if (page) {
        int index = m_tabs->indexOf(page);
        if (index != -1) {
            m_syncing = true;
            m_tabs->removeTab(index);
            m_syncing = false;
        }
    }
    relabelTabs();
}

void TabbedWindow::onTabMoved(quint64 id, int index) {
    QWidget *page = m_pages.value(id);
    int current = page ? m_tabs->indexOf(page) : -1;
    if (current != -1 && current != index) {
        m_syncing = true;
        m_tabs->tabBar()->moveTab(current, index);
        m_syncing = false;
    }
    relabelTabs();
}

void TabbedWindow::onTabTitleChanged() {
    relabelTabs();
    updateWindowTitle();
}

void TabbedWindow::onFocusChanged(quint64 id) {
    QWidget *page = m_pages.value(id);
    if (page) {
        m_syncing = true;
        m_tabs->setCurrentWidget(page);
        m_syncing = false;
        page->setFocus();
    }
    updateWindowTitle();
}

void TabbedWindow::onStateChanged(ShellController::State state) {
    // The last tab went away.
    if (state == ShellController::State::Empty) {
        close();
    }
}

void TabbedWindow::onSpawnFailed(const QString &message) {
    qCritical() << message;
    QMessageBox::warning(this, tr("Cannot open tab"), message);
}

void TabbedWindow::onCurrentChanged(int index) {
    if (m_syncing || index < 0) {
        return;
    }
    quint64 id = sessionAt(index);
    if (id != 0) {
        m_controller->focusTab(id);
    }
}

void TabbedWindow::onTabBarMoved(int from, int to) {
    Q_UNUSED(from);
    if (m_syncing) {
        return;
    }
    quint64 id = sessionAt(to);
    if (id != 0) {
        m_controller->moveTab(id, to);
    }
}

void TabbedWindow::updateShortcuts() {
    const KeyBindings &keys = m_controller->config().keys;
    m_newTab->setShortcut(keys.newTab);
    m_closeTab->setShortcut(keys.closeTab);
    m_nextTab->setShortcut(keys.nextTab);
    m_previousTab->setShortcut(keys.previousTab);
    m_reloadConfig->setShortcut(keys.reloadConfig);
}

void TabbedWindow::relabelTabs() {
    for (int i = 0; i < m_tabs->count(); ++i) {
        PTermSession *session = m_controller->session(sessionAt(i));
        QString title = session ? session->title() : tr("Terminal");
        m_tabs->setTabText(i, QString("%1. %2").arg(i + 1).arg(title));
        m_tabs->setTabToolTip(i, title);
    }
}

quint64 TabbedWindow::sessionAt(int index) const {
    QWidget *page = m_tabs->widget(index);
    if (!page) {
        return 0;
    }
    for (auto it = m_pages.cbegin(); it != m_pages.cend(); ++it) {
        if (it.value() == page) {
            return it.key();
        }
    }
    return 0;
}

void TabbedWindow::updateWindowTitle() {
    PTermSession *session = m_controller->registry().focused();
    setWindowTitle(session ? session->title() : tr("pterm"));
}
