// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <PTerm/ShellController.hpp>
#include <QHash>
#include <QMainWindow>
#include <QPointer>

class QAction;
class QTabWidget;

class TabbedWindow : public QMainWindow {
    Q_OBJECT
  public:
    explicit TabbedWindow(ShellController *controller, QWidget *parent = nullptr);

  protected:
    void closeEvent(QCloseEvent *event) override;

  private slots:
    void onTabOpened(quint64 id, int index);
    void onTabClosed(quint64 id, bool unexpected);
    void onTabMoved(quint64 id, int index);
    void onTabTitleChanged();
    void onFocusChanged(quint64 id);
    void onStateChanged(ShellController::State state);
    void onSpawnFailed(const QString &message);
    void onCurrentChanged(int index);
    void onTabBarMoved(int from, int to);
    void updateShortcuts();

  private:
    void relabelTabs();
    quint64 sessionAt(int index) const;
    void updateWindowTitle();

    ShellController *m_controller;
    QTabWidget *m_tabs;
    QHash<quint64, QPointer<QWidget>> m_pages;
    QAction *m_newTab;
    QAction *m_closeTab;
    QAction *m_nextTab;
    QAction *m_previousTab;
    QAction *m_reloadConfig;
    bool m_syncing = false;
};
