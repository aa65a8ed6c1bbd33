// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <QList>
#include <QString>

#include "PTermSession.hpp"

// Ordered tabs with a single focus. Does not own the sessions.
//
// The focused session, if any, is always one of the registered sessions. When it is
// removed, focus moves to its left neighbour, or to the new leftmost session when
// it was the first one, or to none when the registry becomes empty.
class TabRegistry {
  public:
    struct Entry {
        SessionId id;
        QString title;
    };

    int insert(PTermSession *session);
    bool remove(SessionId id);
    bool focus(SessionId id);
    bool move(SessionId id, int index);

    QList<Entry> list() const;
    QList<PTermSession *> sessions() const { return m_sessions; }

    PTermSession *session(SessionId id) const;
    PTermSession *at(int index) const;
    PTermSession *focused() const { return m_focused; }
    SessionId focusedId() const { return m_focused ? m_focused->id() : 0; }
    int indexOf(SessionId id) const;
    int focusedIndex() const;

    int count() const { return (int)m_sessions.size(); }
    bool isEmpty() const { return m_sessions.isEmpty(); }
    bool contains(SessionId id) const { return indexOf(id) != -1; }

  private:
    QList<PTermSession *> m_sessions;
    PTermSession *m_focused = nullptr;
};
