// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PTerm/TabRegistry.hpp"

int TabRegistry::insert(PTermSession *session) {
    if (!session) {
        return -1;
    }
    int existing = indexOf(session->id());
    if (existing != -1) {
        m_focused = m_sessions[existing];
        return existing;
    }
    m_sessions.append(session);
    m_focused = session;
    return (int)m_sessions.size() - 1;
}

bool TabRegistry::remove(SessionId id) {
    int index = indexOf(id);
    if (index == -1) {
        return false;
    }

    PTermSession *removed = m_sessions.takeAt(index);
    if (removed != m_focused) {
        return true;
    }
    if (m_sessions.isEmpty()) {
        m_focused = nullptr;
    } else if (index > 0) {
        m_focused = m_sessions[index - 1];
    } else {
        m_focused = m_sessions.first();
    }
    return true;
}

bool TabRegistry::focus(SessionId id) {
    PTermSession *target = session(id);
    if (!target) {
        return false;
    }
    m_focused = target;
    return true;
}

bool TabRegistry::move(SessionId id, int index) {
    int from = indexOf(id);
    if (from == -1 || index < 0 || index >= m_sessions.size()) {
        return false;
    }
    if (from != index) {
        m_sessions.move(from, index);
    }
    return true;
}

QList<TabRegistry::Entry> TabRegistry::list() const {
    QList<Entry> entries;
    entries.reserve(m_sessions.size());
    for (const PTermSession *s : m_sessions) {
        entries.append({s->id(), s->title()});
    }
    return entries;
}

PTermSession *TabRegistry::session(SessionId id) const {
    int index = indexOf(id);
    return index == -1 ? nullptr : m_sessions[index];
}

PTermSession *TabRegistry::at(int index) const {
    if (index < 0 || index >= m_sessions.size()) {
        return nullptr;
    }
    return m_sessions[index];
}

int TabRegistry::indexOf(SessionId id) const {
    for (int i = 0; i < m_sessions.size(); ++i) {
        if (m_sessions[i]->id() == id) {
            return i;
        }
    }
    return -1;
}

int TabRegistry::focusedIndex() const {
    return m_focused ? (int)m_sessions.indexOf(m_focused) : -1;
}
