// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PTerm/VTermBackend.hpp"
#include "PtyProcess.h"

#include <QFont>

VTermTerminal::VTermTerminal(PtyProcess *pty, VTermView *view, QObject *parent)
    : TerminalInstance(parent), m_pty(pty), m_view(view) {
    m_pty->setParent(this);
    connect(m_pty, &PtyProcess::finished, this, &TerminalInstance::finished);
    connect(m_view, &VTermView::titleChanged, this, &TerminalInstance::titleChanged);
}

VTermTerminal::~VTermTerminal() {
    // The view may sit in a tab widget; deleting it removes the page.
    delete m_view;
}

qint64 VTermTerminal::processId() const { return m_pty->processId(); }

bool VTermTerminal::isRunning() const { return m_pty->isRunning(); }

void VTermTerminal::setColors(const TerminalPalette &palette) {
    if (m_view) {
        m_view->setColors(palette);
    }
}

void VTermTerminal::setFont(const QString &family, int pointSize) {
    if (m_view) {
        QFont font(family, pointSize);
        font.setStyleHint(QFont::Monospace);
        m_view->setTerminalFont(font);
    }
}

void VTermTerminal::requestTerminate() { m_pty->terminate(); }

QString VTermTerminal::workingDirectory() const { return m_pty->currentDirectory(); }

TerminalInstance *VTermBackend::spawn(const ShellCommand &command, SpawnError *error) {
    auto fail = [&](const QString &message) -> TerminalInstance * {
        if (error) {
            *error = {command.program, message};
        }
        return nullptr;
    };

    PtyProcess *pty = PtyProcess::create();
    if (!pty) {
        return fail(QObject::tr("Pseudo-terminals are not supported on this platform"));
    }
    pty->setProgram(command.program);
    pty->setArguments(command.arguments);
    pty->setWorkingDirectory(command.workingDirectory);

    auto *view = new VTermView(pty);
    if (!pty->start(view->terminalSize())) {
        QString message = pty->errorString();
        delete view;
        delete pty;
        return fail(message);
    }
    return new VTermTerminal(pty, view);
}
