// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PtyProcess.h"
#include <QtGlobal>

#if defined(Q_OS_UNIX)
#include "PtyProcess_unix.h"
#endif

bool PtyProcess::start(const QString &program, const QStringList &arguments, const QSize &size) {
    m_program = program;
    m_arguments = arguments;
    return start(size);
}

PtyProcess *PtyProcess::create(QObject *parent) {
#if defined(Q_OS_UNIX)
    return new PtyProcessUnix(parent);
#else
    Q_UNUSED(parent);
    return nullptr;
#endif
}
